#pragma once
#include <string>

// 日志级别：低于当前级别的消息不输出
enum class LogLevel { DBG, INFO, WARN, ERR, OFF };

void set_log_level(LogLevel level);

// "debug" / "info" / "warn" / "error" / "off"
bool parse_log_level(const std::string& s, LogLevel& level);

// 输出格式：[YYYY-MM-DD HH:MM:SS] [LEVEL] [component] msg
// INFO 及以下走 stdout，WARN/ERROR 走 stderr
void log_debug(const std::string& component, const std::string& msg);
void log_info(const std::string& component, const std::string& msg);
void log_warn(const std::string& component, const std::string& msg);
void log_error(const std::string& component, const std::string& msg);
