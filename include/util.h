#pragma once
#include <string>

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
bool iequals(const std::string& a, const std::string& b);

// 按 UTF-8 码点计数（用于列宽等显示长度）
size_t display_length(const std::string& s);

// YYYY-MM-DD，并且必须是真实存在的公历日期（含闰年）
bool is_valid_date(const std::string& d);
std::string today_date();

// 日志用：YYYY-MM-DD HH:MM:SS
std::string current_time_str();
// 文件名用：YYYYMMDD_HHMMSS
std::string file_time_str();

// 文件辅助
bool file_exists(const std::string& path);
bool read_file(const std::string& path, std::string& content);
bool copy_file(const std::string& from, const std::string& to);
std::string join_path(const std::string& dir, const std::string& name);
