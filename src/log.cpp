#include "log.h"
#include "util.h"
#include <iostream>

static LogLevel g_log_level = LogLevel::WARN;

void set_log_level(LogLevel level) { g_log_level = level; }

bool parse_log_level(const std::string& s, LogLevel& level) {
  std::string v = to_lower(trim(s));
  if (v == "debug") { level = LogLevel::DBG;  return true; }
  if (v == "info")  { level = LogLevel::INFO; return true; }
  if (v == "warn")  { level = LogLevel::WARN; return true; }
  if (v == "error") { level = LogLevel::ERR;  return true; }
  if (v == "off")   { level = LogLevel::OFF;  return true; }
  return false;
}

static void emit(LogLevel level, const char* tag,
                 const std::string& component, const std::string& msg) {
  if (g_log_level == LogLevel::OFF || level < g_log_level) return;
  std::ostream& os = (level >= LogLevel::WARN) ? std::cerr : std::cout;
  os << "[" << current_time_str() << "] [" << tag << "] [" << component << "] "
     << msg << std::endl;
}

void log_debug(const std::string& component, const std::string& msg) {
  emit(LogLevel::DBG, "DEBUG", component, msg);
}

void log_info(const std::string& component, const std::string& msg) {
  emit(LogLevel::INFO, "INFO", component, msg);
}

void log_warn(const std::string& component, const std::string& msg) {
  emit(LogLevel::WARN, "WARN", component, msg);
}

void log_error(const std::string& component, const std::string& msg) {
  emit(LogLevel::ERR, "ERROR", component, msg);
}
