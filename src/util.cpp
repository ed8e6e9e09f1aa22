#include "util.h"
#include <cctype>
#include <ctime>
#include <fstream>
#include <sstream>
#include <unistd.h>

std::string trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string to_lower(const std::string& s) {
  std::string out = s;
  for (auto& c : out) c = (char)std::tolower((unsigned char)c);
  return out;
}

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  }
  return true;
}


size_t display_length(const std::string& s) {
  size_t n = 0;
  for (unsigned char c : s) {
    // 续字节 10xxxxxx 不计数
    if ((c & 0xC0) != 0x80) n++;
  }
  return n;
}

static bool is_leap(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

bool is_valid_date(const std::string& d) {
  if (d.size() != 10) return false;
  if (d[4] != '-' || d[7] != '-') return false;
  for (int i = 0; i < 10; ++i) {
    if (i == 4 || i == 7) continue;
    if (!std::isdigit((unsigned char)d[i])) return false;
  }

  int y = std::stoi(d.substr(0, 4));
  int m = std::stoi(d.substr(5, 2));
  int day = std::stoi(d.substr(8, 2));
  if (y < 1 || m < 1 || m > 12 || day < 1) return false;

  static const int days_in_month[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  int limit = days_in_month[m - 1];
  if (m == 2 && is_leap(y)) limit = 29;
  return day <= limit;
}

static std::string format_now(const char* fmt) {
  std::time_t now = std::time(nullptr);
  std::tm lt = *std::localtime(&now);
  char buf[64];
  std::strftime(buf, sizeof(buf), fmt, &lt);
  return std::string(buf);
}

std::string today_date() { return format_now("%Y-%m-%d"); }

std::string current_time_str() { return format_now("%Y-%m-%d %H:%M:%S"); }

std::string file_time_str() { return format_now("%Y%m%d_%H%M%S"); }

bool file_exists(const std::string& path) {
  return ::access(path.c_str(), F_OK) == 0;
}

bool read_file(const std::string& path, std::string& content) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) return false;
  std::ostringstream oss;
  oss << in.rdbuf();
  if (in.bad()) return false;
  content = oss.str();
  return true;
}

bool copy_file(const std::string& from, const std::string& to) {
  std::ifstream in(from, std::ios::binary);
  if (!in.is_open()) return false;
  std::ofstream out(to, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) return false;

  // 空文件时 operator<< 会给 out 置 failbit，这里单独处理
  if (in.peek() != std::ifstream::traits_type::eof()) out << in.rdbuf();
  out.flush();
  return !in.bad() && out.good();
}

std::string join_path(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}
