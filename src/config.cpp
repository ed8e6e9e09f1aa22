#include "config.h"
#include "log.h"
#include "util.h"
#include <sstream>

static const char* kComponent = "config";

static bool parse_bool(const std::string& s, bool& out) {
  std::string v = to_lower(s);
  if (v == "true" || v == "yes" || v == "on" || v == "1")  { out = true;  return true; }
  if (v == "false" || v == "no" || v == "off" || v == "0") { out = false; return true; }
  return false;
}

Status parse_config(const std::string& text, Config& cfg) {
  Config next = cfg;
  Status st;

  std::istringstream in(text);
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;

    auto bad = [&](const std::string& why) {
      st.add(Error{ErrorCode::CONFIG_INVALID,
                   "第 " + std::to_string(line_no) + " 行：" + why, kComponent});
    };

    auto pos = line.find('=');
    if (pos == std::string::npos) {
      bad("缺少 '='");
      continue;
    }
    std::string key = trim(line.substr(0, pos));
    std::string value = line.substr(pos + 1);
    // 行尾注释
    auto hash = value.find(" #");
    if (hash != std::string::npos) value = value.substr(0, hash);
    value = trim(value);

    if (key == "data_file") {
      if (value.empty()) bad("data_file 不能为空");
      else next.data_file = value;
    } else if (key == "export_dir") {
      next.export_dir = value.empty() ? "." : value;
    } else if (key == "log_level") {
      if (!parse_log_level(value, next.log_level)) bad("未知日志级别 " + value);
    } else if (key == "require_description") {
      if (!parse_bool(value, next.require_description)) bad("require_description 应为 true/false");
    } else {
      bad("未知配置项 " + key);
    }
  }

  if (st.ok()) cfg = next;
  return st;
}

Status load_config(const std::string& path, Config& cfg) {
  if (!file_exists(path)) {
    log_debug(kComponent, "未找到配置文件，使用默认值：" + path);
    return Status();
  }
  std::string text;
  if (!read_file(path, text))
    return Status(ErrorCode::CONFIG_INVALID, "无法读取配置文件 " + path, kComponent);

  Status st = parse_config(text, cfg);
  if (!st.ok()) log_error(kComponent, path + "：" + st.to_string());
  return st;
}
