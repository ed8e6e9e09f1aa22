#pragma once
#include "log.h"
#include "status.h"
#include <string>

// 配置文件：每行 key = value，# 开头为注释
//
//   data_file           = expenses.json
//   export_dir          = .
//   log_level           = warn      # debug / info / warn / error / off
//   require_description = true
struct Config {
  std::string data_file = "expenses.json";
  std::string export_dir = ".";
  LogLevel log_level = LogLevel::WARN;
  bool require_description = true;
};

// 文件不存在时保留默认值并返回成功；未知键和非法取值全部汇总返回
Status load_config(const std::string& path, Config& cfg);
Status parse_config(const std::string& text, Config& cfg);
