#pragma once
#include "status.h"
#include <google/protobuf/struct.pb.h>
#include <string>
#include <vector>

struct Expense {
  std::string date;         // YYYY-MM-DD
  std::string category;     // 显示时保留大小写，比较时忽略大小写
  double amount = 0.0;      // > 0
  std::string description;
};

bool operator==(const Expense& a, const Expense& b);
bool operator!=(const Expense& a, const Expense& b);

// 单条记录 <-> 字段映射（date / category / amount / description）
google::protobuf::Struct to_mapping(const Expense& e);
Status from_mapping(const google::protobuf::Struct& m, Expense& out);

// 整个集合 <-> JSON 文本：顶层是数组，每个元素是一条记录的映射
Status encode_expenses(const std::vector<Expense>& v, std::string& json);
Status decode_expenses(const std::string& json, std::vector<Expense>& out);
