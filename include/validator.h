#pragma once
#include "record.h"
#include "status.h"
#include <string>

// 调用方传入的原始字段（尚未校验）
struct ExpenseFields {
  std::string date;         // 空 = 今天（由 ExpenseStore 填充）
  std::string category;
  std::string amount;
  std::string description;
};

// 金额以“分”为最小单位：最多两位小数，单笔上限一千万
const double kMaxAmount = 10000000.0;

struct ValidationRules {
  bool require_description = true;
};

// 每个函数独立校验一个字段：成功时写出规范化后的值
// （金额规范化为整分，和 Money 的汇总一致）
Status validate_amount(const std::string& raw, double& amount);
Status validate_amount(double value, double& amount);
Status validate_date(const std::string& raw, std::string& date);
Status validate_category(const std::string& raw, std::string& category);
Status validate_description(const std::string& raw, bool required, std::string& description);

// 整条记录：四个字段全部检查，汇总所有错误，不在第一个错误处停下
Status validate_record(const ExpenseFields& fields, const ValidationRules& rules, Expense& out);
Status validate_expense(const Expense& e, const ValidationRules& rules, Expense& out);
