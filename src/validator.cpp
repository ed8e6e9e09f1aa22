#include "validator.h"
#include "money.h"
#include "util.h"
#include <cerrno>
#include <cmath>
#include <cstdlib>

static const char* kComponent = "validator";

Status validate_amount(const std::string& raw, double& amount) {
  std::string s = trim(raw);
  if (s.empty())
    return Status(ErrorCode::INVALID_AMOUNT, "金额不能为空", kComponent);

  // 只接受普通十进制写法（拒绝 nan / inf / 十六进制）
  if (s.find_first_not_of("0123456789.+-eE") != std::string::npos)
    return Status(ErrorCode::INVALID_AMOUNT, "金额不是合法数字：" + s, kComponent);

  errno = 0;
  char* end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || errno == ERANGE)
    return Status(ErrorCode::INVALID_AMOUNT, "金额不是合法数字：" + s, kComponent);

  return validate_amount(v, amount);
}

Status validate_amount(double value, double& amount) {
  if (!std::isfinite(value))
    return Status(ErrorCode::INVALID_AMOUNT, "金额必须是有限数字", kComponent);
  if (value <= 0)
    return Status(ErrorCode::INVALID_AMOUNT, "金额必须大于 0", kComponent);
  if (value > kMaxAmount)
    return Status(ErrorCode::INVALID_AMOUNT,
                  "金额超出上限 " + Money::from_amount(kMaxAmount).to_string(), kComponent);

  // 上限以内 value * 100 的浮点误差远小于 1e-6
  double cents = value * 100.0;
  double whole = std::round(cents);
  if (std::fabs(cents - whole) > 1e-6)
    return Status(ErrorCode::INVALID_AMOUNT, "金额最多两位小数", kComponent);
  if (whole < 1)
    return Status(ErrorCode::INVALID_AMOUNT, "金额至少为 0.01", kComponent);

  amount = whole / 100.0;
  return Status();
}

Status validate_date(const std::string& raw, std::string& date) {
  std::string s = trim(raw);
  if (!is_valid_date(s))
    return Status(ErrorCode::INVALID_DATE, "日期应为有效的 YYYY-MM-DD：" + s, kComponent);
  date = s;
  return Status();
}

Status validate_category(const std::string& raw, std::string& category) {
  std::string s = trim(raw);
  if (s.empty())
    return Status(ErrorCode::EMPTY_CATEGORY, "分类不能为空", kComponent);
  category = s;
  return Status();
}

Status validate_description(const std::string& raw, bool required, std::string& description) {
  std::string s = trim(raw);
  if (s.empty() && required)
    return Status(ErrorCode::EMPTY_DESCRIPTION, "描述不能为空", kComponent);
  description = s;
  return Status();
}

Status validate_record(const ExpenseFields& fields, const ValidationRules& rules, Expense& out) {
  Expense e;
  Status st;
  st.merge(validate_date(fields.date, e.date));
  st.merge(validate_category(fields.category, e.category));
  st.merge(validate_amount(fields.amount, e.amount));
  st.merge(validate_description(fields.description, rules.require_description, e.description));
  if (st.ok()) out = e;
  return st;
}

Status validate_expense(const Expense& in, const ValidationRules& rules, Expense& out) {
  Expense e;
  Status st;
  st.merge(validate_date(in.date, e.date));
  st.merge(validate_category(in.category, e.category));
  st.merge(validate_amount(in.amount, e.amount));
  st.merge(validate_description(in.description, rules.require_description, e.description));
  if (st.ok()) out = e;
  return st;
}
