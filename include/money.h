#pragma once
#include <cstdint>
#include <string>

// 定点金额：内部以“分”为单位的整数保存，汇总时不产生浮点累积误差
class Money {
public:
  Money() = default;

  // 四舍五入到分；amount 应已通过 validate_amount（有上限，不会溢出）
  static Money from_amount(double amount);
  static Money from_cents(std::int64_t cents) { return Money(cents); }

  std::int64_t cents() const { return cents_; }
  double to_double() const { return static_cast<double>(cents_) / 100.0; }
  // 固定两位小数，例如 "40.50"
  std::string to_string() const;

  Money& operator+=(const Money& other) {
    cents_ += other.cents_;
    return *this;
  }
  Money operator+(const Money& other) const { return Money(cents_ + other.cents_); }

  bool operator==(const Money& other) const { return cents_ == other.cents_; }
  bool operator!=(const Money& other) const { return cents_ != other.cents_; }
  bool operator<(const Money& other) const { return cents_ < other.cents_; }

private:
  explicit Money(std::int64_t cents) : cents_(cents) {}

  std::int64_t cents_ = 0;
};
