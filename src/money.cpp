#include "money.h"
#include <cmath>
#include <cstdio>

Money Money::from_amount(double amount) {
  return Money(static_cast<std::int64_t>(std::llround(amount * 100.0)));
}

std::string Money::to_string() const {
  // 用无符号取绝对值，INT64_MIN 也不会溢出
  std::uint64_t v = static_cast<std::uint64_t>(cents_);
  if (cents_ < 0) v = 0 - v;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s%llu.%02llu", cents_ < 0 ? "-" : "",
                static_cast<unsigned long long>(v / 100),
                static_cast<unsigned long long>(v % 100));
  return std::string(buf);
}
