#include "money.h"
#include <cstdint>
#include <gtest/gtest.h>

TEST(MoneyTest, SumsWithoutFloatingPointDrift) {
  Money m;
  for (int i = 0; i < 10; ++i) m += Money::from_amount(0.1);
  EXPECT_EQ(m.cents(), 100);
  EXPECT_EQ(m.to_string(), "1.00");

  EXPECT_EQ((Money::from_amount(0.1) + Money::from_amount(0.2)).cents(), 30);
}

TEST(MoneyTest, FormatsTwoDecimals) {
  EXPECT_EQ(Money::from_amount(40.5).to_string(), "40.50");
  EXPECT_EQ(Money::from_amount(0.05).to_string(), "0.05");
  EXPECT_EQ(Money::from_cents(-1234).to_string(), "-12.34");
  EXPECT_EQ(Money().to_string(), "0.00");
  EXPECT_EQ(Money::from_cents(INT64_MIN).to_string(), "-92233720368547758.08");
  EXPECT_EQ(Money::from_cents(INT64_MAX).to_string(), "92233720368547758.07");
}

TEST(MoneyTest, RoundsToNearestCent) {
  EXPECT_EQ(Money::from_amount(0.125).cents(), 13);
  EXPECT_EQ(Money::from_amount(1.375).cents(), 138);
  EXPECT_EQ(Money::from_amount(25.5).cents(), 2550);
  EXPECT_DOUBLE_EQ(Money::from_cents(4050).to_double(), 40.5);
}
