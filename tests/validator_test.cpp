#include "validator.h"
#include <gtest/gtest.h>
#include <limits>

TEST(ValidatorTest, AmountAcceptsPositiveDecimals) {
  double v = 0;
  EXPECT_TRUE(validate_amount("25.50", v).ok());
  EXPECT_DOUBLE_EQ(v, 25.5);
  EXPECT_TRUE(validate_amount(" 50.99 ", v).ok());
  EXPECT_DOUBLE_EQ(v, 50.99);
  EXPECT_TRUE(validate_amount("1e2", v).ok());
  EXPECT_DOUBLE_EQ(v, 100.0);
}

TEST(ValidatorTest, AmountRejectsBadValues) {
  double v = 7;
  for (const char* raw : {"0", "-50", "0.0", "invalid_amount", "", "12abc", "nan", "inf",
                          "0x10", "1e999"}) {
    Status st = validate_amount(raw, v);
    EXPECT_EQ(st.code(), ErrorCode::INVALID_AMOUNT) << raw;
  }
  EXPECT_DOUBLE_EQ(v, 7);
}

TEST(ValidatorTest, AmountLimitedToWholeCentsAndMaximum) {
  double v = 7;
  for (const char* raw : {"0.004", "0.001", "12.345", "1e-9", "1e18", "10000000.01"}) {
    EXPECT_EQ(validate_amount(raw, v).code(), ErrorCode::INVALID_AMOUNT) << raw;
  }
  EXPECT_DOUBLE_EQ(v, 7);

  EXPECT_TRUE(validate_amount("10000000", v).ok());
  EXPECT_DOUBLE_EQ(v, kMaxAmount);
  EXPECT_TRUE(validate_amount("0.01", v).ok());
  EXPECT_DOUBLE_EQ(v, 0.01);
  EXPECT_TRUE(validate_amount("9999999.99", v).ok());
  EXPECT_DOUBLE_EQ(v, 9999999.99);

  // 从文件读到的数字走同一规则
  EXPECT_EQ(validate_amount(0.004, v).code(), ErrorCode::INVALID_AMOUNT);
  EXPECT_EQ(validate_amount(1e18, v).code(), ErrorCode::INVALID_AMOUNT);
  EXPECT_TRUE(validate_amount(0.1 + 0.2, v).ok());
  EXPECT_DOUBLE_EQ(v, 0.3);
}

TEST(ValidatorTest, NumericAmountRejectsNonFinite) {
  double v = 0;
  EXPECT_EQ(validate_amount(std::numeric_limits<double>::quiet_NaN(), v).code(),
            ErrorCode::INVALID_AMOUNT);
  EXPECT_EQ(validate_amount(std::numeric_limits<double>::infinity(), v).code(),
            ErrorCode::INVALID_AMOUNT);
  EXPECT_EQ(validate_amount(-0.01, v).code(), ErrorCode::INVALID_AMOUNT);
  EXPECT_TRUE(validate_amount(0.01, v).ok());
}

TEST(ValidatorTest, DateMustBeRealCalendarDate) {
  std::string d;
  EXPECT_TRUE(validate_date(" 2024-02-29 ", d).ok());
  EXPECT_EQ(d, "2024-02-29");
  EXPECT_EQ(validate_date("2023-02-29", d).code(), ErrorCode::INVALID_DATE);
  EXPECT_EQ(validate_date("invalid-date", d).code(), ErrorCode::INVALID_DATE);
  EXPECT_EQ(validate_date("", d).code(), ErrorCode::INVALID_DATE);
}

TEST(ValidatorTest, CategoryIsTrimmedAndRequired) {
  std::string c;
  EXPECT_TRUE(validate_category("  Groceries ", c).ok());
  EXPECT_EQ(c, "Groceries");
  EXPECT_EQ(validate_category(" \t", c).code(), ErrorCode::EMPTY_CATEGORY);
}

TEST(ValidatorTest, DescriptionStrictAndLenient) {
  std::string d = "old";
  EXPECT_EQ(validate_description("   ", true, d).code(), ErrorCode::EMPTY_DESCRIPTION);
  EXPECT_EQ(d, "old");
  EXPECT_TRUE(validate_description("   ", false, d).ok());
  EXPECT_EQ(d, "");
  EXPECT_TRUE(validate_description(" Bus fare ", true, d).ok());
  EXPECT_EQ(d, "Bus fare");
}

TEST(ValidatorTest, RecordAggregatesEveryFailure) {
  ExpenseFields f;
  f.date = "2024-13-40";
  f.category = "";
  f.amount = "-3";
  f.description = " ";

  Expense out;
  out.category = "unchanged";
  Status st = validate_record(f, ValidationRules(), out);
  ASSERT_EQ(st.errors().size(), 4u);
  EXPECT_TRUE(st.has(ErrorCode::INVALID_DATE));
  EXPECT_TRUE(st.has(ErrorCode::EMPTY_CATEGORY));
  EXPECT_TRUE(st.has(ErrorCode::INVALID_AMOUNT));
  EXPECT_TRUE(st.has(ErrorCode::EMPTY_DESCRIPTION));
  EXPECT_EQ(out.category, "unchanged");
}

TEST(ValidatorTest, RecordNormalizesFields) {
  ExpenseFields f;
  f.date = "2024-01-15";
  f.category = " Food ";
  f.amount = "25.50";
  f.description = " Lunch ";

  Expense out;
  ASSERT_TRUE(validate_record(f, ValidationRules(), out).ok());
  EXPECT_EQ(out.category, "Food");
  EXPECT_EQ(out.description, "Lunch");
  EXPECT_DOUBLE_EQ(out.amount, 25.5);
}
