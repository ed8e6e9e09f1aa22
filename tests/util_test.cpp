#include "util.h"
#include <gtest/gtest.h>

TEST(UtilTest, TrimRemovesSurroundingWhitespace) {
  EXPECT_EQ(trim("  Food \t\r\n"), "Food");
  EXPECT_EQ(trim(" \t "), "");
  EXPECT_EQ(trim("a b"), "a b");
}

TEST(UtilTest, IequalsIgnoresAsciiCase) {
  EXPECT_TRUE(iequals("Food", "fOOD"));
  EXPECT_FALSE(iequals("Food", "Foods"));
}

TEST(UtilTest, DisplayLengthCountsCodePoints) {
  EXPECT_EQ(display_length("abc"), 3u);
  EXPECT_EQ(display_length("餐饮"), 2u);
}

TEST(UtilTest, ValidDatesIncludingLeapDay) {
  EXPECT_TRUE(is_valid_date("2024-01-15"));
  EXPECT_TRUE(is_valid_date("2024-02-29"));
  EXPECT_TRUE(is_valid_date("2000-02-29"));
  EXPECT_TRUE(is_valid_date("2023-12-31"));
}

TEST(UtilTest, InvalidDates) {
  EXPECT_FALSE(is_valid_date("2023-02-29"));
  EXPECT_FALSE(is_valid_date("1900-02-29"));
  EXPECT_FALSE(is_valid_date("2024-13-01"));
  EXPECT_FALSE(is_valid_date("2024-04-31"));
  EXPECT_FALSE(is_valid_date("2024-00-10"));
  EXPECT_FALSE(is_valid_date("0000-01-01"));
  EXPECT_FALSE(is_valid_date("2024-1-15"));
  EXPECT_FALSE(is_valid_date("2024/01/15"));
  EXPECT_FALSE(is_valid_date("invalid-date"));
  EXPECT_FALSE(is_valid_date(""));
}

TEST(UtilTest, TodayIsAValidDate) {
  EXPECT_TRUE(is_valid_date(today_date()));
  EXPECT_EQ(file_time_str().size(), 15u);
}

TEST(UtilTest, JoinPath) {
  EXPECT_EQ(join_path("", "a.csv"), "a.csv");
  EXPECT_EQ(join_path("out", "a.csv"), "out/a.csv");
  EXPECT_EQ(join_path("out/", "a.csv"), "out/a.csv");
}
