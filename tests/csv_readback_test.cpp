#include "export.h"
#include "test_support.h"
#include <cstdio>
#include <gtest/gtest.h>
#include "rapidcsv.h"

static Expense make(const std::string& date, const std::string& category, double amount,
                    const std::string& description) {
  Expense e;
  e.date = date;
  e.category = category;
  e.amount = amount;
  e.description = description;
  return e;
}

TEST(CsvReadbackTest, StandardReaderRecoversFields) {
  TempDir dir;
  std::vector<Expense> v = {
      make("2024-01-15", "Food", 25.50, "Lunch at restaurant"),
      make("2024-01-17", "Entertainment", 45.75, "Movie, popcorn"),
      make("2024-01-20", "Food", 30.00, "a, \"b\", c"),
  };
  std::string written;
  ASSERT_TRUE(export_csv(v, dir.file("r.csv"), dir.path(), written).ok());

  rapidcsv::Document doc(written, rapidcsv::LabelParams(0, -1));
  ASSERT_EQ(doc.GetRowCount(), 3u);
  EXPECT_EQ(doc.GetColumnNames(),
            (std::vector<std::string>{"date", "category", "amount", "description"}));

  for (size_t i = 0; i < v.size(); ++i) {
    EXPECT_EQ(doc.GetCell<std::string>("date", i), v[i].date);
    EXPECT_EQ(doc.GetCell<std::string>("category", i), v[i].category);
    EXPECT_DOUBLE_EQ(doc.GetCell<double>("amount", i), v[i].amount);
    EXPECT_EQ(doc.GetCell<std::string>("description", i), v[i].description);
  }
}

TEST(CsvReadbackTest, LargeExportKeepsEveryRow) {
  TempDir dir;
  const char* categories[] = {"Food", "Transport", "Entertainment", "Utilities", "Healthcare"};
  std::vector<Expense> v;
  for (int i = 0; i < 100; ++i) {
    char date[16];
    std::snprintf(date, sizeof(date), "2024-01-%02d", i % 28 + 1);
    v.push_back(make(date, categories[i % 5], 10.0 + i * 1.5,
                     "Test expense " + std::to_string(i) + " with description"));
  }
  std::string written;
  ASSERT_TRUE(export_csv(v, dir.file("big.csv"), dir.path(), written).ok());

  rapidcsv::Document doc(written, rapidcsv::LabelParams(0, -1));
  ASSERT_EQ(doc.GetRowCount(), 100u);
  EXPECT_EQ(doc.GetCell<std::string>("category", 99), "Healthcare");
  EXPECT_DOUBLE_EQ(doc.GetCell<double>("amount", 99), 10.0 + 99 * 1.5);
}
