#include "status.h"
#include <gtest/gtest.h>

TEST(StatusTest, DefaultIsOk) {
  Status st;
  EXPECT_TRUE(st.ok());
  EXPECT_EQ(st.code(), ErrorCode::OK);
  EXPECT_EQ(st.to_string(), "OK");
}

TEST(StatusTest, MergeKeepsEveryError) {
  Status st(ErrorCode::INVALID_AMOUNT, "bad amount", "validator");
  st.merge(Status(ErrorCode::EMPTY_CATEGORY, "no category", "validator"));
  st.merge(Status());

  EXPECT_FALSE(st.ok());
  EXPECT_EQ(st.errors().size(), 2u);
  EXPECT_EQ(st.code(), ErrorCode::INVALID_AMOUNT);
  EXPECT_TRUE(st.has(ErrorCode::EMPTY_CATEGORY));
  EXPECT_FALSE(st.has(ErrorCode::INVALID_DATE));
}

TEST(StatusTest, AtIndexTagsAllErrors) {
  Status st(ErrorCode::MALFORMED_RECORD, "missing date", "record");
  st.merge(Status(ErrorCode::MALFORMED_RECORD, "missing category", "record"));
  Status tagged = st.at_index(3);
  for (auto& e : tagged.errors()) EXPECT_EQ(e.index, 3);
  EXPECT_NE(tagged.to_string().find("MALFORMED_RECORD[#3]"), std::string::npos);
}
