#pragma once
#include <string>
#include <vector>

enum class ErrorCode {
  OK = 0,
  // 字段校验（可恢复：调用方重新输入即可）
  INVALID_AMOUNT,
  INVALID_DATE,
  EMPTY_CATEGORY,
  EMPTY_DESCRIPTION,
  // 加载（中止初始化，由调用方决定重建还是退出）
  MALFORMED_RECORD,
  INVALID_RECORD,
  CORRUPT_STORE,
  // 操作
  INDEX_OUT_OF_RANGE,
  PERSIST_ERROR,
  EXPORT_EMPTY,
  CAPABILITY_UNAVAILABLE,
  CONFIG_INVALID,
};

const char* error_code_name(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::OK;
  std::string message;
  std::string component;  // store / validator / record / export.csv ...
  long long index = -1;   // 相关记录下标，-1 表示不适用
};

// 一次操作的结果：可以同时携带多个错误（校验时不短路）
class Status {
public:
  Status() = default;
  Status(ErrorCode code, std::string message, std::string component, long long index = -1);

  bool ok() const { return errors_.empty(); }
  // 第一个错误的错误码；成功时为 OK
  ErrorCode code() const { return errors_.empty() ? ErrorCode::OK : errors_.front().code; }
  bool has(ErrorCode code) const;
  const std::vector<Error>& errors() const { return errors_; }

  void add(const Error& e) { errors_.push_back(e); }
  void merge(const Status& other);

  // 给所有错误标上记录下标（加载时定位出错记录）
  Status at_index(long long index) const;

  std::string to_string() const;

private:
  std::vector<Error> errors_;
};
