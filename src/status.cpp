#include "status.h"
#include <sstream>

const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:                     return "OK";
    case ErrorCode::INVALID_AMOUNT:         return "INVALID_AMOUNT";
    case ErrorCode::INVALID_DATE:           return "INVALID_DATE";
    case ErrorCode::EMPTY_CATEGORY:         return "EMPTY_CATEGORY";
    case ErrorCode::EMPTY_DESCRIPTION:      return "EMPTY_DESCRIPTION";
    case ErrorCode::MALFORMED_RECORD:       return "MALFORMED_RECORD";
    case ErrorCode::INVALID_RECORD:         return "INVALID_RECORD";
    case ErrorCode::CORRUPT_STORE:          return "CORRUPT_STORE";
    case ErrorCode::INDEX_OUT_OF_RANGE:     return "INDEX_OUT_OF_RANGE";
    case ErrorCode::PERSIST_ERROR:          return "PERSIST_ERROR";
    case ErrorCode::EXPORT_EMPTY:           return "EXPORT_EMPTY";
    case ErrorCode::CAPABILITY_UNAVAILABLE: return "CAPABILITY_UNAVAILABLE";
    case ErrorCode::CONFIG_INVALID:         return "CONFIG_INVALID";
  }
  return "UNKNOWN";
}

Status::Status(ErrorCode code, std::string message, std::string component, long long index) {
  Error e;
  e.code = code;
  e.message = std::move(message);
  e.component = std::move(component);
  e.index = index;
  errors_.push_back(e);
}

bool Status::has(ErrorCode code) const {
  for (auto& e : errors_)
    if (e.code == code) return true;
  return false;
}

void Status::merge(const Status& other) {
  errors_.insert(errors_.end(), other.errors_.begin(), other.errors_.end());
}

Status Status::at_index(long long index) const {
  Status s = *this;
  for (auto& e : s.errors_) e.index = index;
  return s;
}

std::string Status::to_string() const {
  if (errors_.empty()) return "OK";
  std::ostringstream oss;
  for (size_t i = 0; i < errors_.size(); ++i) {
    const Error& e = errors_[i];
    if (i > 0) oss << "; ";
    oss << error_code_name(e.code);
    if (e.index >= 0) oss << "[#" << e.index << "]";
    oss << ": " << e.message;
  }
  return oss.str();
}
