#include "record.h"
#include <google/protobuf/util/json_util.h>
#include <utility>

namespace pb = google::protobuf;

bool operator==(const Expense& a, const Expense& b) {
  return a.date == b.date && a.category == b.category &&
         a.amount == b.amount && a.description == b.description;
}

bool operator!=(const Expense& a, const Expense& b) { return !(a == b); }

pb::Struct to_mapping(const Expense& e) {
  pb::Struct m;
  auto& fields = *m.mutable_fields();
  fields["date"].set_string_value(e.date);
  fields["category"].set_string_value(e.category);
  fields["amount"].set_number_value(e.amount);
  fields["description"].set_string_value(e.description);
  return m;
}

// 取一个必填字段，并检查 JSON 基本类型
static const pb::Value* require_field(const pb::Struct& m, const std::string& key,
                                      pb::Value::KindCase kind, const char* kind_name,
                                      Status& st) {
  auto it = m.fields().find(key);
  if (it == m.fields().end()) {
    st.add(Error{ErrorCode::MALFORMED_RECORD, "缺少字段 " + key, "record"});
    return nullptr;
  }
  if (it->second.kind_case() != kind) {
    st.add(Error{ErrorCode::MALFORMED_RECORD,
                 "字段 " + key + " 应为" + kind_name, "record"});
    return nullptr;
  }
  return &it->second;
}

Status from_mapping(const pb::Struct& m, Expense& out) {
  Status st;
  const pb::Value* d = require_field(m, "date", pb::Value::kStringValue, "字符串", st);
  const pb::Value* c = require_field(m, "category", pb::Value::kStringValue, "字符串", st);
  const pb::Value* a = require_field(m, "amount", pb::Value::kNumberValue, "数字", st);
  const pb::Value* n = require_field(m, "description", pb::Value::kStringValue, "字符串", st);
  if (!st.ok()) return st;

  out.date = d->string_value();
  out.category = c->string_value();
  out.amount = a->number_value();
  out.description = n->string_value();
  return st;
}

Status encode_expenses(const std::vector<Expense>& v, std::string& json) {
  pb::Value root;
  pb::ListValue* list = root.mutable_list_value();
  for (auto& e : v) *list->add_values()->mutable_struct_value() = to_mapping(e);

  pb::util::JsonPrintOptions opt;
  opt.add_whitespace = true;

  std::string out;
  auto st = pb::util::MessageToJsonString(root, &out, opt);
  if (!st.ok())
    return Status(ErrorCode::PERSIST_ERROR, "序列化失败：" + st.ToString(), "record");
  json = std::move(out);
  return Status();
}

Status decode_expenses(const std::string& json, std::vector<Expense>& out) {
  pb::Value root;
  auto st = pb::util::JsonStringToMessage(json, &root);
  if (!st.ok())
    return Status(ErrorCode::CORRUPT_STORE, "JSON 解析失败：" + st.ToString(), "record");
  if (root.kind_case() != pb::Value::kListValue)
    return Status(ErrorCode::CORRUPT_STORE, "顶层必须是记录数组", "record");

  std::vector<Expense> v;
  const auto& items = root.list_value().values();
  v.reserve(items.size());
  for (int i = 0; i < items.size(); ++i) {
    const pb::Value& item = items.Get(i);
    if (item.kind_case() != pb::Value::kStructValue)
      return Status(ErrorCode::MALFORMED_RECORD, "记录不是对象", "record", i);

    Expense e;
    Status s = from_mapping(item.struct_value(), e);
    if (!s.ok()) return s.at_index(i);
    v.push_back(e);
  }

  out = std::move(v);
  return Status();
}
