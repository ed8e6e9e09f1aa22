#include "store.h"
#include "log.h"
#include "query.h"
#include "util.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unistd.h>

static const char* kComponent = "store";

ExpenseStore::ExpenseStore(std::string path, ValidationRules rules)
    : path_(std::move(path)), rules_(rules) {}

void ExpenseStore::warn(const std::string& msg) {
  warnings_.push_back(msg);
  log_warn(kComponent, msg);
}

Status ExpenseStore::load() {
  warnings_.clear();

  if (!file_exists(path_)) {
    expenses_.clear();
    log_info(kComponent, "数据文件不存在，从空账本开始：" + path_);
    return Status();
  }

  std::string content;
  if (!read_file(path_, content)) {
    Status st(ErrorCode::PERSIST_ERROR,
              "无法读取数据文件 " + path_ + "：" + std::strerror(errno), kComponent);
    log_error(kComponent, st.to_string());
    return st;
  }

  if (trim(content).empty()) {
    expenses_.clear();
    warn("数据文件为空，按空账本处理：" + path_);
    return Status();
  }

  std::vector<Expense> loaded;
  Status st = decode_expenses(content, loaded);
  if (!st.ok()) {
    log_error(kComponent, "加载失败 " + path_ + "：" + st.to_string());
    return st;
  }

  // 全有或全无：任何一条记录不合法就整体拒绝
  for (size_t i = 0; i < loaded.size(); ++i) {
    Expense norm;
    Status v = validate_expense(loaded[i], rules_, norm);
    if (!v.ok()) {
      Status bad(ErrorCode::INVALID_RECORD,
                 "第 " + std::to_string(i) + " 条记录无效：" + v.to_string(),
                 kComponent, (long long)i);
      log_error(kComponent, "加载失败 " + path_ + "：" + bad.to_string());
      return bad;
    }
    loaded[i] = norm;
  }

  expenses_.swap(loaded);
  log_info(kComponent, "已加载 " + std::to_string(expenses_.size()) + " 条记录：" + path_);
  return Status();
}

void ExpenseStore::backup_existing() {
  if (!file_exists(path_)) return;
  if (!copy_file(path_, backup_file()))
    warn("备份失败（继续保存）：" + backup_file());
}

Status ExpenseStore::write_file(const std::vector<Expense>& v) {
  std::string json;
  Status st = encode_expenses(v, json);
  if (!st.ok()) return st;
  json += "\n";

  // 1) 旧文件 -> .backup
  backup_existing();

  // 2) 写临时文件，flush + fsync 后再 rename，保证崩溃时不会留下半个文件
  const std::string tmp = path_ + ".tmp";
  auto fail = [&](const std::string& what, int err) {
    std::remove(tmp.c_str());
    Status s(ErrorCode::PERSIST_ERROR, what + "：" + std::strerror(err), kComponent);
    log_error(kComponent, s.to_string());
    return s;
  };

  std::FILE* f = std::fopen(tmp.c_str(), "wb");
  if (!f) return fail("无法创建 " + tmp, errno);

  if (std::fwrite(json.data(), 1, json.size(), f) != json.size()) {
    int err = errno;
    std::fclose(f);
    return fail("写入失败 " + tmp, err);
  }
  if (std::fflush(f) != 0 || ::fsync(::fileno(f)) != 0) {
    int err = errno;
    std::fclose(f);
    return fail("刷盘失败 " + tmp, err);
  }
  if (std::fclose(f) != 0) return fail("关闭失败 " + tmp, errno);

  if (std::rename(tmp.c_str(), path_.c_str()) != 0)
    return fail("无法替换 " + path_, errno);

  log_debug(kComponent, "已保存 " + std::to_string(v.size()) + " 条记录：" + path_);
  return Status();
}

Status ExpenseStore::save() {
  warnings_.clear();
  return write_file(expenses_);
}

Status ExpenseStore::check_position(long long position) const {
  if (position < 0 || position >= (long long)expenses_.size()) {
    return Status(ErrorCode::INDEX_OUT_OF_RANGE,
                  "位置 " + std::to_string(position) + " 超出范围 [0, " +
                      std::to_string(expenses_.size()) + ")",
                  kComponent, position);
  }
  return Status();
}

Status ExpenseStore::prepare(const ExpenseFields& fields, Expense& out) const {
  ExpenseFields f = fields;
  if (trim(f.date).empty()) f.date = today_date();
  return validate_record(f, rules_, out);
}

Status ExpenseStore::add(const ExpenseFields& fields, Expense& created) {
  warnings_.clear();
  Expense e;
  Status st = prepare(fields, e);
  if (!st.ok()) {
    log_info(kComponent, "拒绝添加：" + st.to_string());
    return st;
  }

  std::vector<Expense> next = expenses_;
  next.push_back(e);
  st = write_file(next);
  if (!st.ok()) return st;

  expenses_.swap(next);
  created = e;
  log_info(kComponent, "已添加：" + e.date + " " + e.category + " " +
                           Money::from_amount(e.amount).to_string());
  return st;
}

Status ExpenseStore::edit(long long position, const ExpenseFields& fields, Expense& updated) {
  warnings_.clear();
  Status st = check_position(position);
  if (!st.ok()) return st;

  Expense e;
  st = prepare(fields, e);
  if (!st.ok()) {
    log_info(kComponent, "拒绝修改：" + st.to_string());
    return st;
  }

  std::vector<Expense> next = expenses_;
  next[(size_t)position] = e;
  st = write_file(next);
  if (!st.ok()) return st;

  expenses_.swap(next);
  updated = e;
  log_info(kComponent, "已修改位置 " + std::to_string(position));
  return st;
}

Status ExpenseStore::remove(long long position) {
  warnings_.clear();
  Status st = check_position(position);
  if (!st.ok()) return st;

  std::vector<Expense> next = expenses_;
  next.erase(next.begin() + position);
  st = write_file(next);
  if (!st.ok()) return st;

  expenses_.swap(next);
  log_info(kComponent, "已删除位置 " + std::to_string(position));
  return st;
}

std::vector<Expense> ExpenseStore::filter_by_category(const std::string& category) const {
  return ::filter_by_category(expenses_, category);
}

std::vector<std::pair<std::string, Money>> ExpenseStore::summary_by_category() const {
  return sum_by_category(expenses_);
}

Money ExpenseStore::total() const { return sum_amount(expenses_); }

std::vector<std::string> ExpenseStore::categories() const {
  return list_categories(expenses_);
}
