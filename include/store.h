#pragma once
#include "money.h"
#include "record.h"
#include "status.h"
#include "validator.h"
#include <string>
#include <utility>
#include <vector>

// 支出记录仓库：内存中的有序集合 + 一个 JSON 数据文件
//
// 每个修改操作都先校验、再落盘；落盘成功后才替换内存状态，
// 所以失败时内存集合保持原样，磁盘文件保持上一次成功保存的内容。
class ExpenseStore {
public:
  explicit ExpenseStore(std::string path, ValidationRules rules = ValidationRules());

  const std::string& path() const { return path_; }
  std::string backup_file() const { return path_ + ".backup"; }

  // 文件不存在 -> 空集合；文件为空白 -> 空集合 + 警告；
  // 解析失败或任何一条记录无效 -> 整体失败，不会丢弃部分数据
  Status load();

  // 先把旧文件复制到 .backup（失败只记警告），再写临时文件并 rename 覆盖
  Status save();

  // 基本 CRUD（position 从 0 开始）
  Status add(const ExpenseFields& fields, Expense& created);
  Status edit(long long position, const ExpenseFields& fields, Expense& updated);
  Status remove(long long position);

  const std::vector<Expense>& expenses() const { return expenses_; }
  size_t size() const { return expenses_.size(); }
  bool empty() const { return expenses_.empty(); }

  // 查询（不修改集合）
  std::vector<Expense> filter_by_category(const std::string& category) const;
  std::vector<std::pair<std::string, Money>> summary_by_category() const;
  Money total() const;
  std::vector<std::string> categories() const;

  // 最近一次 load/save 产生的警告
  const std::vector<std::string>& warnings() const { return warnings_; }

private:
  std::string path_;
  ValidationRules rules_;
  std::vector<Expense> expenses_;
  std::vector<std::string> warnings_;

  Status check_position(long long position) const;
  Status prepare(const ExpenseFields& fields, Expense& out) const;

  // 把 v 写入数据文件；成功后再由调用方替换内存
  Status write_file(const std::vector<Expense>& v);
  void backup_existing();
  void warn(const std::string& msg);
};
