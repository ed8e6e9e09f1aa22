#pragma once

#include "config.h"
#include "store.h"

#include <ostream>
#include <string>
#include <vector>

// 列表显示：第一列是按当前顺序重新编号的序号（从 1 开始），不是持久 ID
void print_expenses(const std::vector<Expense>& v, std::ostream& os);
void print_summary(const ExpenseStore& store, std::ostream& os);
void print_status(const Status& st, std::ostream& os);

// 序号（从 1 开始） -> 位置（从 0 开始）
bool parse_label(const std::string& s, long long& position);

// 交互菜单的各项操作
void menu_add(ExpenseStore& store);
void menu_edit(ExpenseStore& store);
void menu_delete(ExpenseStore& store);
void menu_filter(ExpenseStore& store);
void menu_summary(ExpenseStore& store);
void menu_export_csv(ExpenseStore& store, const Config& cfg);
void menu_export_xlsx(ExpenseStore& store, const Config& cfg);
