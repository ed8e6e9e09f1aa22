#pragma once
#include "money.h"
#include "record.h"
#include <string>
#include <utility>
#include <vector>

// 分类相等（忽略大小写、忽略首尾空白）
std::vector<Expense> filter_by_category(
    const std::vector<Expense>& all,
    const std::string& category);

Money sum_amount(const std::vector<Expense>& v);

// 按分类汇总；顺序为分类第一次出现的顺序，名称取第一次出现时的写法
std::vector<std::pair<std::string, Money>>
sum_by_category(const std::vector<Expense>& v);

// 去重后的分类列表（忽略大小写），按字母序
std::vector<std::string> list_categories(const std::vector<Expense>& v);
