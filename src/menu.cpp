#include "menu.h"

#include "chart.h"
#include "export.h"
#include "query.h"
#include "util.h"

#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <iostream>

// ================= 私有工具函数（仅 menu.cpp 可见） =================

static std::string read_line_local(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();
    std::string s;
    std::getline(std::cin, s);
    return s;
}

static bool confirm(const std::string& prompt) {
    std::string ans = trim(read_line_local(prompt));
    return !ans.empty() && (ans[0] == 'y' || ans[0] == 'Y');
}

static void print_one(long long label, const Expense& r, std::ostream& os) {
    os << std::setw(3) << label << ") "
       << r.date << " | "
       << r.category << " | "
       << Money::from_amount(r.amount).to_string() << " | "
       << r.description << "\n";
}

// ================= 显示 =================

void print_expenses(const std::vector<Expense>& v, std::ostream& os) {
    if (v.empty()) {
        os << "（无记录）\n";
        return;
    }
    long long label = 1;
    for (auto& r : v) print_one(label++, r, os);
    os << "合计：" << sum_amount(v).to_string() << "\n";
}

void print_summary(const ExpenseStore& store, std::ostream& os) {
    auto sums = store.summary_by_category();
    if (sums.empty()) {
        os << "（无数据）\n";
        return;
    }
    for (auto& kv : sums) {
        size_t n = store.filter_by_category(kv.first).size();
        os << kv.first << "：" << kv.second.to_string() << "（" << n << " 笔）\n";
    }
    os << "总计：" << store.total().to_string() << "\n\n";
    draw_bar_chart(sums, os, 40, -1);
}

void print_status(const Status& st, std::ostream& os) {
    if (st.ok()) return;
    for (auto& e : st.errors()) {
        os << "❌ ";
        if (e.index >= 0) os << "[#" << e.index << "] ";
        os << e.message << "\n";
    }
}

bool parse_label(const std::string& s, long long& position) {
    std::string t = trim(s);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if (end != t.c_str() + t.size() || errno == ERANGE) return false;
    // 序号从 1 开始
    if (v < 1) return false;
    position = v - 1;
    return true;
}

// ================= 添加 =================

void menu_add(ExpenseStore& store) {
    ExpenseFields f;
    f.date = trim(read_line_local("日期(回车=今天；YYYY-MM-DD)："));
    f.category = trim(read_line_local("分类："));
    f.amount = trim(read_line_local("金额："));
    f.description = trim(read_line_local("描述："));

    Expense created;
    Status st = store.add(f, created);
    if (!st.ok()) {
        print_status(st, std::cout);
        return;
    }
    std::cout << "✅ 已添加 #" << store.size() << "\n";
}

// ================= 编辑（回车=保留原值） =================

void menu_edit(ExpenseStore& store) {
    long long pos = -1;
    if (!parse_label(read_line_local("要编辑的序号："), pos)) {
        std::cout << "❌ 请输入合法整数\n";
        return;
    }
    if (pos < 0 || pos >= (long long)store.size()) {
        std::cout << "❌ 未找到该序号\n";
        return;
    }

    const Expense cur = store.expenses()[(size_t)pos];
    std::cout << "当前：";
    print_one(pos + 1, cur, std::cout);

    // 部分修改在这里补全，仓库只接收完整的新记录
    ExpenseFields f;
    f.date = trim(read_line_local("新日期(回车=不改)："));
    f.category = trim(read_line_local("新分类(回车=不改)："));
    f.amount = trim(read_line_local("新金额(回车=不改)："));
    f.description = trim(read_line_local("新描述(回车=不改)："));
    if (f.date.empty()) f.date = cur.date;
    if (f.category.empty()) f.category = cur.category;
    if (f.amount.empty()) f.amount = format_amount(cur.amount);
    if (f.description.empty()) f.description = cur.description;

    Expense updated;
    Status st = store.edit(pos, f, updated);
    if (!st.ok()) print_status(st, std::cout);
    else std::cout << "✅ 已更新\n";
}

// ================= 删除 =================

void menu_delete(ExpenseStore& store) {
    long long pos = -1;
    if (!parse_label(read_line_local("要删除的序号："), pos)) {
        std::cout << "❌ 请输入合法整数\n";
        return;
    }
    if (pos < 0 || pos >= (long long)store.size()) {
        std::cout << "❌ 未找到该序号\n";
        return;
    }

    std::cout << "将删除：";
    print_one(pos + 1, store.expenses()[(size_t)pos], std::cout);
    if (!confirm("确认删除？(y/N)：")) {
        std::cout << "已取消\n";
        return;
    }

    Status st = store.remove(pos);
    if (!st.ok()) print_status(st, std::cout);
    else std::cout << "✅ 已删除（序号已重新编排）\n";
}

// ================= 按分类筛选 / 汇总 =================

void menu_filter(ExpenseStore& store) {
    std::string c = trim(read_line_local("分类："));
    if (c.empty()) {
        std::cout << "❌ 分类不能为空\n";
        return;
    }
    print_expenses(store.filter_by_category(c), std::cout);
}

void menu_summary(ExpenseStore& store) {
    std::cout << "\n📊 分类汇总\n";
    print_summary(store, std::cout);
}

// ================= 导出 =================

void menu_export_csv(ExpenseStore& store, const Config& cfg) {
    if (store.empty()) {
        std::cout << "（无记录可导出）\n";
        return;
    }
    std::string name = trim(read_line_local("CSV 文件名(回车=自动生成)："));
    std::string written;
    Status st = export_csv(store.expenses(), name, cfg.export_dir, written);
    if (!st.ok()) print_status(st, std::cout);
    else std::cout << "✅ 已导出到 " << written << "\n";
}

void menu_export_xlsx(ExpenseStore& store, const Config& cfg) {
    if (!spreadsheet_export_available()) {
        std::cout << "❌ 当前构建不支持 xlsx 导出\n";
        return;
    }
    if (store.empty()) {
        std::cout << "（无记录可导出）\n";
        return;
    }
    std::string name = trim(read_line_local("xlsx 文件名(回车=自动生成)："));
    std::string written;
    Status st = export_xlsx(store.expenses(), name, cfg.export_dir, written);
    if (!st.ok()) print_status(st, std::cout);
    else std::cout << "✅ 已导出到 " << written << "\n";
}
