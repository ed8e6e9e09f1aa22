#include "app.h"
#include "export.h"
#include "menu.h"
#include "util.h"

#include <iostream>
#include <utility>

// ================= 构造 =================

App::App(Config cfg)
    : cfg_(std::move(cfg)),
      store_(cfg_.data_file, ValidationRules{cfg_.require_description}) {}

// ================= UI 辅助 =================

void App::press_enter() {
    std::cout << "按回车继续...";
    std::cout.flush();
    std::string tmp;
    std::getline(std::cin, tmp);
}

std::string App::read_line(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();
    std::string s;
    std::getline(std::cin, s);
    return s;
}

int App::report(const Status& st) {
    if (st.ok()) return 0;
    print_status(st, std::cerr);
    return 1;
}

void App::print_help() {
    std::cout << "用法：\n"
              << "  expense_tracker [-c 配置文件]                       交互模式\n"
              << "  expense_tracker add <金额> <分类> [描述] [日期]\n"
              << "  expense_tracker list\n"
              << "  expense_tracker edit <序号> <日期> <分类> <金额> <描述>\n"
              << "  expense_tracker delete <序号>\n"
              << "  expense_tracker filter <分类>\n"
              << "  expense_tracker summary\n"
              << "  expense_tracker categories\n"
              << "  expense_tracker export [文件名]                     导出 CSV\n"
              << "  expense_tracker export-xlsx [文件名]                导出 xlsx\n"
              << "  expense_tracker help\n";
}

// ================= 单条命令 =================

int App::cmd_add(const std::vector<std::string>& a) {
    if (a.size() < 3) {
        print_help();
        return 1;
    }
    ExpenseFields f;
    f.amount = a[1];
    f.category = a[2];
    if (a.size() > 3) f.description = a[3];
    if (a.size() > 4) f.date = a[4];

    Expense created;
    Status st = store_.add(f, created);
    if (!st.ok()) return report(st);
    std::cout << "✅ 已添加：" << created.date << " " << created.category << " "
              << Money::from_amount(created.amount).to_string() << "\n";
    return 0;
}

int App::cmd_list() {
    print_expenses(store_.expenses(), std::cout);
    return 0;
}

int App::cmd_edit(const std::vector<std::string>& a) {
    long long pos = -1;
    if (a.size() < 6 || !parse_label(a[1], pos)) {
        print_help();
        return 1;
    }
    ExpenseFields f;
    f.date = a[2];
    f.category = a[3];
    f.amount = a[4];
    f.description = a[5];

    Expense updated;
    Status st = store_.edit(pos, f, updated);
    if (!st.ok()) return report(st);
    std::cout << "✅ 已更新 #" << pos + 1 << "\n";
    return 0;
}

int App::cmd_delete(const std::vector<std::string>& a) {
    long long pos = -1;
    if (a.size() < 2 || !parse_label(a[1], pos)) {
        print_help();
        return 1;
    }
    Status st = store_.remove(pos);
    if (!st.ok()) return report(st);
    std::cout << "✅ 已删除 #" << pos + 1 << "\n";
    return 0;
}

int App::cmd_filter(const std::vector<std::string>& a) {
    if (a.size() < 2) {
        print_help();
        return 1;
    }
    print_expenses(store_.filter_by_category(a[1]), std::cout);
    return 0;
}

int App::cmd_summary() {
    print_summary(store_, std::cout);
    return 0;
}

int App::cmd_categories() {
    auto v = store_.categories();
    if (v.empty()) std::cout << "（无分类）\n";
    for (auto& c : v) std::cout << c << "\n";
    return 0;
}

int App::cmd_export_csv(const std::vector<std::string>& a) {
    std::string written;
    Status st = export_csv(store_.expenses(), a.size() > 1 ? a[1] : "", cfg_.export_dir, written);
    if (!st.ok()) return report(st);
    std::cout << "✅ 已导出到 " << written << "\n";
    return 0;
}

int App::cmd_export_xlsx(const std::vector<std::string>& a) {
    std::string written;
    Status st = export_xlsx(store_.expenses(), a.size() > 1 ? a[1] : "", cfg_.export_dir, written);
    if (!st.ok()) return report(st);
    std::cout << "✅ 已导出到 " << written << "\n";
    return 0;
}

// ================= 入口 =================

int App::run(const std::vector<std::string>& args) {
    if (!args.empty() && (args[0] == "help" || args[0] == "--help")) {
        print_help();
        return 0;
    }

    // 数据文件损坏时不自动重建，交给用户处理
    Status st = store_.load();
    if (!st.ok()) {
        std::cerr << "❌ 无法加载数据文件 " << store_.path() << "\n";
        print_status(st, std::cerr);
        std::cerr << "请修复或移走该文件后重试（上次保存前的内容在 "
                  << store_.backup_file() << "）\n";
        return 1;
    }

    if (args.empty()) {
        interactive();
        return 0;
    }

    const std::string& c = args[0];
    if (c == "add")         return cmd_add(args);
    if (c == "list")        return cmd_list();
    if (c == "edit")        return cmd_edit(args);
    if (c == "delete")      return cmd_delete(args);
    if (c == "filter")      return cmd_filter(args);
    if (c == "summary")     return cmd_summary();
    if (c == "categories")  return cmd_categories();
    if (c == "export")      return cmd_export_csv(args);
    if (c == "export-xlsx") return cmd_export_xlsx(args);

    std::cerr << "❌ 未知命令：" << c << "\n";
    print_help();
    return 1;
}

// ================= 主循环 =================

void App::interactive() {
    while (true) {
        std::cout << "\n========== 💳 支出记录 ==========\n";
        std::cout << "数据文件: " << store_.path() << "（" << store_.size() << " 条）\n";
        std::cout << "--------------------------------\n";
        std::cout << "1) 添加\n";
        std::cout << "2) 列表\n";
        std::cout << "3) 编辑(按序号)\n";
        std::cout << "4) 删除(按序号)\n";
        std::cout << "5) 按分类筛选\n";
        std::cout << "6) 分类汇总\n";
        std::cout << "7) 导出 CSV\n";
        if (spreadsheet_export_available())
            std::cout << "8) 导出 xlsx\n";
        std::cout << "0) 退出\n";

        std::string c = trim(read_line("请选择："));
        if (!std::cin) {
            std::cout << "\n";
            return;
        }

        if (c == "0") {
            std::cout << "再见！\n";
            return;
        }

        if (c == "1") { menu_add(store_);                 press_enter(); continue; }
        if (c == "2") { print_expenses(store_.expenses(), std::cout); press_enter(); continue; }
        if (c == "3") { menu_edit(store_);                press_enter(); continue; }
        if (c == "4") { menu_delete(store_);              press_enter(); continue; }
        if (c == "5") { menu_filter(store_);              press_enter(); continue; }
        if (c == "6") { menu_summary(store_);             press_enter(); continue; }
        if (c == "7") { menu_export_csv(store_, cfg_);    press_enter(); continue; }
        if (c == "8" && spreadsheet_export_available()) {
            menu_export_xlsx(store_, cfg_);
            press_enter();
            continue;
        }

        std::cout << "❌ 无效选择\n";
        press_enter();
    }
}
