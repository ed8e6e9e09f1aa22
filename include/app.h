#pragma once
#include "config.h"
#include "store.h"
#include <string>
#include <vector>

// 命令行外壳：只负责解析输入和显示结果，所有修改都经过 ExpenseStore 校验
class App {
public:
  explicit App(Config cfg);

  // args 为空进入交互菜单，否则执行一条命令；返回进程退出码
  int run(const std::vector<std::string>& args);

private:
  Config cfg_;
  ExpenseStore store_;

  void interactive();

  int cmd_add(const std::vector<std::string>& a);
  int cmd_list();
  int cmd_edit(const std::vector<std::string>& a);
  int cmd_delete(const std::vector<std::string>& a);
  int cmd_filter(const std::vector<std::string>& a);
  int cmd_summary();
  int cmd_categories();
  int cmd_export_csv(const std::vector<std::string>& a);
  int cmd_export_xlsx(const std::vector<std::string>& a);

  // UI 辅助
  static void print_help();
  static void press_enter();
  static std::string read_line(const std::string& prompt);
  static int report(const Status& st);
};
