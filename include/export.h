#pragma once
#include "money.h"
#include "record.h"
#include "status.h"
#include <string>
#include <vector>

// 两个导出器都只读取传入的快照，不修改仓库。
// filename 为空时在 dir 下生成带时间戳的文件名；written 返回实际写入的路径。
// 空集合 -> EXPORT_EMPTY（不创建文件）；I/O 失败 -> PERSIST_ERROR。

// CSV：表头 date,category,amount,description，按集合顺序逐行写出
Status export_csv(const std::vector<Expense>& expenses,
                  const std::string& filename,
                  const std::string& dir,
                  std::string& written);

// xlsx：单个工作表 "Expenses"，带样式表头和合计行。
// 构建时未找到 libxlsxwriter 则返回 CAPABILITY_UNAVAILABLE。
bool spreadsheet_export_available();
Status export_xlsx(const std::vector<Expense>& expenses,
                   const std::string& filename,
                   const std::string& dir,
                   std::string& written);

// xlsx 版面：不依赖 libxlsxwriter，由 write_workbook 照此写出
struct SheetLayout {
  std::string sheet_name;                // "Expenses"
  std::vector<std::string> headers;      // Date, Category, Amount, Description
  std::vector<double> column_widths;     // 每列最长内容（按码点），最多 kMaxColumnWidth
  size_t total_row = 0;                  // 从 0 数：最后一行数据下方两行
  int total_label_col = 1;               // "Total:" 写在 Category 列
  int total_value_col = 2;               // 合计写在 Amount 列
  std::string total_label;
  Money total;
};

const size_t kMaxColumnWidth = 50;

SheetLayout spreadsheet_layout(const std::vector<Expense>& expenses);

// 含逗号、双引号、换行的字段加引号，内部双引号写成两个
std::string csv_escape(const std::string& field);

// 能精确还原的最短十进制写法，整数补 ".0"（25.5 -> "25.5"，15 -> "15.0"）
std::string format_amount(double amount);

// expenses_export_YYYYMMDD_HHMMSS.<ext>，同名已存在时追加 _1、_2 ...
std::string default_export_path(const std::string& dir, const std::string& ext);
