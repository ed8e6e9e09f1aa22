#include "export.h"
#include "log.h"
#include "money.h"
#include "util.h"
#include <algorithm>
#include <cstdio>

#ifdef EXPENSE_TRACKER_HAVE_XLSXWRITER
#include <xlsxwriter.h>
#endif

static const char* kComponent = "export.xlsx";

bool spreadsheet_export_available() {
#ifdef EXPENSE_TRACKER_HAVE_XLSXWRITER
  return true;
#else
  return false;
#endif
}

SheetLayout spreadsheet_layout(const std::vector<Expense>& expenses) {
  SheetLayout l;
  l.sheet_name = "Expenses";
  l.headers = {"Date", "Category", "Amount", "Description"};
  l.total_label = "Total:";

  std::vector<size_t> width;
  for (auto& h : l.headers) width.push_back(display_length(h));

  for (auto& e : expenses) {
    width[0] = std::max(width[0], display_length(e.date));
    width[1] = std::max(width[1], display_length(e.category));
    width[2] = std::max(width[2], display_length(format_amount(e.amount)));
    width[3] = std::max(width[3], display_length(e.description));
    l.total += Money::from_amount(e.amount);
  }

  // 表头占第 0 行，数据是 1..n，空一行后是合计
  l.total_row = expenses.size() + 2;
  width[l.total_label_col] = std::max(width[l.total_label_col], display_length(l.total_label));
  width[l.total_value_col] = std::max(width[l.total_value_col], display_length(l.total.to_string()));

  for (size_t w : width) l.column_widths.push_back((double)std::min(w, kMaxColumnWidth));
  return l;
}

#ifdef EXPENSE_TRACKER_HAVE_XLSXWRITER

static Status write_workbook(const std::vector<Expense>& expenses, const std::string& path) {
  SheetLayout layout = spreadsheet_layout(expenses);

  lxw_workbook* wb = workbook_new(path.c_str());
  if (!wb) return Status(ErrorCode::PERSIST_ERROR, "无法创建工作簿 " + path, kComponent);

  lxw_worksheet* ws = workbook_add_worksheet(wb, layout.sheet_name.c_str());

  lxw_format* header = workbook_add_format(wb);
  format_set_bold(header);
  format_set_pattern(header, LXW_PATTERN_SOLID);
  format_set_bg_color(header, 0xD9E1F2);
  format_set_align(header, LXW_ALIGN_CENTER);

  lxw_format* bold = workbook_add_format(wb);
  format_set_bold(bold);

  // 记录第一个写入错误，但仍然要 workbook_close 释放资源
  lxw_error first_err = LXW_NO_ERROR;
  auto keep = [&](lxw_error e) {
    if (first_err == LXW_NO_ERROR) first_err = e;
  };

  for (size_t c = 0; c < layout.headers.size(); ++c)
    keep(worksheet_write_string(ws, 0, (lxw_col_t)c, layout.headers[c].c_str(), header));

  lxw_row_t row = 1;
  for (auto& e : expenses) {
    keep(worksheet_write_string(ws, row, 0, e.date.c_str(), NULL));
    keep(worksheet_write_string(ws, row, 1, e.category.c_str(), NULL));
    keep(worksheet_write_number(ws, row, 2, e.amount, NULL));
    keep(worksheet_write_string(ws, row, 3, e.description.c_str(), NULL));
    ++row;
  }

  lxw_row_t total_row = (lxw_row_t)layout.total_row;
  keep(worksheet_write_string(ws, total_row, (lxw_col_t)layout.total_label_col,
                              layout.total_label.c_str(), bold));
  keep(worksheet_write_number(ws, total_row, (lxw_col_t)layout.total_value_col,
                              layout.total.to_double(), bold));

  for (size_t c = 0; c < layout.column_widths.size(); ++c)
    keep(worksheet_set_column(ws, (lxw_col_t)c, (lxw_col_t)c, layout.column_widths[c], NULL));

  lxw_error close_err = workbook_close(wb);
  if (first_err == LXW_NO_ERROR) first_err = close_err;

  if (first_err != LXW_NO_ERROR) {
    std::remove(path.c_str());
    return Status(ErrorCode::PERSIST_ERROR,
                  "写入失败 " + path + "：" + lxw_strerror(first_err), kComponent);
  }
  return Status();
}

#endif

Status export_xlsx(const std::vector<Expense>& expenses,
                   const std::string& filename,
                   const std::string& dir,
                   std::string& written) {
#ifndef EXPENSE_TRACKER_HAVE_XLSXWRITER
  (void)expenses;
  (void)filename;
  (void)dir;
  (void)written;
  Status st(ErrorCode::CAPABILITY_UNAVAILABLE,
            "当前构建未启用 xlsx 导出（缺少 libxlsxwriter）", kComponent);
  log_warn(kComponent, st.to_string());
  return st;
#else
  if (expenses.empty())
    return Status(ErrorCode::EXPORT_EMPTY, "没有记录可导出", kComponent);

  std::string path = trim(filename).empty() ? default_export_path(dir, "xlsx") : filename;

  Status st = write_workbook(expenses, path);
  if (!st.ok()) {
    log_error(kComponent, st.to_string());
    return st;
  }

  written = path;
  log_info(kComponent, "已导出 " + std::to_string(expenses.size()) + " 条记录到 " + path);
  return st;
#endif
}
