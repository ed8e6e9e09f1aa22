#include "export.h"
#include "log.h"
#include "util.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out += "\"";
    return out;
}

std::string format_amount(double amount) {
    char buf[64];
    for (int prec = 1; prec <= 17; ++prec) {
        std::snprintf(buf, sizeof(buf), "%.*g", prec, amount);
        if (std::strtod(buf, nullptr) == amount) break;
    }
    std::string s(buf);
    if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
    return s;
}

std::string default_export_path(const std::string& dir, const std::string& ext) {
    std::string base = join_path(dir, "expenses_export_" + file_time_str());
    std::string path = base + "." + ext;
    for (int i = 1; file_exists(path); ++i)
        path = base + "_" + std::to_string(i) + "." + ext;
    return path;
}

Status export_csv(const std::vector<Expense>& expenses,
                  const std::string& filename,
                  const std::string& dir,
                  std::string& written) {
    const char* component = "export.csv";
    if (expenses.empty())
        return Status(ErrorCode::EXPORT_EMPTY, "没有记录可导出", component);

    std::string path = trim(filename).empty() ? default_export_path(dir, "csv") : filename;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        Status st(ErrorCode::PERSIST_ERROR,
                  "无法创建 " + path + "：" + std::strerror(errno), component);
        log_error(component, st.to_string());
        return st;
    }

    out << "date,category,amount,description\n";
    for (auto& r : expenses) {
        out << csv_escape(r.date) << ","
            << csv_escape(r.category) << ","
            << format_amount(r.amount) << ","
            << csv_escape(r.description) << "\n";
    }
    out.flush();

    if (!out.good()) {
        out.close();
        std::remove(path.c_str());
        Status st(ErrorCode::PERSIST_ERROR, "写入失败 " + path, component);
        log_error(component, st.to_string());
        return st;
    }

    written = path;
    log_info(component, "已导出 " + std::to_string(expenses.size()) + " 条记录到 " + path);
    return Status();
}
