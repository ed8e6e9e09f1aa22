#include "query.h"
#include "util.h"
#include <algorithm>
#include <unordered_map>

std::vector<Expense> filter_by_category(
    const std::vector<Expense>& all,
    const std::string& category) {

    std::string key = trim(category);
    std::vector<Expense> r;
    for (auto& x : all)
        if (iequals(x.category, key)) r.push_back(x);
    return r;
}

Money sum_amount(const std::vector<Expense>& v) {
    Money s;
    for (auto& x : v) s += Money::from_amount(x.amount);
    return s;
}

std::vector<std::pair<std::string, Money>>
sum_by_category(const std::vector<Expense>& v) {
    std::vector<std::pair<std::string, Money>> out;
    std::unordered_map<std::string, size_t> slot;
    for (auto& x : v) {
        std::string key = to_lower(x.category);
        auto it = slot.find(key);
        if (it == slot.end()) {
            slot[key] = out.size();
            out.emplace_back(x.category, Money::from_amount(x.amount));
        } else {
            out[it->second].second += Money::from_amount(x.amount);
        }
    }
    return out;
}

std::vector<std::string> list_categories(const std::vector<Expense>& v) {
    std::vector<std::string> r;
    for (auto& kv : sum_by_category(v)) r.push_back(kv.first);
    std::sort(r.begin(), r.end(), [](const std::string& a, const std::string& b) {
        std::string la = to_lower(a), lb = to_lower(b);
        if (la != lb) return la < lb;
        return a < b;
    });
    return r;
}
