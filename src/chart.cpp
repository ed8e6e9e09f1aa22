#include "chart.h"
#include "util.h"
#include <algorithm>

void draw_bar_chart(
    const std::vector<std::pair<std::string, Money>>& m,
    std::ostream& os,
    int width,
    int topN) {

    if (m.empty()) {
        os << "（无数据）\n";
        return;
    }

    std::vector<std::pair<std::string, Money>> v(m.begin(), m.end());
    std::stable_sort(v.begin(), v.end(),
                     [](const auto& a, const auto& b){ return b.second < a.second; });

    if (topN > 0 && (int)v.size() > topN)
        v.resize(topN);

    double maxv = v.front().second.to_double();
    if (maxv <= 0) maxv = 1;

    for (auto& kv : v) {
        int bar = (int)(kv.second.to_double() / maxv * width);
        os << kv.first;
        for (size_t i = display_length(kv.first); i < 14; ++i) os << ' ';
        os << " | ";
        for (int i = 0; i < bar; ++i) os << "█";
        os << " " << kv.second.to_string() << "\n";
    }
}
