#pragma once
#include "money.h"
#include <ostream>
#include <string>
#include <utility>
#include <vector>

// 横向条形图：按金额从大到小，topN <= 0 表示全部
void draw_bar_chart(
    const std::vector<std::pair<std::string, Money>>& v,
    std::ostream& os,
    int width = 40,
    int topN = -1);
