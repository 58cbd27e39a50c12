#include "core/SeriesMerge.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace core {
namespace {

void refresh_open_interest(domain::BarSeries& series) {
    series.hasOpenInterest = std::any_of(series.bars.begin(), series.bars.end(),
                                         [](const domain::Bar& bar) { return bar.openInterest.has_value(); });
}

void dedupe_and_sort(std::vector<domain::Bar>& bars) {
    std::unordered_set<domain::TimestampMs> seen;
    seen.reserve(bars.size());
    std::vector<domain::Bar> unique;
    unique.reserve(bars.size());
    for (auto& bar : bars) {
        if (seen.insert(bar.timestamp).second) {
            unique.push_back(std::move(bar));
        }
    }
    std::sort(unique.begin(), unique.end(), [](const domain::Bar& lhs, const domain::Bar& rhs) {
        return lhs.timestamp < rhs.timestamp;
    });
    bars = std::move(unique);
}

}  // namespace

domain::BarSeries merge_series(const std::vector<domain::BarSeries>& chunks,
                               domain::TimestampMs fromMs,
                               domain::TimestampMs toMs) {
    domain::BarSeries merged;
    std::size_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.bars.size();
        if (merged.symbol.empty()) {
            merged.symbol = chunk.symbol;
        }
    }
    merged.bars.reserve(total);
    for (const auto& chunk : chunks) {
        merged.bars.insert(merged.bars.end(), chunk.bars.begin(), chunk.bars.end());
    }

    dedupe_and_sort(merged.bars);
    merged.bars.erase(std::remove_if(merged.bars.begin(), merged.bars.end(),
                                     [fromMs, toMs](const domain::Bar& bar) {
                                         return bar.timestamp < fromMs || bar.timestamp > toMs;
                                     }),
                      merged.bars.end());
    refresh_open_interest(merged);
    return merged;
}

domain::BarSeries normalize_series(domain::BarSeries series) {
    dedupe_and_sort(series.bars);
    refresh_open_interest(series);
    return series;
}

}  // namespace core
