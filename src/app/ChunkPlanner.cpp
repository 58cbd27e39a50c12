#include "app/ChunkPlanner.hpp"

#include <algorithm>
#include <stdexcept>

#include "domain/AccountPlan.hpp"

namespace app {

std::int64_t auto_chunk_days(domain::Interval interval, std::string_view planTier) {
    const std::int64_t safeBars = domain::safe_bar_limit(planTier);
    return std::max<std::int64_t>(1, safeBars * domain::interval_seconds(interval) / 86'400);
}

domain::ChunkPlan build_chunk_plan(domain::TimestampMs startMs, domain::TimestampMs endMs, std::int64_t chunkDays) {
    if (startMs >= endMs) {
        throw std::invalid_argument("start must be before end");
    }
    if (chunkDays < 1) {
        throw std::invalid_argument("chunk_days must be >= 1");
    }

    // A chunk longer than the whole range is the whole range.
    const domain::TimestampMs span = endMs - startMs;
    const domain::TimestampMs step =
        chunkDays > span / domain::kMillisPerDay ? span : chunkDays * domain::kMillisPerDay;
    domain::ChunkPlan plan;
    plan.reserve(static_cast<std::size_t>(span / step + (span % step != 0 ? 1 : 0)));
    for (domain::TimestampMs cursor = startMs; cursor < endMs;) {
        const domain::TimestampMs next = endMs - cursor <= step ? endMs : cursor + step;
        plan.push_back(domain::ChunkWindow{cursor, next});
        cursor = next;
    }
    return plan;
}

std::string range_token(const domain::ChunkWindow& window, domain::Interval interval) {
    domain::TimestampMs start = window.startMs;
    domain::TimestampMs end = window.endMs;
    if (domain::is_intraday(interval)) {
        start -= kIntradayRangeShiftMs;
        end -= kIntradayRangeShiftMs;
    }
    return "r," + std::to_string(start) + ":" + std::to_string(end);
}

domain::TimestampMs clamp_to_history_depth(domain::TimestampMs startMs,
                                           domain::TimestampMs endMs,
                                           domain::Interval interval) {
    const auto depthDays = domain::interval_max_depth_days(interval);
    if (!depthDays) {
        return startMs;
    }
    const domain::TimestampMs earliest = endMs - static_cast<domain::TimestampMs>(*depthDays) * domain::kMillisPerDay;
    return std::max(startMs, earliest);
}

}  // namespace app
