#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "domain/Interval.hpp"
#include "domain/Types.h"

namespace app {

// Intraday range bounds are moved back by this much to absorb the server's
// session-boundary rounding.
constexpr domain::TimestampMs kIntradayRangeShiftMs = 30 * domain::kMillisPerMinute;

// Calendar days per chunk so that one chunk stays within the safe bar limit of
// the plan tier. Never below 1.
std::int64_t auto_chunk_days(domain::Interval interval, std::string_view planTier);

// Contiguous windows of chunkDays covering [startMs, endMs); the last one is
// truncated at endMs. Throws std::invalid_argument when startMs >= endMs or
// chunkDays < 1.
domain::ChunkPlan build_chunk_plan(domain::TimestampMs startMs, domain::TimestampMs endMs, std::int64_t chunkDays);

// "r,<start>:<end>" in epoch milliseconds.
std::string range_token(const domain::ChunkWindow& window, domain::Interval interval);

// Moves startMs forward to endMs minus the interval's maximum history depth.
// Returns startMs unchanged when the interval has no known depth limit.
domain::TimestampMs clamp_to_history_depth(domain::TimestampMs startMs,
                                           domain::TimestampMs endMs,
                                           domain::Interval interval);

}  // namespace app
