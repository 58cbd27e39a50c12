#pragma once

#include <vector>

#include "domain/Types.h"

namespace core {

// Concatenates the chunk series in order, keeps the first bar seen for each
// timestamp, sorts ascending and drops bars outside [fromMs, toMs] (inclusive).
// The open-interest column is promoted when any surviving bar carries it.
domain::BarSeries merge_series(const std::vector<domain::BarSeries>& chunks,
                               domain::TimestampMs fromMs,
                               domain::TimestampMs toMs);

// Dedupe and sort without clipping.
domain::BarSeries normalize_series(domain::BarSeries series);

}  // namespace core
