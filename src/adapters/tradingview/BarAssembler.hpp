#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/json/value.hpp>

#include "domain/Types.h"

namespace adapters::tradingview {

// Extracts bars from "timescale_update" and "du" packets. The result keeps packet order
// (unsorted, duplicates included); an empty series means no bar was found at all.
domain::BarSeries assemble_bars(const std::vector<boost::json::value>& packets, const std::string& symbol);

// Maps one "v" tuple (ts, o, h, l, c[, volume[, oi]]) to a bar; std::nullopt when malformed.
std::optional<domain::Bar> bar_from_tuple(const boost::json::value& tuple);

}  // namespace adapters::tradingview
