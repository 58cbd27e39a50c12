#pragma once

#include <vector>

#include <boost/json/value.hpp>

#include "domain/Types.h"

namespace adapters::tradingview {

// Folds "symbol_resolved" and "qsd" packets into one metadata record. Quote fields
// overwrite resolved ones; values that are neither scalars nor string lists are ignored.
// tick_size (minmov / pricescale) and point_value are derived when the inputs exist.
domain::SecurityInfo assemble_quote(const std::vector<boost::json::value>& packets);

}  // namespace adapters::tradingview
