#pragma once

#include <ostream>

#include "domain/Types.h"

namespace app {

// datetime,symbol,open,high,low,close,volume[,open_interest]
// The open_interest column exists only when the series carries it.
void write_csv(std::ostream& out, const domain::BarSeries& series);

}  // namespace app
