#include "app/CsvExport.hpp"

#include <cstdio>
#include <string>

#include "core/TimeUtils.h"

namespace app {
namespace {

std::string format_number(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.15g", value);
    return buffer;
}

}  // namespace

void write_csv(std::ostream& out, const domain::BarSeries& series) {
    out << "datetime,symbol,open,high,low,close,volume";
    if (series.hasOpenInterest) {
        out << ",open_interest";
    }
    out << '\n';

    for (const auto& bar : series.bars) {
        out << core::format_iso8601(bar.timestamp) << ',' << series.symbol << ',' << format_number(bar.open) << ','
            << format_number(bar.high) << ',' << format_number(bar.low) << ',' << format_number(bar.close) << ','
            << format_number(bar.volume);
        if (series.hasOpenInterest) {
            out << ',';
            if (bar.openInterest) {
                out << format_number(*bar.openInterest);
            }
        }
        out << '\n';
    }
}

}  // namespace app
