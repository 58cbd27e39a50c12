#include "domain/Interval.hpp"

#include <algorithm>
#include <cctype>

namespace domain {

std::string interval_code(Interval interval) {
    return std::string(detail::interval_code_literal(interval));
}

Interval interval_from_code(const std::string& value) {
    std::string normalized = value;
    normalized.erase(std::remove_if(normalized.begin(), normalized.end(),
                                    [](unsigned char ch) { return std::isspace(ch) != 0; }),
                     normalized.end());
    // Accept lower-case suffixes ("1h", "1d") but keep "1M" (month) distinct from minutes.
    if (normalized.size() > 1) {
        auto& suffix = normalized.back();
        if (suffix == 'h' || suffix == 'd' || suffix == 'w') {
            suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(suffix)));
        }
    }
    try {
        return detail::interval_from_literal(normalized);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("Unsupported interval string: " + value);
    }
}

std::optional<int> interval_max_depth_days(Interval interval) {
    switch (interval) {
    case Interval::Minute1:
        return 180;
    case Interval::Minute3:
    case Interval::Minute5:
        return 365;
    case Interval::Minute15:
    case Interval::Minute30:
    case Interval::Minute45:
    case Interval::Hour1:
    case Interval::Hour2:
    case Interval::Hour3:
    case Interval::Hour4:
        return 730;
    case Interval::Day1:
    case Interval::Week1:
    case Interval::Month1:
        break;
    }
    return std::nullopt;
}

}  // namespace domain
