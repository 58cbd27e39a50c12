#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace domain {

enum class Interval {
    Minute1,
    Minute3,
    Minute5,
    Minute15,
    Minute30,
    Minute45,
    Hour1,
    Hour2,
    Hour3,
    Hour4,
    Day1,
    Week1,
    Month1,
};

std::string interval_code(Interval interval);
Interval interval_from_code(const std::string& value);
std::optional<int> interval_max_depth_days(Interval interval);

namespace detail {

constexpr std::string_view interval_code_literal(Interval interval) {
    switch (interval) {
    case Interval::Minute1:
        return "1";
    case Interval::Minute3:
        return "3";
    case Interval::Minute5:
        return "5";
    case Interval::Minute15:
        return "15";
    case Interval::Minute30:
        return "30";
    case Interval::Minute45:
        return "45";
    case Interval::Hour1:
        return "1H";
    case Interval::Hour2:
        return "2H";
    case Interval::Hour3:
        return "3H";
    case Interval::Hour4:
        return "4H";
    case Interval::Day1:
        return "1D";
    case Interval::Week1:
        return "1W";
    case Interval::Month1:
        return "1M";
    }
    throw std::invalid_argument("Unsupported interval");
}

constexpr Interval interval_from_literal(std::string_view value) {
    constexpr Interval kAll[] = {Interval::Minute1, Interval::Minute3, Interval::Minute5, Interval::Minute15,
                                 Interval::Minute30, Interval::Minute45, Interval::Hour1, Interval::Hour2,
                                 Interval::Hour3, Interval::Hour4, Interval::Day1, Interval::Week1,
                                 Interval::Month1};
    for (const auto candidate : kAll) {
        if (interval_code_literal(candidate) == value) {
            return candidate;
        }
    }
    throw std::invalid_argument("Unsupported interval code");
}

}  // namespace detail

constexpr std::int64_t interval_seconds(Interval interval) {
    switch (interval) {
    case Interval::Minute1:
        return 60;
    case Interval::Minute3:
        return 180;
    case Interval::Minute5:
        return 300;
    case Interval::Minute15:
        return 900;
    case Interval::Minute30:
        return 1'800;
    case Interval::Minute45:
        return 2'700;
    case Interval::Hour1:
        return 3'600;
    case Interval::Hour2:
        return 7'200;
    case Interval::Hour3:
        return 10'800;
    case Interval::Hour4:
        return 14'400;
    case Interval::Day1:
        return 86'400;
    case Interval::Week1:
        return 604'800;
    case Interval::Month1:
        return 2'592'000;
    }
    return 86'400;
}

constexpr bool is_intraday(Interval interval) {
    return interval_seconds(interval) < 86'400;
}

static_assert(detail::interval_code_literal(Interval::Hour1) == std::string_view{"1H"});
static_assert(detail::interval_from_literal("45") == Interval::Minute45);
static_assert(detail::interval_from_literal("1M") == Interval::Month1);
static_assert(interval_seconds(Interval::Minute15) == 900);
static_assert(is_intraday(Interval::Hour4) && !is_intraday(Interval::Day1));

}  // namespace domain
