#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "app/ChunkPlanner.hpp"
#include "core/TimeUtils.h"
#include "domain/AccountPlan.hpp"
#include "domain/Interval.hpp"

using domain::Interval;

int main() {
    {
        const Interval all[] = {Interval::Minute1, Interval::Minute3, Interval::Minute5, Interval::Minute15,
                                Interval::Minute30, Interval::Minute45, Interval::Hour1, Interval::Hour2,
                                Interval::Hour3, Interval::Hour4, Interval::Day1, Interval::Week1,
                                Interval::Month1};
        for (const auto interval : all) {
            if (domain::interval_from_code(domain::interval_code(interval)) != interval) {
                std::cerr << "Interval code does not map back: " << domain::interval_code(interval) << '\n';
                return 1;
            }
        }
        if (domain::interval_from_code(" 4h ") != Interval::Hour4 || domain::interval_from_code("1d") != Interval::Day1 ||
            domain::interval_from_code("1M") != Interval::Month1) {
            std::cerr << "Interval parsing is not lenient enough\n";
            return 1;
        }
        bool threw = false;
        try {
            (void)domain::interval_from_code("2D");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Unknown interval must be rejected\n";
            return 1;
        }
    }

    {
        if (app::auto_chunk_days(Interval::Day1, "") != 4000 || app::auto_chunk_days(Interval::Minute1, "") != 2 ||
            app::auto_chunk_days(Interval::Minute15, "pro_premium") != 166) {
            std::cerr << "Unexpected auto chunk size\n";
            return 1;
        }
        // 4000 one-minute bars per chunk at pro is still 2 days; never below one day.
        if (app::auto_chunk_days(Interval::Minute1, "pro") < 1) {
            std::cerr << "Chunk size must be at least one day\n";
            return 1;
        }
    }

    {
        const auto start = core::parse_iso8601_ms("2020-01-01");
        const auto end = core::parse_iso8601_ms("2020-03-15T12:00:00Z");
        const std::int64_t chunkDays = 30;
        const auto plan = app::build_chunk_plan(start, end, chunkDays);
        if (plan.size() != 3) {
            std::cerr << "Expected 3 chunks, got " << plan.size() << '\n';
            return 1;
        }
        if (plan.front().startMs != start || plan.back().endMs != end) {
            std::cerr << "Plan does not cover the requested range\n";
            return 1;
        }
        for (std::size_t i = 0; i < plan.size(); ++i) {
            if (i + 1 < plan.size() && plan[i].endMs != plan[i + 1].startMs) {
                std::cerr << "Chunks " << i << " and " << i + 1 << " are not contiguous\n";
                return 1;
            }
            if (i + 1 < plan.size() && plan[i].durationMs() != chunkDays * domain::kMillisPerDay) {
                std::cerr << "Chunk " << i << " has the wrong length\n";
                return 1;
            }
            if (plan[i].empty()) {
                std::cerr << "Chunk " << i << " is empty\n";
                return 1;
            }
        }
    }

    {
        bool threw = false;
        try {
            (void)app::build_chunk_plan(1000, 1000, 1);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "start >= end must be rejected\n";
            return 1;
        }
    }

    {
        const domain::ChunkWindow window{1'600'000'000'000LL, 1'600'086'400'000LL};
        if (app::range_token(window, Interval::Day1) != "r,1600000000000:1600086400000") {
            std::cerr << "Daily range token must not be shifted\n";
            return 1;
        }
        if (app::range_token(window, Interval::Minute15) != "r,1599998200000:1600084600000") {
            std::cerr << "Intraday range token must be shifted back 30 minutes\n";
            return 1;
        }
    }

    {
        const auto end = core::parse_iso8601_ms("2024-01-01");
        const auto start = core::parse_iso8601_ms("2015-01-01");
        const auto clamped = app::clamp_to_history_depth(start, end, Interval::Minute15);
        if (clamped != end - 730 * domain::kMillisPerDay) {
            std::cerr << "15 minute history must be clamped to 730 days\n";
            return 1;
        }
        if (app::clamp_to_history_depth(start, end, Interval::Day1) != start) {
            std::cerr << "Daily history must not be clamped\n";
            return 1;
        }
        const auto recent = end - 10 * domain::kMillisPerDay;
        if (app::clamp_to_history_depth(recent, end, Interval::Minute1) != recent) {
            std::cerr << "A start inside the depth limit must be kept\n";
            return 1;
        }
    }

    {
        // Chunk sizes beyond the range collapse to a single window.
        const domain::TimestampMs start = 946'684'800'000LL;
        const domain::TimestampMs end = 1'700'000'000'000LL;
        for (const std::int64_t days : {std::int64_t{200'000'000'000}, std::numeric_limits<std::int64_t>::max(),
                                        static_cast<std::int64_t>((end - start) / domain::kMillisPerDay + 1)}) {
            const auto plan = app::build_chunk_plan(start, end, days);
            if (plan.size() != 1 || plan.front().startMs != start || plan.front().endMs != end) {
                std::cerr << "Oversized chunk_days " << days << " must yield one window over the range\n";
                return 1;
            }
        }
        const auto exact = app::build_chunk_plan(start, end, (end - start) / domain::kMillisPerDay);
        if (exact.size() != 2 || exact.back().endMs != end || exact.front().endMs != exact.back().startMs) {
            std::cerr << "Largest in-range chunk_days must leave a remainder window\n";
            return 1;
        }
    }

    {
        if (core::parse_iso8601_ms("1970-01-01") != 0) {
            std::cerr << "Epoch must parse to 0\n";
            return 1;
        }
        if (core::parse_iso8601_ms("1969-12-31") != -domain::kMillisPerDay) {
            std::cerr << "Day before the epoch must be negative\n";
            return 1;
        }
        if (core::parse_iso8601_ms("1900-03-01") != -2'203'891'200'000LL) {
            std::cerr << "1900-03-01 parsed incorrectly: " << core::parse_iso8601_ms("1900-03-01") << '\n';
            return 1;
        }
        if (core::parse_iso8601_ms("2021-06-01T10:30:00+02:00") != core::parse_iso8601_ms("2021-06-01T08:30:00Z")) {
            std::cerr << "Offsets must be applied\n";
            return 1;
        }
        if (core::format_iso8601(core::parse_iso8601_ms("1965-07-04 09:15:30.250")) != "1965-07-04T09:15:30.250Z") {
            std::cerr << "Pre-1970 timestamp did not round trip\n";
            return 1;
        }
        bool threw = false;
        try {
            (void)core::parse_iso8601_ms("2021-13-01");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Month 13 must be rejected\n";
            return 1;
        }
    }

    std::cout << "test_interval_chunk_plan passed\n";
    return 0;
}
