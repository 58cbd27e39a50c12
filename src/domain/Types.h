#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace domain {

using TimestampMs = long long;
using Symbol = std::string;

constexpr TimestampMs kMillisPerSecond = 1'000;
constexpr TimestampMs kMillisPerMinute = 60 * kMillisPerSecond;
constexpr TimestampMs kMillisPerDay = 86'400 * kMillisPerSecond;

struct Bar {
    TimestampMs timestamp{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
    std::optional<double> openInterest;
};

// The open-interest column exists for the whole series or not at all.
struct BarSeries {
    Symbol symbol;
    std::vector<Bar> bars;
    bool hasOpenInterest{false};

    bool empty() const noexcept { return bars.empty(); }
    std::size_t size() const noexcept { return bars.size(); }
    TimestampMs firstTimestamp() const noexcept { return bars.empty() ? 0 : bars.front().timestamp; }
    TimestampMs lastTimestamp() const noexcept { return bars.empty() ? 0 : bars.back().timestamp; }
};

// Half-open window [startMs, endMs).
struct ChunkWindow {
    TimestampMs startMs{0};
    TimestampMs endMs{0};

    bool empty() const noexcept { return endMs <= startMs; }
    TimestampMs durationMs() const noexcept { return endMs - startMs; }
};

using ChunkPlan = std::vector<ChunkWindow>;

using SecurityValue = std::variant<std::string, std::int64_t, double, bool, std::vector<std::string>>;
using SecurityInfo = std::map<std::string, SecurityValue>;

}  // namespace domain
