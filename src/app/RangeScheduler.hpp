#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/Interval.hpp"
#include "domain/Ports.hpp"
#include "domain/Types.h"

namespace app {

struct HistoricalQuery {
    std::string symbol;
    std::string exchange = "NSE";
    std::optional<int> contract;
    domain::Interval interval{domain::Interval::Day1};
    std::int64_t barCount{10};
    // ISO-8601 bounds. Neither set selects bar-count mode.
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::optional<std::int64_t> chunkDays;
    bool extendedSession{false};
};

struct SchedulerOptions {
    std::chrono::milliseconds chunkPause{std::chrono::seconds(3)};
    int maxAttempts = 3;
    int maxConsecutiveFailedChunks = 3;
    // 2000-01-01T00:00:00Z
    domain::TimestampMs defaultStartMs = 946'684'800'000LL;
    std::function<void(std::chrono::milliseconds)> sleep;
    std::function<domain::TimestampMs()> now;
};

enum class StopReason { PlanExhausted, ConsecutiveFailures, SymbolError, AuthFailed };

const char* to_string(StopReason reason) noexcept;

struct HistoricalResult {
    domain::BarSeries series;
    domain::SecurityInfo quote;
    std::size_t chunksPlanned{0};
    std::size_t chunksFetched{0};
    StopReason stopReason{StopReason::PlanExhausted};
};

// Turns one historical query into one ordered, deduplicated series. Chunks run
// strictly one after another against a single data source.
class RangeScheduler {
public:
    explicit RangeScheduler(domain::IChartDataSource& source, SchedulerOptions options = {});

    // Throws std::invalid_argument for caller errors (start >= end, bad
    // contract or bar count). Missing or partial data never throws.
    HistoricalResult run(const HistoricalQuery& query);

private:
    HistoricalResult runBarCount_(const std::string& symbol, const HistoricalQuery& query);
    HistoricalResult runRange_(const std::string& symbol, const HistoricalQuery& query);

    void pause_(std::chrono::milliseconds duration);
    domain::TimestampMs now_() const;
    void logCoverage_(const domain::BarSeries& series,
                      domain::Interval interval,
                      domain::TimestampMs startMs,
                      domain::TimestampMs endMs) const;

    domain::IChartDataSource& source_;
    SchedulerOptions options_;
};

}  // namespace app
