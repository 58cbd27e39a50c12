#include "app/RangeScheduler.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

#include "app/ChunkPlanner.hpp"
#include "core/SeriesMerge.h"
#include "core/TimeUtils.h"
#include "domain/AccountPlan.hpp"
#include "domain/Symbol.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr int kTradingDaysPerYear = 252;
constexpr double kTradingHoursPerDay = 6.5;
constexpr long long kSessionOverheadSeconds = 5;

bool is_fatal(domain::FetchStatus status) noexcept {
    return status == domain::FetchStatus::SymbolError || status == domain::FetchStatus::AuthFailed;
}

// Later chunks only fill fields the earlier ones did not report.
void merge_quote(domain::SecurityInfo& into, const domain::SecurityInfo& from) {
    for (const auto& [key, value] : from) {
        into.emplace(key, value);
    }
}

}  // namespace

const char* to_string(StopReason reason) noexcept {
    switch (reason) {
    case StopReason::PlanExhausted:
        return "plan_exhausted";
    case StopReason::ConsecutiveFailures:
        return "consecutive_failures";
    case StopReason::SymbolError:
        return "symbol_error";
    case StopReason::AuthFailed:
        return "auth_failed";
    }
    return "unknown";
}

RangeScheduler::RangeScheduler(domain::IChartDataSource& source, SchedulerOptions options)
    : source_(source), options_(std::move(options)) {
    if (options_.maxAttempts < 1) {
        options_.maxAttempts = 1;
    }
    if (options_.maxConsecutiveFailedChunks < 1) {
        options_.maxConsecutiveFailedChunks = 1;
    }
}

HistoricalResult RangeScheduler::run(const HistoricalQuery& query) {
    const std::string symbol = domain::format_symbol(query.symbol, query.exchange, query.contract);

    const std::string tier = source_.planTier();
    const char* label = source_.anonymous() ? "nologin" : (tier.empty() ? "free" : tier.c_str());
    LOG_INFO(logging::LogCategory::SCHED, "account: %s | max bars/query: %lld", label,
             static_cast<long long>(domain::plan_bar_limit(tier)));

    if (!query.from && !query.to) {
        return runBarCount_(symbol, query);
    }
    return runRange_(symbol, query);
}

HistoricalResult RangeScheduler::runBarCount_(const std::string& symbol, const HistoricalQuery& query) {
    if (query.barCount < 1) {
        throw std::invalid_argument("bar count must be >= 1");
    }

    domain::SeriesRequest request;
    request.symbol = symbol;
    request.interval = query.interval;
    request.barCount = query.barCount;
    request.extendedSession = query.extendedSession;

    LOG_DEBUG(logging::LogCategory::SCHED, "getting %lld bars for %s", static_cast<long long>(query.barCount),
              symbol.c_str());
    domain::FetchResult fetched = source_.fetch(request);

    HistoricalResult result;
    result.chunksPlanned = 1;
    result.series = core::normalize_series(std::move(fetched.series));
    result.series.symbol = symbol;
    result.quote = std::move(fetched.quote);
    if (fetched.status == domain::FetchStatus::Ok) {
        result.chunksFetched = 1;
    } else if (fetched.status == domain::FetchStatus::SymbolError) {
        result.stopReason = StopReason::SymbolError;
    } else if (fetched.status == domain::FetchStatus::AuthFailed) {
        result.stopReason = StopReason::AuthFailed;
    } else {
        LOG_ERROR(logging::LogCategory::SCHED, "no data for %s, the symbol may be invalid or have no history",
                  symbol.c_str());
    }
    return result;
}

HistoricalResult RangeScheduler::runRange_(const std::string& symbol, const HistoricalQuery& query) {
    const domain::TimestampMs now = now_();
    domain::TimestampMs startMs = query.from ? core::parse_iso8601_ms(*query.from) : options_.defaultStartMs;
    domain::TimestampMs endMs = query.to ? core::parse_iso8601_ms(*query.to) : now;
    if (endMs > now) {
        endMs = now;
    }
    if (startMs >= endMs) {
        throw std::invalid_argument("start_date must be before end_date");
    }

    const domain::TimestampMs clamped = clamp_to_history_depth(startMs, endMs, query.interval);
    if (clamped != startMs) {
        LOG_WARN(logging::LogCategory::SCHED, "only ~%d days of %s data are available, clamping start from %s to %s",
                 domain::interval_max_depth_days(query.interval).value_or(0),
                 domain::interval_code(query.interval).c_str(), core::format_date(startMs).c_str(),
                 core::format_date(clamped).c_str());
        startMs = clamped;
    }

    std::int64_t chunkDays = 0;
    if (query.chunkDays) {
        if (*query.chunkDays < 1) {
            throw std::invalid_argument("chunk_days must be >= 1");
        }
        chunkDays = *query.chunkDays;
    } else {
        chunkDays = auto_chunk_days(query.interval, source_.planTier());
        LOG_INFO(logging::LogCategory::SCHED,
                 "auto chunk size: %lld calendar days per chunk (%lld safe bars, %s interval)",
                 static_cast<long long>(chunkDays),
                 static_cast<long long>(domain::safe_bar_limit(source_.planTier())),
                 domain::interval_code(query.interval).c_str());
    }

    const domain::ChunkPlan plan = build_chunk_plan(startMs, endMs, chunkDays);
    const long long totalDays = (endMs - startMs) / domain::kMillisPerDay;
    const long long pauseSeconds =
        std::chrono::duration_cast<std::chrono::seconds>(options_.chunkPause).count();
    const long long estimate = static_cast<long long>(plan.size()) * (kSessionOverheadSeconds + pauseSeconds);
    LOG_INFO(logging::LogCategory::SCHED,
             "date range: %s -> %s (%lld calendar days, %zu chunks x %lld days/chunk) | est. time: %lldm %llds",
             core::format_date(startMs).c_str(), core::format_date(endMs).c_str(), totalDays, plan.size(),
             static_cast<long long>(chunkDays), estimate / 60, estimate % 60);

    HistoricalResult result;
    result.chunksPlanned = plan.size();
    std::vector<domain::BarSeries> fetchedChunks;
    int consecutiveFailed = 0;

    for (std::size_t index = 0; index < plan.size(); ++index) {
        const domain::ChunkWindow& window = plan[index];
        const std::size_t chunkNumber = index + 1;
        LOG_INFO(logging::LogCategory::SCHED, "chunk %zu/%zu: %s -> %s", chunkNumber, plan.size(),
                 core::format_date(window.startMs).c_str(), core::format_date(window.endMs).c_str());

        domain::SeriesRequest request;
        request.symbol = symbol;
        request.interval = query.interval;
        request.rangeToken = range_token(window, query.interval);
        request.extendedSession = query.extendedSession;

        domain::FetchResult fetched;
        for (int attempt = 1; attempt <= options_.maxAttempts; ++attempt) {
            // The plan tier may change after an auth recovery.
            request.barCount = domain::safe_bar_limit(source_.planTier());
            fetched = source_.fetch(request);
            if (fetched.status == domain::FetchStatus::Ok || is_fatal(fetched.status)) {
                break;
            }
            if (attempt < options_.maxAttempts) {
                const auto delay = options_.chunkPause * attempt;
                LOG_WARN(logging::LogCategory::SCHED,
                         "chunk %zu/%zu returned no data (%s, attempt %d/%d), retrying in %lld ms", chunkNumber,
                         plan.size(), domain::to_string(fetched.status), attempt, options_.maxAttempts,
                         static_cast<long long>(delay.count()));
                pause_(delay);
            }
        }

        if (fetched.status == domain::FetchStatus::SymbolError) {
            LOG_ERROR(logging::LogCategory::SCHED, "chunk %zu/%zu: symbol %s rejected, skipping remaining chunks",
                      chunkNumber, plan.size(), symbol.c_str());
            result.stopReason = StopReason::SymbolError;
            break;
        }
        if (fetched.status == domain::FetchStatus::AuthFailed) {
            LOG_ERROR(logging::LogCategory::SCHED, "chunk %zu/%zu: authentication failed, skipping remaining chunks",
                      chunkNumber, plan.size());
            result.stopReason = StopReason::AuthFailed;
            break;
        }

        if (fetched.status == domain::FetchStatus::Ok) {
            merge_quote(result.quote, fetched.quote);
            fetchedChunks.push_back(std::move(fetched.series));
            ++result.chunksFetched;
            consecutiveFailed = 0;
        } else {
            ++consecutiveFailed;
            LOG_WARN(logging::LogCategory::SCHED, "chunk %zu/%zu failed after %d attempts", chunkNumber, plan.size(),
                     options_.maxAttempts);
            if (consecutiveFailed >= options_.maxConsecutiveFailedChunks) {
                LOG_WARN(logging::LogCategory::SCHED,
                         "%d consecutive chunks failed, stopping (likely rate limited or reached the maximum "
                         "available history for %s interval)",
                         consecutiveFailed, domain::interval_code(query.interval).c_str());
                result.stopReason = StopReason::ConsecutiveFailures;
                break;
            }
        }

        if (chunkNumber < plan.size()) {
            pause_(options_.chunkPause);
        }
    }

    result.series = core::merge_series(fetchedChunks, startMs, endMs);
    result.series.symbol = symbol;
    if (!result.series.empty()) {
        logCoverage_(result.series, query.interval, startMs, endMs);
    } else {
        LOG_WARN(logging::LogCategory::SCHED, "no bars retrieved for %s (%s)", symbol.c_str(),
                 to_string(result.stopReason));
    }
    return result;
}

void RangeScheduler::pause_(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return;
    }
    if (options_.sleep) {
        options_.sleep(duration);
        return;
    }
    std::this_thread::sleep_for(duration);
}

domain::TimestampMs RangeScheduler::now_() const {
    return options_.now ? options_.now() : core::now_ms();
}

void RangeScheduler::logCoverage_(const domain::BarSeries& series,
                                  domain::Interval interval,
                                  domain::TimestampMs startMs,
                                  domain::TimestampMs endMs) const {
    const long long calendarDays = (endMs - startMs) / domain::kMillisPerDay;
    const long long tradingDays = calendarDays * kTradingDaysPerYear / 365;
    const std::string first = core::format_date(series.firstTimestamp());
    const std::string last = core::format_date(series.lastTimestamp());

    if (domain::is_intraday(interval)) {
        const long long barsPerDay =
            static_cast<long long>(kTradingHoursPerDay * 3600.0 / static_cast<double>(domain::interval_seconds(interval)));
        LOG_INFO(logging::LogCategory::DATA,
                 "received %zu bars (%s -> %s) | est. %lld trading days x %lld bars/day = %lld expected (limited by "
                 "account)",
                 series.size(), first.c_str(), last.c_str(), tradingDays, barsPerDay, tradingDays * barsPerDay);
        return;
    }
    LOG_INFO(logging::LogCategory::DATA, "received %zu bars (%s -> %s) | est. %lld trading days expected",
             series.size(), first.c_str(), last.c_str(), tradingDays);
}

}  // namespace app
