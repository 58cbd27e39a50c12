#pragma once

#include <cstdint>
#include <string>

#include "domain/Types.h"

namespace core {

namespace TimeUtils {
constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kSecondsPerDay = 86'400;
}  // namespace TimeUtils

// Days since 1970-01-01 for a proleptic Gregorian date; negative before the epoch.
std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day) noexcept;

// Accepts "YYYY-MM-DD", "YYYY-MM-DD[T ]HH:MM[:SS[.fff]]" with an optional "Z" or "+HH:MM" suffix.
// Values without an offset are UTC. Throws std::invalid_argument on malformed input.
domain::TimestampMs parse_iso8601_ms(const std::string& text);

// "YYYY-MM-DDTHH:MM:SSZ" (milliseconds appended only when non-zero).
std::string format_iso8601(domain::TimestampMs ms);

// "YYYY-MM-DD"
std::string format_date(domain::TimestampMs ms);

domain::TimestampMs now_ms();

}  // namespace core
