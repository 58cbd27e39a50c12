#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "config/Config.h"
#include "domain/Interval.hpp"

namespace tvf::common {

struct Config {
    std::string symbol;
    std::string exchange = "NSE";
    domain::Interval interval = domain::Interval::Day1;
    std::int64_t bars = 10;
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::optional<int> contract;
    bool extendedSession = false;
    std::optional<std::int64_t> chunkDays;
    std::uint32_t sleepSeconds = 3;

    std::string token;
    std::string tokenFile;
    std::string plan;
    bool deleteRejectedToken = false;

    config::LogLevel logLevel = config::LogLevel::Info;
    std::string logFile;

    std::string wsHost = "data.tradingview.com";
    std::uint32_t connectTimeoutMs = 5000;
    std::uint32_t readTimeoutMs = 30000;
    // 0 leaves the streaming phase bounded only by the per-read timeout.
    std::uint32_t streamDeadlineMs = 0;

    std::string output;
    std::string securityInfoFile;
    bool help = false;

    // Defaults, then environment, then command line. Throws std::runtime_error
    // on an invalid value.
    static Config fromArgs(int argc, char** argv);

    static const char* usage();
};

}  // namespace tvf::common
