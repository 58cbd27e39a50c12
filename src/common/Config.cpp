#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <limits>
#include <stdexcept>
#include <string>

#include "logging/Log.h"

namespace tvf::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::int64_t parsePositive(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
            throw std::out_of_range("value must be >= 1");
        }
        return static_cast<std::int64_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label, bool allowZero) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || (parsed == 0U && !allowZero) ||
            parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("duration out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::uint32_t parseSeconds(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed > 3600U) {
            throw std::out_of_range("seconds out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

config::LogLevel parseLogLevel(const std::string& value) {
    config::LogLevel level{};
    if (!logging::Log::try_parse_log_level(toLower(trim(value)), level)) {
        throw std::runtime_error("Invalid log level: " + value);
    }
    return level;
}

domain::Interval parseInterval(const std::string& value) {
    try {
        return domain::interval_from_code(value);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Invalid interval: " + value);
    }
}

std::string envValue(const char* name) {
    const char* raw = std::getenv(name);
    return raw != nullptr ? trim(raw) : std::string{};
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (auto envToken = envValue("TV_TOKEN"); !envToken.empty()) {
        config.token = envToken;
    }
    if (auto envTokenFile = envValue("TV_TOKEN_FILE"); !envTokenFile.empty()) {
        config.tokenFile = envTokenFile;
    }
    if (auto envPlan = envValue("TV_PLAN"); !envPlan.empty()) {
        config.plan = toLower(envPlan);
    }
    if (auto envLogLevel = envValue("LOG_LEVEL"); !envLogLevel.empty()) {
        config.logLevel = parseLogLevel(envLogLevel);
    }
    if (auto envLogFile = envValue("TVFEED_LOG_FILE"); !envLogFile.empty()) {
        config.logFile = envLogFile;
    }
    if (auto envHost = envValue("TVFEED_WS_HOST"); !envHost.empty()) {
        config.wsHost = envHost;
    }
    if (auto envRead = envValue("TVFEED_READ_TIMEOUT_MS"); !envRead.empty()) {
        config.readTimeoutMs = parseDurationMs(envRead, "TVFEED_READ_TIMEOUT_MS", false);
    }
    if (auto envDeadline = envValue("TVFEED_STREAM_DEADLINE_MS"); !envDeadline.empty()) {
        config.streamDeadlineMs = parseDurationMs(envDeadline, "TVFEED_STREAM_DEADLINE_MS", true);
    }

    config.help = hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h");

    if (auto symbolArg = valueFromArgs(argc, argv, "--symbol"); !symbolArg.empty()) {
        config.symbol = trim(symbolArg);
    }
    if (auto exchangeArg = valueFromArgs(argc, argv, "--exchange"); !exchangeArg.empty()) {
        config.exchange = trim(exchangeArg);
    }
    if (auto intervalArg = valueFromArgs(argc, argv, "--interval"); !intervalArg.empty()) {
        config.interval = parseInterval(intervalArg);
    }
    if (auto barsArg = valueFromArgs(argc, argv, "--bars"); !barsArg.empty()) {
        config.bars = parsePositive(barsArg, "--bars");
    }
    if (auto fromArg = valueFromArgs(argc, argv, "--from"); !fromArg.empty()) {
        config.from = trim(fromArg);
    }
    if (auto toArg = valueFromArgs(argc, argv, "--to"); !toArg.empty()) {
        config.to = trim(toArg);
    }
    if (auto contractArg = valueFromArgs(argc, argv, "--contract"); !contractArg.empty()) {
        const auto contract = parsePositive(contractArg, "--contract");
        if (contract > std::numeric_limits<int>::max()) {
            throw std::runtime_error("Invalid value for --contract: " + contractArg);
        }
        config.contract = static_cast<int>(contract);
    }
    if (hasFlag(argc, argv, "--extended")) {
        config.extendedSession = true;
    }
    if (auto chunkArg = valueFromArgs(argc, argv, "--chunk-days"); !chunkArg.empty()) {
        config.chunkDays = parsePositive(chunkArg, "--chunk-days");
    }
    if (auto sleepArg = valueFromArgs(argc, argv, "--sleep-seconds"); !sleepArg.empty()) {
        config.sleepSeconds = parseSeconds(sleepArg, "--sleep-seconds");
    }
    if (auto tokenArg = valueFromArgs(argc, argv, "--token"); !tokenArg.empty()) {
        config.token = trim(tokenArg);
    }
    if (auto tokenFileArg = valueFromArgs(argc, argv, "--token-file"); !tokenFileArg.empty()) {
        config.tokenFile = trim(tokenFileArg);
    }
    if (hasFlag(argc, argv, "--delete-rejected-token")) {
        config.deleteRejectedToken = true;
    }
    if (auto planArg = valueFromArgs(argc, argv, "--plan"); !planArg.empty()) {
        config.plan = toLower(trim(planArg));
    }
    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = parseLogLevel(levelArg);
    }
    if (auto logFileArg = valueFromArgs(argc, argv, "--log-file"); !logFileArg.empty()) {
        config.logFile = trim(logFileArg);
    }
    if (auto connectArg = valueFromArgs(argc, argv, "--connect-timeout-ms"); !connectArg.empty()) {
        config.connectTimeoutMs = parseDurationMs(connectArg, "--connect-timeout-ms", false);
    }
    if (auto readArg = valueFromArgs(argc, argv, "--read-timeout-ms"); !readArg.empty()) {
        config.readTimeoutMs = parseDurationMs(readArg, "--read-timeout-ms", false);
    }
    if (auto deadlineArg = valueFromArgs(argc, argv, "--stream-deadline-ms"); !deadlineArg.empty()) {
        config.streamDeadlineMs = parseDurationMs(deadlineArg, "--stream-deadline-ms", true);
    }
    if (auto outputArg = valueFromArgs(argc, argv, "--output"); !outputArg.empty()) {
        config.output = trim(outputArg);
    }
    if (auto infoArg = valueFromArgs(argc, argv, "--security-info-file"); !infoArg.empty()) {
        config.securityInfoFile = trim(infoArg);
    }

    if (!config.plan.empty() && config.plan != "pro" && config.plan != "pro_plus" && config.plan != "pro_premium") {
        throw std::runtime_error("Invalid plan tier: " + config.plan + " (expected pro, pro_plus or pro_premium)");
    }
    if (!config.help && config.symbol.empty()) {
        throw std::runtime_error("--symbol is required");
    }

    return config;
}

const char* Config::usage() {
    return "Usage: tvfeed --symbol <TICKER|EXCHANGE:TICKER> [options]\n"
           "\n"
           "  --exchange <name>            exchange prefix (default NSE)\n"
           "  --interval <code>            1 3 5 15 30 45 1H 2H 3H 4H 1D 1W 1M (default 1D)\n"
           "  --bars <n>                   bar count when no date range is given (default 10)\n"
           "  --from <date>                range start, ISO-8601 (default 2000-01-01)\n"
           "  --to <date>                  range end, ISO-8601 (default now)\n"
           "  --contract <n>               continuous futures contract (1 = front)\n"
           "  --extended                   request extended session data\n"
           "  --chunk-days <n>             calendar days per range chunk (default: from plan)\n"
           "  --sleep-seconds <n>          pause between chunks (default 3)\n"
           "  --token <token>              auth token (env TV_TOKEN)\n"
           "  --token-file <path>          cached token file (env TV_TOKEN_FILE)\n"
           "  --delete-rejected-token      remove the token file when the server rejects it\n"
           "  --plan <tier>                pro | pro_plus | pro_premium (env TV_PLAN)\n"
           "  --log-level <level>          trace debug info warn error (env LOG_LEVEL)\n"
           "  --log-file <path>            also append log lines here (env TVFEED_LOG_FILE)\n"
           "  --connect-timeout-ms <ms>    connect and handshake timeout (default 5000)\n"
           "  --read-timeout-ms <ms>       per-read timeout (default 30000)\n"
           "  --stream-deadline-ms <ms>    overall streaming ceiling, 0 = none\n"
           "  --output <path>              CSV destination (default stdout)\n"
           "  --security-info-file <path>  store symbol metadata in this file\n";
}

}  // namespace tvf::common
