#include "adapters/auth/CredentialProviders.hpp"
#include "adapters/storage/SecurityInfoFileStore.hpp"
#include "adapters/tradingview/TvChartClient.hpp"
#include "app/CsvExport.hpp"
#include "app/RangeScheduler.hpp"
#include "common/Config.hpp"
#include "domain/Symbol.hpp"
#include "infra/net/WebSocketClient.h"
#include "logging/Log.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace bootstrap {
namespace {

constexpr int kExitUsage = 2;

std::unique_ptr<domain::ICredentialProvider> makeCredentials(const tvf::common::Config& config) {
    if (!config.token.empty()) {
        return std::make_unique<adapters::auth::StaticCredentialProvider>(config.token, config.plan);
    }
    if (!config.tokenFile.empty()) {
        return std::make_unique<adapters::auth::TokenFileCredentialProvider>(config.tokenFile, config.plan,
                                                                            config.deleteRejectedToken);
    }
    return nullptr;
}

void storeSecurityInfo(const tvf::common::Config& config, const app::HistoricalResult& result) {
    if (config.securityInfoFile.empty()) {
        return;
    }
    if (result.quote.empty()) {
        LOG_WARN(logging::LogCategory::CACHE, "No symbol metadata received for %s", result.series.symbol.c_str());
        return;
    }
    adapters::storage::SecurityInfoFileStore store(config.securityInfoFile);
    const std::string key = domain::security_key(result.series.symbol);
    try {
        if (!store.store(key, result.quote)) {
            LOG_INFO(logging::LogCategory::CACHE, "[%s] already cached in %s", key.c_str(),
                     config.securityInfoFile.c_str());
        }
    } catch (const std::runtime_error& ex) {
        LOG_WARN(logging::LogCategory::CACHE, "Security info not stored: %s", ex.what());
    }
}

}  // namespace

int run(int argc, char** argv) {
    tvf::common::Config config;
    try {
        config = tvf::common::Config::fromArgs(argc, argv);
    } catch (const std::runtime_error& ex) {
        std::cerr << "tvfeed: " << ex.what() << "\n\n" << tvf::common::Config::usage();
        return kExitUsage;
    }
    if (config.help) {
        std::cout << tvf::common::Config::usage();
        return EXIT_SUCCESS;
    }

    logging::Log::set_log_level(config.logLevel);
    if (!config.logFile.empty()) {
        logging::Log::set_log_file(config.logFile);
    }
    LOG_DEBUG(logging::LogCategory::APP, "Log level: %s", logging::Log::level_to_string(config.logLevel));

    infra::net::WsEndpoint endpoint;
    endpoint.host = config.wsHost;
    endpoint.origin = "https://" + config.wsHost;
    endpoint.connectTimeout = std::chrono::milliseconds(config.connectTimeoutMs);

    adapters::tradingview::SessionOptions sessionOptions;
    sessionOptions.readTimeout = std::chrono::milliseconds(config.readTimeoutMs);
    sessionOptions.streamDeadline = std::chrono::milliseconds(config.streamDeadlineMs);

    auto credentials = makeCredentials(config);
    adapters::tradingview::TvChartClient client(infra::net::WebSocketClient::factory(endpoint), credentials.get(),
                                                sessionOptions);

    app::SchedulerOptions schedulerOptions;
    schedulerOptions.chunkPause = std::chrono::seconds(config.sleepSeconds);
    app::RangeScheduler scheduler(client, schedulerOptions);

    app::HistoricalQuery query;
    query.symbol = config.symbol;
    query.exchange = config.exchange;
    query.contract = config.contract;
    query.interval = config.interval;
    query.barCount = config.bars;
    query.from = config.from;
    query.to = config.to;
    query.chunkDays = config.chunkDays;
    query.extendedSession = config.extendedSession;

    app::HistoricalResult result;
    try {
        result = scheduler.run(query);
    } catch (const std::invalid_argument& ex) {
        LOG_ERROR(logging::LogCategory::APP, "%s", ex.what());
        logging::Log::flush();
        return kExitUsage;
    }

    if (config.output.empty()) {
        app::write_csv(std::cout, result.series);
        std::cout.flush();
    } else {
        std::ofstream out(config.output, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open output file " + config.output);
        }
        app::write_csv(out, result.series);
        LOG_INFO(logging::LogCategory::APP, "Wrote %zu bars to %s", result.series.size(), config.output.c_str());
    }

    storeSecurityInfo(config, result);
    logging::Log::flush();
    return result.series.empty() ? EXIT_FAILURE : EXIT_SUCCESS;
}

}  // namespace bootstrap

int main(int argc, char** argv) {
    std::set_terminate([] {
        if (auto eptr = std::current_exception()) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(EXIT_FAILURE);
    });

    try {
        return bootstrap::run(argc, argv);
    } catch (const std::exception& ex) {
        LOG_ERROR(logging::LogCategory::APP, "Fatal: %s", ex.what());
        logging::Log::flush();
        return EXIT_FAILURE;
    }
}
