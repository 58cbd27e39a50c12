#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "domain/Interval.hpp"
#include "domain/Types.h"

namespace domain {

struct Credentials {
    std::string token;
    std::string planTier;
};

class ICredentialProvider {
public:
    virtual ~ICredentialProvider() = default;

    // Initial credentials; std::nullopt means anonymous access.
    virtual std::optional<Credentials> obtain() = 0;

    // Called only after the server rejected rejectedToken. std::nullopt is final.
    virtual std::optional<Credentials> recover(const std::string& rejectedToken) = 0;
};

class ISecurityInfoCache {
public:
    virtual ~ISecurityInfoCache() = default;

    virtual std::optional<SecurityInfo> lookup(const std::string& key) const = 0;

    // First write wins: returns false and leaves the store untouched when key exists.
    virtual bool store(const std::string& key, const SecurityInfo& info) = 0;
};

struct SeriesRequest {
    Symbol symbol;
    Interval interval{Interval::Day1};
    std::int64_t barCount{0};
    std::optional<std::string> rangeToken;
    bool extendedSession{false};
};

enum class FetchStatus {
    Ok,
    Empty,
    SymbolError,
    AuthFailed,
    ConnectFailed,
};

const char* to_string(FetchStatus status) noexcept;

struct FetchResult {
    FetchStatus status{FetchStatus::Empty};
    BarSeries series;
    SecurityInfo quote;
};

// One request against the remote chart service, one connection.
class IChartDataSource {
public:
    virtual ~IChartDataSource() = default;

    virtual FetchResult fetch(const SeriesRequest& request) = 0;

    virtual std::string planTier() const = 0;
    virtual bool anonymous() const = 0;
};

}  // namespace domain
