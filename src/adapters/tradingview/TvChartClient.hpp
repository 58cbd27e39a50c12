#pragma once

#include <optional>
#include <random>
#include <string>

#include "adapters/tradingview/ProtocolSession.hpp"
#include "adapters/tradingview/SessionIdentity.hpp"
#include "domain/Ports.hpp"
#include "infra/net/IWsTransport.hpp"

namespace adapters::tradingview {

// Chart data source backed by one ProtocolSession per fetch. Credentials are
// obtained once at construction and replaced only by the auth recovery path.
// Not safe for concurrent use; create one client per concurrent flow.
class TvChartClient : public domain::IChartDataSource {
public:
    TvChartClient(infra::net::TransportFactory factory,
                  domain::ICredentialProvider* credentials,
                  SessionOptions options = {},
                  std::optional<std::mt19937::result_type> seed = std::nullopt);

    domain::FetchResult fetch(const domain::SeriesRequest& request) override;

    std::string planTier() const override { return auth_.planTier; }
    bool anonymous() const override;

    bool unrecoverable() const noexcept { return auth_.unrecoverable; }

private:
    infra::net::TransportFactory factory_;
    domain::ICredentialProvider* credentials_;
    SessionOptions options_;
    SessionIdentity identity_;
    AuthState auth_;
};

}  // namespace adapters::tradingview
