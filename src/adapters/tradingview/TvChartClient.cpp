#include "adapters/tradingview/TvChartClient.hpp"

#include <utility>
#include <vector>

#include "adapters/tradingview/BarAssembler.hpp"
#include "adapters/tradingview/FrameCodec.hpp"
#include "adapters/tradingview/QuoteAssembler.hpp"
#include "logging/Log.h"

namespace adapters::tradingview {
namespace {

SessionIdentity make_identity(const std::optional<std::mt19937::result_type>& seed) {
    return seed ? SessionIdentity(*seed) : SessionIdentity();
}

}  // namespace

TvChartClient::TvChartClient(infra::net::TransportFactory factory,
                             domain::ICredentialProvider* credentials,
                             SessionOptions options,
                             std::optional<std::mt19937::result_type> seed)
    : factory_(std::move(factory)),
      credentials_(credentials),
      options_(options),
      identity_(make_identity(seed)) {
    std::optional<domain::Credentials> initial;
    if (credentials_ != nullptr) {
        initial = credentials_->obtain();
    }
    if (initial && !initial->token.empty()) {
        auth_.token = initial->token;
        auth_.planTier = initial->planTier;
    } else {
        LOG_WARN(logging::LogCategory::AUTH, "No auth token available, using anonymous access; data may be limited");
    }
}

bool TvChartClient::anonymous() const {
    return auth_.token == kAnonymousToken;
}

domain::FetchResult TvChartClient::fetch(const domain::SeriesRequest& request) {
    domain::FetchResult result;
    result.series.symbol = request.symbol;

    ProtocolSession session(factory_, auth_, credentials_, identity_, options_);
    const SessionOutcome outcome = session.run(request);

    switch (outcome.status) {
    case SessionStatus::AuthFailed:
        result.status = domain::FetchStatus::AuthFailed;
        return result;
    case SessionStatus::ConnectFailed:
        result.status = domain::FetchStatus::ConnectFailed;
        return result;
    case SessionStatus::SymbolError:
        result.status = domain::FetchStatus::SymbolError;
        return result;
    case SessionStatus::Completed:
    case SessionStatus::Interrupted:
        break;
    }

    const std::vector<boost::json::value> packets = decode(outcome.raw);
    result.series = assemble_bars(packets, request.symbol);
    result.quote = assemble_quote(packets);
    result.status = result.series.empty() ? domain::FetchStatus::Empty : domain::FetchStatus::Ok;
    LOG_DEBUG(logging::LogCategory::DATA, "%s: %zu packets, %zu bars, %zu quote fields", request.symbol.c_str(),
              packets.size(), result.series.size(), result.quote.size());
    return result;
}

}  // namespace adapters::tradingview
