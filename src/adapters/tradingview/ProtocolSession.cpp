#include "adapters/tradingview/ProtocolSession.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>

#include "adapters/tradingview/FrameCodec.hpp"
#include "logging/Log.h"

namespace adapters::tradingview {
namespace {

namespace json = boost::json;

constexpr const char* kSymbolAlias = "symbol_1";
constexpr const char* kSeriesId = "s1";
constexpr const char* kCompletedMarker = "series_completed";
constexpr const char* kSymbolErrorMarker = "symbol_error";
constexpr const char* kProtocolErrorMarker = "protocol_error";

constexpr const char* kQuoteFields[] = {
    "ch",          "chp",           "current_session", "description", "local_description",
    "language",    "exchange",      "fractional",      "is_tradable", "lp",
    "lp_time",     "minmov",        "minmove2",        "original_name", "pricescale",
    "pro_name",    "short_name",    "type",            "update_mode", "volume",
    "currency_code", "rchp",        "rtc",
};

std::string protocol_error_reason(const std::string& message) {
    for (const auto& packet : decode(message)) {
        if (!packet.is_object()) {
            continue;
        }
        const auto& obj = packet.as_object();
        const auto* method = obj.if_contains("m");
        if (method == nullptr || !method->is_string() || method->as_string() != kProtocolErrorMarker) {
            continue;
        }
        const auto* params = obj.if_contains("p");
        if (params != nullptr && params->is_array() && !params->as_array().empty() &&
            params->as_array()[0].is_string()) {
            const auto& reason = params->as_array()[0].as_string();
            return std::string(reason.data(), reason.size());
        }
        return kProtocolErrorMarker;
    }
    return kProtocolErrorMarker;
}

}  // namespace

const char* to_string(SessionState state) noexcept {
    switch (state) {
    case SessionState::Idle:
        return "idle";
    case SessionState::Connecting:
        return "connecting";
    case SessionState::Authenticating:
        return "authenticating";
    case SessionState::Resolving:
        return "resolving";
    case SessionState::Streaming:
        return "streaming";
    case SessionState::Completed:
        return "completed";
    case SessionState::Failed:
        return "failed";
    }
    return "unknown";
}

const char* to_string(SessionStatus status) noexcept {
    switch (status) {
    case SessionStatus::Completed:
        return "completed";
    case SessionStatus::Interrupted:
        return "interrupted";
    case SessionStatus::SymbolError:
        return "symbol_error";
    case SessionStatus::AuthFailed:
        return "auth_failed";
    case SessionStatus::ConnectFailed:
        return "connect_failed";
    }
    return "unknown";
}

ProtocolSession::ProtocolSession(infra::net::TransportFactory factory,
                                 AuthState& auth,
                                 domain::ICredentialProvider* credentials,
                                 SessionIdentity& identity,
                                 SessionOptions options)
    : factory_(std::move(factory)),
      auth_(auth),
      credentials_(credentials),
      identity_(identity),
      options_(options) {}

ProtocolSession::~ProtocolSession() {
    close_();
}

SessionOutcome ProtocolSession::run(const domain::SeriesRequest& request) {
    if (auth_.unrecoverable) {
        LOG_DEBUG(logging::LogCategory::AUTH, "Skipping %s: credentials marked unrecoverable",
                  request.symbol.c_str());
        return fail_(SessionStatus::AuthFailed);
    }

    state_ = SessionState::Connecting;
    if (!open_()) {
        return fail_(SessionStatus::ConnectFailed);
    }

    state_ = SessionState::Authenticating;
    switch (authenticate_(true)) {
    case AuthOutcome::Accepted:
        break;
    case AuthOutcome::Rejected:
        return fail_(SessionStatus::AuthFailed);
    case AuthOutcome::ConnectFailed:
        return fail_(SessionStatus::ConnectFailed);
    }

    state_ = SessionState::Resolving;
    try {
        resolve_(request);
    } catch (const std::exception& ex) {
        LOG_WARN(logging::LogCategory::NET, "Request setup for %s failed: %s", request.symbol.c_str(), ex.what());
        return fail_(SessionStatus::ConnectFailed);
    }

    state_ = SessionState::Streaming;
    SessionOutcome outcome;
    outcome.status = stream_(request.symbol, outcome.raw);
    close_();
    state_ = SessionState::Completed;
    LOG_DEBUG(logging::LogCategory::PROTO, "Session %s for %s ended: %s (%zu bytes)", ids_.chartSession.c_str(),
              request.symbol.c_str(), to_string(outcome.status), outcome.raw.size());
    return outcome;
}

bool ProtocolSession::open_() {
    close_();
    ids_ = identity_.newSession();
    history_.push_back(ids_);
    transport_ = factory_();
    if (!transport_) {
        LOG_ERROR(logging::LogCategory::NET, "Transport factory returned no connection");
        return false;
    }
    try {
        transport_->connect();
    } catch (const std::exception& ex) {
        LOG_WARN(logging::LogCategory::NET, "Connection failed: %s", ex.what());
        transport_.reset();
        return false;
    }
    return true;
}

ProtocolSession::AuthOutcome ProtocolSession::authenticate_(bool recoveryAllowed) {
    try {
        send_("set_auth_token", json::array{json::string(auth_.token)});
    } catch (const std::exception& ex) {
        LOG_WARN(logging::LogCategory::NET, "Sending auth token failed: %s", ex.what());
        return AuthOutcome::ConnectFailed;
    }

    for (int read = 0; read < options_.authCheckReads; ++read) {
        std::string message;
        try {
            message = transport_->receive(options_.authCheckTimeout);
        } catch (const infra::net::ReceiveTimeout& ex) {
            // Silence after the token is the normal case for an accepted session.
            LOG_DEBUG(logging::LogCategory::AUTH, "Auth check read %d: %s", read + 1, ex.what());
            break;
        } catch (const std::exception& ex) {
            LOG_WARN(logging::LogCategory::NET, "Connection lost during auth check: %s", ex.what());
            return AuthOutcome::ConnectFailed;
        }
        if (message.find(kProtocolErrorMarker) != std::string::npos) {
            LOG_ERROR(logging::LogCategory::AUTH, "Auth failed: %s", protocol_error_reason(message).c_str());
            return recover_(recoveryAllowed);
        }
    }
    return AuthOutcome::Accepted;
}

ProtocolSession::AuthOutcome ProtocolSession::recover_(bool recoveryAllowed) {
    if (recoveryAllowed && credentials_ != nullptr) {
        const auto fresh = credentials_->recover(auth_.token);
        if (fresh && !fresh->token.empty() && fresh->token != auth_.token) {
            LOG_INFO(logging::LogCategory::AUTH, "Retrying with refreshed credentials");
            auth_.token = fresh->token;
            auth_.planTier = fresh->planTier;
            state_ = SessionState::Connecting;
            if (!open_()) {
                return AuthOutcome::ConnectFailed;
            }
            state_ = SessionState::Authenticating;
            return authenticate_(false);
        }
    }
    LOG_ERROR(logging::LogCategory::AUTH, "Could not recover a valid auth token; no further requests will be sent");
    auth_.unrecoverable = true;
    return AuthOutcome::Rejected;
}

void ProtocolSession::resolve_(const domain::SeriesRequest& request) {
    const std::string& qs = ids_.quoteSession;
    const std::string& cs = ids_.chartSession;
    const std::string& symbol = request.symbol;

    send_("chart_create_session", json::array{json::string(cs), json::string("")});
    send_("quote_create_session", json::array{json::string(qs)});

    json::array fields{json::string(qs)};
    for (const char* field : kQuoteFields) {
        fields.emplace_back(json::string(field));
    }
    send_("quote_set_fields", fields);

    json::object flags;
    flags["flags"] = json::array{json::string("force_permission")};
    send_("quote_add_symbols", json::array{json::string(qs), json::string(symbol), flags});
    send_("quote_fast_symbols", json::array{json::string(qs), json::string(symbol)});

    json::object descriptor;
    descriptor["symbol"] = symbol;
    descriptor["adjustment"] = "splits";
    descriptor["session"] = request.extendedSession ? "extended" : "regular";
    send_("resolve_symbol",
          json::array{json::string(cs), json::string(kSymbolAlias), json::string("=" + json::serialize(descriptor))});

    json::array series{json::string(cs), json::string(kSeriesId), json::string(kSeriesId),
                       json::string(kSymbolAlias), json::string(domain::interval_code(request.interval)),
                       request.barCount};
    if (request.rangeToken) {
        series.emplace_back(json::string(*request.rangeToken));
    }
    send_("create_series", series);
    send_("switch_timezone", json::array{json::string(cs), json::string("exchange")});
}

SessionStatus ProtocolSession::stream_(const std::string& symbol, std::string& raw) {
    using Clock = std::chrono::steady_clock;
    const bool bounded = options_.streamDeadline.count() > 0;
    const auto deadline = Clock::now() + options_.streamDeadline;

    while (true) {
        auto readTimeout = options_.readTimeout;
        if (bounded) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0) {
                LOG_WARN(logging::LogCategory::PROTO, "Stream for %s exceeded %lld ms, keeping %zu bytes",
                         symbol.c_str(), static_cast<long long>(options_.streamDeadline.count()), raw.size());
                return SessionStatus::Interrupted;
            }
            readTimeout = std::min(readTimeout, remaining);
        }

        std::string message;
        try {
            message = transport_->receive(readTimeout);
        } catch (const infra::net::ReceiveTimeout& ex) {
            LOG_ERROR(logging::LogCategory::NET, "Stream for %s stalled: %s", symbol.c_str(), ex.what());
            return SessionStatus::Interrupted;
        } catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::NET, "Stream for %s interrupted: %s", symbol.c_str(), ex.what());
            return SessionStatus::Interrupted;
        }
        raw += message;
        raw += '\n';

        for (const auto& beat : heartbeats(message)) {
            try {
                transport_->send(wrap_frame(beat));
            } catch (const std::exception& ex) {
                LOG_DEBUG(logging::LogCategory::NET, "Heartbeat echo failed: %s", ex.what());
            }
        }

        if (message.find(kCompletedMarker) != std::string::npos) {
            return SessionStatus::Completed;
        }
        if (message.find(kSymbolErrorMarker) != std::string::npos) {
            LOG_ERROR(logging::LogCategory::PROTO, "Invalid symbol: %s, check exchange and symbol name",
                      symbol.c_str());
            return SessionStatus::SymbolError;
        }
    }
}

void ProtocolSession::send_(const std::string& method, const boost::json::array& params) {
    const std::string frame = encode(method, params);
    LOG_TRACE(logging::LogCategory::PROTO, "-> %s", frame.c_str());
    transport_->send(frame);
}

void ProtocolSession::close_() noexcept {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}

SessionOutcome ProtocolSession::fail_(SessionStatus status) {
    close_();
    state_ = SessionState::Failed;
    SessionOutcome outcome;
    outcome.status = status;
    return outcome;
}

}  // namespace adapters::tradingview
