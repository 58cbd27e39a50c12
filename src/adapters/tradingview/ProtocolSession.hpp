#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/json/array.hpp>

#include "adapters/tradingview/SessionIdentity.hpp"
#include "domain/Ports.hpp"
#include "infra/net/IWsTransport.hpp"

namespace adapters::tradingview {

constexpr const char* kAnonymousToken = "unauthorized_user_token";

// Credential state shared by every session of one engine. Only the auth
// recovery path writes to it.
struct AuthState {
    std::string token = kAnonymousToken;
    std::string planTier;
    bool unrecoverable{false};
};

enum class SessionState { Idle, Connecting, Authenticating, Resolving, Streaming, Completed, Failed };

enum class SessionStatus {
    Completed,      // terminal marker observed
    Interrupted,    // read failure or stream deadline; raw holds what arrived
    SymbolError,
    AuthFailed,
    ConnectFailed,
};

const char* to_string(SessionState state) noexcept;
const char* to_string(SessionStatus status) noexcept;

struct SessionOptions {
    int authCheckReads = 3;
    std::chrono::milliseconds authCheckTimeout{5000};
    std::chrono::milliseconds readTimeout{30000};
    // Zero disables the overall ceiling on the streaming phase.
    std::chrono::milliseconds streamDeadline{0};
};

struct SessionOutcome {
    SessionStatus status{SessionStatus::ConnectFailed};
    std::string raw;
};

// One request over one physical connection (two when auth recovery reconnects):
// Connecting -> Authenticating -> Resolving -> Streaming -> Completed | Failed.
class ProtocolSession {
public:
    ProtocolSession(infra::net::TransportFactory factory,
                    AuthState& auth,
                    domain::ICredentialProvider* credentials,
                    SessionIdentity& identity,
                    SessionOptions options = {});
    ~ProtocolSession();

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    SessionOutcome run(const domain::SeriesRequest& request);

    SessionState state() const noexcept { return state_; }
    // Session ids of every connection opened by this session, oldest first.
    const std::vector<SessionIds>& sessionHistory() const noexcept { return history_; }

private:
    enum class AuthOutcome { Accepted, Rejected, ConnectFailed };

    bool open_();
    AuthOutcome authenticate_(bool recoveryAllowed);
    AuthOutcome recover_(bool recoveryAllowed);
    void resolve_(const domain::SeriesRequest& request);
    SessionStatus stream_(const std::string& symbol, std::string& raw);
    void send_(const std::string& method, const boost::json::array& params);
    void close_() noexcept;
    SessionOutcome fail_(SessionStatus status);

    infra::net::TransportFactory factory_;
    AuthState& auth_;
    domain::ICredentialProvider* credentials_;
    SessionIdentity& identity_;
    SessionOptions options_;

    SessionState state_{SessionState::Idle};
    SessionIds ids_;
    std::vector<SessionIds> history_;
    std::unique_ptr<infra::net::IWsTransport> transport_;
};

}  // namespace adapters::tradingview
