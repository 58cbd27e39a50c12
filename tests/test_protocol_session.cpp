#include <chrono>
#include <deque>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "adapters/tradingview/FrameCodec.hpp"
#include "adapters/tradingview/ProtocolSession.hpp"

namespace json = boost::json;
using namespace adapters::tradingview;

namespace {

// A read scripted as kTimeout reports a quiet server and keeps the connection;
// running out of reads behaves like a reset and closes it.
const std::string kTimeout = "<timeout>";

struct Script {
    bool failConnect = false;
    std::deque<std::string> reads;
    std::vector<std::string> sent;
    std::vector<std::chrono::milliseconds> readTimeouts;
    bool closed = false;
    bool reset = false;
};

class ScriptedTransport : public infra::net::IWsTransport {
public:
    explicit ScriptedTransport(std::shared_ptr<Script> script) : script_(std::move(script)) {}

    void connect() override {
        if (script_->failConnect) {
            throw std::runtime_error("connection refused");
        }
    }

    void send(const std::string& text) override {
        if (script_->reset) {
            throw std::runtime_error("send on a closed connection");
        }
        script_->sent.push_back(text);
    }

    std::string receive(std::chrono::milliseconds timeout) override {
        script_->readTimeouts.push_back(timeout);
        if (script_->reset || script_->reads.empty()) {
            script_->reset = true;
            throw std::runtime_error("connection reset");
        }
        std::string next = script_->reads.front();
        script_->reads.pop_front();
        if (next == kTimeout) {
            throw infra::net::ReceiveTimeout("no message within timeout");
        }
        return next;
    }

    void close() noexcept override { script_->closed = true; }

private:
    std::shared_ptr<Script> script_;
};

struct ScriptedFactory {
    std::vector<std::shared_ptr<Script>> scripts;
    std::size_t opened = 0;

    infra::net::TransportFactory factory() {
        return [this]() -> std::unique_ptr<infra::net::IWsTransport> {
            if (opened >= scripts.size()) {
                auto refused = std::make_shared<Script>();
                refused->failConnect = true;
                scripts.push_back(refused);
            }
            return std::make_unique<ScriptedTransport>(scripts[opened++]);
        };
    }
};

class FakeCredentials : public domain::ICredentialProvider {
public:
    std::optional<domain::Credentials> refreshed;
    std::vector<std::string> rejected;

    std::optional<domain::Credentials> obtain() override { return domain::Credentials{"stale", "pro"}; }

    std::optional<domain::Credentials> recover(const std::string& rejectedToken) override {
        rejected.push_back(rejectedToken);
        return refreshed;
    }
};

std::string greeting() {
    return wrap_frame(R"({"session_id":"<0.1.2>_abc","timestamp":1700000000,"release":"registry"})");
}

std::string bars_frame() {
    return wrap_frame(
        R"({"m":"timescale_update","p":["cs_x",{"s1":{"s":[{"i":0,"v":[1700000000,1,2,0.5,1.5,10]}]}}]})");
}

std::string completed_frame() {
    return wrap_frame(R"({"m":"series_completed","p":["cs_x","s1","s1_1"]})");
}

std::vector<std::string> methods_of(const std::vector<std::string>& frames) {
    std::vector<std::string> methods;
    for (const auto& frame : frames) {
        for (const auto& packet : decode(frame)) {
            if (packet.is_object() && packet.as_object().contains("m")) {
                methods.emplace_back(packet.as_object().at("m").as_string().c_str());
            }
        }
    }
    return methods;
}

json::array params_of(const std::vector<std::string>& frames, const std::string& method) {
    for (const auto& frame : frames) {
        for (const auto& packet : decode(frame)) {
            if (packet.is_object() && packet.as_object().at("m").as_string() == method) {
                return packet.as_object().at("p").as_array();
            }
        }
    }
    return {};
}

domain::SeriesRequest daily_request() {
    domain::SeriesRequest request;
    request.symbol = "NSE:NIFTY";
    request.interval = domain::Interval::Day1;
    request.barCount = 10;
    return request;
}

}  // namespace

int main() {
    {
        ScriptedFactory transports;
        auto script = std::make_shared<Script>();
        script->reads = {greeting(), kTimeout, bars_frame(), completed_frame(), bars_frame()};
        transports.scripts.push_back(script);

        AuthState auth;
        SessionIdentity identity(42);
        ProtocolSession session(transports.factory(), auth, nullptr, identity);
        const auto outcome = session.run(daily_request());

        if (outcome.status != SessionStatus::Completed || session.state() != SessionState::Completed) {
            std::cerr << "Expected completed session, got " << to_string(outcome.status) << '\n';
            return 1;
        }
        if (script->reads.size() != 1) {
            std::cerr << "Streaming must stop at the completion marker\n";
            return 1;
        }
        if (outcome.raw != bars_frame() + "\n" + completed_frame() + "\n") {
            std::cerr << "Raw stream must hold every streamed read followed by a newline\n";
            return 1;
        }
        const std::vector<std::string> expected{"set_auth_token",    "chart_create_session", "quote_create_session",
                                                "quote_set_fields",  "quote_add_symbols",    "quote_fast_symbols",
                                                "resolve_symbol",    "create_series",        "switch_timezone"};
        if (methods_of(script->sent) != expected) {
            std::cerr << "Unexpected handshake order\n";
            return 1;
        }
        if (params_of(script->sent, "set_auth_token") != json::array{"unauthorized_user_token"}) {
            std::cerr << "Anonymous token not sent\n";
            return 1;
        }
        const auto& ids = session.sessionHistory();
        if (ids.size() != 1 || ids.front().chartSession.rfind("cs_", 0) != 0 ||
            ids.front().quoteSession.rfind("qs_", 0) != 0 ||
            ids.front().chartSession.size() != 3 + SessionIdentity::kSuffixLength) {
            std::cerr << "Unexpected session ids\n";
            return 1;
        }
        const auto series = params_of(script->sent, "create_series");
        const json::array expectedSeries{json::string_view(ids.front().chartSession), "s1", "s1", "symbol_1", "1D", 10};
        if (series != expectedSeries) {
            std::cerr << "Unexpected create_series params: " << json::serialize(series) << '\n';
            return 1;
        }
        const auto resolve = params_of(script->sent, "resolve_symbol");
        if (resolve.size() != 3 ||
            resolve[2] != json::value(R"(={"symbol":"NSE:NIFTY","adjustment":"splits","session":"regular"})")) {
            std::cerr << "Unexpected resolve_symbol params: " << json::serialize(resolve) << '\n';
            return 1;
        }
        if (params_of(script->sent, "quote_set_fields").size() != 24) {
            std::cerr << "quote_set_fields must carry the session and 23 fields\n";
            return 1;
        }
        if (!script->closed) {
            std::cerr << "Connection not closed after completion\n";
            return 1;
        }
    }

    {
        // Range request on an extended session.
        ScriptedFactory transports;
        auto script = std::make_shared<Script>();
        script->reads = {kTimeout, completed_frame()};
        transports.scripts.push_back(script);

        AuthState auth;
        SessionIdentity identity(7);
        ProtocolSession session(transports.factory(), auth, nullptr, identity);
        auto request = daily_request();
        request.interval = domain::Interval::Minute15;
        request.barCount = 4000;
        request.rangeToken = "r,1599998200000:1600084600000";
        request.extendedSession = true;
        (void)session.run(request);

        const auto series = params_of(script->sent, "create_series");
        if (series.size() != 7 || series[4] != json::value("15") || series[5] != json::value(4000) ||
            series[6] != json::value("r,1599998200000:1600084600000")) {
            std::cerr << "Range create_series params wrong: " << json::serialize(series) << '\n';
            return 1;
        }
        const auto resolve = params_of(script->sent, "resolve_symbol");
        if (resolve[2].as_string().find(R"("session":"extended")") == json::string::npos) {
            std::cerr << "Extended session flag not sent\n";
            return 1;
        }
    }

    {
        // Rejected token, provider supplies a new one: second connection with fresh ids.
        ScriptedFactory transports;
        auto rejected = std::make_shared<Script>();
        rejected->reads = {greeting(), wrap_frame(R"({"m":"protocol_error","p":["wrong or expired auth token"]})")};
        auto accepted = std::make_shared<Script>();
        accepted->reads = {greeting(), kTimeout, bars_frame(), completed_frame()};
        transports.scripts = {rejected, accepted};

        FakeCredentials credentials;
        credentials.refreshed = domain::Credentials{"fresh", "pro_premium"};
        AuthState auth;
        auth.token = "stale";
        auth.planTier = "pro";
        SessionIdentity identity(1);
        ProtocolSession session(transports.factory(), auth, &credentials, identity);
        const auto outcome = session.run(daily_request());

        if (outcome.status != SessionStatus::Completed) {
            std::cerr << "Recovery should complete the session, got " << to_string(outcome.status) << '\n';
            return 1;
        }
        if (transports.opened != 2 || !rejected->closed) {
            std::cerr << "Expected the rejected connection to be closed and a second one opened\n";
            return 1;
        }
        const auto& ids = session.sessionHistory();
        if (ids.size() != 2 || ids[0].chartSession == ids[1].chartSession ||
            ids[0].quoteSession == ids[1].quoteSession) {
            std::cerr << "Reconnect must use fresh session ids\n";
            return 1;
        }
        if (credentials.rejected != std::vector<std::string>{"stale"} || auth.token != "fresh" ||
            auth.planTier != "pro_premium" || auth.unrecoverable) {
            std::cerr << "Shared auth state not updated by recovery\n";
            return 1;
        }
        if (params_of(accepted->sent, "set_auth_token") != json::array{"fresh"}) {
            std::cerr << "Second connection must authenticate with the refreshed token\n";
            return 1;
        }
        if (params_of(accepted->sent, "create_series").at(0) != json::value(json::string_view(ids[1].chartSession))) {
            std::cerr << "Series must be created on the second session\n";
            return 1;
        }
        if (methods_of(rejected->sent) != std::vector<std::string>{"set_auth_token"}) {
            std::cerr << "Nothing but the token may be sent on a rejected connection\n";
            return 1;
        }
    }

    {
        // Recovery fails: unrecoverable, and later runs never touch the network.
        ScriptedFactory transports;
        auto rejected = std::make_shared<Script>();
        rejected->reads = {wrap_frame(R"({"m":"protocol_error","p":["invalid token"]})")};
        transports.scripts = {rejected};

        FakeCredentials credentials;
        AuthState auth;
        auth.token = "stale";
        SessionIdentity identity(2);
        ProtocolSession first(transports.factory(), auth, &credentials, identity);
        if (first.run(daily_request()).status != SessionStatus::AuthFailed || !auth.unrecoverable ||
            first.state() != SessionState::Failed) {
            std::cerr << "Failed recovery must mark credentials unrecoverable\n";
            return 1;
        }

        ProtocolSession second(transports.factory(), auth, &credentials, identity);
        if (second.run(daily_request()).status != SessionStatus::AuthFailed || transports.opened != 1 ||
            credentials.rejected.size() != 1) {
            std::cerr << "Unrecoverable credentials must short-circuit without connecting\n";
            return 1;
        }
    }

    {
        // Refreshed token rejected as well: recovery is attempted once only.
        ScriptedFactory transports;
        auto first = std::make_shared<Script>();
        first->reads = {wrap_frame(R"({"m":"protocol_error","p":["invalid token"]})")};
        auto second = std::make_shared<Script>();
        second->reads = {wrap_frame(R"({"m":"protocol_error","p":["invalid token"]})")};
        transports.scripts = {first, second};

        FakeCredentials credentials;
        credentials.refreshed = domain::Credentials{"also-bad", ""};
        AuthState auth;
        auth.token = "stale";
        SessionIdentity identity(3);
        ProtocolSession session(transports.factory(), auth, &credentials, identity);
        if (session.run(daily_request()).status != SessionStatus::AuthFailed || !auth.unrecoverable ||
            credentials.rejected.size() != 1 || transports.opened != 2) {
            std::cerr << "Second rejection must not trigger another recovery\n";
            return 1;
        }
    }

    {
        ScriptedFactory transports;
        auto script = std::make_shared<Script>();
        script->reads = {kTimeout, wrap_frame(R"({"m":"symbol_error","p":["cs_x","symbol_1","invalid symbol"]})"),
                         completed_frame()};
        transports.scripts = {script};

        AuthState auth;
        SessionIdentity identity(4);
        ProtocolSession session(transports.factory(), auth, nullptr, identity);
        const auto outcome = session.run(daily_request());
        if (outcome.status != SessionStatus::SymbolError || script->reads.size() != 1 || !script->closed) {
            std::cerr << "Symbol error must end the stream immediately\n";
            return 1;
        }
    }

    {
        // A failing read ends the stream with what has arrived.
        ScriptedFactory transports;
        auto script = std::make_shared<Script>();
        script->reads = {kTimeout, bars_frame()};
        transports.scripts = {script};

        AuthState auth;
        SessionIdentity identity(5);
        ProtocolSession session(transports.factory(), auth, nullptr, identity);
        const auto outcome = session.run(daily_request());
        if (outcome.status != SessionStatus::Interrupted || outcome.raw != bars_frame() + "\n") {
            std::cerr << "Read failure must keep the partial stream\n";
            return 1;
        }
    }

    {
        ScriptedFactory transports;
        auto script = std::make_shared<Script>();
        script->reads = {kTimeout, wrap_frame("~h~9"), completed_frame()};
        transports.scripts = {script};

        AuthState auth;
        SessionIdentity identity(6);
        ProtocolSession session(transports.factory(), auth, nullptr, identity);
        (void)session.run(daily_request());
        if (script->sent.empty() || script->sent.back() != "~m~4~m~~h~9") {
            std::cerr << "Heartbeat must be echoed back\n";
            return 1;
        }
    }

    {
        ScriptedFactory transports;
        auto refused = std::make_shared<Script>();
        refused->failConnect = true;
        transports.scripts = {refused};

        AuthState auth;
        SessionIdentity identity(8);
        ProtocolSession session(transports.factory(), auth, nullptr, identity);
        if (session.run(daily_request()).status != SessionStatus::ConnectFailed ||
            session.state() != SessionState::Failed || !refused->sent.empty()) {
            std::cerr << "Connect failure must fail the session without sending\n";
            return 1;
        }
    }

    {
        // A server that stays quiet after the greeting has accepted the token.
        ScriptedFactory transports;
        auto script = std::make_shared<Script>();
        script->reads = {greeting(), kTimeout, bars_frame(), completed_frame()};
        transports.scripts = {script};

        AuthState auth;
        SessionIdentity identity(10);
        ProtocolSession session(transports.factory(), auth, nullptr, identity);
        const auto outcome = session.run(daily_request());
        if (outcome.status != SessionStatus::Completed || script->reset ||
            methods_of(script->sent).back() != "switch_timezone" || auth.unrecoverable) {
            std::cerr << "Silence after the greeting must leave the session usable\n";
            return 1;
        }
    }

    {
        // A reset during the auth check is a connection failure, not an accepted token.
        ScriptedFactory transports;
        auto script = std::make_shared<Script>();
        script->reads = {greeting()};
        transports.scripts = {script};

        AuthState auth;
        SessionIdentity identity(11);
        ProtocolSession session(transports.factory(), auth, nullptr, identity);
        const auto outcome = session.run(daily_request());
        if (outcome.status != SessionStatus::ConnectFailed ||
            methods_of(script->sent) != std::vector<std::string>{"set_auth_token"} || auth.unrecoverable) {
            std::cerr << "Reset during auth check must fail the connection, got " << to_string(outcome.status)
                      << '\n';
            return 1;
        }
    }

    {
        // A stall mid-stream keeps what arrived.
        ScriptedFactory transports;
        auto script = std::make_shared<Script>();
        script->reads = {kTimeout, bars_frame(), kTimeout, completed_frame()};
        transports.scripts = {script};

        AuthState auth;
        SessionIdentity identity(12);
        ProtocolSession session(transports.factory(), auth, nullptr, identity);
        const auto outcome = session.run(daily_request());
        if (outcome.status != SessionStatus::Interrupted || outcome.raw != bars_frame() + "\n") {
            std::cerr << "Stalled stream must end interrupted with the partial data\n";
            return 1;
        }
    }

    {
        // Per-read timeouts: short auth check, configured read timeout capped by the stream deadline.
        ScriptedFactory transports;
        auto script = std::make_shared<Script>();
        script->reads = {kTimeout, completed_frame()};
        transports.scripts = {script};

        SessionOptions options;
        options.authCheckTimeout = std::chrono::milliseconds(1500);
        options.readTimeout = std::chrono::milliseconds(30000);
        options.streamDeadline = std::chrono::milliseconds(10000);
        AuthState auth;
        SessionIdentity identity(9);
        ProtocolSession session(transports.factory(), auth, nullptr, identity, options);
        (void)session.run(daily_request());
        if (script->readTimeouts.size() != 2 || script->readTimeouts[0] != std::chrono::milliseconds(1500) ||
            script->readTimeouts[1] > std::chrono::milliseconds(10000) ||
            script->readTimeouts[1] <= std::chrono::milliseconds(0)) {
            std::cerr << "Read timeouts not applied as configured\n";
            return 1;
        }
    }

    std::cout << "test_protocol_session passed\n";
    return 0;
}
