#include "infra/net/WebSocketClient.h"

#include <sstream>
#include <string>
#include <stdexcept>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Log.h"

namespace infra::net {
namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr std::chrono::milliseconds kCloseTimeout{2000};

std::runtime_error make_error(const std::string& message) {
    return std::runtime_error("WebSocketClient: " + message);
}

}  // namespace

WebSocketClient::WebSocketClient(WsEndpoint endpoint)
    : endpoint_{std::move(endpoint)}, sslCtx_{ssl::context::tls_client} {
    sslCtx_.set_default_verify_paths();
    sslCtx_.set_verify_mode(ssl::verify_peer);
}

WebSocketClient::~WebSocketClient() {
    close();
}

template <typename Initiate>
void WebSocketClient::runWithDeadline_(std::chrono::milliseconds timeout, const char* what, Initiate&& initiate) {
    beast::error_code result = asio::error::would_block;
    // Applies only to the operation started here; a pending read keeps no expiry.
    beast::get_lowest_layer(*ws_).expires_after(timeout);
    initiate([&result](const beast::error_code& ec, auto&&...) { result = ec; });
    ioc_.restart();
    // A pending read may complete on the way; its handler records the result.
    while (result == asio::error::would_block && ioc_.run_one() != 0) {
    }
    if (ws_) {
        // Reads started later inside a pending message read must not inherit this deadline.
        beast::get_lowest_layer(*ws_).expires_never();
    }
    if (result == asio::error::would_block) {
        throw make_error(std::string(what) + " did not complete");
    }
    if (result) {
        throw make_error(std::string(what) + " failed: " + result.message());
    }
}

void WebSocketClient::connect() {
    close();
    ws_ = std::make_unique<WsStream>(ioc_, sslCtx_);

    if (endpoint_.verifyPeer) {
        ws_->next_layer().set_verify_mode(ssl::verify_peer);
        ws_->next_layer().set_verify_callback(ssl::host_name_verification(endpoint_.host));
    } else {
        ws_->next_layer().set_verify_mode(ssl::verify_none);
        LOG_WARN(logging::LogCategory::NET, "TLS peer verification disabled for %s", endpoint_.host.c_str());
    }
    if (!::SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), endpoint_.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI host name to '" << endpoint_.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw make_error(oss.str());
    }

    asio::ip::tcp::resolver resolver(ioc_);
    beast::error_code ec;
    LOG_DEBUG(logging::LogCategory::NET, "Resolving host=%s port=%s", endpoint_.host.c_str(),
              endpoint_.port.c_str());
    const auto results = resolver.resolve(endpoint_.host, endpoint_.port, ec);
    if (ec) {
        throw make_error("DNS resolve failed: " + ec.message());
    }

    runWithDeadline_(endpoint_.connectTimeout, "connect", [&](auto handler) {
        beast::get_lowest_layer(*ws_).async_connect(results, std::move(handler));
    });
    runWithDeadline_(endpoint_.connectTimeout, "TLS handshake", [&](auto handler) {
        ws_->next_layer().async_handshake(ssl::stream_base::client, std::move(handler));
    });

    const std::string origin = endpoint_.origin;
    ws_->set_option(websocket::stream_base::decorator([origin](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "tvfeed/1.0");
        if (!origin.empty()) {
            req.set(beast::http::field::origin, origin);
        }
    }));
    runWithDeadline_(endpoint_.connectTimeout, "WebSocket handshake", [&](auto handler) {
        ws_->async_handshake(endpoint_.host, endpoint_.target, std::move(handler));
    });
    ws_->text(true);

    LOG_DEBUG(logging::LogCategory::NET, "Connected to wss://%s%s", endpoint_.host.c_str(),
              endpoint_.target.c_str());
}

void WebSocketClient::send(const std::string& text) {
    if (!isOpen()) {
        throw make_error("send on a closed connection");
    }
    runWithDeadline_(endpoint_.connectTimeout, "write", [&](auto handler) {
        ws_->async_write(asio::buffer(text), std::move(handler));
    });
}

std::string WebSocketClient::receive(std::chrono::milliseconds timeout) {
    if (!readPending_) {
        if (!isOpen()) {
            throw make_error("receive on a closed connection");
        }
        buffer_.clear();
        readDone_ = false;
        readResult_ = {};
        readPending_ = true;
        beast::get_lowest_layer(*ws_).expires_never();
        ws_->async_read(buffer_, [this](const beast::error_code& ec, std::size_t) {
            readResult_ = ec;
            readDone_ = true;
        });
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    ioc_.restart();
    while (!readDone_ && ioc_.run_one_until(deadline) != 0) {
    }
    if (!readDone_) {
        throw ReceiveTimeout("WebSocketClient: no message within " + std::to_string(timeout.count()) + " ms");
    }

    readPending_ = false;
    if (readResult_) {
        throw make_error("read failed: " + readResult_.message());
    }
    std::string payload = beast::buffers_to_string(buffer_.cdata());
    buffer_.consume(buffer_.size());
    return payload;
}

void WebSocketClient::close() noexcept {
    if (!ws_) {
        return;
    }
    // The closing handshake would have to share the stream with the pending
    // read, so a connection with a read in flight is dropped without it.
    if (ws_->is_open() && !readPending_) {
        try {
            runWithDeadline_(kCloseTimeout, "close", [&](auto handler) {
                ws_->async_close(websocket::close_code::normal, std::move(handler));
            });
        } catch (const std::exception& ex) {
            LOG_DEBUG(logging::LogCategory::NET, "WebSocket close: %s", ex.what());
        }
    }
    beast::error_code ec;
    beast::get_lowest_layer(*ws_).socket().close(ec);
    // Let aborted handlers finish before the stream goes away.
    ioc_.restart();
    ioc_.run();
    ws_.reset();
    buffer_.clear();
    readPending_ = false;
    readDone_ = false;
}

bool WebSocketClient::isOpen() const noexcept {
    return ws_ != nullptr && ws_->is_open();
}

TransportFactory WebSocketClient::factory(const WsEndpoint& endpoint) {
    return [endpoint]() -> std::unique_ptr<IWsTransport> { return std::make_unique<WebSocketClient>(endpoint); };
}

}  // namespace infra::net
