// WebSocketClient.h
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "infra/net/IWsTransport.hpp"

namespace infra::net {

// TLS WebSocket client on a private io_context. Connect, write and close run
// under a stream deadline. A read is never expired: receive() drives the
// io_context for at most its timeout and leaves an unfinished read pending for
// the next call, so a quiet server does not cost the connection.
class WebSocketClient : public IWsTransport {
public:
    explicit WebSocketClient(WsEndpoint endpoint);
    ~WebSocketClient() override;

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    void connect() override;
    void send(const std::string& text) override;
    std::string receive(std::chrono::milliseconds timeout) override;
    void close() noexcept override;

    bool isOpen() const noexcept;

    static TransportFactory factory(const WsEndpoint& endpoint);

private:
    using WsStream = boost::beast::websocket::stream<
        boost::asio::ssl::stream<boost::beast::tcp_stream>>;

    template <typename Initiate>
    void runWithDeadline_(std::chrono::milliseconds timeout, const char* what, Initiate&& initiate);

    WsEndpoint endpoint_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context sslCtx_;
    std::unique_ptr<WsStream> ws_;
    boost::beast::flat_buffer buffer_;
    bool readPending_{false};
    bool readDone_{false};
    boost::beast::error_code readResult_;
};

}  // namespace infra::net
