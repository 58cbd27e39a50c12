#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace infra::net {

struct WsEndpoint {
    std::string host = "data.tradingview.com";
    std::string port = "443";
    std::string target = "/socket.io/websocket";
    std::string origin = "https://data.tradingview.com";
    // Bounds DNS-to-upgrade setup, writes and the closing handshake.
    std::chrono::milliseconds connectTimeout{5000};
    // Off only for endpoints with self-signed certificates, such as a local relay.
    bool verifyPeer = true;
};

// No complete message arrived within the receive timeout. The connection stays
// open and the message still in flight is returned by the next receive.
class ReceiveTimeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Blocking message-oriented connection. A receive timeout raises ReceiveTimeout;
// every other failure (reset, peer close, write timeout) raises
// std::runtime_error and leaves the connection closed.
class IWsTransport {
public:
    virtual ~IWsTransport() = default;

    virtual void connect() = 0;
    virtual void send(const std::string& text) = 0;
    // One complete message, waiting at most timeout.
    virtual std::string receive(std::chrono::milliseconds timeout) = 0;
    virtual void close() noexcept = 0;
};

using TransportFactory = std::function<std::unique_ptr<IWsTransport>()>;

}  // namespace infra::net
