#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "dentassist/core/async.hpp"
#include "dentassist/core/config.hpp"
#include "dentassist/core/error.hpp"
#include "dentassist/gateway/frame.hpp"
#include "dentassist/gateway/protocol.hpp"

namespace dentassist::gateway {

using boost::asio::awaitable;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

/// A single connected WebSocket client.
///
/// Requests are dispatched concurrently; responses are queued and written
/// one at a time. When the peer goes away the connection's CancelToken is
/// set so in-flight chat turns are abandoned.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using WsStream = websocket::stream<beast::tcp_stream>;

    Connection(WsStream ws, std::string id, std::shared_ptr<Protocol> protocol);

    /// Read frames until the peer closes.
    auto run() -> awaitable<void>;

    auto send(const Frame& frame) -> awaitable<Result<void>>;

    auto close() -> awaitable<void>;

    [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }
    [[nodiscard]] auto in_flight() const noexcept -> size_t { return in_flight_; }

private:
    auto read_loop() -> awaitable<void>;
    auto handle_frame(Frame frame) -> awaitable<void>;
    auto handle_request(RequestFrame req) -> awaitable<void>;
    void mark_closed();

    WsStream ws_;
    std::string id_;
    std::shared_ptr<Protocol> protocol_;
    CancelToken cancel_;
    std::deque<std::string> outbox_;
    bool writing_ = false;
    size_t in_flight_ = 0;
    std::atomic<bool> open_{true};
};

/// Listens on a TCP port, accepts WebSocket upgrades and routes request
/// frames through the Protocol registry. Runs on a single-threaded
/// io_context.
class GatewayServer {
public:
    static constexpr int PROTOCOL_VERSION = 1;
    static constexpr size_t MAX_PAYLOAD_BYTES = 1024 * 1024;

    explicit GatewayServer(net::io_context& ioc);

    /// Bind and accept until stop(). Throws if the port cannot be bound.
    auto start(const GatewayConfig& config) -> awaitable<void>;

    /// Close the acceptor and all connections.
    auto stop() -> awaitable<void>;

    [[nodiscard]] auto protocol() -> std::shared_ptr<Protocol>;

private:
    auto accept_loop() -> awaitable<void>;
    auto handle_connection(tcp::socket socket) -> awaitable<void>;

    net::io_context& ioc_;
    std::shared_ptr<Protocol> protocol_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    GatewayConfig config_;

    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;

    std::atomic<bool> running_{false};
};

} // namespace dentassist::gateway
