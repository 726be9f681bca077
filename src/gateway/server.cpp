#include "dentassist/gateway/server.hpp"

#include <algorithm>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/field.hpp>

#include "dentassist/core/logger.hpp"
#include "dentassist/core/utils.hpp"

namespace dentassist::gateway {

// ===========================================================================
// Connection
// ===========================================================================

Connection::Connection(WsStream ws, std::string id, std::shared_ptr<Protocol> protocol)
    : ws_(std::move(ws))
    , id_(std::move(id))
    , protocol_(std::move(protocol)) {}

auto Connection::run() -> awaitable<void> {
    co_await read_loop();
    mark_closed();
}

void Connection::mark_closed() {
    open_ = false;
    cancel_.cancel();
    outbox_.clear();
}

auto Connection::send(const Frame& frame) -> awaitable<Result<void>> {
    if (!open_) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionClosed, "Connection is closed"));
    }

    outbox_.push_back(serialize_frame(frame));
    if (writing_) {
        // The active writer drains the queue.
        co_return ok_result();
    }

    writing_ = true;
    auto self = shared_from_this();
    while (!outbox_.empty() && open_) {
        auto message = std::move(outbox_.front());
        outbox_.pop_front();
        try {
            ws_.text(true);
            co_await ws_.async_write(net::buffer(message), net::use_awaitable);
        } catch (const boost::system::system_error& e) {
            LOG_WARN("Connection {}: write error: {}", id_, e.what());
            writing_ = false;
            mark_closed();
            co_return make_fail(
                make_error(ErrorCode::IoError, "WebSocket write failed", e.what()));
        }
    }
    writing_ = false;
    co_return ok_result();
}

auto Connection::close() -> awaitable<void> {
    if (!open_) co_return;
    mark_closed();

    try {
        co_await ws_.async_close(
            websocket::close_code::normal, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        LOG_DEBUG("Connection {}: close error (expected if peer gone): {}",
                  id_, e.what());
    }
}

auto Connection::read_loop() -> awaitable<void> {
    beast::flat_buffer buffer;

    while (open_) {
        try {
            co_await ws_.async_read(buffer, net::use_awaitable);
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                LOG_INFO("Connection {}: peer closed", id_);
            } else {
                LOG_WARN("Connection {}: read error: {}", id_, e.what());
            }
            break;
        }

        auto data = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());

        auto frame = parse_frame(data);
        if (!frame) {
            LOG_WARN("Connection {}: bad frame: {}", id_, frame.error().what());
            auto sent = co_await send(Frame{make_error_response("", frame.error())});
            if (!sent) break;
            continue;
        }

        co_await handle_frame(std::move(*frame));
    }
}

auto Connection::handle_frame(Frame frame) -> awaitable<void> {
    if (auto* req = std::get_if<RequestFrame>(&frame)) {
        // Requests run concurrently so a slow chat turn does not block
        // kb.* calls on the same connection.
        ++in_flight_;
        net::co_spawn(ws_.get_executor(),
            [self = shared_from_this(), req = std::move(*req)]() mutable
                -> awaitable<void> {
                co_await self->handle_request(std::move(req));
                --self->in_flight_;
            },
            net::detached);
    } else if (auto* resp = std::get_if<ResponseFrame>(&frame)) {
        LOG_DEBUG("Connection {}: received unexpected {} frame id={}",
                  id_, resp->is_error() ? "error" : "response", resp->id);
    } else if (auto* evt = std::get_if<EventFrame>(&frame)) {
        LOG_DEBUG("Connection {}: received event '{}' from client",
                  id_, evt->event);
    }
}

auto Connection::handle_request(RequestFrame req) -> awaitable<void> {
    LOG_DEBUG("Connection {}: request method={} id={}", id_, req.method, req.id);

    auto result = co_await protocol_->dispatch(req, RequestContext{id_, cancel_});

    if (!open_) {
        LOG_DEBUG("Connection {}: dropping response to {} after disconnect",
                  id_, req.id);
        co_return;
    }

    Frame response = result
        ? Frame{make_response(req.id, std::move(*result))}
        : Frame{make_error_response(req.id, result.error())};

    auto sent = co_await send(response);
    if (!sent) {
        LOG_DEBUG("Connection {}: failed to send response {}: {}",
                  id_, req.id, sent.error().what());
    }
}

// ===========================================================================
// GatewayServer
// ===========================================================================

GatewayServer::GatewayServer(net::io_context& ioc)
    : ioc_(ioc)
    , protocol_(std::make_shared<Protocol>()) {}

auto GatewayServer::start(const GatewayConfig& config) -> awaitable<void> {
    config_ = config;

    auto address = (config.bind == BindMode::All)
        ? net::ip::make_address("0.0.0.0")
        : net::ip::make_address("127.0.0.1");

    auto endpoint = tcp::endpoint{address, config.port};

    acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(net::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(net::socket_base::max_listen_connections);

    running_ = true;
    LOG_INFO("Gateway server listening on {}:{} ({} methods)",
             address.to_string(), config.port, protocol_->methods().size());

    co_await accept_loop();
}

auto GatewayServer::stop() -> awaitable<void> {
    if (!running_) co_return;
    running_ = false;

    LOG_INFO("Gateway server shutting down, closing {} connections",
             connections_.size());

    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
        if (ec) LOG_DEBUG("Acceptor close: {}", ec.message());
    }

    // close() suspends, so work on a copy of the map.
    auto open = connections_;
    for (auto& [id, conn] : open) {
        co_await conn->close();
    }
    connections_.clear();

    LOG_INFO("Gateway server stopped");
}

auto GatewayServer::protocol() -> std::shared_ptr<Protocol> {
    return protocol_;
}

auto GatewayServer::accept_loop() -> awaitable<void> {
    while (running_) {
        try {
            auto socket = co_await acceptor_->async_accept(net::use_awaitable);

            if (connections_.size() >= config_.max_connections) {
                LOG_WARN("Max connections ({}) reached, rejecting",
                         config_.max_connections);
                boost::system::error_code ec;
                socket.close(ec);
                continue;
            }

            net::co_spawn(ioc_, handle_connection(std::move(socket)), net::detached);

        } catch (const boost::system::system_error& e) {
            if (!running_) break;  // acceptor closed by stop()
            LOG_ERROR("Accept error: {}", e.what());
        }
    }
}

auto GatewayServer::handle_connection(tcp::socket socket) -> awaitable<void> {
    auto conn_id = utils::generate_id(12);

    boost::system::error_code ep_ec;
    auto remote_ep = socket.remote_endpoint(ep_ec);
    auto remote = ep_ec ? std::string("unknown")
                        : remote_ep.address().to_string() + ":" +
                              std::to_string(remote_ep.port());
    LOG_INFO("New connection {} from {}", conn_id, remote);

    Connection::WsStream ws(std::move(socket));

    try {
        ws.set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::server));
        ws.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(beast::http::field::server, "dentassist-gateway");
            }));
        ws.read_message_max(MAX_PAYLOAD_BYTES);

        co_await ws.async_accept(net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        LOG_WARN("Connection {}: WebSocket handshake failed: {}",
                 conn_id, e.what());
        co_return;
    }

    auto conn = std::make_shared<Connection>(std::move(ws), conn_id, protocol_);
    connections_[conn_id] = conn;

    auto hello = make_event("gateway.ready", json{
        {"connection_id", conn_id},
        {"protocol", PROTOCOL_VERSION},
        {"methods", protocol_->methods().size()},
        {"max_payload", MAX_PAYLOAD_BYTES},
    });
    auto sent = co_await conn->send(Frame{hello});
    if (sent) {
        co_await conn->run();
    }

    connections_.erase(conn_id);
    LOG_INFO("Connection {} closed ({} requests abandoned)", conn_id, conn->in_flight());
}

} // namespace dentassist::gateway
