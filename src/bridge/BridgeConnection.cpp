#include "bridge/BridgeConnection.h"

#include "async/TaskGroup.h"
#include "logging/Log.h"
#include "protocol/Message.h"
#include "protocol/Utf8.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <array>

namespace termrelay::bridge {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using protocol::MessageType;

namespace {

std::string endpoint_string(const tcp::socket& socket) {
    boost::system::error_code ec;
    const auto ep = socket.remote_endpoint(ec);
    if (ec) return "unknown";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

BridgeConnection::BridgeConnection(tcp::socket socket, networking::WebSocketUrl url, networking::ClientOptions options)
    : socket_(std::move(socket)),
      peer_(endpoint_string(socket_)) {
    ws_ = std::make_shared<networking::WebSocketClient>(socket_.get_executor(), std::move(url), options);
}

asio::awaitable<void> BridgeConnection::run() {
    auto self = shared_from_this();

    spdlog::info("Connecting {} to {}", peer_, ws_->url().str());
    try {
        co_await ws_->connect();
    } catch (const boost::system::system_error& e) {
        spdlog::error("Bridge error ({}): {}", peer_, e.what());
        shutdown();
        co_return;
    }
    spdlog::info("Connected {} to {}", peer_, ws_->describe());

    async::TaskGroup relays(co_await asio::this_coro::executor, "bridge " + peer_);
    relays.spawn(tcp_to_ws());
    relays.spawn(ws_to_tcp());
    co_await relays.join();
}

void BridgeConnection::shutdown() {
    if (closing_) return;
    closing_ = true;

    ws_->close();

    // SHUT_RD completes the pending TCP read with EOF; queued writes still go out.
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_receive, ec);
    if (tcp_queue_.empty()) close_tcp();
}

asio::awaitable<void> BridgeConnection::tcp_to_ws() {
    std::array<char, 4096> buf;

    for (;;) {
        boost::system::error_code ec;
        const std::size_t n = co_await socket_.async_read_some(
            asio::buffer(buf), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec == asio::error::eof) {
                spdlog::debug("TCP connection closed (EOF) ({})", peer_);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::warn("TCP read from {} failed: {}", peer_, ec.message());
            }
            break;
        }

        const std::string_view raw(buf.data(), n);
        spdlog::debug("<<< {} bytes from {}: {}", n, peer_, logging::hex_dump(raw));

        auto decoded = decoder_.feed(raw);
        if (!decoded.replies.empty()) {
            spdlog::debug(">>> Telnet reply to {}: {}", peer_, logging::hex_dump(decoded.replies));
            write_tcp(std::move(decoded.replies));
        }
        if (decoded.data.empty()) continue;

        if (!ws_->is_open()) break;
        ws_->send(protocol::make_frame(MessageType::Input, {}, protocol::latin1_to_utf8(decoded.data)));
    }

    shutdown();
}

asio::awaitable<void> BridgeConnection::ws_to_tcp() {
    for (;;) {
        auto frame = co_await ws_->read();
        if (!frame) break;

        protocol::Message msg;
        try {
            msg = protocol::decode(*frame);
        } catch (const protocol::ProtocolError& e) {
            spdlog::error("Invalid frame from router: {}: {}", e.what(), frame->substr(0, 100));
            continue;
        }

        if (msg.type == MessageType::Output) {
            if (msg.data.empty()) continue;
            write_tcp(telnet_escape(protocol::utf8_to_latin1(msg.data)));
        } else if (msg.type == MessageType::Error) {
            spdlog::warn("Server error ({}): {}", peer_, msg.data.empty() ? "Unknown error" : msg.data);
        } else if (msg.type == MessageType::Exit) {
            spdlog::info("Server closed connection ({}): {}", peer_, msg.data.empty() ? "Connection closed" : msg.data);
            break;
        } else {
            spdlog::debug("Unknown message type from server: {}", msg.type_name);
        }
    }

    if (const auto ec = ws_->last_error()) spdlog::debug("WebSocket for {} closed: {}", peer_, ec.message());
    shutdown();
}

void BridgeConnection::write_tcp(std::string bytes) {
    if (!socket_.is_open() || bytes.empty()) return;

    bool writing = !tcp_queue_.empty();
    tcp_queue_.push_back(std::move(bytes));
    if (!writing) do_write_tcp();
}

void BridgeConnection::do_write_tcp() {
    asio::async_write(
        socket_,
        asio::buffer(tcp_queue_.front()),
        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::error("TCP write to {} failed: {}", self->peer_, ec.message());
                }
                self->tcp_queue_.clear();
                self->close_tcp();
                self->shutdown();
                return;
            }

            self->tcp_queue_.pop_front();
            if (!self->tcp_queue_.empty()) {
                self->do_write_tcp();
            } else if (self->closing_) {
                self->close_tcp();
            }
        });
}

void BridgeConnection::close_tcp() {
    if (!socket_.is_open()) return;
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

} // namespace termrelay::bridge
