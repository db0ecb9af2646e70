#pragma once

#include "networking/Channel.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace termrelay::networking {

using ClientId = std::uint64_t;

struct ServerOptions {
    std::string name = "ws";          // log prefix
    std::string address = "0.0.0.0";
    unsigned short port = 0;          // 0 picks an ephemeral port
    // Set for wss://; plaintext when null.
    std::shared_ptr<boost::asio::ssl::context> tls;
    // Pings go out at half the idle timeout.
    std::chrono::seconds idle_timeout{120};
    std::chrono::seconds handshake_timeout{30};
    std::size_t max_message_size = 1 << 20;
};

// Accepts WebSocket clients on one port. All callbacks and all calls run on
// the io_context thread.
class WebSocketServer {
public:
    using OnConnect    = std::function<void(ClientId)>;
    using OnDisconnect = std::function<void(ClientId)>;
    using OnMessage    = std::function<void(ClientId, const std::string&)>;

    WebSocketServer(boost::asio::io_context& ioc, ServerOptions options);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active connections

    void send(ClientId client, const std::string& msg);
    void close(ClientId client);

    // The connection as a Channel, or null once it is gone.
    ChannelPtr channel(ClientId client) const;

    unsigned short port() const;
    std::size_t connection_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace termrelay::networking
