#pragma once

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include "async/TaskGroup.h"
#include "networking/WebSocketClient.h"
#include "networking/Url.h"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>
#include <string>
#include <unordered_set>

namespace termrelay::bridge {

class BridgeConnection;

struct BridgeOptions {
    std::string address = "127.0.0.1";
    unsigned short port = 10018;  // 0 picks an ephemeral port
    networking::WebSocketUrl router;
    networking::ClientOptions client;
};

// Accepts Telnet clients and gives each its own upstream WebSocket.
class TelnetBridge {
public:
    TelnetBridge(boost::asio::any_io_executor ex, BridgeOptions options);
    ~TelnetBridge();

    TelnetBridge(const TelnetBridge&) = delete;
    TelnetBridge& operator=(const TelnetBridge&) = delete;

    // Binds and starts accepting. Throws boost::system::system_error if the
    // port cannot be bound.
    void start();

    // Stops accepting and shuts every live connection down.
    void stop();

    unsigned short port() const;
    std::size_t active_connections() const noexcept { return connections_.size(); }

private:
    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> serve(std::shared_ptr<BridgeConnection> conn);

    boost::asio::any_io_executor ex_;
    BridgeOptions options_;
    boost::asio::ip::tcp::acceptor acceptor_;
    async::TaskGroup tasks_;
    std::unordered_set<std::shared_ptr<BridgeConnection>> connections_;
};

} // namespace termrelay::bridge
