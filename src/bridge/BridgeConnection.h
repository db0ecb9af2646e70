#pragma once

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include "bridge/TelnetCodec.h"
#include "networking/WebSocketClient.h"
#include "networking/Url.h"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <deque>
#include <memory>
#include <string>

namespace termrelay::bridge {

// One legacy Telnet client joined to the router as if it were a browser:
// one TCP socket, one WebSocket, two relay tasks. Whichever direction ends
// first shuts the whole connection down.
class BridgeConnection : public std::enable_shared_from_this<BridgeConnection> {
public:
    BridgeConnection(boost::asio::ip::tcp::socket socket,
                     networking::WebSocketUrl url,
                     networking::ClientOptions options = {});

    BridgeConnection(const BridgeConnection&) = delete;
    BridgeConnection& operator=(const BridgeConnection&) = delete;

    // Connects upstream, relays until either side closes, then returns once
    // both relay tasks have finished.
    boost::asio::awaitable<void> run();

    // Safe to call repeatedly. Queued Telnet output is flushed before the
    // TCP socket closes.
    void shutdown();

    const std::string& peer() const noexcept { return peer_; }

private:
    boost::asio::awaitable<void> tcp_to_ws();
    boost::asio::awaitable<void> ws_to_tcp();

    void write_tcp(std::string bytes);
    void do_write_tcp();
    void close_tcp();

    boost::asio::ip::tcp::socket socket_;
    std::shared_ptr<networking::WebSocketClient> ws_;
    std::string peer_;
    TelnetDecoder decoder_;
    std::deque<std::string> tcp_queue_;
    bool closing_ = false;
};

} // namespace termrelay::bridge
