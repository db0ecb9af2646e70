#pragma once

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include "networking/Channel.h"
#include "networking/Url.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace termrelay::networking {

struct ClientOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds idle_timeout{120};
    std::size_t max_message_size = 1 << 20;
};

// Outbound ws:// or wss:// connection. Reads are awaited by one task at a
// time; send() may be called from anywhere on the same executor and is
// serialized through a write queue. Certificates of wss:// peers are not
// verified.
class WebSocketClient : public Channel {
public:
    WebSocketClient(boost::asio::any_io_executor ex, WebSocketUrl url, ClientOptions options = {});
    ~WebSocketClient() override;

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    // Resolve, connect, TLS handshake when secure, WebSocket handshake.
    // Throws boost::system::system_error on failure.
    boost::asio::awaitable<void> connect();

    // Next text frame, or nullopt once the connection is closed or failed;
    // last_error() tells which.
    boost::asio::awaitable<std::optional<std::string>> read();

    void send(const std::string& frame) override;
    void close() override;
    bool is_open() const override;
    std::string describe() const override;

    const WebSocketUrl& url() const { return url_; }
    boost::system::error_code last_error() const;

private:
    class Stream;
    template <class WsStream>
    class StreamImpl;

    WebSocketUrl url_;
    std::shared_ptr<Stream> stream_;
};

} // namespace termrelay::networking
