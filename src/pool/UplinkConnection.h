#pragma once

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include "networking/WebSocketClient.h"
#include "networking/Url.h"
#include "pool/ExponentialBackoff.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <functional>
#include <memory>
#include <string>

namespace termrelay::pool {

class SessionPool;

enum class LinkState { Disconnected, Connecting, Connected };

const char* to_string(LinkState state) noexcept;

// The pool's connection to one router. A fresh WebSocketClient is made for
// every attempt, so at most one socket per uplink is ever live.
class UplinkConnection {
public:
    using StateHandler = std::function<void(LinkState)>;

    UplinkConnection(boost::asio::any_io_executor ex,
                     networking::WebSocketUrl url,
                     SessionPool& pool,
                     ExponentialBackoff backoff = {},
                     networking::ClientOptions client_options = {});

    UplinkConnection(const UplinkConnection&) = delete;
    UplinkConnection& operator=(const UplinkConnection&) = delete;

    // A single attempt with no delay. True once the uplink is Connected.
    boost::asio::awaitable<bool> connect_once();

    // Runs until stop(): listens while connected, sleeps the backoff delay
    // and retries while disconnected.
    boost::asio::awaitable<void> supervise();

    void stop();

    LinkState state() const noexcept { return state_; }
    unsigned retry_count() const noexcept { return backoff_.failures(); }
    const ExponentialBackoff& backoff() const noexcept { return backoff_; }
    const networking::WebSocketUrl& url() const noexcept { return url_; }
    std::string name() const { return url_.display_name(); }

    void set_on_state_change(StateHandler handler) { on_state_change_ = std::move(handler); }

private:
    boost::asio::awaitable<void> listen(std::shared_ptr<networking::WebSocketClient> client);
    void set_state(LinkState state);

    boost::asio::any_io_executor ex_;
    networking::WebSocketUrl url_;
    SessionPool& pool_;
    ExponentialBackoff backoff_;
    networking::ClientOptions client_options_;
    boost::asio::steady_timer retry_timer_;
    std::shared_ptr<networking::WebSocketClient> client_;
    LinkState state_ = LinkState::Disconnected;
    StateHandler on_state_change_;
    bool stopping_ = false;
};

} // namespace termrelay::pool
