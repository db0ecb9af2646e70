#include "pool/UplinkConnection.h"

#include "pool/SessionPool.h"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace termrelay::pool {

namespace asio = boost::asio;
using networking::WebSocketClient;

const char* to_string(LinkState state) noexcept {
    switch (state) {
        case LinkState::Disconnected: return "disconnected";
        case LinkState::Connecting: return "connecting";
        case LinkState::Connected: return "connected";
    }
    return "unknown";
}

UplinkConnection::UplinkConnection(asio::any_io_executor ex,
                                   networking::WebSocketUrl url,
                                   SessionPool& pool,
                                   ExponentialBackoff backoff,
                                   networking::ClientOptions client_options)
    : ex_(ex),
      url_(std::move(url)),
      pool_(pool),
      backoff_(backoff),
      client_options_(client_options),
      retry_timer_(ex) {}

asio::awaitable<bool> UplinkConnection::connect_once() {
    if (stopping_) co_return false;

    set_state(LinkState::Connecting);
    auto client = std::make_shared<WebSocketClient>(ex_, url_, client_options_);
    client_ = client;

    try {
        co_await client->connect();
    } catch (const boost::system::system_error& e) {
        spdlog::warn("Failed to connect to router ({}) at {}: {}", name(), url_.str(), e.what());
        client_.reset();
        backoff_.record_failure();
        set_state(LinkState::Disconnected);
        co_return false;
    }

    if (stopping_) {
        client->close();
        client_.reset();
        set_state(LinkState::Disconnected);
        co_return false;
    }

    backoff_.reset();
    set_state(LinkState::Connected);
    spdlog::info("Connected to router ({}) at {}", name(), url_.str());
    co_return true;
}

asio::awaitable<void> UplinkConnection::supervise() {
    while (!stopping_) {
        if (state_ == LinkState::Connected && client_) {
            auto client = client_;
            try {
                co_await listen(client);
            } catch (const std::exception& e) {
                spdlog::error("Listener for router ({}) failed: {}", name(), e.what());
            }
            if (state_ == LinkState::Connected && !stopping_) {
                spdlog::warn("Listener for router ({}) exited unexpectedly, restarting", name());
            }
            continue;
        }

        const auto delay = backoff_.delay();
        spdlog::info("Reconnecting to router ({}) in {}ms (attempt {})",
                     name(), delay.count(), backoff_.failures() + 1);

        boost::system::error_code ec;
        retry_timer_.expires_after(delay);
        co_await retry_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (stopping_) break;

        co_await connect_once();
    }
    spdlog::debug("Supervisor for router ({}) stopped", name());
}

void UplinkConnection::stop() {
    stopping_ = true;
    retry_timer_.cancel();
    if (client_) client_->close();
}

asio::awaitable<void> UplinkConnection::listen(std::shared_ptr<WebSocketClient> client) {
    for (;;) {
        auto frame = co_await client->read();
        if (!frame) break;
        pool_.handle_frame(*frame, client);
    }

    if (client_ == client) {
        const auto ec = client->last_error();
        spdlog::warn("Lost connection to router ({}): {}", name(), ec ? ec.message() : "closed");
        client_.reset();
        set_state(LinkState::Disconnected);
    }

    co_await pool_.drop_owner(client);
}

void UplinkConnection::set_state(LinkState state) {
    if (state_ == state) return;
    spdlog::debug("Uplink {} {} -> {}", name(), to_string(state_), to_string(state));
    state_ = state;
    if (on_state_change_) on_state_change_(state);
}

} // namespace termrelay::pool
