#pragma once

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include "async/TaskGroup.h"
#include "networking/Channel.h"
#include "pool/SimSession.h"
#include "pool/SlotPool.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace termrelay::pool {

struct PoolOptions {
    std::string script = "./do.sh";
    std::string interpreter = "/bin/bash";
    std::string slot_variable = "SESSION_NUMBER";

    // Teardown: attention byte, then a newline, then SIGTERM, then SIGKILL.
    std::chrono::milliseconds attention_wait{300};
    std::chrono::milliseconds newline_wait{200};
    std::chrono::milliseconds terminate_wait{2000};
    std::chrono::milliseconds kill_wait{1000};
};

// The global simulator pool shared by every uplink. Owns all sessions,
// their processes and the slot numbers; nothing else mutates them.
class SessionPool {
public:
    static constexpr char kAttentionByte = 0x1D;  // Ctrl-]

    SessionPool(boost::asio::any_io_executor ex, PoolOptions options);
    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    // Entry point for frames arriving on an uplink. Malformed frames and
    // unknown types are logged and dropped.
    void handle_frame(const std::string& text, const networking::ChannelPtr& owner);

    // Returns false when the request was refused (capacity, duplicate id,
    // spawn failure); the owner has been told why.
    bool create_session(const std::string& id, networking::ChannelPtr owner);

    // Idempotent. Completes after the process is gone and the slot is free.
    boost::asio::awaitable<void> destroy_session(std::string id);

    void handle_input(const std::string& id, std::string_view data);
    void handle_resize(const std::string& id, int cols, int rows);
    void handle_baud_rate(const std::string& id, int baud_rate);

    // The uplink behind `owner` is gone: destroy every session it created.
    boost::asio::awaitable<void> drop_owner(networking::ChannelPtr owner);

    // Destroys all sessions and waits for every teardown and relay.
    boost::asio::awaitable<void> shutdown();

    std::size_t session_count() const noexcept { return sessions_.size(); }
    bool has_session(const std::string& id) const;
    std::optional<int> slot_of(const std::string& id) const;
    std::optional<int> baud_rate_of(const std::string& id) const;
    const SlotPool& slots() const noexcept { return slots_; }
    const PoolOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<SimSession> find(const std::string& id) const;
    std::shared_ptr<SimSession> find_owned(const std::string& id, const networking::ChannelPtr& owner) const;

    boost::asio::awaitable<void> relay(std::shared_ptr<SimSession> session);
    boost::asio::awaitable<bool> pace_out(SimSession& session, const std::string& text);
    boost::asio::awaitable<void> terminate(SimSession& session);
    boost::asio::awaitable<void> sleep_for(std::chrono::milliseconds d);

    boost::asio::any_io_executor ex_;
    PoolOptions options_;
    SlotPool slots_;
    std::unordered_map<std::string, std::shared_ptr<SimSession>> sessions_;
    async::TaskGroup relays_;
    async::TaskGroup teardowns_;
    bool stopping_ = false;
};

} // namespace termrelay::pool
