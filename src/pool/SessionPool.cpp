#include "pool/SessionPool.h"

#include "protocol/Message.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <signal.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <vector>

namespace termrelay::pool {

namespace asio = boost::asio;
using protocol::MessageType;

namespace {

constexpr std::chrono::milliseconds kExitPollInterval{50};
constexpr std::array<int, 2> kStopSignals{SIGTERM, SIGKILL};

std::string busy_message() {
    return "All " + std::to_string(SlotPool::kCapacity) + " terminals are busy. Please try again later.";
}

} // namespace

SessionPool::SessionPool(asio::any_io_executor ex, PoolOptions options)
    : ex_(ex),
      options_(std::move(options)),
      relays_(ex, "relay"),
      teardowns_(ex, "teardown") {}

SessionPool::~SessionPool() = default;

void SessionPool::handle_frame(const std::string& text, const networking::ChannelPtr& owner) {
    protocol::Message msg;
    try {
        msg = protocol::decode(text);
    } catch (const protocol::ProtocolError& e) {
        spdlog::error("Invalid frame from {}: {}: {}", owner->describe(), e.what(), text.substr(0, 100));
        return;
    }

    if (msg.session.empty()) {
        spdlog::error("Message from {} missing session ID (type={})", owner->describe(), msg.type_name);
        return;
    }

    switch (msg.type) {
        case MessageType::NewSession:
            create_session(msg.session, owner);
            break;
        case MessageType::CloseSession:
            if (find_owned(msg.session, owner)) teardowns_.spawn(destroy_session(msg.session));
            break;
        case MessageType::Input:
            if (find_owned(msg.session, owner)) handle_input(msg.session, msg.data);
            break;
        case MessageType::Resize:
            if (find_owned(msg.session, owner)) handle_resize(msg.session, msg.cols, msg.rows);
            break;
        case MessageType::SetBaudRate:
            if (find_owned(msg.session, owner)) handle_baud_rate(msg.session, msg.baud_rate);
            break;
        default:
            spdlog::warn("Unknown message type from {}: {}", owner->describe(), msg.type_name);
            break;
    }
}

bool SessionPool::create_session(const std::string& id, networking::ChannelPtr owner) {
    auto reply = [&](MessageType type, std::string_view data) {
        if (owner && owner->is_open()) owner->send(protocol::make_frame(type, id, data));
    };

    if (stopping_) {
        spdlog::warn("Pool shutting down, rejecting {}", id);
        reply(MessageType::Error, "Simulator pool is shutting down");
        reply(MessageType::Exit, "Connection closed - server shutting down");
        return false;
    }

    if (sessions_.count(id)) {
        spdlog::warn("Session {} already exists", id);
        return false;
    }

    const auto slot = slots_.acquire();
    if (!slot) {
        spdlog::warn("Session limit reached ({}), rejecting {}", SlotPool::kCapacity, id);
        reply(MessageType::Error, busy_message());
        reply(MessageType::Exit, "Connection closed - terminal busy");
        return false;
    }
    spdlog::info("Allocated session number {} for {}", *slot, id);

    PtyProcess::Options spawn_options;
    spawn_options.interpreter = options_.interpreter;
    spawn_options.script = options_.script;
    spawn_options.env.emplace_back(options_.slot_variable, std::to_string(*slot));

    PtyProcess process;
    try {
        process = PtyProcess::spawn(spawn_options);
    } catch (const std::system_error& e) {
        spdlog::error("Failed to create session {}: {}; returning session number {} to pool", id, e.what(), *slot);
        slots_.release(*slot);
        reply(MessageType::Error, "Failed to start simulator");
        return false;
    }

    spdlog::info("Spawned simulator for session {} with {}={} (PID {})",
                 id, options_.slot_variable, *slot, process.pid());

    auto session = std::make_shared<SimSession>(ex_, id, *slot, std::move(process), std::move(owner));
    sessions_[id] = session;
    session->relay_started();
    relays_.spawn(relay(session));

    spdlog::info("Created session {} ({}/{})", id, sessions_.size(), SlotPool::kCapacity);
    return true;
}

asio::awaitable<void> SessionPool::destroy_session(std::string id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        spdlog::debug("Session {} already destroyed", id);
        co_return;
    }

    // Unroute first so no handler reaches the session while it winds down.
    auto session = it->second;
    sessions_.erase(it);
    session->deactivate();

    if (session->relay_running()) {
        boost::system::error_code ec;
        co_await session->relay_exit().async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }

    co_await terminate(*session);
    session->close_pty();
    slots_.release(session->slot());

    spdlog::info("Destroyed session {}, returned session number {} to pool ({}/{})",
                 id, session->slot(), sessions_.size(), SlotPool::kCapacity);
}

void SessionPool::handle_input(const std::string& id, std::string_view data) {
    auto session = find(id);
    if (!session) {
        spdlog::debug("Input for unknown session {}", id);
        return;
    }
    session->write_input(std::string(data));
}

void SessionPool::handle_resize(const std::string& id, int cols, int rows) {
    auto session = find(id);
    if (!session) {
        spdlog::debug("Resize for unknown session {}", id);
        return;
    }
    try {
        session->resize(static_cast<unsigned short>(cols), static_cast<unsigned short>(rows));
        spdlog::info("Resized terminal ({}) to {}x{}", id, cols, rows);
    } catch (const std::system_error& e) {
        spdlog::error("Error resizing PTY ({}): {}", id, e.what());
    }
}

void SessionPool::handle_baud_rate(const std::string& id, int baud_rate) {
    auto session = find(id);
    if (!session) {
        spdlog::debug("Baud rate for unknown session {}", id);
        return;
    }
    try {
        session->pacer().set_baud(baud_rate);
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Ignoring baud rate for {}: {}", id, e.what());
        return;
    }
    const double cps = session->pacer().chars_per_second();
    spdlog::info("Set baud rate ({}) to {} ({:.1f} CPS, {:.1f}ms per char)", id, baud_rate, cps, 1000.0 / cps);
}

asio::awaitable<void> SessionPool::drop_owner(networking::ChannelPtr owner) {
    std::vector<std::string> ids;
    for (const auto& [id, session] : sessions_) {
        if (session->owner() == owner) ids.push_back(id);
    }
    if (ids.empty()) co_return;

    spdlog::info("Cleaning up {} session(s) from disconnected {}", ids.size(), owner->describe());
    async::TaskGroup group(ex_, "drop-owner");
    for (auto& id : ids) group.spawn(destroy_session(std::move(id)));
    co_await group.join();
}

asio::awaitable<void> SessionPool::shutdown() {
    stopping_ = true;

    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) ids.push_back(id);
    for (auto& id : ids) teardowns_.spawn(destroy_session(std::move(id)));

    co_await teardowns_.join();
    co_await relays_.join();
    spdlog::info("Session pool stopped");
}

bool SessionPool::has_session(const std::string& id) const {
    return sessions_.count(id) != 0;
}

std::optional<int> SessionPool::slot_of(const std::string& id) const {
    auto session = find(id);
    if (!session) return std::nullopt;
    return session->slot();
}

std::optional<int> SessionPool::baud_rate_of(const std::string& id) const {
    auto session = find(id);
    if (!session) return std::nullopt;
    return session->pacer().baud();
}

std::shared_ptr<SimSession> SessionPool::find(const std::string& id) const {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<SimSession> SessionPool::find_owned(const std::string& id, const networking::ChannelPtr& owner) const {
    auto session = find(id);
    if (!session) {
        spdlog::debug("No session {} (already closed?)", id);
        return nullptr;
    }
    if (session->owner() != owner) {
        spdlog::warn("{} addressed session {} owned by another router, ignoring", owner->describe(), id);
        return nullptr;
    }
    return session;
}

asio::awaitable<void> SessionPool::relay(std::shared_ptr<SimSession> session) {
    std::array<char, 4096> buf;
    std::string reason = "stopped";

    while (session->active()) {
        if (!session->owner_alive()) {
            reason = "router connection lost";
            break;
        }

        boost::system::error_code ec;
        const std::size_t n = co_await session->pty().async_read_some(
            asio::buffer(buf), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            // Linux reports EIO on the master once every slave fd is closed.
            if (ec == asio::error::operation_aborted) {
                reason = "cancelled";
            } else if (ec == asio::error::eof || ec == boost::system::errc::io_error) {
                reason = "simulator exited";
            } else {
                reason = ec.message();
            }
            break;
        }

        const std::string text = session->decoder().decode_append(std::string_view(buf.data(), n));
        const bool delivered = co_await pace_out(*session, text);
        if (!delivered) {
            reason = session->active() ? "router connection lost" : "cancelled";
            break;
        }
    }

    // A sequence cut off by the end of the stream goes out as U+FFFD.
    const std::string tail = session->decoder().finish();
    if (!tail.empty()) co_await pace_out(*session, tail);

    session->relay_finished();
    spdlog::info("Relay ended for session {} ({})", session->id(), reason);

    auto it = sessions_.find(session->id());
    if (it != sessions_.end() && it->second == session) {
        co_await destroy_session(session->id());
    }
}

asio::awaitable<bool> SessionPool::pace_out(SimSession& session, const std::string& text) {
    for (const auto& chunk : session.pacer().split(text)) {
        // Checked per chunk: a close can land during any pacing sleep.
        if (!session.active() || !session.owner_alive()) co_return false;

        session.send(MessageType::Output, chunk);

        boost::system::error_code ec;
        session.pace_timer().expires_after(session.pacer().delay_for(protocol::utf8_length(chunk)));
        co_await session.pace_timer().async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec) co_return false;
    }
    co_return true;
}

asio::awaitable<void> SessionPool::terminate(SimSession& session) {
    auto& process = session.process();

    if (process.running()) {
        // Ask the launcher to leave on its own first (telnet escape, then confirm).
        if (!session.write_raw(std::string_view(&kAttentionByte, 1))) {
            spdlog::debug("Could not send attention byte ({})", session.id());
        }
        co_await sleep_for(options_.attention_wait);

        if (process.running()) {
            session.write_raw("\n");
            co_await sleep_for(options_.newline_wait);
        }
    }

    for (const int sig : kStopSignals) {
        if (!process.running()) co_return;

        if (!process.signal_group(sig)) {
            spdlog::warn("kill({}) of process group {} failed ({}): {}",
                         sig == SIGTERM ? "SIGTERM" : "SIGKILL", process.pid(), session.id(), std::strerror(errno));
        }

        const auto wait = sig == SIGTERM ? options_.terminate_wait : options_.kill_wait;
        const auto deadline = std::chrono::steady_clock::now() + wait;
        while (process.running() && std::chrono::steady_clock::now() < deadline) {
            co_await sleep_for(kExitPollInterval);
        }
    }

    if (process.running()) {
        spdlog::error("Process group {} of session {} survived SIGKILL, abandoning it", process.pid(), session.id());
    }
}

asio::awaitable<void> SessionPool::sleep_for(std::chrono::milliseconds d) {
    asio::steady_timer timer(ex_, d);
    boost::system::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

} // namespace termrelay::pool
