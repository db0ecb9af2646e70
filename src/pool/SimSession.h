#pragma once

#include "networking/Channel.h"
#include "pool/BaudPacer.h"
#include "pool/PtyProcess.h"
#include "protocol/Message.h"
#include "protocol/Utf8.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <deque>
#include <memory>
#include <string>
#include <string_view>

namespace termrelay::pool {

// One simulator instance: its process, its pty, its pacing state and the
// uplink that asked for it. Touched only by its own relay task and by the
// input/resize/baud handlers for its id.
class SimSession : public std::enable_shared_from_this<SimSession> {
public:
    SimSession(boost::asio::any_io_executor ex,
               std::string id,
               int slot,
               PtyProcess process,
               networking::ChannelPtr owner);

    SimSession(const SimSession&) = delete;
    SimSession& operator=(const SimSession&) = delete;

    const std::string& id() const noexcept { return id_; }
    int slot() const noexcept { return slot_; }

    const networking::ChannelPtr& owner() const noexcept { return owner_; }
    bool owner_alive() const { return owner_ && owner_->is_open(); }

    // Frame to the owning uplink; dropped (debug log) once it is gone.
    void send(protocol::MessageType type, std::string_view data);

    // Queued write of user input to the pty.
    void write_input(std::string data);

    // Immediate one-byte write used during teardown; false if it failed.
    bool write_raw(std::string_view bytes) noexcept;

    void resize(unsigned short cols, unsigned short rows);

    BaudPacer& pacer() noexcept { return pacer_; }
    PtyProcess& process() noexcept { return process_; }
    protocol::Utf8StreamDecoder& decoder() noexcept { return decoder_; }
    boost::asio::posix::stream_descriptor& pty() noexcept { return pty_; }
    boost::asio::steady_timer& pace_timer() noexcept { return pace_timer_; }

    bool active() const noexcept { return active_; }

    // Stops the relay: cancels the pending pty read and pacing sleep.
    void deactivate();
    void close_pty();

    // Relay task bookkeeping so teardown can wait for the relay to unwind.
    void relay_started() noexcept { relay_running_ = true; }
    void relay_finished();
    bool relay_running() const noexcept { return relay_running_; }
    boost::asio::steady_timer& relay_exit() noexcept { return relay_exit_; }

private:
    void do_write();

    std::string id_;
    int slot_;
    networking::ChannelPtr owner_;
    PtyProcess process_;
    boost::asio::posix::stream_descriptor pty_;
    boost::asio::steady_timer pace_timer_;
    boost::asio::steady_timer relay_exit_;
    BaudPacer pacer_;
    protocol::Utf8StreamDecoder decoder_;
    std::deque<std::string> write_queue_;
    bool active_ = true;
    bool relay_running_ = false;
};

} // namespace termrelay::pool
