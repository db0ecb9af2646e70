#include "pool/SimSession.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <system_error>

namespace termrelay::pool {

namespace asio = boost::asio;

SimSession::SimSession(asio::any_io_executor ex,
                       std::string id,
                       int slot,
                       PtyProcess process,
                       networking::ChannelPtr owner)
    : id_(std::move(id)),
      slot_(slot),
      owner_(std::move(owner)),
      process_(std::move(process)),
      pty_(ex),
      pace_timer_(ex),
      relay_exit_(ex, asio::steady_timer::time_point::max()) {
    pty_.assign(process_.release_master());
}

void SimSession::send(protocol::MessageType type, std::string_view data) {
    if (!owner_alive()) {
        spdlog::debug("No connected router for session {}, dropping {}", id_, protocol::to_string(type));
        return;
    }
    owner_->send(protocol::make_frame(type, id_, data));
}

void SimSession::write_input(std::string data) {
    if (!active_ || data.empty()) return;

    bool writing = !write_queue_.empty();
    write_queue_.push_back(std::move(data));
    if (!writing) do_write();
}

void SimSession::do_write() {
    asio::async_write(
        pty_,
        asio::buffer(write_queue_.front()),
        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::error("Error writing to PTY ({}): {}", self->id_, ec.message());
                }
                self->write_queue_.clear();
                return;
            }

            self->write_queue_.pop_front();
            if (!self->write_queue_.empty()) self->do_write();
        });
}

bool SimSession::write_raw(std::string_view bytes) noexcept {
    if (!pty_.is_open()) return false;
    const ssize_t n = ::write(pty_.native_handle(), bytes.data(), bytes.size());
    return n == static_cast<ssize_t>(bytes.size());
}

void SimSession::resize(unsigned short cols, unsigned short rows) {
    PtyProcess::resize(pty_.native_handle(), cols, rows);
}

void SimSession::deactivate() {
    active_ = false;
    boost::system::error_code ec;
    pty_.cancel(ec);
    pace_timer_.cancel();
}

void SimSession::close_pty() {
    boost::system::error_code ec;
    pty_.close(ec);
    if (ec) spdlog::debug("close pty ({}): {}", id_, ec.message());
}

void SimSession::relay_finished() {
    relay_running_ = false;
    relay_exit_.cancel();
}

} // namespace termrelay::pool
