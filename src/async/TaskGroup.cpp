#include "async/TaskGroup.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace termrelay::async {

namespace asio = boost::asio;

TaskGroup::TaskGroup(asio::any_io_executor ex, std::string name)
    : ex_(ex),
      name_(std::move(name)),
      state_(std::make_shared<State>(ex)) {}

void TaskGroup::spawn(asio::awaitable<void> task) {
    ++state_->running;
    asio::co_spawn(
        ex_,
        std::move(task),
        [state = state_, name = name_](std::exception_ptr e) {
            if (e) {
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    spdlog::error("[{}] task failed: {}", name, ex.what());
                } catch (...) {
                    spdlog::error("[{}] task failed: unknown exception", name);
                }
            }
            if (--state->running == 0) state->idle.cancel();
        });
}

asio::awaitable<void> TaskGroup::join() {
    auto state = state_;
    while (state->running > 0) {
        boost::system::error_code ec;
        co_await state->idle.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

std::size_t TaskGroup::running() const noexcept {
    return state_->running;
}

} // namespace termrelay::async
