#pragma once

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace termrelay::async {

// Coroutines spawned on one executor that can be awaited as a group.
// Exceptions escaping a task are logged under the group's name and not
// rethrown.
class TaskGroup {
public:
    TaskGroup(boost::asio::any_io_executor ex, std::string name);

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(boost::asio::awaitable<void> task);

    // Completes once no task of the group is running.
    boost::asio::awaitable<void> join();

    std::size_t running() const noexcept;

private:
    struct State {
        explicit State(boost::asio::any_io_executor ex)
            : idle(ex, boost::asio::steady_timer::time_point::max()) {}

        std::size_t running = 0;
        boost::asio::steady_timer idle;
    };

    boost::asio::any_io_executor ex_;
    std::string name_;
    std::shared_ptr<State> state_;
};

} // namespace termrelay::async
