#include "async/TaskGroup.h"
#include "config/Config.h"
#include "logging/Log.h"
#include "pool/SessionPool.h"
#include "pool/SlotPool.h"
#include "pool/UplinkConnection.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/this_coro.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace asio = boost::asio;
using termrelay::pool::UplinkConnection;

using Uplinks = std::vector<std::unique_ptr<UplinkConnection>>;

static asio::awaitable<void> first_contact(UplinkConnection& uplink) {
    co_await uplink.connect_once();
}

static asio::awaitable<void> run_pool(termrelay::pool::SessionPool& sessions, Uplinks& uplinks) {
    auto ex = co_await asio::this_coro::executor;

    // Every router gets one immediate attempt before the backoff loops start.
    {
        termrelay::async::TaskGroup initial(ex, "connect");
        for (auto& uplink : uplinks) initial.spawn(first_contact(*uplink));
        co_await initial.join();
    }

    std::size_t connected = 0;
    for (const auto& uplink : uplinks) {
        if (uplink->state() == termrelay::pool::LinkState::Connected) ++connected;
    }
    if (connected == 0) {
        spdlog::warn("No router reachable yet, retrying in the background");
    } else {
        spdlog::info("Connected to {}/{} router(s)", connected, uplinks.size());
    }

    termrelay::async::TaskGroup supervisors(ex, "uplink");
    for (auto& uplink : uplinks) supervisors.spawn(uplink->supervise());
    co_await supervisors.join();

    co_await sessions.shutdown();
}

int main(int argc, char** argv) {
    using namespace termrelay;

    logging::init("pool");

    config::PoolConfig cfg;
    try {
        cfg = config::parse_pool_args(config::arguments(argc, argv));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << config::pool_usage();
        return 1;
    }

    try {
        asio::io_context ioc;

        pool::PoolOptions opts;
        opts.script = cfg.script;
        opts.interpreter = cfg.interpreter;
        pool::SessionPool sessions(ioc.get_executor(), opts);

        Uplinks uplinks;
        for (const auto& url : cfg.routers) {
            uplinks.push_back(std::make_unique<UplinkConnection>(ioc.get_executor(), url, sessions));
        }

        spdlog::info("Starting session pool");
        for (const auto& url : cfg.routers) spdlog::info("  Router: {} ({})", url.str(), url.display_name());
        spdlog::info("  Script: {} (via {})", cfg.script, cfg.interpreter);
        spdlog::info("  Max sessions: {} (global limit)", pool::SlotPool::kCapacity);

        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            spdlog::info("Signal {} received, shutting down", sig);
            for (auto& uplink : uplinks) uplink->stop();
        });

        asio::co_spawn(ioc, run_pool(sessions, uplinks), [&](std::exception_ptr e) {
            signals.cancel();
            if (e) std::rethrow_exception(e);
        });

        ioc.run();
        spdlog::info("Session pool exited");
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
