#include "bridge/TelnetBridge.h"
#include "config/Config.h"
#include "logging/Log.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
    using namespace termrelay;

    logging::init("bridge");

    config::BridgeConfig cfg;
    try {
        cfg = config::parse_bridge_args(config::arguments(argc, argv));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << config::bridge_usage();
        return 1;
    }

    try {
        boost::asio::io_context ioc;

        bridge::BridgeOptions opts;
        opts.address = cfg.bind_address;
        opts.port = cfg.tcp_port;
        opts.router = cfg.router;

        bridge::TelnetBridge server(ioc.get_executor(), opts);
        server.start();
        spdlog::info("Start your terminal with: telnet localhost {}", server.port());

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            spdlog::info("Signal {} received, shutting down", sig);
            server.stop();
        });

        ioc.run();
        spdlog::info("Bridge stopped");
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
