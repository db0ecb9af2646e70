#include "config/Config.h"
#include "logging/Log.h"
#include "networking/WebSocketServer.h"
#include "router/SessionRouter.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <unordered_map>

namespace ssl = boost::asio::ssl;

static std::shared_ptr<ssl::context> load_tls(const termrelay::config::RouterConfig& cfg) {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
    ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3);
    ctx->use_certificate_chain_file(cfg.cert_file);
    ctx->use_private_key_file(cfg.key_file, ssl::context::pem);
    return ctx;
}

int main(int argc, char** argv) {
    using namespace termrelay;
    using networking::ClientId;

    logging::init("router");

    config::RouterConfig cfg;
    try {
        cfg = config::parse_router_args(config::arguments(argc, argv));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << config::router_usage();
        return 1;
    }

    try {
        boost::asio::io_context ioc;

        std::shared_ptr<ssl::context> tls;
        if (cfg.tls()) {
            tls = load_tls(cfg);
            spdlog::info("TLS enabled ({})", cfg.cert_file);
        }

        networking::ServerOptions browser_opts;
        browser_opts.name = "browser";
        browser_opts.address = cfg.bind_address;
        browser_opts.port = cfg.browser_port;
        browser_opts.tls = tls;

        networking::ServerOptions pool_opts = browser_opts;
        pool_opts.name = "pool";
        pool_opts.port = cfg.pool_port;

        networking::WebSocketServer browsers(ioc, browser_opts);
        networking::WebSocketServer pools(ioc, pool_opts);

        router::SessionRouter router;
        std::unordered_map<ClientId, std::string> browser_sessions;
        std::unordered_map<ClientId, networking::ChannelPtr> pool_links;

        browsers.set_on_connect([&](ClientId id) {
            browser_sessions[id] = router.accept_downstream(browsers.channel(id));
        });

        browsers.set_on_message([&](ClientId id, const std::string& msg) {
            auto it = browser_sessions.find(id);
            if (it != browser_sessions.end()) router.downstream_message(it->second, msg);
        });

        browsers.set_on_disconnect([&](ClientId id) {
            auto it = browser_sessions.find(id);
            if (it == browser_sessions.end()) return;
            router.downstream_closed(it->second);
            browser_sessions.erase(it);
        });

        pools.set_on_connect([&](ClientId id) {
            auto link = pools.channel(id);
            pool_links[id] = link;
            router.accept_uplink(link);
        });

        pools.set_on_message([&](ClientId id, const std::string& msg) {
            auto it = pool_links.find(id);
            if (it != pool_links.end()) router.uplink_message(it->second, msg);
        });

        pools.set_on_disconnect([&](ClientId id) {
            auto it = pool_links.find(id);
            if (it == pool_links.end()) return;
            router.uplink_closed(it->second);
            pool_links.erase(it);
        });

        browsers.start();
        pools.start();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            spdlog::info("Signal {} received, shutting down", sig);
            browsers.stop();
            pools.stop();
        });

        const char* scheme = tls ? "wss" : "ws";
        spdlog::info("Router running: browsers on {}://{}:{}, pool managers on {}://{}:{}",
                     scheme, cfg.bind_address, browsers.port(), scheme, cfg.bind_address, pools.port());

        // Returns once both servers have closed every connection.
        ioc.run();
        spdlog::info("Router stopped");
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
