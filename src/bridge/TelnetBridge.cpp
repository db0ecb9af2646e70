#include "bridge/TelnetBridge.h"

#include "bridge/BridgeConnection.h"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <vector>

namespace termrelay::bridge {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

TelnetBridge::TelnetBridge(asio::any_io_executor ex, BridgeOptions options)
    : ex_(ex),
      options_(std::move(options)),
      acceptor_(ex),
      tasks_(ex, "bridge") {}

TelnetBridge::~TelnetBridge() = default;

void TelnetBridge::start() {
    const tcp::endpoint endpoint(asio::ip::make_address(options_.address), options_.port);

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);

    spdlog::info("Bridge listening on {}:{}, forwarding to {}", options_.address, port(), options_.router.str());
    tasks_.spawn(accept_loop());
}

void TelnetBridge::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);

    // serve() erases from the set as each connection finishes.
    const std::vector<std::shared_ptr<BridgeConnection>> live(connections_.begin(), connections_.end());
    for (const auto& conn : live) conn->shutdown();
}

unsigned short TelnetBridge::port() const {
    boost::system::error_code ec;
    const auto ep = acceptor_.local_endpoint(ec);
    return ec ? options_.port : ep.port();
}

asio::awaitable<void> TelnetBridge::accept_loop() {
    while (acceptor_.is_open()) {
        boost::system::error_code ec;
        tcp::socket socket = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec == asio::error::operation_aborted) break;
            spdlog::warn("accept failed: {}", ec.message());
            continue;
        }

        auto conn = std::make_shared<BridgeConnection>(std::move(socket), options_.router, options_.client);
        connections_.insert(conn);
        spdlog::info("Telnet client connected from {} ({} active)", conn->peer(), connections_.size());
        tasks_.spawn(serve(conn));
    }
    spdlog::debug("Bridge accept loop stopped");
}

asio::awaitable<void> TelnetBridge::serve(std::shared_ptr<BridgeConnection> conn) {
    co_await conn->run();
    connections_.erase(conn);
    spdlog::info("Telnet client disconnected from {} ({} active)", conn->peer(), connections_.size());
}

} // namespace termrelay::bridge
