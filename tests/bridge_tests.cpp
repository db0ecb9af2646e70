#include "TestSupport.h"

#include "bridge/TelnetBridge.h"
#include "networking/WebSocketServer.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <gtest/gtest.h>

#include <array>
#include <functional>
#include <string>
#include <vector>

namespace asio = boost::asio;
using namespace termrelay;
using namespace termrelay::test;
using protocol::MessageType;

namespace {

// Raw TCP peer standing in for a Telnet terminal.
class TelnetPeer {
public:
    explicit TelnetPeer(asio::io_context& ioc) : socket_(ioc) {}

    void connect(unsigned short port) {
        socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
        read_more();
    }

    void write(const std::string& bytes) { asio::write(socket_, asio::buffer(bytes)); }

    const std::string& received() const { return received_; }
    bool closed() const { return closed_; }

private:
    void read_more() {
        socket_.async_read_some(asio::buffer(buf_), [this](boost::system::error_code ec, std::size_t n) {
            if (ec) {
                closed_ = true;
                return;
            }
            received_.append(buf_.data(), n);
            read_more();
        });
    }

    asio::ip::tcp::socket socket_;
    std::array<char, 1024> buf_{};
    std::string received_;
    bool closed_ = false;
};

} // namespace

class TelnetBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        networking::ServerOptions opts;
        opts.name = "fake-router";
        opts.address = "127.0.0.1";
        router_ = std::make_unique<networking::WebSocketServer>(ioc_, opts);
        router_->set_on_connect([this](networking::ClientId id) {
            browsers_.push_back(id);
            if (on_browser_) on_browser_(id);
        });
        router_->set_on_message([this](networking::ClientId, const std::string& msg) {
            received_.push_back(protocol::decode(msg));
        });
        router_->start();

        bridge::BridgeOptions bopts;
        bopts.port = 0;
        bopts.router = networking::WebSocketUrl::parse("ws://127.0.0.1:" + std::to_string(router_->port()));
        bridge_ = std::make_unique<bridge::TelnetBridge>(ioc_.get_executor(), bopts);
        bridge_->start();
    }

    void TearDown() override {
        bridge_->stop();
        router_->stop();
        run_until(ioc_, [this] { return bridge_->active_connections() == 0 && router_->connection_count() == 0; });
    }

    std::string input_seen() const {
        std::string out;
        for (const auto& m : received_) {
            if (m.type == MessageType::Input) out += m.data;
        }
        return out;
    }

    asio::io_context ioc_;
    std::unique_ptr<networking::WebSocketServer> router_;
    std::unique_ptr<bridge::TelnetBridge> bridge_;
    std::vector<networking::ClientId> browsers_;
    std::vector<protocol::Message> received_;
    std::function<void(networking::ClientId)> on_browser_;
};

TEST_F(TelnetBridgeTest, EachTcpClientGetsItsOwnWebSocket) {
    TelnetPeer first(ioc_);
    TelnetPeer second(ioc_);
    first.connect(bridge_->port());
    second.connect(bridge_->port());

    EXPECT_TRUE(run_until(ioc_, [&] { return browsers_.size() == 2; }));
    EXPECT_EQ(bridge_->active_connections(), 2u);
}

TEST_F(TelnetBridgeTest, OutputIsLatin1AndIacEscaped) {
    on_browser_ = [this](networking::ClientId id) {
        router_->send(id, protocol::make_frame(MessageType::Output, {}, "h\xC3\xA9\xC3\xBF\xE2\x82\xAC"));
    };

    TelnetPeer peer(ioc_);
    peer.connect(bridge_->port());
    EXPECT_TRUE(run_until(ioc_, [&] { return peer.received().size() >= 5; }));
    EXPECT_EQ(peer.received(), std::string("h\xE9\xFF\xFF?"));
}

TEST_F(TelnetBridgeTest, TelnetInputIsDecodedAndOptionsRefused) {
    TelnetPeer peer(ioc_);
    peer.connect(bridge_->port());
    ASSERT_TRUE(run_until(ioc_, [&] { return browsers_.size() == 1; }));

    peer.write(std::string("ls\r\xFF\xF4\xFF\xFD\x01", 8));
    EXPECT_TRUE(run_until(ioc_, [&] { return input_seen().size() >= 4; }));
    EXPECT_EQ(input_seen(), std::string("ls\r\x03"));
    EXPECT_TRUE(run_until(ioc_, [&] { return peer.received().size() >= 3; }));
    EXPECT_EQ(peer.received(), std::string("\xFF\xFC\x01", 3));
}

TEST_F(TelnetBridgeTest, ExitFrameClosesTheTerminal) {
    on_browser_ = [this](networking::ClientId id) {
        router_->send(id, protocol::make_frame(MessageType::Output, {}, "bye"));
        router_->send(id, protocol::make_frame(MessageType::Exit, {}, "Connection closed - terminal busy"));
    };

    TelnetPeer peer(ioc_);
    peer.connect(bridge_->port());
    EXPECT_TRUE(run_until(ioc_, [&] { return peer.closed(); }));
    EXPECT_EQ(peer.received(), "bye");
    EXPECT_TRUE(run_until(ioc_, [&] { return bridge_->active_connections() == 0; }));
}

TEST_F(TelnetBridgeTest, ClosingTheTerminalClosesTheWebSocket) {
    {
        TelnetPeer peer(ioc_);
        peer.connect(bridge_->port());
        ASSERT_TRUE(run_until(ioc_, [&] { return router_->connection_count() == 1; }));
    }
    EXPECT_TRUE(run_until(ioc_, [&] { return router_->connection_count() == 0; }));
}

TEST_F(TelnetBridgeTest, UnreachableRouterDropsTheTerminal) {
    router_->stop();
    ASSERT_TRUE(run_until(ioc_, [&] { return router_->connection_count() == 0; }));

    TelnetPeer peer(ioc_);
    peer.connect(bridge_->port());
    EXPECT_TRUE(run_until(ioc_, [&] { return peer.closed(); }));
    EXPECT_EQ(bridge_->active_connections(), 0u);
}
