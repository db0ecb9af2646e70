#include "networking/WebSocketServer.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <spdlog/spdlog.h>

#include <deque>
#include <type_traits>
#include <unordered_map>

namespace termrelay::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

using PlainStream = websocket::stream<beast::tcp_stream>;
using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, ServerOptions options)
        : options_(std::move(options)),
          acceptor_(ioc) {
        tcp::endpoint endpoint(asio::ip::make_address(options_.address), options_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(asio::socket_base::max_listen_connections);
    }

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        // Closing completes asynchronously and erases from sessions_, so walk a copy.
        auto sessions = sessions_;
        for (auto& [id, s] : sessions) {
            s->close();
        }
    }

    void send(ClientId client, const std::string& msg) {
        auto it = sessions_.find(client);
        if (it == sessions_.end()) return;
        it->second->send(msg);
    }

    void close(ClientId client) {
        auto it = sessions_.find(client);
        if (it == sessions_.end()) return;
        it->second->close();
    }

    ChannelPtr channel(ClientId client) const {
        auto it = sessions_.find(client);
        if (it == sessions_.end()) return nullptr;
        return it->second;
    }

    unsigned short port() const {
        beast::error_code ec;
        return acceptor_.local_endpoint(ec).port();
    }

    std::size_t connection_count() const { return sessions_.size(); }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }

private:
    class Peer : public Channel, public std::enable_shared_from_this<Peer> {
    public:
        Peer(Impl& server, ClientId id, std::string remote)
            : server_(server),
              id_(id),
              remote_(std::move(remote)) {}

        virtual void start() = 0;

        ClientId id() const { return id_; }

        std::string describe() const override {
            return server_.options_.name + "#" + std::to_string(id_) + " (" + remote_ + ")";
        }

    protected:
        void on_accepted() {
            connected_ = true;
            spdlog::debug("[{}] connected", describe());
            if (server_.on_connect_) server_.on_connect_(id_);
        }

        void on_message(const std::string& msg) {
            if (server_.on_message_) server_.on_message_(id_, msg);
        }

        // Handshake never finished: no connect was reported, so no disconnect either.
        void abort_handshake(const char* what, beast::error_code ec) {
            spdlog::warn("[{}] {}: {}", describe(), what, ec.message());
            closed_ = true;
            server_.remove_session(id_);
        }

        void on_close_or_fail(beast::error_code ec) {
            if (closed_) return;
            closed_ = true;

            // WebSocket close is common; treat it as disconnect.
            if (ec == websocket::error::closed || ec == asio::error::operation_aborted) {
                spdlog::debug("[{}] closed", describe());
            } else {
                fail("io", ec);
            }
            server_.remove_session(id_);
            if (connected_ && server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            spdlog::info("[{}] {}: {}", describe(), what, ec.message());
        }

        Impl& server_;
        ClientId id_;
        std::string remote_;
        bool connected_ = false;
        bool closing_ = false;
        bool closed_ = false;
    };

    template <class WsStream>
    class PeerImpl final : public Peer {
    public:
        static constexpr bool kTls = std::is_same_v<WsStream, TlsStream>;

        template <class... StreamArgs>
        PeerImpl(Impl& server, ClientId id, std::string remote, StreamArgs&&... args)
            : Peer(server, id, std::move(remote)),
              ws_(std::forward<StreamArgs>(args)...) {}

        void start() override {
            if constexpr (kTls) {
                beast::get_lowest_layer(ws_).expires_after(this->server_.options_.handshake_timeout);
                ws_.next_layer().async_handshake(
                    ssl::stream_base::server,
                    [self = shared_self()](beast::error_code ec) {
                        if (ec) return self->abort_handshake("tls handshake", ec);
                        self->accept();
                    });
            } else {
                accept();
            }
        }

        void send(const std::string& msg) override {
            if (!this->connected_ || this->closing_ || this->closed_) return;

            bool writing = !write_queue_.empty();
            write_queue_.push_back(msg);
            if (!writing) do_write();
        }

        void close() override {
            if (this->closing_ || this->closed_) return;
            this->closing_ = true;

            if (!this->connected_) {
                beast::get_lowest_layer(ws_).close();
                return;
            }
            ws_.async_close(
                websocket::close_code::normal,
                [self = shared_self()](beast::error_code ec) {
                    if (ec) self->on_close_or_fail(ec);
                });
        }

        bool is_open() const override {
            return this->connected_ && !this->closing_ && !this->closed_ && ws_.is_open();
        }

    private:
        std::shared_ptr<PeerImpl> shared_self() {
            return std::static_pointer_cast<PeerImpl>(this->shared_from_this());
        }

        void accept() {
            const auto& opts = this->server_.options_;
            beast::get_lowest_layer(ws_).expires_never();

            // Ping at half the idle timeout, give up after the full one.
            websocket::stream_base::timeout timeouts{};
            timeouts.handshake_timeout = opts.handshake_timeout;
            timeouts.idle_timeout = opts.idle_timeout;
            timeouts.keep_alive_pings = true;
            ws_.set_option(timeouts);
            ws_.read_message_max(opts.max_message_size);
            ws_.set_option(websocket::stream_base::decorator(
                [name = opts.name](websocket::response_type& res) {
                    res.set(http::field::server, "termrelay-" + name);
                }));

            ws_.async_accept(
                [self = shared_self()](beast::error_code ec) {
                    if (ec) return self->abort_handshake("accept", ec);
                    self->on_accepted();
                    self->do_read();
                });
        }

        void do_read() {
            ws_.async_read(
                buffer_,
                [self = shared_self()](beast::error_code ec, std::size_t) {
                    if (ec) return self->on_close_or_fail(ec);

                    std::string msg = beast::buffers_to_string(self->buffer_.data());
                    self->buffer_.consume(self->buffer_.size());

                    self->on_message(msg);
                    if (!self->closed_) self->do_read();
                });
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                [self = shared_self()](beast::error_code ec, std::size_t) {
                    if (ec) {
                        self->write_queue_.clear();
                        self->on_close_or_fail(ec);
                        beast::get_lowest_layer(self->ws_).close();
                        return;
                    }

                    self->write_queue_.pop_front();
                    if (!self->write_queue_.empty()) self->do_write();
                });
        }

        WsStream ws_;
        beast::flat_buffer buffer_;
        std::deque<std::string> write_queue_;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    spdlog::warn("[{}] accept: {}", options_.name, ec.message());
                    return do_accept();
                }

                beast::error_code ep_ec;
                const auto ep = socket.remote_endpoint(ep_ec);
                std::string remote = ep_ec ? std::string("?") : ep.address().to_string() + ":" + std::to_string(ep.port());

                auto id = next_client_id_++;
                std::shared_ptr<Peer> peer;
                if (options_.tls) {
                    peer = std::make_shared<PeerImpl<TlsStream>>(*this, id, std::move(remote), std::move(socket), *options_.tls);
                } else {
                    peer = std::make_shared<PeerImpl<PlainStream>>(*this, id, std::move(remote), std::move(socket));
                }

                sessions_[id] = peer;
                peer->start();
                do_accept();
            });
    }

    void remove_session(ClientId id) {
        sessions_.erase(id);
    }

    ServerOptions options_;
    tcp::acceptor acceptor_;

    ClientId next_client_id_ = 1;
    std::unordered_map<ClientId, std::shared_ptr<Peer>> sessions_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, ServerOptions options)
    : impl_(new Impl(ioc, std::move(options))) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

void WebSocketServer::send(ClientId client, const std::string& msg) { impl_->send(client, msg); }
void WebSocketServer::close(ClientId client) { impl_->close(client); }

ChannelPtr WebSocketServer::channel(ClientId client) const { return impl_->channel(client); }

unsigned short WebSocketServer::port() const { return impl_->port(); }
std::size_t WebSocketServer::connection_count() const { return impl_->connection_count(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace termrelay::networking
