#include "networking/WebSocketClient.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <spdlog/spdlog.h>

#include <deque>
#include <type_traits>

namespace termrelay::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

using PlainStream = websocket::stream<beast::tcp_stream>;
using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

class WebSocketClient::Stream : public std::enable_shared_from_this<Stream> {
public:
    virtual ~Stream() = default;

    virtual asio::awaitable<void> connect(const WebSocketUrl& url) = 0;
    virtual asio::awaitable<std::optional<std::string>> read() = 0;
    virtual void send(const std::string& frame) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    beast::error_code last_error;
};

template <class WsStream>
class WebSocketClient::StreamImpl final : public WebSocketClient::Stream {
public:
    static constexpr bool kTls = std::is_same_v<WsStream, TlsStream>;

    template <class... StreamArgs>
    StreamImpl(ClientOptions options, std::shared_ptr<ssl::context> tls, StreamArgs&&... args)
        : options_(options),
          tls_(std::move(tls)),
          ws_(std::forward<StreamArgs>(args)...) {}

    asio::awaitable<void> connect(const WebSocketUrl& url) override {
        auto ex = co_await asio::this_coro::executor;
        tcp::resolver resolver(ex);
        auto results = co_await resolver.async_resolve(url.host, url.port, asio::use_awaitable);

        auto& lowest = beast::get_lowest_layer(ws_);
        lowest.expires_after(options_.connect_timeout);
        co_await lowest.async_connect(results, asio::use_awaitable);

        if constexpr (kTls) {
            // SNI, or virtual-hosted routers answer with the wrong certificate.
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url.host.c_str())) {
                throw beast::system_error(beast::error_code(
                    static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
            }
            co_await ws_.next_layer().async_handshake(ssl::stream_base::client, asio::use_awaitable);
        }

        lowest.expires_never();

        websocket::stream_base::timeout timeouts{};
        timeouts.handshake_timeout = options_.connect_timeout;
        timeouts.idle_timeout = options_.idle_timeout;
        timeouts.keep_alive_pings = true;
        ws_.set_option(timeouts);
        ws_.read_message_max(options_.max_message_size);
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(http::field::user_agent, "termrelay");
            }));

        co_await ws_.async_handshake(url.host_header(), url.target, asio::use_awaitable);
        connected_ = true;
    }

    asio::awaitable<std::optional<std::string>> read() override {
        if (!connected_) co_return std::nullopt;

        beast::error_code ec;
        buffer_.consume(buffer_.size());
        co_await ws_.async_read(buffer_, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            last_error = ec;
            connected_ = false;
            co_return std::nullopt;
        }
        co_return beast::buffers_to_string(buffer_.data());
    }

    void send(const std::string& frame) override {
        if (!connected_ || closing_) return;

        bool writing = !write_queue_.empty();
        write_queue_.push_back(frame);
        if (!writing) do_write();
    }

    void close() override {
        if (closing_) return;
        closing_ = true;

        if (!connected_) {
            beast::get_lowest_layer(ws_).close();
            return;
        }
        ws_.async_close(
            websocket::close_code::normal,
            [self = shared_self()](beast::error_code ec) {
                if (ec) beast::get_lowest_layer(self->ws_).close();
            });
    }

    bool is_open() const override {
        return connected_ && !closing_ && ws_.is_open();
    }

private:
    std::shared_ptr<StreamImpl> shared_self() {
        return std::static_pointer_cast<StreamImpl>(shared_from_this());
    }

    void do_write() {
        ws_.text(true);
        ws_.async_write(
            asio::buffer(write_queue_.front()),
            [self = shared_self()](beast::error_code ec, std::size_t) {
                if (ec) {
                    spdlog::debug("websocket write: {}", ec.message());
                    self->last_error = ec;
                    self->connected_ = false;
                    self->write_queue_.clear();
                    beast::get_lowest_layer(self->ws_).close();
                    return;
                }

                self->write_queue_.pop_front();
                if (!self->write_queue_.empty()) self->do_write();
            });
    }

    ClientOptions options_;
    std::shared_ptr<ssl::context> tls_;
    WsStream ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;
    bool connected_ = false;
    bool closing_ = false;
};

WebSocketClient::WebSocketClient(asio::any_io_executor ex, WebSocketUrl url, ClientOptions options)
    : url_(std::move(url)) {
    if (url_.secure) {
        auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
        ctx->set_verify_mode(ssl::verify_none);
        auto& ctx_ref = *ctx;
        stream_ = std::make_shared<StreamImpl<TlsStream>>(options, std::move(ctx), ex, ctx_ref);
    } else {
        stream_ = std::make_shared<StreamImpl<PlainStream>>(options, nullptr, ex);
    }
}

WebSocketClient::~WebSocketClient() = default;

asio::awaitable<void> WebSocketClient::connect() {
    auto stream = stream_;
    co_await stream->connect(url_);
}

asio::awaitable<std::optional<std::string>> WebSocketClient::read() {
    auto stream = stream_;
    co_return co_await stream->read();
}

void WebSocketClient::send(const std::string& frame) { stream_->send(frame); }
void WebSocketClient::close() { stream_->close(); }
bool WebSocketClient::is_open() const { return stream_->is_open(); }

std::string WebSocketClient::describe() const {
    return url_.display_name() + " (" + url_.str() + ")";
}

boost::system::error_code WebSocketClient::last_error() const { return stream_->last_error; }

} // namespace termrelay::networking
