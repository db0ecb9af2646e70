#pragma once

#include <string>
#include <string_view>

namespace termrelay::networking {

// ws:// or wss:// endpoint, split the way Beast's handshake wants it.
struct WebSocketUrl {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";

    // Throws std::invalid_argument for anything but ws:// or wss:// URLs.
    static WebSocketUrl parse(std::string_view url);

    static bool looks_like_websocket_url(std::string_view text) noexcept;

    // Value of the Host header: host, plus ":port" when not the default.
    std::string host_header() const;

    // Short name for log lines: "local" for loopback hosts, else the host.
    std::string display_name() const;

    std::string str() const;
};

} // namespace termrelay::networking
