#include "networking/Url.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace termrelay::networking {

namespace {

constexpr std::string_view kPlain = "ws://";
constexpr std::string_view kSecure = "wss://";

bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool all_digits(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

bool WebSocketUrl::looks_like_websocket_url(std::string_view text) noexcept {
    return starts_with(text, kPlain) || starts_with(text, kSecure);
}

WebSocketUrl WebSocketUrl::parse(std::string_view url) {
    WebSocketUrl out;
    std::string_view rest;
    if (starts_with(url, kSecure)) {
        out.secure = true;
        rest = url.substr(kSecure.size());
    } else if (starts_with(url, kPlain)) {
        rest = url.substr(kPlain.size());
    } else {
        throw std::invalid_argument("websocket url must start with ws:// or wss://: " + std::string(url));
    }

    const auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) out.target = std::string(rest.substr(slash));

    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            throw std::invalid_argument("unterminated ipv6 address in url: " + std::string(url));
        }
        out.host = std::string(authority.substr(1, close - 1));
        std::string_view tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') throw std::invalid_argument("bad authority in url: " + std::string(url));
            port = tail.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(authority.substr(0, colon));
            port = authority.substr(colon + 1);
        } else {
            out.host = std::string(authority);
        }
    }

    if (out.host.empty()) throw std::invalid_argument("missing host in url: " + std::string(url));

    if (port.empty()) {
        out.port = out.secure ? "443" : "80";
    } else {
        if (!all_digits(port) || port.size() > 5 || std::stoul(std::string(port)) > 65535) {
            throw std::invalid_argument("bad port in url: " + std::string(url));
        }
        out.port = std::string(port);
    }
    return out;
}

std::string WebSocketUrl::host_header() const {
    const bool default_port = (secure && port == "443") || (!secure && port == "80");
    const bool ipv6 = host.find(':') != std::string::npos;
    std::string h = ipv6 ? "[" + host + "]" : host;
    if (!default_port) h += ":" + port;
    return h;
}

std::string WebSocketUrl::display_name() const {
    if (host == "localhost" || host == "127.0.0.1" || host == "::1") return "local";
    return host;
}

std::string WebSocketUrl::str() const {
    return std::string(secure ? kSecure : kPlain) + host_header() + target;
}

} // namespace termrelay::networking
