#include "config/Config.h"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace termrelay::config {

namespace fs = std::filesystem;

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

unsigned short parse_port(const std::string& text, const std::string& what) {
    std::size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid " + what + " '" + text + "'");
    }
    if (used != text.size() || value < 1 || value > 65535) {
        throw std::invalid_argument("Invalid " + what + " '" + text + "'");
    }
    return static_cast<unsigned short>(value);
}

std::vector<std::string> arguments(int argc, char** argv) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) out.emplace_back(argv[i]);
    return out;
}

RouterConfig parse_router_args(const std::vector<std::string>& args) {
    RouterConfig cfg;

    if (args.size() == 1) throw std::invalid_argument("TLS needs both a certificate and a key file");
    if (args.size() > 2) throw std::invalid_argument("Too many arguments");

    if (args.size() == 2) {
        cfg.cert_file = args[0];
        cfg.key_file = args[1];
        for (const auto& file : {cfg.cert_file, cfg.key_file}) {
            if (!fs::exists(file)) throw std::invalid_argument("File not found: " + file);
        }
    }

    if (const char* v = env("TERMRELAY_BROWSER_PORT")) cfg.browser_port = parse_port(v, "TERMRELAY_BROWSER_PORT");
    if (const char* v = env("TERMRELAY_POOL_PORT")) cfg.pool_port = parse_port(v, "TERMRELAY_POOL_PORT");
    if (cfg.browser_port == cfg.pool_port) {
        throw std::invalid_argument("Browser and pool ports must differ (" + std::to_string(cfg.pool_port) + ")");
    }
    return cfg;
}

PoolConfig parse_pool_args(const std::vector<std::string>& args) {
    PoolConfig cfg;

    // URLs anywhere; anything else is the script path, last one wins.
    for (const auto& arg : args) {
        if (networking::WebSocketUrl::looks_like_websocket_url(arg)) {
            cfg.routers.push_back(networking::WebSocketUrl::parse(arg));
        } else {
            cfg.script = arg;
        }
    }

    if (cfg.routers.empty()) throw std::invalid_argument("At least one router URL (ws:// or wss://) required");

    std::error_code ec;
    if (!fs::is_regular_file(cfg.script, ec)) throw std::invalid_argument("Script not found: " + cfg.script);

    if (const char* v = env("TERMRELAY_SHELL")) cfg.interpreter = v;
    return cfg;
}

BridgeConfig parse_bridge_args(const std::vector<std::string>& args) {
    BridgeConfig cfg;

    if (args.size() > 2) throw std::invalid_argument("Too many arguments");
    if (args.size() > 0) cfg.tcp_port = parse_port(args[0], "TCP port");
    if (args.size() > 1) {
        if (!networking::WebSocketUrl::looks_like_websocket_url(args[1])) {
            throw std::invalid_argument("WebSocket URL must start with ws:// or wss://");
        }
        cfg.router = networking::WebSocketUrl::parse(args[1]);
    }
    return cfg;
}

const char* router_usage() {
    return "Usage: termrelay-router [cert-file key-file]\n"
           "  Browsers connect on port 8080, the pool manager on 8081.\n"
           "  Give a certificate and key to serve wss:// on both ports.\n"
           "  Environment: TERMRELAY_BROWSER_PORT, TERMRELAY_POOL_PORT, TERMRELAY_LOG_LEVEL\n";
}

const char* pool_usage() {
    return "Usage: termrelay-pool <router-url> [router-url...] [script]\n"
           "  router-url  ws:// or wss:// address of a router's pool port\n"
           "  script      launcher run once per session (default ./do.sh);\n"
           "              it receives SESSION_NUMBER=0..7\n"
           "  Environment: TERMRELAY_SHELL (default /bin/bash), TERMRELAY_LOG_LEVEL\n";
}

const char* bridge_usage() {
    return "Usage: termrelay-bridge [tcp-port [router-url]]\n"
           "  Defaults: 10018 and ws://localhost:8080\n"
           "  Then point a Telnet client at localhost:<tcp-port>.\n"
           "  Environment: TERMRELAY_LOG_LEVEL\n";
}

} // namespace termrelay::config
