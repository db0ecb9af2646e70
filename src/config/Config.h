#pragma once

#include "networking/Url.h"

#include <string>
#include <vector>

namespace termrelay::config {

// Command-line parsing for the three executables. Every parse_* function
// throws std::invalid_argument with a message fit for the user; usage()
// strings are printed alongside it.

struct RouterConfig {
    unsigned short browser_port = 8080;
    unsigned short pool_port = 8081;
    std::string bind_address = "0.0.0.0";
    std::string cert_file;
    std::string key_file;

    bool tls() const { return !cert_file.empty(); }
};

struct PoolConfig {
    std::vector<networking::WebSocketUrl> routers;
    std::string script = "./do.sh";
    std::string interpreter = "/bin/bash";
};

struct BridgeConfig {
    unsigned short tcp_port = 10018;
    std::string bind_address = "127.0.0.1";
    networking::WebSocketUrl router = networking::WebSocketUrl::parse("ws://localhost:8080");
};

// termrelay-router [cert key]
// TERMRELAY_BROWSER_PORT and TERMRELAY_POOL_PORT override the ports.
RouterConfig parse_router_args(const std::vector<std::string>& args);

// termrelay-pool <ws-url>... [script]
// The script must exist. TERMRELAY_SHELL overrides the interpreter.
PoolConfig parse_pool_args(const std::vector<std::string>& args);

// termrelay-bridge [tcp-port [ws-url]]
BridgeConfig parse_bridge_args(const std::vector<std::string>& args);

// Decimal 1..65535; throws std::invalid_argument naming `what`.
unsigned short parse_port(const std::string& text, const std::string& what);

// argv[1..argc) as strings.
std::vector<std::string> arguments(int argc, char** argv);

const char* router_usage();
const char* pool_usage();
const char* bridge_usage();

} // namespace termrelay::config
