#pragma once

#include <mcp_bridge/core/terminal.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcp_bridge {

struct ServerConfig {
    std::string host = "localhost";
    uint16_t port = 9100;
    int worker_threads = 8;
    std::string name = "MCP Bridge";
};

struct DispatchConfig {
    // Prefix of the signal channel name ("<app_name>.TaskDispatcherEvent").
    std::string app_name = "mcp_bridge";
    int main_thread_timeout_ms = 30000;
};

struct LoggingConfig {
    std::optional<std::string> file;
    bool json = false;
    bool verbose = false;
    bool quiet = false;
    ColorChoice color = ColorChoice::Auto;
};

struct AppConfig {
    ServerConfig server;
    DispatchConfig dispatch;
    LoggingConfig logging;
};

} // namespace mcp_bridge
