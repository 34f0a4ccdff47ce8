#pragma once

#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/mcp/mcp_server.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace mcp_bridge {

struct HttpTransportOptions {
    std::string host = "localhost";
    int port = 9100;             // 0 binds an ephemeral port
    std::size_t worker_threads = 8;
};

// ---------------------------------------------------------------------------
// HttpTransport: serves the MCP dispatcher over HTTP.
//
//   POST /        JSON-RPC request -> response (202 for notifications)
//   GET  /health  liveness probe
//   GET  /tools   tools/list shortcut
//   GET  /        endpoint summary
//
// Each request is served on a worker of the listener's thread pool.
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    HttpTransport(McpServer& server, HttpTransportOptions options);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // Bind the socket and start listening on a background thread.
    // Transport error when the address cannot be bound.
    [[nodiscard]] Result<void, Error> Start();

    // Stop listening and join the listener thread. Idempotent.
    void Stop();

    [[nodiscard]] bool IsRunning() const noexcept { return running_; }

    // The bound port; differs from the configured one when that was 0.
    [[nodiscard]] int Port() const noexcept { return bound_port_; }

private:
    void RegisterRoutes();

    McpServer& server_;
    HttpTransportOptions options_;
    std::unique_ptr<httplib::Server> http_;
    std::thread listen_thread_;
    std::atomic<bool> running_{false};
    int bound_port_ = 0;
};

} // namespace mcp_bridge
