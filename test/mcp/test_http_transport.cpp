#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/mcp/http_transport.hpp>
#include <mcp_bridge/mcp/signal_channel.hpp>

#include "../mocks/execution_thread.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace mcp_bridge;
using mcp_bridge::testing::ExecutionThread;

namespace {

// Full stack on an ephemeral loopback port.
struct LocalBridge {
    LocalBridge()
        : dispatcher(channel, "test"),
          server(registry, dispatcher),
          transport(server, HttpTransportOptions{"127.0.0.1", 0, 4}),
          executor(channel) {
        auto tool = Item::Tool(
            ToolDescriptor::Simple("echo", "Echo the input"),
            [](const ParamMap& params) { return ParamsToJson(params); });
        auto registered = registry.Register(std::move(tool).Value());
        (void)registered;
        auto started = dispatcher.Start();
        (void)started;
    }

    httplib::Client Client() const {
        httplib::Client client("127.0.0.1", transport.Port());
        client.set_connection_timeout(5, 0);
        client.set_read_timeout(5, 0);
        return client;
    }

    Registry registry;
    QueueSignalChannel channel;
    TaskDispatcher dispatcher;
    McpServer server;
    HttpTransport transport;
    ExecutionThread executor;
};

std::string RpcBody(int id, const std::string& method,
                    const nlohmann::json& params = nlohmann::json::object()) {
    return nlohmann::json{
        {"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}
    }.dump();
}

} // anonymous namespace

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_CASE("HttpTransport: binds an ephemeral port", "[mcp][http]") {
    LocalBridge bridge;
    REQUIRE(bridge.transport.Start().IsOk());
    CHECK(bridge.transport.IsRunning());
    CHECK(bridge.transport.Port() > 0);

    bridge.transport.Stop();
    CHECK_FALSE(bridge.transport.IsRunning());
    bridge.transport.Stop();
}

TEST_CASE("HttpTransport: unbindable address is a Transport error", "[mcp][http]") {
    Registry registry;
    QueueSignalChannel channel;
    TaskDispatcher dispatcher(channel, "test");
    McpServer server(registry, dispatcher);
    HttpTransport transport(server, HttpTransportOptions{"256.0.0.1", 0, 1});

    auto started = transport.Start();
    REQUIRE(started.IsErr());
    CHECK(started.Error().category == ErrorCategory::Transport);
    CHECK(started.Error().ExitCode() == 3);
    CHECK(started.Error().message == "Cannot bind 256.0.0.1:0");
    CHECK_FALSE(transport.IsRunning());
}

// ===========================================================================
// POST /
// ===========================================================================

TEST_CASE("HttpTransport: POST carries a JSON-RPC exchange", "[mcp][http]") {
    LocalBridge bridge;
    REQUIRE(bridge.transport.Start().IsOk());
    auto client = bridge.Client();

    auto res = client.Post("/", RpcBody(7, "tools/call",
                                        {{"name", "echo"}, {"arguments", {{"x", 1}}}}),
                           "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(res->get_header_value("Access-Control-Allow-Origin") == "*");

    auto body = nlohmann::json::parse(res->body);
    CHECK(body["id"] == 7);
    CHECK(body["result"]["x"] == 1);
}

TEST_CASE("HttpTransport: invalid UTF-8 in a result still answers 200", "[mcp][http]") {
    LocalBridge bridge;
    auto tool = Item::Tool(
        ToolDescriptor::Simple("raw_bytes", "Returns bytes that are not UTF-8"),
        [](const ParamMap&) { return nlohmann::json(std::string("\xff\xfe raw")); });
    REQUIRE(bridge.registry.Register(std::move(tool).Value()).IsOk());
    REQUIRE(bridge.transport.Start().IsOk());
    auto client = bridge.Client();

    auto res = client.Post("/", RpcBody(3, "tools/call", {{"name", "raw_bytes"}}),
                           "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);

    auto body = nlohmann::json::parse(res->body);
    CHECK(body["id"] == 3);
    CHECK(body["result"] == "\xEF\xBF\xBD\xEF\xBF\xBD raw");
}

TEST_CASE("HttpTransport: notification gets 202 and no body", "[mcp][http]") {
    LocalBridge bridge;
    REQUIRE(bridge.transport.Start().IsOk());
    auto client = bridge.Client();

    auto res = client.Post("/", R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                           "application/json");
    REQUIRE(res);
    CHECK(res->status == 202);
    CHECK(res->body.empty());
}

TEST_CASE("HttpTransport: malformed body is 400", "[mcp][http]") {
    LocalBridge bridge;
    REQUIRE(bridge.transport.Start().IsOk());
    auto client = bridge.Client();

    auto res = client.Post("/", "{not json", "application/json");
    REQUIRE(res);
    CHECK(res->status == 400);
    CHECK(res->body == "Invalid JSON");
}

TEST_CASE("HttpTransport: protocol errors still answer 200", "[mcp][http]") {
    LocalBridge bridge;
    REQUIRE(bridge.transport.Start().IsOk());
    auto client = bridge.Client();

    auto res = client.Post("/", RpcBody(1, "no/such/method"), "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(nlohmann::json::parse(res->body)["error"]["code"] == -32601);
}

TEST_CASE("HttpTransport: parallel clients are served", "[mcp][http]") {
    LocalBridge bridge;
    REQUIRE(bridge.transport.Start().IsOk());

    constexpr int kClients = 6;
    std::vector<int> results(kClients, -1);
    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([&bridge, &results, i]() {
            auto client = bridge.Client();
            auto res = client.Post("/", RpcBody(i, "tools/call",
                                                {{"name", "echo"}, {"arguments", {{"n", i}}}}),
                                   "application/json");
            if (res && res->status == 200) {
                results[i] = nlohmann::json::parse(res->body)["result"]["n"].get<int>();
            }
        });
    }
    for (auto& t : clients) {
        t.join();
    }

    for (int i = 0; i < kClients; ++i) {
        CHECK(results[i] == i);
    }
}

// ===========================================================================
// GET routes
// ===========================================================================

TEST_CASE("HttpTransport: GET /health", "[mcp][http]") {
    LocalBridge bridge;
    REQUIRE(bridge.transport.Start().IsOk());
    auto client = bridge.Client();

    auto res = client.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["status"] == "healthy");
    CHECK(body["server"] == "MCP");
}

TEST_CASE("HttpTransport: GET /tools lists tools", "[mcp][http]") {
    LocalBridge bridge;
    REQUIRE(bridge.transport.Start().IsOk());
    auto client = bridge.Client();

    auto res = client.Get("/tools");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = nlohmann::json::parse(res->body);
    REQUIRE(body["result"]["tools"].size() == 1);
    CHECK(body["result"]["tools"][0]["name"] == "echo");
}

TEST_CASE("HttpTransport: GET / describes the endpoints", "[mcp][http]") {
    LocalBridge bridge;
    REQUIRE(bridge.transport.Start().IsOk());
    auto client = bridge.Client();

    auto res = client.Get("/");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["message"] == "MCP Server");
    CHECK(body["endpoints"].size() == 3);
}

TEST_CASE("HttpTransport: unknown path is 404", "[mcp][http]") {
    LocalBridge bridge;
    REQUIRE(bridge.transport.Start().IsOk());
    auto client = bridge.Client();

    auto res = client.Get("/nope");
    REQUIRE(res);
    CHECK(res->status == 404);
}
