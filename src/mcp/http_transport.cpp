#include <mcp_bridge/mcp/http_transport.hpp>

#include <mcp_bridge/core/log.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace mcp_bridge {

namespace {

constexpr const char* kComponent = "http";

void SendJson(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_content(body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json");
}

} // anonymous namespace

HttpTransport::HttpTransport(McpServer& server, HttpTransportOptions options)
    : server_(server),
      options_(std::move(options)),
      http_(std::make_unique<httplib::Server>()) {
    auto workers = options_.worker_threads;
    http_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    http_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LogDebug(kComponent, req.method + " " + req.path + " -> " +
                                 std::to_string(res.status));
    });
    RegisterRoutes();
}

HttpTransport::~HttpTransport() {
    Stop();
}

Result<void, Error> HttpTransport::Start() {
    if (running_) {
        return Result<void, Error>::Ok();
    }

    int port = options_.port;
    if (port == 0) {
        port = http_->bind_to_any_port(options_.host);
        if (port < 0) {
            port = 0;
        }
    } else if (!http_->bind_to_port(options_.host, port)) {
        port = 0;
    }
    if (port == 0) {
        return Result<void, Error>::Err(Error{
            "HttpTransport",
            "Cannot bind " + options_.host + ":" + std::to_string(options_.port),
            ErrorCategory::Transport});
    }

    bound_port_ = port;
    running_ = true;
    listen_thread_ = std::thread([this] {
        if (!http_->listen_after_bind()) {
            LogWarn(kComponent, "Listener exited with an error");
        }
    });
    // stop() is a no-op until the accept loop runs.
    http_->wait_until_ready();
    LogInfo(kComponent, "Listening on http://" + options_.host + ":" +
                            std::to_string(bound_port_) + " with " +
                            std::to_string(options_.worker_threads) + " worker(s)");
    return Result<void, Error>::Ok();
}

void HttpTransport::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    http_->stop();
    if (listen_thread_.joinable()) {
        listen_thread_.join();
    }
    LogInfo(kComponent, "Stopped");
}

void HttpTransport::RegisterRoutes() {
    http_->Post("/", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json request;
        try {
            request = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::exception&) {
            res.status = 400;
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_content("Invalid JSON", "text/plain");
            return;
        }

        try {
            auto response = server_.HandleMessage(request);
            if (!response) {
                res.status = 202;
                res.set_header("Access-Control-Allow-Origin", "*");
                return;
            }
            SendJson(res, *response);
        } catch (const std::exception& e) {
            LogError(kComponent, std::string("Request failed: ") + e.what());
            res.status = 500;
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_content(e.what(), "text/plain");
        }
    });

    http_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        SendJson(res, {{"status", "healthy"}, {"server", "MCP"}});
    });

    http_->Get("/tools", [this](const httplib::Request&, httplib::Response& res) {
        auto response = server_.HandleMessage(
            {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
        SendJson(res, response.value_or(nlohmann::json::object()));
    });

    http_->Get("/", [](const httplib::Request&, httplib::Response& res) {
        SendJson(res, {
            {"message", "MCP Server"},
            {"endpoints", {"POST / (MCP protocol)", "GET /health", "GET /tools"}}
        });
    });
}

} // namespace mcp_bridge
