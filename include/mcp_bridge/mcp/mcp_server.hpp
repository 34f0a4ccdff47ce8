#pragma once

#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/mcp/primitives.hpp>
#include <mcp_bridge/mcp/registry.hpp>
#include <mcp_bridge/mcp/task_dispatcher.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

struct McpServerOptions {
    std::string name = "MCP Bridge";
    std::string version = "1.0.0";
    std::chrono::milliseconds main_thread_timeout{30000};
};

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 protocol dispatcher.
//
// Implements JSON-RPC 2.0 with the MCP methods:
//   - initialize
//   - tools/list, tools/call
//   - resources/list, resources/templates/list, resources/read
//
// Main-thread items are handed to the execution thread through the task
// dispatcher; any-thread items run on the calling thread. Transport-neutral
// and safe to call from many threads at once.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(Registry& registry, TaskDispatcher& dispatcher,
              McpServerOptions options = {});

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications. Never throws.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] const McpServerOptions& Options() const noexcept { return options_; }

    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

private:
    nlohmann::json Dispatch(const std::string& method,
                            const nlohmann::json& params,
                            const nlohmann::json& id);

    nlohmann::json HandleInitialize(const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    nlohmann::json HandleResourcesList(const nlohmann::json& id);
    nlohmann::json HandleResourcesTemplatesList(const nlohmann::json& id);
    nlohmann::json HandleResourcesRead(const nlohmann::json& params,
                                       const nlohmann::json& id);

    // Exact URI first, then templates in registration order. Fills
    // `captures` with path-variable values on a template match.
    ItemPtr ResolveResource(const std::string& uri,
                            std::map<std::string, std::string>& captures) const;

    // Runs the handler according to its thread affinity.
    Result<nlohmann::json, Error> Invoke(const Item& item,
                                         const ParamMap& params,
                                         const std::string& operation_type);

    Registry& registry_;
    TaskDispatcher& dispatcher_;
    McpServerOptions options_;
};

} // namespace mcp_bridge
