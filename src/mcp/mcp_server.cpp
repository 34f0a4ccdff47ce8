#include <mcp_bridge/mcp/mcp_server.hpp>

#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/mcp/main_thread_call.hpp>
#include <mcp_bridge/mcp/uri_template.hpp>

#include <string>

namespace mcp_bridge {

namespace {

constexpr const char* kComponent = "mcp";
constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kDefaultMimeType = "application/json";

} // anonymous namespace

McpServer::McpServer(Registry& registry, TaskDispatcher& dispatcher,
                     McpServerOptions options)
    : registry_(registry), dispatcher_(dispatcher), options_(std::move(options)) {}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, rpc_code::kInvalidRequest,
                         "Request must be a JSON object");
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], rpc_code::kInvalidRequest,
                             "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id".
    if (!message.contains("id")) {
        if (message.contains("method") && message["method"].is_string()) {
            LogDebug(kComponent, "Notification: " + message["method"].get<std::string>());
        }
        return std::nullopt;
    }

    const auto& id = message["id"];
    if (!message.contains("method") || !message["method"].is_string()) {
        return MakeError(id, rpc_code::kInvalidRequest, "Missing 'method'");
    }
    auto method = message["method"].get<std::string>();
    auto params = message.contains("params") && message["params"].is_object()
                      ? message["params"]
                      : nlohmann::json::object();

    try {
        return Dispatch(method, params, id);
    } catch (const std::exception& e) {
        LogError(kComponent, method + " failed: " + e.what());
        return MakeError(id, rpc_code::kInternalError, e.what());
    } catch (...) {
        LogError(kComponent, method + " failed with an unknown exception");
        return MakeError(id, rpc_code::kInternalError, "unknown exception");
    }
}

nlohmann::json McpServer::Dispatch(const std::string& method,
                                   const nlohmann::json& params,
                                   const nlohmann::json& id) {
    LogDebug(kComponent, "Request: " + method);
    if (method == "initialize") {
        return HandleInitialize(id);
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "resources/list") {
        return HandleResourcesList(id);
    } else if (method == "resources/templates/list") {
        return HandleResourcesTemplatesList(id);
    } else if (method == "resources/read") {
        return HandleResourcesRead(params, id);
    }
    return MakeError(id, rpc_code::kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& id) {
    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()},
        {"resources", {{"listChanged", false}}}
    };
    result["serverInfo"] = {
        {"name", options_.name},
        {"version", options_.version}
    };
    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& item : registry_.List(ItemCategory::Tool)) {
        tools.push_back(item->Describe());
    }
    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, rpc_code::kInvalidParams, "Missing 'name' parameter");
    }
    auto tool_name = params["name"].get<std::string>();

    auto arguments = ParamsFromJson(params.value("arguments", nlohmann::json::object()));
    if (arguments.IsErr()) {
        return MakeError(id, rpc_code::kInvalidParams, arguments.Error().message);
    }

    auto tool = registry_.Get(ItemCategory::Tool, tool_name);
    if (tool.IsErr()) {
        return MakeError(id, rpc_code::kMethodNotFound, "Tool not found: " + tool_name);
    }

    auto result = Invoke(*tool.Value(), arguments.Value(), "Tool");
    if (result.IsErr()) {
        LogWarn(kComponent, "Tool " + tool_name + " failed: " + result.Error().message);
        return MakeError(id, result.Error().RpcCode(),
                         "Tool execution error: " + result.Error().message);
    }
    return MakeResult(id, result.Value());
}

nlohmann::json McpServer::HandleResourcesList(const nlohmann::json& id) {
    nlohmann::json resources = nlohmann::json::array();
    for (const auto& item : registry_.List(ItemCategory::Resource)) {
        if (!item->AsResource().IsTemplate()) {
            resources.push_back(item->Describe());
        }
    }
    return MakeResult(id, {{"resources", resources}});
}

nlohmann::json McpServer::HandleResourcesTemplatesList(const nlohmann::json& id) {
    nlohmann::json templates = nlohmann::json::array();
    for (const auto& item : registry_.List(ItemCategory::Resource)) {
        if (item->AsResource().IsTemplate()) {
            templates.push_back(item->Describe());
        }
    }
    return MakeResult(id, {{"resourceTemplates", templates}});
}

nlohmann::json McpServer::HandleResourcesRead(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.contains("uri") || !params["uri"].is_string()) {
        return MakeError(id, rpc_code::kInvalidParams, "Missing 'uri' parameter");
    }
    auto uri = params["uri"].get<std::string>();

    std::map<std::string, std::string> captures;
    auto resource = ResolveResource(uri, captures);
    if (!resource) {
        return MakeError(id, rpc_code::kMethodNotFound, "Resource not found: " + uri);
    }

    // Extra request params, then path captures, then query parameters.
    auto extra = params;
    extra.erase("uri");
    auto arguments = ParamsFromJson(extra);
    if (arguments.IsErr()) {
        return MakeError(id, rpc_code::kInvalidParams, arguments.Error().message);
    }
    ParamMap handler_args = std::move(arguments).Value();
    for (const auto& [key, value] : captures) {
        handler_args[key] = value;
    }
    for (const auto& [key, value] : QueryArguments(uri)) {
        handler_args[key] = value;
    }

    auto result = Invoke(*resource, handler_args, "Resource");
    if (result.IsErr()) {
        LogWarn(kComponent, "Resource " + uri + " failed: " + result.Error().message);
        return MakeError(id, result.Error().RpcCode(),
                         "Resource read error: " + result.Error().message);
    }

    const auto& value = result.Value();
    const auto& descriptor = resource->AsResource();
    nlohmann::json content = {
        {"uri", uri},
        {"mimeType", descriptor.mime_type.value_or(kDefaultMimeType)},
        {"text", value.is_string()
                     ? value.get<std::string>()
                     : value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)}
    };
    return MakeResult(id, {{"contents", nlohmann::json::array({content})}});
}

ItemPtr McpServer::ResolveResource(
    const std::string& uri, std::map<std::string, std::string>& captures) const {
    if (auto exact = registry_.FindResourceByUri(uri)) {
        return exact;
    }
    for (const auto& item : registry_.List(ItemCategory::Resource)) {
        const auto& descriptor = item->AsResource();
        if (!descriptor.IsTemplate()) {
            continue;
        }
        if (auto match = UriTemplate(descriptor.uri_template).Match(uri)) {
            captures = std::move(*match);
            return item;
        }
    }
    return nullptr;
}

Result<nlohmann::json, Error> McpServer::Invoke(
    const Item& item, const ParamMap& params, const std::string& operation_type) {
    if (item.RunsOnMainThread()) {
        return CallOnMainThread(dispatcher_, item.Handler(), params,
                                operation_type, options_.main_thread_timeout);
    }
    try {
        return Result<nlohmann::json, Error>::Ok(item.Handler()(params));
    } catch (const std::exception& e) {
        return Result<nlohmann::json, Error>::Err(
            Error::Internal(operation_type, e.what()));
    } catch (...) {
        return Result<nlohmann::json, Error>::Err(
            Error::Internal(operation_type, "unknown exception"));
    }
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace mcp_bridge
