#include <mcp_bridge/core/result.hpp>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"message", message},
        {"rpc_code", RpcCode()},
        {"exit_code", ExitCode()},
    };
    if (!operation.empty()) {
        body["operation"] = operation;
    }
    return nlohmann::json{{"error", body}}.dump(-1, ' ', false,
                                               nlohmann::json::error_handler_t::replace);
}

} // namespace mcp_bridge
