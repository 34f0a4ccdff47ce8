#pragma once

#include <mcp_bridge/config/app_config.hpp>
#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/mcp/registry.hpp>

namespace mcp_bridge {

// Register the items the mcp-bridge executable serves out of the box:
//   tools      hello_world, add_numbers, get_system_info
//   resources  server://status, server://config,
//              server://items/{category}, server://echo{?text}
//   prompts    describe_server
// `registry` must outlive the registered handlers' use.
Result<void, Error> RegisterBuiltinItems(Registry& registry, const AppConfig& config);

} // namespace mcp_bridge
