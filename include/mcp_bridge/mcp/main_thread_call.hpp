#pragma once

#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/mcp/primitives.hpp>
#include <mcp_bridge/mcp/task_dispatcher.hpp>

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

constexpr std::chrono::milliseconds kDefaultMainThreadTimeout{30000};

// Run `handler(params)` on the execution thread and block the calling thread
// until it finishes or `timeout` elapses.
//
// `operation_type` names the call in errors and logs ("Tool", "Resource").
// Errors:
//   Internal: the task could not be posted, or the handler threw
//   Timeout:  "<operation_type> execution timed out"; a task that had not
//             started is cancelled, a late result is discarded
// Starts the dispatcher first when it is not running.
Result<nlohmann::json, Error> CallOnMainThread(
    TaskDispatcher& dispatcher,
    const ItemHandler& handler,
    const ParamMap& params,
    const std::string& operation_type,
    std::chrono::milliseconds timeout = kDefaultMainThreadTimeout);

} // namespace mcp_bridge
