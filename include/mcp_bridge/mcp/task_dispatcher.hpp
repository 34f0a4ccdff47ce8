#pragma once

#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/mcp/signal_channel.hpp>

#include <cstddef>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

// Runs on the execution thread with the data given to Post().
using TaskCallback = std::function<void(const nlohmann::json& data)>;

// ---------------------------------------------------------------------------
// TaskDispatcher: posts work from any thread to the single execution thread.
//
// Each posted task is stored under a fresh UUIDv4 id and announced on the
// signal channel "<app>.TaskDispatcherEvent" with the payload
//   {"task_id": ..., "command": ..., "data": ...}
// The channel's consumer runs on the execution thread, removes the task
// from the pending map and invokes its callback outside the lock. A task
// is removed exactly once: by the consumer, by Cancel() or by Stop().
// ---------------------------------------------------------------------------
class TaskDispatcher {
public:
    explicit TaskDispatcher(ISignalChannel& channel,
                            std::string app_name = "mcp_bridge");
    ~TaskDispatcher();

    TaskDispatcher(const TaskDispatcher&) = delete;
    TaskDispatcher& operator=(const TaskDispatcher&) = delete;

    // Registers the channel consumer. No-op when already running.
    [[nodiscard]] Result<void, Error> Start();

    // Unregisters the channel and discards pending tasks; their callbacks
    // never run. No-op when not running.
    [[nodiscard]] Result<void, Error> Stop();

    // Returns the task id. NotRunning before Start() or after Stop();
    // InvalidArgument for an empty callback.
    [[nodiscard]] Result<std::string, Error> Post(const std::string& command,
                                                  TaskCallback callback,
                                                  nlohmann::json data = nlohmann::json::object());

    // Removes a task that has not started yet. False when it is unknown,
    // already ran, or is running.
    bool Cancel(const std::string& task_id);

    [[nodiscard]] bool IsRunning() const;
    [[nodiscard]] std::size_t PendingCount() const;
    [[nodiscard]] const std::string& ChannelName() const noexcept { return channel_name_; }

private:
    struct PendingTask {
        std::string command;
        TaskCallback callback;
        nlohmann::json data;
    };

    void OnSignal(const std::string& payload);
    std::string NewTaskId();  // requires mutex_

    ISignalChannel& channel_;
    std::string channel_name_;

    mutable std::mutex mutex_;
    bool running_ = false;
    std::unordered_map<std::string, PendingTask> pending_;
    std::mt19937_64 rng_;
};

} // namespace mcp_bridge
