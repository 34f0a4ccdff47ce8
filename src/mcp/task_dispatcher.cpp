#include <mcp_bridge/mcp/task_dispatcher.hpp>

#include <mcp_bridge/core/log.hpp>

#include <cstdint>
#include <cstdio>

namespace mcp_bridge {

namespace {

constexpr const char* kComponent = "task_dispatcher";

Error MakeDispatchError(const std::string& message, ErrorCategory category) {
    return Error{"TaskDispatcher", message, category};
}

} // anonymous namespace

TaskDispatcher::TaskDispatcher(ISignalChannel& channel, std::string app_name)
    : channel_(channel),
      channel_name_(std::move(app_name) + ".TaskDispatcherEvent"),
      rng_(std::random_device{}()) {}

TaskDispatcher::~TaskDispatcher() {
    auto stopped = Stop();
    if (stopped.IsErr()) {
        LogWarn(kComponent, "Stop during destruction failed: " +
                                stopped.Error().ToString());
    }
}

Result<void, Error> TaskDispatcher::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        LogDebug(kComponent, "Already running");
        return Result<void, Error>::Ok();
    }

    auto registered = channel_.Register(
        channel_name_, [this](const std::string& payload) { OnSignal(payload); });
    if (registered.IsErr()) {
        LogError(kComponent, "Failed to register channel " + channel_name_ +
                                 ": " + registered.Error().message);
        return registered;
    }

    running_ = true;
    LogInfo(kComponent, "Started on channel " + channel_name_);
    return Result<void, Error>::Ok();
}

Result<void, Error> TaskDispatcher::Stop() {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return Result<void, Error>::Ok();
        }
        running_ = false;
        dropped = pending_.size();
        pending_.clear();
    }

    auto unregistered = channel_.Unregister(channel_name_);
    if (dropped > 0) {
        LogWarn(kComponent, "Discarded " + std::to_string(dropped) +
                                " pending task(s) on stop");
    }
    if (unregistered.IsErr()) {
        LogWarn(kComponent, "Failed to unregister channel " + channel_name_ +
                                ": " + unregistered.Error().message);
        return unregistered;
    }
    LogInfo(kComponent, "Stopped");
    return Result<void, Error>::Ok();
}

Result<std::string, Error> TaskDispatcher::Post(const std::string& command,
                                                TaskCallback callback,
                                                nlohmann::json data) {
    if (!callback) {
        return Result<std::string, Error>::Err(MakeDispatchError(
            "Callback must not be empty", ErrorCategory::InvalidArgument));
    }

    std::string task_id;
    std::string payload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return Result<std::string, Error>::Err(MakeDispatchError(
                "Task dispatcher is not running", ErrorCategory::NotRunning));
        }
        task_id = NewTaskId();
        // Serialised before the task is stored; invalid UTF-8 in `data` is
        // replaced in the signal, the callback still receives it unchanged.
        payload = nlohmann::json{{"task_id", task_id}, {"command", command}, {"data", data}}
                      .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        pending_.emplace(task_id,
                         PendingTask{command, std::move(callback), std::move(data)});
    }

    auto sent = channel_.Send(channel_name_, payload);
    if (sent.IsErr()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(task_id);
        }
        LogError(kComponent, "Failed to signal task " + task_id + ": " +
                                 sent.Error().message);
        return Result<std::string, Error>::Err(sent.Error());
    }

    LogDebug(kComponent, "Posted " + command + " as " + task_id);
    return Result<std::string, Error>::Ok(std::move(task_id));
}

bool TaskDispatcher::Cancel(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.erase(task_id) == 0) {
        return false;
    }
    LogDebug(kComponent, "Cancelled " + task_id);
    return true;
}

bool TaskDispatcher::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::size_t TaskDispatcher::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void TaskDispatcher::OnSignal(const std::string& payload) {
    std::string task_id;
    try {
        auto message = nlohmann::json::parse(payload);
        if (message.is_object() && message.contains("task_id") &&
            message["task_id"].is_string()) {
            task_id = message["task_id"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        LogError(kComponent, std::string("Malformed task signal: ") + e.what());
        return;
    }
    if (task_id.empty()) {
        LogWarn(kComponent, "Task signal without task_id ignored");
        return;
    }

    PendingTask task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(task_id);
        if (it == pending_.end()) {
            LogWarn(kComponent, "Unknown task " + task_id + " ignored");
            return;
        }
        task = std::move(it->second);
        pending_.erase(it);
    }

    LogDebug(kComponent, "Executing " + task.command + " (" + task_id + ")");
    try {
        task.callback(task.data);
    } catch (const std::exception& e) {
        LogError(kComponent, "Task " + task_id + " (" + task.command +
                                 ") failed: " + e.what());
    } catch (...) {
        LogError(kComponent, "Task " + task_id + " (" + task.command +
                                 ") failed with a non-standard exception");
    }
}

std::string TaskDispatcher::NewTaskId() {
    std::uint64_t hi = rng_();
    std::uint64_t lo = rng_();
    // Version 4, RFC 4122 variant.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

} // namespace mcp_bridge
