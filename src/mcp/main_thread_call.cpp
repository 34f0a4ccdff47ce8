#include <mcp_bridge/mcp/main_thread_call.hpp>

#include <mcp_bridge/core/log.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace mcp_bridge {

namespace {

constexpr const char* kComponent = "main_thread";

// Written once by the execution thread, read by the waiting request thread.
// Shared so a late completion after a timeout still has somewhere to write.
struct ResultCell {
    std::mutex mutex;
    std::condition_variable cv;
    bool completed = false;
    std::optional<nlohmann::json> value;
    std::optional<std::string> error;
};

void Complete(ResultCell& cell, std::optional<nlohmann::json> value,
              std::optional<std::string> error) {
    {
        std::lock_guard<std::mutex> lock(cell.mutex);
        cell.value = std::move(value);
        cell.error = std::move(error);
        cell.completed = true;
    }
    cell.cv.notify_all();
}

} // anonymous namespace

Result<nlohmann::json, Error> CallOnMainThread(
    TaskDispatcher& dispatcher,
    const ItemHandler& handler,
    const ParamMap& params,
    const std::string& operation_type,
    std::chrono::milliseconds timeout) {
    const std::string operation = "CallOnMainThread";

    if (!dispatcher.IsRunning()) {
        LogWarn(kComponent, "Task dispatcher not running, starting it");
        auto started = dispatcher.Start();
        if (started.IsErr()) {
            return Result<nlohmann::json, Error>::Err(Error::Internal(
                operation, "Failed to start task dispatcher: " +
                               started.Error().message));
        }
    }

    auto cell = std::make_shared<ResultCell>();
    TaskCallback callback = [cell, handler, params](const nlohmann::json&) {
        try {
            Complete(*cell, handler(params), std::nullopt);
        } catch (const std::exception& e) {
            Complete(*cell, std::nullopt, std::string(e.what()));
        } catch (...) {
            Complete(*cell, std::nullopt, std::string("unknown exception"));
        }
    };

    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto posted = dispatcher.Post(operation_type + "_execution", std::move(callback),
                                  {{"arguments", ParamsToJson(params)}});
    if (posted.IsErr()) {
        LogError(kComponent, "Failed to post task: " + posted.Error().message);
        return Result<nlohmann::json, Error>::Err(
            Error::Internal(operation, "Failed to post task"));
    }
    const auto& task_id = posted.Value();

    std::unique_lock<std::mutex> lock(cell->mutex);
    if (!cell->cv.wait_until(lock, deadline, [&] { return cell->completed; })) {
        lock.unlock();
        if (dispatcher.Cancel(task_id)) {
            LogWarn(kComponent, operation_type + " task " + task_id +
                                    " timed out before it started; cancelled");
        } else {
            LogWarn(kComponent, operation_type + " task " + task_id +
                                    " timed out while running; result will be discarded");
        }
        return Result<nlohmann::json, Error>::Err(Error{
            operation, operation_type + " execution timed out", ErrorCategory::Timeout});
    }

    if (cell->error) {
        return Result<nlohmann::json, Error>::Err(
            Error::Internal(operation, *cell->error));
    }
    return Result<nlohmann::json, Error>::Ok(std::move(*cell->value));
}

} // namespace mcp_bridge
