#include <mcp_bridge/mcp/signal_channel.hpp>

#include <mcp_bridge/core/log.hpp>

namespace mcp_bridge {

namespace {

constexpr const char* kComponent = "signal_channel";

Error MakeChannelError(const std::string& message, ErrorCategory category) {
    return Error{"SignalChannel", message, category};
}

} // anonymous namespace

Result<void, Error> QueueSignalChannel::Register(const std::string& channel,
                                                 SignalConsumer consumer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consumers_.count(channel) > 0) {
        return Result<void, Error>::Err(MakeChannelError(
            "Channel '" + channel + "' already registered",
            ErrorCategory::DuplicateName));
    }
    consumers_[channel] = std::move(consumer);
    return Result<void, Error>::Ok();
}

Result<void, Error> QueueSignalChannel::Unregister(const std::string& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consumers_.erase(channel) == 0) {
        return Result<void, Error>::Err(MakeChannelError(
            "Channel '" + channel + "' not registered", ErrorCategory::NotFound));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> QueueSignalChannel::Send(const std::string& channel,
                                             std::string payload) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (consumers_.count(channel) == 0) {
            return Result<void, Error>::Err(MakeChannelError(
                "Channel '" + channel + "' not registered", ErrorCategory::NotFound));
        }
        queue_.push_back({channel, std::move(payload)});
    }
    cv_.notify_one();
    return Result<void, Error>::Ok();
}

std::size_t QueueSignalChannel::DispatchPending() {
    std::deque<Signal> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queue_);
    }

    std::size_t delivered = 0;
    for (auto& signal : batch) {
        SignalConsumer consumer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = consumers_.find(signal.channel);
            if (it != consumers_.end()) {
                consumer = it->second;
            }
        }
        if (!consumer) {
            LogDebug(kComponent, "Dropping signal for unregistered channel '" +
                                     signal.channel + "'");
            continue;
        }
        try {
            consumer(signal.payload);
        } catch (const std::exception& e) {
            LogError(kComponent, "Consumer for '" + signal.channel +
                                     "' threw: " + e.what());
        }
        ++delivered;
    }
    return delivered;
}

std::size_t QueueSignalChannel::WaitAndDispatch(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout,
                     [this] { return !queue_.empty() || wake_requested_; });
        wake_requested_ = false;
    }
    return DispatchPending();
}

void QueueSignalChannel::Wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_requested_ = true;
    }
    cv_.notify_all();
}

std::size_t QueueSignalChannel::QueuedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace mcp_bridge
