#pragma once

#include <mcp_bridge/core/result.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace mcp_bridge {

// Receives one signal payload on the execution thread.
using SignalConsumer = std::function<void(const std::string& payload)>;

// ---------------------------------------------------------------------------
// ISignalChannel: the host's cross-thread signalling primitive.
//
// A named channel has at most one consumer. Send() may be called from any
// thread; the host delivers each payload to the consumer on its single
// execution thread, in the order the payloads were sent.
//
// Methods return Result<void, Error> and never throw on expected failures.
// ---------------------------------------------------------------------------
class ISignalChannel {
public:
    virtual ~ISignalChannel() = default;

    // Non-copyable, non-movable (polymorphic base).
    ISignalChannel(const ISignalChannel&) = delete;
    ISignalChannel& operator=(const ISignalChannel&) = delete;
    ISignalChannel(ISignalChannel&&) = delete;
    ISignalChannel& operator=(ISignalChannel&&) = delete;

    // DuplicateName if the channel already has a consumer.
    [[nodiscard]] virtual Result<void, Error> Register(const std::string& channel,
                                                       SignalConsumer consumer) = 0;

    // NotFound if the channel is not registered.
    [[nodiscard]] virtual Result<void, Error> Unregister(const std::string& channel) = 0;

    // NotFound if the channel is not registered.
    [[nodiscard]] virtual Result<void, Error> Send(const std::string& channel,
                                                   std::string payload) = 0;

protected:
    ISignalChannel() = default;
};

// ---------------------------------------------------------------------------
// QueueSignalChannel: FIFO implementation for hosts that own their
// execution loop. Producers enqueue; the execution thread calls
// DispatchPending() or WaitAndDispatch() to deliver.
// ---------------------------------------------------------------------------
class QueueSignalChannel : public ISignalChannel {
public:
    QueueSignalChannel() = default;

    Result<void, Error> Register(const std::string& channel,
                                 SignalConsumer consumer) override;
    Result<void, Error> Unregister(const std::string& channel) override;
    Result<void, Error> Send(const std::string& channel,
                             std::string payload) override;

    // -- Execution-thread side ----------------------------------------------

    // Deliver every signal queued at the time of the call. Returns the number
    // delivered to a consumer (signals for unregistered channels are dropped).
    std::size_t DispatchPending();

    // Block until a signal arrives, Wake() is called or the timeout elapses,
    // then deliver what is queued.
    std::size_t WaitAndDispatch(std::chrono::milliseconds timeout);

    // Interrupt a blocked WaitAndDispatch().
    void Wake();

    [[nodiscard]] std::size_t QueuedCount() const;

private:
    struct Signal {
        std::string channel;
        std::string payload;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Signal> queue_;
    std::map<std::string, SignalConsumer> consumers_;
    bool wake_requested_ = false;
};

} // namespace mcp_bridge
