#pragma once

/// @file cancellation_channel.h
/// @brief Single-use cancellation hand-off between the heartbeat thread and
/// the coordinating thread.

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <utility>

namespace swfcoord::worker::internal {

/// A received cancellation. Null cause means the task is gone.
struct CancelSignal {
    std::exception_ptr cause;
};

/// Thread-safe single-slot channel. Only the first send is accepted; sends
/// after close() are rejected.
class CancellationChannel {
public:
    CancellationChannel() = default;

    CancellationChannel(const CancellationChannel&) = delete;
    CancellationChannel& operator=(const CancellationChannel&) = delete;

    /// Try to post a cancellation. Returns true if this was the first send
    /// and the channel was still open.
    bool try_send(std::exception_ptr cause) {
        {
            std::lock_guard lock(mutex_);
            if (closed_ || sent_) return false;
            sent_ = true;
            pending_.emplace(CancelSignal{std::move(cause)});
        }
        cv_.notify_all();
        return true;
    }

    /// Block until a cancellation is posted or the deadline passes.
    /// @return The cancellation, or nullopt on timeout.
    template <typename Clock, typename Duration>
    std::optional<CancelSignal> wait_until(
        const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return pending_.has_value(); });
        return std::exchange(pending_, std::nullopt);
    }

    /// Take a posted cancellation without blocking.
    std::optional<CancelSignal> try_receive() {
        std::lock_guard lock(mutex_);
        return std::exchange(pending_, std::nullopt);
    }

    /// Reject all further sends.
    void close() {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }

    bool is_closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<CancelSignal> pending_;
    bool sent_{false};
    bool closed_{false};
};

}  // namespace swfcoord::worker::internal
