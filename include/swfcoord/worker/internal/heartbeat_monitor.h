#pragma once

/// @file heartbeat_monitor.h
/// @brief Periodic liveness reporting for one coordinated activity task.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include <swfcoord/activities/activity_task.h>
#include <swfcoord/common/diagnostics.h>
#include <swfcoord/worker/internal/cancellation_channel.h>

namespace swfcoord::client {
class IActivityServiceClient;
}

namespace swfcoord::worker::internal {

/// Configuration for a HeartbeatMonitor.
struct HeartbeatMonitorOptions {
    /// Time between heartbeats.
    std::chrono::milliseconds interval{std::chrono::seconds{30}};

    /// Consecutive transient failures after which the task is considered
    /// lost. Unset means transient failures never end monitoring.
    std::optional<std::uint32_t> max_consecutive_failures{};
};

/// Heartbeats a task on its own thread until stopped, and posts at most one
/// cancellation to the channel when the service asks for cancellation, when
/// the task no longer exists, or when the failure bound is reached. After
/// posting, the monitor stops on its own.
///
/// The task, client, channel and diagnostics sink must outlive the monitor.
class HeartbeatMonitor {
public:
    HeartbeatMonitor(client::IActivityServiceClient& client,
                     const activities::ActivityTask& task,
                     HeartbeatMonitorOptions options,
                     CancellationChannel& channel,
                     const common::DiagnosticSink& diagnostics);

    /// Stops and joins the heartbeat thread.
    ~HeartbeatMonitor();

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    /// Launch the heartbeat thread.
    /// @throws std::logic_error if already started.
    void start();

    /// Close the channel, then stop and join the heartbeat thread.
    /// Idempotent. Nothing is posted to the channel after this returns.
    void stop();

    /// Whether the heartbeat thread has exited (stopped or self-stopped).
    bool finished() const noexcept {
        return finished_.load(std::memory_order_acquire);
    }

    /// Number of heartbeat calls attempted so far.
    std::uint32_t heartbeats_attempted() const noexcept {
        return attempted_.load(std::memory_order_acquire);
    }

private:
    /// Thread body.
    void run(std::stop_token stop_token);

    /// Send one heartbeat. Returns false when monitoring must end.
    bool beat();

    /// Record a transient failure. Returns false when the bound is reached.
    bool record_failure(std::exception_ptr error, const std::string& message);

    client::IActivityServiceClient& client_;
    const activities::ActivityTask& task_;
    HeartbeatMonitorOptions options_;
    CancellationChannel& channel_;
    const common::DiagnosticSink& diagnostics_;

    std::uint32_t consecutive_failures_{0};
    std::atomic<std::uint32_t> attempted_{0};
    std::atomic<bool> finished_{false};

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::jthread thread_;
};

}  // namespace swfcoord::worker::internal
