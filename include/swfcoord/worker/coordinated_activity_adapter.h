#pragma once

/// @file coordinated_activity_adapter.h
/// @brief Drives a coordinated handler through start, heartbeat, tick and
/// cancel to a single terminal outcome.

#include <any>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include <swfcoord/activities/activity_task.h>
#include <swfcoord/activities/coordinated_handler.h>
#include <swfcoord/common/diagnostics.h>
#include <swfcoord/worker/coordination_outcome.h>

namespace swfcoord::client {
class IActivityServiceClient;
}

namespace swfcoord::worker {

class ITaskUpdateSignaler;

/// Timing configuration for a coordinated activity.
struct CoordinatedActivityOptions {
    /// Time between heartbeats. Must be positive.
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds{30}};

    /// Minimum time between the starts of two consecutive ticks. Must be
    /// positive. Ticks run slower when a tick takes longer than this.
    std::chrono::milliseconds tick_min_interval{std::chrono::seconds{1}};

    /// Consecutive transient heartbeat failures after which the task is
    /// canceled with HeartbeatLostException. Unset leaves the decision that
    /// a task is gone to the service. Must be positive when set.
    std::optional<std::uint32_t> max_consecutive_heartbeat_failures{};

    /// @throws std::invalid_argument on a non-positive interval or bound.
    void validate() const;
};

/// Runs one coordinated activity task per coordinate() call.
///
/// Sequence: handler start, start signal, then the heartbeat thread runs
/// alongside a rate-limited tick loop on the calling thread. Non-empty tick
/// results with keep_going set are forwarded as update signals. The session
/// ends when a tick returns keep_going == false, a tick throws, or a
/// cancellation arrives (from the heartbeat thread or from a failed update
/// signal). The heartbeat thread is always stopped and joined before
/// coordinate() returns.
///
/// Thread-safe: concurrent coordinate() calls for different tasks share no
/// session state, provided the handler supports it.
class CoordinatedActivityAdapter {
public:
    /// @throws std::invalid_argument on invalid options or null collaborators.
    CoordinatedActivityAdapter(
        CoordinatedActivityOptions options,
        std::shared_ptr<activities::ICoordinatedActivityHandler> handler,
        std::shared_ptr<client::IActivityServiceClient> client,
        std::shared_ptr<ITaskUpdateSignaler> signaler,
        common::DiagnosticSink diagnostics = {});

    CoordinatedActivityAdapter(const CoordinatedActivityAdapter&) = delete;
    CoordinatedActivityAdapter& operator=(const CoordinatedActivityAdapter&) =
        delete;

    /// Coordinate one task to its terminal outcome. Handler and signaler
    /// exceptions derived from std::exception are captured in the outcome;
    /// anything else propagates to the caller.
    CoordinationOutcome coordinate(const activities::ActivityTask& task,
                                   const std::any& input);

    const CoordinatedActivityOptions& options() const noexcept {
        return options_;
    }

    activities::ICoordinatedActivityHandler& handler() const noexcept {
        return *handler_;
    }

    const common::DiagnosticSink& diagnostics() const noexcept {
        return diagnostics_;
    }

private:
    /// Run the handler's cancel and build the canceled outcome.
    CoordinationOutcome cancel(const activities::ActivityTask& task,
                               const std::any& input,
                               std::exception_ptr cause);

    CoordinatedActivityOptions options_;
    std::shared_ptr<activities::ICoordinatedActivityHandler> handler_;
    std::shared_ptr<client::IActivityServiceClient> client_;
    std::shared_ptr<ITaskUpdateSignaler> signaler_;
    common::DiagnosticSink diagnostics_;
};

}  // namespace swfcoord::worker
