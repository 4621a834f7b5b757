#include "swfcoord/worker/coordinated_activity_adapter.h"

#include <stdexcept>
#include <utility>

#include "swfcoord/client/activity_service_client.h"
#include "swfcoord/exceptions/swf_exception.h"
#include "swfcoord/worker/internal/cancellation_channel.h"
#include "swfcoord/worker/internal/heartbeat_monitor.h"
#include "swfcoord/worker/task_update_signaler.h"

namespace swfcoord::worker {

namespace {

constexpr const char* kComponent = "coordinator";

}  // namespace

void CoordinatedActivityOptions::validate() const {
    if (heartbeat_interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("heartbeat_interval must be positive");
    }
    if (tick_min_interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("tick_min_interval must be positive");
    }
    if (max_consecutive_heartbeat_failures &&
        *max_consecutive_heartbeat_failures == 0) {
        throw std::invalid_argument(
            "max_consecutive_heartbeat_failures must be positive when set");
    }
}

CoordinatedActivityAdapter::CoordinatedActivityAdapter(
    CoordinatedActivityOptions options,
    std::shared_ptr<activities::ICoordinatedActivityHandler> handler,
    std::shared_ptr<client::IActivityServiceClient> client,
    std::shared_ptr<ITaskUpdateSignaler> signaler,
    common::DiagnosticSink diagnostics)
    : options_(std::move(options)),
      handler_(std::move(handler)),
      client_(std::move(client)),
      signaler_(std::move(signaler)),
      diagnostics_(std::move(diagnostics)) {
    options_.validate();
    if (!handler_) {
        throw std::invalid_argument("Coordinated activity requires a handler");
    }
    if (!client_) {
        throw std::invalid_argument("Coordinated activity requires a client");
    }
    if (!signaler_) {
        throw std::invalid_argument(
            "Coordinated activity requires an update signaler");
    }
}

CoordinationOutcome CoordinatedActivityAdapter::coordinate(
    const activities::ActivityTask& task, const std::any& input) {
    std::any update;
    try {
        update = handler_->start(task, input);
        signaler_->signal_start(task, update);
    } catch (const std::exception& e) {
        diagnostics_.emit(common::DiagnosticLevel::kWarn, kComponent, task,
                          common::DiagnosticEventKind::kTaskFailed, e.what());
        return CoordinationOutcome::failed(std::current_exception());
    }

    // Must outlive the monitor.
    internal::CancellationChannel cancel_channel;
    internal::HeartbeatMonitor monitor(
        *client_, task,
        internal::HeartbeatMonitorOptions{
            options_.heartbeat_interval,
            options_.max_consecutive_heartbeat_failures},
        cancel_channel, diagnostics_);
    monitor.start();

    auto next_tick =
        std::chrono::steady_clock::now() + options_.tick_min_interval;
    while (true) {
        if (auto signal = cancel_channel.wait_until(next_tick)) {
            monitor.stop();
            return cancel(task, input, std::move(signal->cause));
        }

        next_tick =
            std::chrono::steady_clock::now() + options_.tick_min_interval;

        activities::TickResult tick;
        try {
            tick = handler_->tick(task, input);
        } catch (const std::exception& e) {
            monitor.stop();
            diagnostics_.emit(common::DiagnosticLevel::kWarn, kComponent,
                              task, common::DiagnosticEventKind::kTaskFailed,
                              e.what());
            return CoordinationOutcome::failed(std::current_exception());
        }

        if (!tick.keep_going) {
            monitor.stop();
            diagnostics_.emit(common::DiagnosticLevel::kInfo, kComponent,
                              task,
                              common::DiagnosticEventKind::kTaskCompleted);
            return CoordinationOutcome::completed(std::move(tick.result));
        }

        if (!tick.result.has_value()) {
            continue;
        }
        try {
            signaler_->signal_update(task, tick.result);
            diagnostics_.emit(common::DiagnosticLevel::kDebug, kComponent,
                              task,
                              common::DiagnosticEventKind::kSignalUpdate);
        } catch (const std::exception& e) {
            diagnostics_.emit(common::DiagnosticLevel::kWarn, kComponent,
                              task,
                              common::DiagnosticEventKind::kSignalUpdateError,
                              e.what());
            // Picked up by the wait at the top of the loop. If the
            // heartbeat thread already posted, its cancellation wins.
            cancel_channel.try_send(std::current_exception());
        }
    }
}

CoordinationOutcome CoordinatedActivityAdapter::cancel(
    const activities::ActivityTask& task, const std::any& input,
    std::exception_ptr cause) {
    try {
        handler_->cancel(task, input);
    } catch (const std::exception& e) {
        diagnostics_.emit(common::DiagnosticLevel::kWarn, kComponent, task,
                          common::DiagnosticEventKind::kCancelError, e.what());
    }
    diagnostics_.emit(common::DiagnosticLevel::kInfo, kComponent, task,
                      common::DiagnosticEventKind::kTaskCanceled,
                      cause ? std::optional<std::string>(
                                  exceptions::describe(cause))
                            : std::nullopt);
    return CoordinationOutcome::canceled(std::move(cause));
}

}  // namespace swfcoord::worker
