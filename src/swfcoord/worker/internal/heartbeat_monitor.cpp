#include "swfcoord/worker/internal/heartbeat_monitor.h"

#include <stdexcept>
#include <utility>

#include "swfcoord/client/activity_service_client.h"
#include "swfcoord/exceptions/swf_exception.h"

namespace swfcoord::worker::internal {

namespace {

constexpr const char* kComponent = "heartbeat";

}  // namespace

HeartbeatMonitor::HeartbeatMonitor(client::IActivityServiceClient& client,
                                   const activities::ActivityTask& task,
                                   HeartbeatMonitorOptions options,
                                   CancellationChannel& channel,
                                   const common::DiagnosticSink& diagnostics)
    : client_(client),
      task_(task),
      options_(std::move(options)),
      channel_(channel),
      diagnostics_(diagnostics) {
    if (options_.interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Heartbeat interval must be positive");
    }
}

HeartbeatMonitor::~HeartbeatMonitor() { stop(); }

void HeartbeatMonitor::start() {
    if (thread_.joinable()) {
        throw std::logic_error("Heartbeat monitor already started");
    }
    thread_ = std::jthread(
        [this](std::stop_token stop_token) { run(std::move(stop_token)); });
}

void HeartbeatMonitor::stop() {
    channel_.close();
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

void HeartbeatMonitor::run(std::stop_token stop_token) {
    auto next = std::chrono::steady_clock::now() + options_.interval;
    while (true) {
        {
            std::unique_lock lock(wait_mutex_);
            // Wakes early only when stop is requested.
            wait_cv_.wait_until(lock, stop_token, next, [] { return false; });
        }
        if (stop_token.stop_requested() || !beat()) {
            break;
        }
        auto now = std::chrono::steady_clock::now();
        next += options_.interval;
        if (next < now) {
            next = now + options_.interval;
        }
    }
    finished_.store(true, std::memory_order_release);
}

bool HeartbeatMonitor::beat() {
    v1::RecordActivityTaskHeartbeatRequest request;
    request.set_task_token(task_.token_string());
    attempted_.fetch_add(1, std::memory_order_acq_rel);

    try {
        auto response = client_.record_activity_task_heartbeat(request);
        consecutive_failures_ = 0;
        diagnostics_.emit(common::DiagnosticLevel::kDebug, kComponent, task_,
                          common::DiagnosticEventKind::kHeartbeatRecorded);
        if (response.cancel_requested()) {
            diagnostics_.emit(common::DiagnosticLevel::kInfo, kComponent,
                              task_,
                              common::DiagnosticEventKind::kCancelRequested);
            channel_.try_send(std::make_exception_ptr(
                exceptions::ActivityTaskCanceledException()));
            return false;
        }
        return true;
    } catch (const exceptions::ServiceException& e) {
        if (e.is_task_gone()) {
            diagnostics_.emit(common::DiagnosticLevel::kWarn, kComponent,
                              task_,
                              common::DiagnosticEventKind::kActivityGone);
            channel_.try_send(nullptr);
            return false;
        }
        return record_failure(std::current_exception(), e.what());
    } catch (const std::exception& e) {
        return record_failure(std::current_exception(), e.what());
    }
}

bool HeartbeatMonitor::record_failure(std::exception_ptr error,
                                      const std::string& message) {
    ++consecutive_failures_;
    diagnostics_.emit(common::DiagnosticLevel::kWarn, kComponent, task_,
                      common::DiagnosticEventKind::kHeartbeatError, message);

    if (!options_.max_consecutive_failures ||
        consecutive_failures_ < *options_.max_consecutive_failures) {
        return true;
    }
    diagnostics_.emit(common::DiagnosticLevel::kError, kComponent, task_,
                      common::DiagnosticEventKind::kHeartbeatLost, message);
    channel_.try_send(std::make_exception_ptr(
        exceptions::HeartbeatLostException(consecutive_failures_,
                                           std::move(error))));
    return false;
}

}  // namespace swfcoord::worker::internal
