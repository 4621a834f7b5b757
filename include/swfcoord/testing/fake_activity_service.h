#pragma once

/// @file fake_activity_service.h
/// @brief In-memory activity service for testing coordinated activities.

#include <swfcoord/activities/activity_task.h>
#include <swfcoord/client/activity_service_client.h>
#include <swfcoord/exceptions/swf_exception.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace swfcoord::testing {

/// Records every call and answers heartbeats from a scriptable responder.
///
/// By default heartbeats succeed without a cancel request and all other
/// calls succeed. Responders run on the calling thread (heartbeats on the
/// heartbeat thread) and may throw to simulate faults.
class FakeActivityService : public client::IActivityServiceClient {
public:
    using Clock = std::chrono::steady_clock;

    /// Receives the 1-based heartbeat call number.
    using HeartbeatResponder =
        std::function<v1::RecordActivityTaskHeartbeatResponse(std::size_t)>;

    /// Receives the 1-based signal call number and the request.
    using SignalResponder = std::function<void(
        std::size_t, const v1::SignalWorkflowExecutionRequest&)>;

    FakeActivityService();
    ~FakeActivityService() override;

    FakeActivityService(const FakeActivityService&) = delete;
    FakeActivityService& operator=(const FakeActivityService&) = delete;

    /// Replace the heartbeat responder.
    void set_heartbeat_responder(HeartbeatResponder fn);

    /// Replace the signal responder.
    void set_signal_responder(SignalResponder fn);

    /// Make every following heartbeat report a cancel request.
    void request_cancel();

    /// Make respond calls throw the given fault.
    void fail_responds_with(exceptions::ServiceException fault);

    // -- IActivityServiceClient --

    v1::RecordActivityTaskHeartbeatResponse record_activity_task_heartbeat(
        const v1::RecordActivityTaskHeartbeatRequest& request) override;
    void signal_workflow_execution(
        const v1::SignalWorkflowExecutionRequest& request) override;
    void respond_activity_task_completed(
        const v1::RespondActivityTaskCompletedRequest& request) override;
    void respond_activity_task_failed(
        const v1::RespondActivityTaskFailedRequest& request) override;
    void respond_activity_task_canceled(
        const v1::RespondActivityTaskCanceledRequest& request) override;

    // -- Recorded calls (copies, safe while coordination runs) --

    std::size_t heartbeat_count() const;
    std::vector<Clock::time_point> heartbeat_times() const;
    std::vector<v1::RecordActivityTaskHeartbeatRequest> heartbeats() const;
    std::vector<v1::SignalWorkflowExecutionRequest> signals() const;
    std::vector<v1::RespondActivityTaskCompletedRequest> completed() const;
    std::vector<v1::RespondActivityTaskFailedRequest> failed() const;
    std::vector<v1::RespondActivityTaskCanceledRequest> canceled() const;

private:
    mutable std::mutex mutex_;
    HeartbeatResponder heartbeat_responder_;
    SignalResponder signal_responder_;
    bool cancel_requested_{false};
    std::optional<exceptions::ServiceException> respond_fault_;

    std::vector<Clock::time_point> heartbeat_times_;
    std::vector<v1::RecordActivityTaskHeartbeatRequest> heartbeats_;
    std::vector<v1::SignalWorkflowExecutionRequest> signals_;
    std::vector<v1::RespondActivityTaskCompletedRequest> completed_;
    std::vector<v1::RespondActivityTaskFailedRequest> failed_;
    std::vector<v1::RespondActivityTaskCanceledRequest> canceled_;
};

/// The fault the service raises when heartbeating a task that is gone.
exceptions::ServiceException task_gone_fault(
    const activities::ActivityTask& task);

/// Default activity task for testing.
inline activities::ActivityTask default_activity_task() {
    activities::ActivityTask task;
    const std::string token = "test-task-token";
    task.task_token.assign(token.begin(), token.end());
    task.activity_id = "test-activity-id";
    task.started_event_id = 7;
    task.workflow_execution.workflow_id = "test-workflow-id";
    task.workflow_execution.run_id = "test-run-id";
    task.activity_type.name = "TestActivity";
    task.activity_type.version = "1";
    task.input = R"({"target":3})";
    return task;
}

} // namespace swfcoord::testing
