#pragma once

/// @file activity_service_client.h
/// @brief Calls the worker makes against the orchestration service.

#include <swfcoord/v1/activity_service.pb.h>

namespace swfcoord::client {

/// Transport-agnostic client for the activity-side service API.
///
/// Implementations report service faults by throwing
/// exceptions::ServiceException and must be safe to call concurrently from
/// the heartbeat thread and the coordinating thread.
class IActivityServiceClient {
public:
    virtual ~IActivityServiceClient() = default;

    /// Record a liveness heartbeat for a task.
    virtual v1::RecordActivityTaskHeartbeatResponse
    record_activity_task_heartbeat(
        const v1::RecordActivityTaskHeartbeatRequest& request) = 0;

    /// Deliver a signal to a workflow execution.
    virtual void signal_workflow_execution(
        const v1::SignalWorkflowExecutionRequest& request) = 0;

    /// Close a task as completed.
    virtual void respond_activity_task_completed(
        const v1::RespondActivityTaskCompletedRequest& request) = 0;

    /// Close a task as failed.
    virtual void respond_activity_task_failed(
        const v1::RespondActivityTaskFailedRequest& request) = 0;

    /// Close a task as canceled.
    virtual void respond_activity_task_canceled(
        const v1::RespondActivityTaskCanceledRequest& request) = 0;
};

}  // namespace swfcoord::client
