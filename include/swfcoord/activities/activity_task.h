#pragma once

/// @file activity_task.h
/// @brief Activity task identity, token and input.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace swfcoord::v1 {
class ActivityTask;
}

namespace swfcoord::activities {

/// Workflow run an activity task belongs to.
struct WorkflowExecution {
    std::string workflow_id;
    std::string run_id;
};

/// Registered type of an activity.
struct ActivityType {
    std::string name;
    std::string version;
};

/// One claimed unit of activity work. Immutable once handed to a
/// coordinator; shared read-only with the heartbeat thread.
struct ActivityTask {
    /// Opaque credential used for every service call about this task.
    std::vector<uint8_t> task_token;
    /// ID for the activity.
    std::string activity_id;
    /// History event ID of the ActivityTaskStarted event.
    int64_t started_event_id = 0;
    /// Workflow run that scheduled this activity.
    WorkflowExecution workflow_execution;
    /// Type of the activity.
    ActivityType activity_type;
    /// Raw input as delivered by the service.
    std::string input;

    /// Task token as the string form used in service messages.
    std::string token_string() const {
        return std::string(task_token.begin(), task_token.end());
    }

    /// Convert from the wire message.
    static ActivityTask from_proto(const v1::ActivityTask& proto);

    /// Parse a serialized v1::ActivityTask.
    /// @throws std::runtime_error if the bytes are not a valid message.
    static ActivityTask from_bytes(std::string_view bytes);
    static ActivityTask from_bytes(const std::vector<uint8_t>& bytes);

    /// Convert to the wire message.
    void to_proto(v1::ActivityTask* proto) const;
};

}  // namespace swfcoord::activities
