#pragma once

/// @file task_update_signaler.h
/// @brief Notifies the owning workflow about activity start and progress.

#include <any>
#include <memory>
#include <string>
#include <string_view>

#include <swfcoord/activities/activity_task.h>

namespace swfcoord::client {
class IActivityServiceClient;
}

namespace swfcoord::converters {
class DataConverter;
}

namespace swfcoord::worker {

/// Signal name sent once the handler has started.
inline constexpr std::string_view kActivityStartedSignal =
    "ActivityStartedSignal";

/// Signal name sent for each progress update.
inline constexpr std::string_view kActivityUpdatedSignal =
    "ActivityUpdatedSignal";

/// Capability used by the coordinator to publish start and progress
/// updates. Implementations throw on failure.
class ITaskUpdateSignaler {
public:
    virtual ~ITaskUpdateSignaler() = default;

    /// Publish the value returned by the handler's start.
    virtual void signal_start(const activities::ActivityTask& task,
                              const std::any& payload) = 0;

    /// Publish a non-empty progress result returned by a tick.
    virtual void signal_update(const activities::ActivityTask& task,
                               const std::any& payload) = 0;
};

/// Configuration for WorkflowSignaler.
struct WorkflowSignalerOptions {
    /// Domain the workflow runs in.
    std::string domain;

    /// Converter for payloads. A default DataConverter is used if null.
    std::shared_ptr<converters::DataConverter> data_converter;
};

/// Signals the workflow execution that scheduled the task. The signal input
/// is a JSON object {"activity_id": ..., "input": <payload>}.
class WorkflowSignaler : public ITaskUpdateSignaler {
public:
    WorkflowSignaler(std::shared_ptr<client::IActivityServiceClient> client,
                     WorkflowSignalerOptions options);

    void signal_start(const activities::ActivityTask& task,
                      const std::any& payload) override;

    void signal_update(const activities::ActivityTask& task,
                       const std::any& payload) override;

private:
    void signal(const activities::ActivityTask& task,
                std::string_view signal_name, const std::any& payload);

    std::shared_ptr<client::IActivityServiceClient> client_;
    WorkflowSignalerOptions options_;
};

}  // namespace swfcoord::worker
