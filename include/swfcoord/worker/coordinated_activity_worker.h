#pragma once

/// @file coordinated_activity_worker.h
/// @brief Runs claimed activity tasks through a coordinated handler and
/// reports the outcome to the service.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <swfcoord/activities/activity_task.h>
#include <swfcoord/activities/coordinated_handler.h>
#include <swfcoord/common/diagnostics.h>
#include <swfcoord/worker/coordinated_activity_adapter.h>
#include <swfcoord/worker/coordination_outcome.h>

namespace swfcoord::v1 {
class ActivityTask;
}

namespace swfcoord::converters {
class DataConverter;
}

namespace swfcoord::worker {

class ITaskUpdateSignaler;

namespace interceptors {
class IActivityInterceptor;
}

/// Service limit on the failure reason field.
inline constexpr std::size_t kMaxReasonLength = 256;

/// Service limit on details and result fields.
inline constexpr std::size_t kMaxDetailsLength = 32768;

/// Configuration for CoordinatedActivityWorker.
struct CoordinatedActivityWorkerOptions {
    /// Domain the worker serves.
    std::string domain;

    /// Heartbeat and tick timing.
    CoordinatedActivityOptions coordination{};

    /// Converter for task input and results. A default DataConverter is
    /// used if null.
    std::shared_ptr<converters::DataConverter> data_converter;

    /// Signaler for start and progress updates. A WorkflowSignaler on the
    /// worker's client is used if null.
    std::shared_ptr<ITaskUpdateSignaler> signaler;

    /// Interceptors, invoked in order.
    std::vector<std::shared_ptr<interceptors::IActivityInterceptor>>
        interceptors;

    /// Diagnostic event sink.
    common::DiagnosticSink diagnostics{};
};

/// Handles claimed tasks for one coordinated handler: decodes the input,
/// runs interceptors, coordinates the task and reports its outcome with the
/// matching RespondActivityTask* call. Polling and retrying failed respond
/// calls are left to the caller.
class CoordinatedActivityWorker {
public:
    /// @throws std::invalid_argument on invalid options or null arguments.
    CoordinatedActivityWorker(
        std::shared_ptr<client::IActivityServiceClient> client,
        std::shared_ptr<activities::ICoordinatedActivityHandler> handler,
        CoordinatedActivityWorkerOptions options = {});

    ~CoordinatedActivityWorker();

    CoordinatedActivityWorker(const CoordinatedActivityWorker&) = delete;
    CoordinatedActivityWorker& operator=(const CoordinatedActivityWorker&) =
        delete;

    /// Handle a task; blocks until the outcome has been reported.
    CoordinationOutcome handle_activity_task(
        const activities::ActivityTask& task);

    /// Handle a task in wire form.
    CoordinationOutcome handle_activity_task(const v1::ActivityTask& task);

    /// Handle a serialized v1::ActivityTask.
    /// @throws std::runtime_error if the bytes cannot be parsed.
    CoordinationOutcome handle_activity_task(
        const std::vector<uint8_t>& task_bytes);

    const CoordinatedActivityWorkerOptions& options() const noexcept {
        return options_;
    }

private:
    /// Decode input, check the activity type and coordinate.
    CoordinationOutcome run(const activities::ActivityTask& task);

    /// Send the respond call and notify interceptors. Returns the reported
    /// outcome, which is Failed if a completed result cannot be encoded.
    CoordinationOutcome report(const activities::ActivityTask& task,
                               CoordinationOutcome outcome);

    std::shared_ptr<client::IActivityServiceClient> client_;
    std::shared_ptr<activities::ICoordinatedActivityHandler> handler_;
    CoordinatedActivityWorkerOptions options_;
    std::unique_ptr<CoordinatedActivityAdapter> adapter_;
};

}  // namespace swfcoord::worker
