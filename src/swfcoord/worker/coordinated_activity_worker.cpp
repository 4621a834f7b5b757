#include "swfcoord/worker/coordinated_activity_worker.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <swfcoord/v1/activity_service.pb.h>

#include "swfcoord/client/activity_service_client.h"
#include "swfcoord/converters/data_converter.h"
#include "swfcoord/exceptions/swf_exception.h"
#include "swfcoord/worker/interceptors/activity_interceptor.h"
#include "swfcoord/worker/task_update_signaler.h"

namespace swfcoord::worker {

namespace {

constexpr const char* kComponent = "worker";

/// Cut to at most max_length bytes without splitting a UTF-8 sequence.
std::string truncate(std::string value, std::size_t max_length) {
    if (value.size() <= max_length) {
        return value;
    }
    auto cut = max_length;
    // A continuation byte at the cut means its lead byte is kept; drop both.
    while (cut > 0 &&
           (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    value.resize(cut);
    return value;
}

}  // namespace

CoordinatedActivityWorker::CoordinatedActivityWorker(
    std::shared_ptr<client::IActivityServiceClient> client,
    std::shared_ptr<activities::ICoordinatedActivityHandler> handler,
    CoordinatedActivityWorkerOptions options)
    : client_(std::move(client)),
      handler_(std::move(handler)),
      options_(std::move(options)) {
    if (!client_) {
        throw std::invalid_argument("Activity worker requires a client");
    }
    if (!options_.data_converter) {
        options_.data_converter =
            std::make_shared<converters::DataConverter>();
    }
    if (!options_.signaler) {
        options_.signaler = std::make_shared<WorkflowSignaler>(
            client_, WorkflowSignalerOptions{options_.domain,
                                             options_.data_converter});
    }
    adapter_ = std::make_unique<CoordinatedActivityAdapter>(
        options_.coordination, handler_, client_, options_.signaler,
        options_.diagnostics);
}

CoordinatedActivityWorker::~CoordinatedActivityWorker() = default;

CoordinationOutcome CoordinatedActivityWorker::handle_activity_task(
    const activities::ActivityTask& task) {
    for (const auto& interceptor : options_.interceptors) {
        interceptor->before_task(task);
    }
    return report(task, run(task));
}

CoordinationOutcome CoordinatedActivityWorker::handle_activity_task(
    const v1::ActivityTask& task) {
    return handle_activity_task(activities::ActivityTask::from_proto(task));
}

CoordinationOutcome CoordinatedActivityWorker::handle_activity_task(
    const std::vector<uint8_t>& task_bytes) {
    return handle_activity_task(activities::ActivityTask::from_bytes(task_bytes));
}

CoordinationOutcome CoordinatedActivityWorker::run(
    const activities::ActivityTask& task) {
    const auto& name = handler_->activity_name();
    if (!name.empty() && name != task.activity_type.name) {
        return CoordinationOutcome::failed(
            std::make_exception_ptr(std::invalid_argument(
                "Activity " + task.activity_type.name +
                " is not handled by this worker")));
    }

    std::any input;
    try {
        input = options_.data_converter->from_json(task.input);
    } catch (const std::exception&) {
        return CoordinationOutcome::failed(std::current_exception());
    }
    return adapter_->coordinate(task, input);
}

CoordinationOutcome CoordinatedActivityWorker::report(
    const activities::ActivityTask& task, CoordinationOutcome outcome) {
    std::optional<std::string> result;
    if (outcome.is_completed()) {
        try {
            result = options_.data_converter->to_json(outcome.result());
            if (result->size() > kMaxDetailsLength) {
                throw std::invalid_argument(
                    "Activity result exceeds " +
                    std::to_string(kMaxDetailsLength) + " bytes");
            }
        } catch (const std::exception&) {
            outcome = CoordinationOutcome::failed(std::current_exception());
        }
    }

    try {
        if (outcome.is_completed()) {
            v1::RespondActivityTaskCompletedRequest request;
            request.set_task_token(task.token_string());
            request.set_result(*result);
            client_->respond_activity_task_completed(request);
        } else if (outcome.is_failed()) {
            auto message = exceptions::describe(outcome.error());
            v1::RespondActivityTaskFailedRequest request;
            request.set_task_token(task.token_string());
            request.set_reason(truncate(message, kMaxReasonLength));
            request.set_details(truncate(
                exceptions::describe_chain(outcome.error()), kMaxDetailsLength));
            client_->respond_activity_task_failed(request);
        } else {
            v1::RespondActivityTaskCanceledRequest request;
            request.set_task_token(task.token_string());
            request.set_details(truncate(exceptions::describe(outcome.error()),
                                         kMaxDetailsLength));
            client_->respond_activity_task_canceled(request);
        }
    } catch (const std::exception& e) {
        // Retrying the respond call is up to the caller's dispatch loop.
        options_.diagnostics.emit(common::DiagnosticLevel::kError, kComponent,
                                  task,
                                  common::DiagnosticEventKind::kRespondError,
                                  e.what());
    }

    for (const auto& interceptor : options_.interceptors) {
        switch (outcome.kind()) {
            case CoordinationOutcome::Kind::kCompleted:
                interceptor->after_task_complete(task, outcome.result());
                break;
            case CoordinationOutcome::Kind::kFailed:
                interceptor->after_task_failed(task, outcome.error());
                break;
            case CoordinationOutcome::Kind::kCanceled:
                interceptor->after_task_canceled(
                    task, exceptions::describe(outcome.error()));
                break;
        }
    }
    return outcome;
}

}  // namespace swfcoord::worker
