#include "swfcoord/worker/task_update_signaler.h"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "swfcoord/client/activity_service_client.h"
#include "swfcoord/converters/data_converter.h"

namespace swfcoord::worker {

WorkflowSignaler::WorkflowSignaler(
    std::shared_ptr<client::IActivityServiceClient> client,
    WorkflowSignalerOptions options)
    : client_(std::move(client)), options_(std::move(options)) {
    if (!client_) {
        throw std::invalid_argument("WorkflowSignaler requires a client");
    }
    if (!options_.data_converter) {
        options_.data_converter =
            std::make_shared<converters::DataConverter>();
    }
}

void WorkflowSignaler::signal_start(const activities::ActivityTask& task,
                                    const std::any& payload) {
    signal(task, kActivityStartedSignal, payload);
}

void WorkflowSignaler::signal_update(const activities::ActivityTask& task,
                                     const std::any& payload) {
    signal(task, kActivityUpdatedSignal, payload);
}

void WorkflowSignaler::signal(const activities::ActivityTask& task,
                              std::string_view signal_name,
                              const std::any& payload) {
    nlohmann::json envelope;
    envelope["activity_id"] = task.activity_id;
    envelope["input"] = options_.data_converter->to_json_value(payload);

    v1::SignalWorkflowExecutionRequest request;
    request.set_domain(options_.domain);
    request.set_workflow_id(task.workflow_execution.workflow_id);
    request.set_run_id(task.workflow_execution.run_id);
    request.set_signal_name(std::string(signal_name));
    request.set_input(envelope.dump());
    client_->signal_workflow_execution(request);
}

}  // namespace swfcoord::worker
