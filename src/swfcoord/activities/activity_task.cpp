#include "swfcoord/activities/activity_task.h"

#include <swfcoord/v1/activity_service.pb.h>

#include "swfcoord/api/proto_util.h"

namespace swfcoord::activities {

ActivityTask ActivityTask::from_proto(const v1::ActivityTask& proto) {
    ActivityTask task;
    const auto& token = proto.task_token();
    task.task_token.assign(token.begin(), token.end());
    task.activity_id = proto.activity_id();
    task.started_event_id = proto.started_event_id();
    if (proto.has_workflow_execution()) {
        task.workflow_execution.workflow_id =
            proto.workflow_execution().workflow_id();
        task.workflow_execution.run_id = proto.workflow_execution().run_id();
    }
    if (proto.has_activity_type()) {
        task.activity_type.name = proto.activity_type().name();
        task.activity_type.version = proto.activity_type().version();
    }
    task.input = proto.input();
    return task;
}

ActivityTask ActivityTask::from_bytes(std::string_view bytes) {
    return from_proto(api::decode_message<v1::ActivityTask>(bytes));
}

ActivityTask ActivityTask::from_bytes(const std::vector<uint8_t>& bytes) {
    return from_proto(api::decode_message<v1::ActivityTask>(bytes));
}

void ActivityTask::to_proto(v1::ActivityTask* proto) const {
    proto->set_task_token(token_string());
    proto->set_activity_id(activity_id);
    proto->set_started_event_id(started_event_id);
    auto* execution = proto->mutable_workflow_execution();
    execution->set_workflow_id(workflow_execution.workflow_id);
    execution->set_run_id(workflow_execution.run_id);
    auto* type = proto->mutable_activity_type();
    type->set_name(activity_type.name);
    type->set_version(activity_type.version);
    proto->set_input(input);
}

}  // namespace swfcoord::activities
