#include "swfcoord/common/diagnostics.h"

#include <cstdio>
#include <utility>

#include "swfcoord/activities/activity_task.h"

namespace swfcoord::common {

std::string_view to_string(DiagnosticLevel level) noexcept {
    switch (level) {
        case DiagnosticLevel::kTrace: return "TRACE";
        case DiagnosticLevel::kDebug: return "DEBUG";
        case DiagnosticLevel::kInfo:  return "INFO";
        case DiagnosticLevel::kWarn:  return "WARN";
        case DiagnosticLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

std::string_view to_string(DiagnosticEventKind kind) noexcept {
    switch (kind) {
        case DiagnosticEventKind::kHeartbeatRecorded:
            return "heartbeat-recorded";
        case DiagnosticEventKind::kHeartbeatError: return "heartbeat-error";
        case DiagnosticEventKind::kActivityGone: return "activity-gone";
        case DiagnosticEventKind::kCancelRequested:
            return "activity-cancel-requested";
        case DiagnosticEventKind::kHeartbeatLost: return "heartbeat-lost";
        case DiagnosticEventKind::kCancelError: return "activity-cancel-err";
        case DiagnosticEventKind::kSignalUpdate: return "signal-update";
        case DiagnosticEventKind::kSignalUpdateError:
            return "signal-update-error";
        case DiagnosticEventKind::kTaskCompleted: return "task-completed";
        case DiagnosticEventKind::kTaskFailed: return "task-failed";
        case DiagnosticEventKind::kTaskCanceled: return "task-canceled";
        case DiagnosticEventKind::kRespondError: return "respond-error";
    }
    return "unknown";
}

void write_to_stderr(const DiagnosticEvent& event) {
    auto level = to_string(event.level);
    auto kind = to_string(event.kind);
    std::fprintf(stderr,
                 "[%.*s] component=%s workflow-id=%s activity-type=%s "
                 "activity-id=%s at=%.*s",
                 static_cast<int>(level.size()), level.data(),
                 event.component.c_str(), event.workflow_id.c_str(),
                 event.activity_type.c_str(), event.activity_id.c_str(),
                 static_cast<int>(kind.size()), kind.data());
    if (event.error) {
        std::fprintf(stderr, " error=\"%s\"", event.error->c_str());
    }
    std::fprintf(stderr, "\n");
}

DiagnosticSink::DiagnosticSink(DiagnosticCallback callback,
                               DiagnosticLevel min_level)
    : callback_(std::move(callback)), min_level_(min_level) {}

void DiagnosticSink::emit(const DiagnosticEvent& event) const {
    if (static_cast<int>(event.level) < static_cast<int>(min_level_)) {
        return;
    }
    if (callback_) {
        callback_(event);
    } else {
        write_to_stderr(event);
    }
}

void DiagnosticSink::emit(DiagnosticLevel level, std::string_view component,
                          const activities::ActivityTask& task,
                          DiagnosticEventKind kind,
                          std::optional<std::string> error) const {
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }
    DiagnosticEvent event;
    event.level = level;
    event.component = std::string(component);
    event.workflow_id = task.workflow_execution.workflow_id;
    event.activity_type = task.activity_type.name;
    event.activity_id = task.activity_id;
    event.kind = kind;
    event.error = std::move(error);
    emit(event);
}

}  // namespace swfcoord::common
