#pragma once

/// @file diagnostics.h
/// @brief Structured diagnostic events emitted by workers and coordinators.

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace swfcoord::activities {
struct ActivityTask;
}

namespace swfcoord::common {

/// Severity of a diagnostic event.
enum class DiagnosticLevel : int {
    kTrace = 0,
    kDebug = 1,
    kInfo = 2,
    kWarn = 3,
    kError = 4,
};

/// What happened.
enum class DiagnosticEventKind : int {
    kHeartbeatRecorded,
    kHeartbeatError,
    kActivityGone,
    kCancelRequested,
    kHeartbeatLost,
    kCancelError,
    kSignalUpdate,
    kSignalUpdateError,
    kTaskCompleted,
    kTaskFailed,
    kTaskCanceled,
    kRespondError,
};

/// One diagnostic event, correlated to the activity task it concerns.
struct DiagnosticEvent {
    DiagnosticLevel level{DiagnosticLevel::kInfo};
    /// Emitting component, e.g. "heartbeat" or "coordinator".
    std::string component;
    std::string workflow_id;
    std::string activity_type;
    std::string activity_id;
    DiagnosticEventKind kind{DiagnosticEventKind::kHeartbeatRecorded};
    /// Error text, set for failure events.
    std::optional<std::string> error;
};

/// Callback receiving diagnostic events. May be invoked concurrently from
/// the heartbeat thread and the coordinating thread.
using DiagnosticCallback = std::function<void(const DiagnosticEvent&)>;

std::string_view to_string(DiagnosticLevel level) noexcept;
std::string_view to_string(DiagnosticEventKind kind) noexcept;

/// Emission point for diagnostic events. Events below the minimum level are
/// dropped; the rest go to the callback, or to stderr if none is set.
class DiagnosticSink {
public:
    DiagnosticSink() = default;
    explicit DiagnosticSink(DiagnosticCallback callback,
                            DiagnosticLevel min_level = DiagnosticLevel::kInfo);

    /// Emit an event.
    void emit(const DiagnosticEvent& event) const;

    /// Build and emit an event for the given task.
    void emit(DiagnosticLevel level, std::string_view component,
              const activities::ActivityTask& task, DiagnosticEventKind kind,
              std::optional<std::string> error = std::nullopt) const;

    DiagnosticLevel min_level() const noexcept { return min_level_; }

private:
    DiagnosticCallback callback_;
    DiagnosticLevel min_level_{DiagnosticLevel::kInfo};
};

/// Default formatter: writes one key=value line per event to stderr.
void write_to_stderr(const DiagnosticEvent& event);

}  // namespace swfcoord::common
