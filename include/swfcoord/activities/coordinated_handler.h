#pragma once

/// @file coordinated_handler.h
/// @brief Handler contract for coordinated long-running activities.

#include <any>
#include <functional>
#include <memory>
#include <string>

#include <swfcoord/activities/activity_task.h>

namespace swfcoord::activities {

/// Result of one tick.
struct TickResult {
    /// False ends coordination with `result` as the activity result.
    bool keep_going{true};
    /// Progress update (when keep_going) or final result. Empty means none.
    std::any result;
};

/// Business logic driven by a CoordinatedActivityAdapter.
///
/// All three methods run on the coordinating thread and report errors by
/// throwing. Progress state belongs to the implementation.
class ICoordinatedActivityHandler {
public:
    virtual ~ICoordinatedActivityHandler() = default;

    /// Activity type name this handler serves.
    virtual const std::string& activity_name() const = 0;

    /// One-time setup. The returned value is sent as the "activity started"
    /// signal payload.
    virtual std::any start(const ActivityTask& task,
                           const std::any& input) = 0;

    /// Called at most once per tick interval until it returns
    /// keep_going == false or throws.
    virtual TickResult tick(const ActivityTask& task,
                            const std::any& input) = 0;

    /// Called exactly once when the activity is canceled, to release
    /// resources.
    virtual void cancel(const ActivityTask& task, const std::any& input) = 0;
};

/// Handler built from callables.
///
///   auto handler = std::make_shared<FuncCoordinatedActivityHandler>(
///       "resize-cluster",
///       [](const ActivityTask&, const std::any&) -> TickResult {
///           return {false, std::string("done")};
///       });
///
/// Unset start and cancel functions are no-ops; start then reports an empty
/// update.
class FuncCoordinatedActivityHandler : public ICoordinatedActivityHandler {
public:
    using StartFn =
        std::function<std::any(const ActivityTask&, const std::any&)>;
    using TickFn =
        std::function<TickResult(const ActivityTask&, const std::any&)>;
    using CancelFn =
        std::function<void(const ActivityTask&, const std::any&)>;

    /// @throws std::invalid_argument if tick is empty.
    FuncCoordinatedActivityHandler(std::string activity_name, TickFn tick,
                                   StartFn start = {}, CancelFn cancel = {});

    const std::string& activity_name() const override {
        return activity_name_;
    }

    std::any start(const ActivityTask& task, const std::any& input) override;
    TickResult tick(const ActivityTask& task, const std::any& input) override;
    void cancel(const ActivityTask& task, const std::any& input) override;

private:
    std::string activity_name_;
    TickFn tick_;
    StartFn start_;
    CancelFn cancel_;
};

}  // namespace swfcoord::activities
