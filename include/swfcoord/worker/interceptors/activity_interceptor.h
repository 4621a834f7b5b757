#pragma once

/// @file activity_interceptor.h
/// @brief Hooks invoked by the worker around each coordinated task.

#include <any>
#include <exception>
#include <functional>
#include <string>

#include <swfcoord/activities/activity_task.h>

namespace swfcoord::worker::interceptors {

/// Observes and annotates the lifecycle of activity tasks. All methods
/// default to no-ops; exactly one after_task_* call follows each
/// before_task call.
class IActivityInterceptor {
public:
    virtual ~IActivityInterceptor() = default;

    /// Called before the handler's start.
    virtual void before_task(const activities::ActivityTask& /*task*/) {}

    /// Called after the task was reported completed.
    virtual void after_task_complete(const activities::ActivityTask& /*task*/,
                                     const std::any& /*result*/) {}

    /// Called after the task was reported failed.
    virtual void after_task_failed(const activities::ActivityTask& /*task*/,
                                   std::exception_ptr /*error*/) {}

    /// Called after the task was reported canceled.
    virtual void after_task_canceled(const activities::ActivityTask& /*task*/,
                                     const std::string& /*details*/) {}
};

/// Interceptor whose hooks are set as callables. Unset hooks are no-ops.
class FuncInterceptor : public IActivityInterceptor {
public:
    std::function<void(const activities::ActivityTask&)> before_task_fn;
    std::function<void(const activities::ActivityTask&, const std::any&)>
        after_task_complete_fn;
    std::function<void(const activities::ActivityTask&, std::exception_ptr)>
        after_task_failed_fn;
    std::function<void(const activities::ActivityTask&, const std::string&)>
        after_task_canceled_fn;

    void before_task(const activities::ActivityTask& task) override;
    void after_task_complete(const activities::ActivityTask& task,
                             const std::any& result) override;
    void after_task_failed(const activities::ActivityTask& task,
                           std::exception_ptr error) override;
    void after_task_canceled(const activities::ActivityTask& task,
                             const std::string& details) override;
};

}  // namespace swfcoord::worker::interceptors
