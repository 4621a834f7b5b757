#include "swfcoord/worker/interceptors/activity_interceptor.h"

namespace swfcoord::worker::interceptors {

void FuncInterceptor::before_task(const activities::ActivityTask& task) {
    if (before_task_fn) {
        before_task_fn(task);
    }
}

void FuncInterceptor::after_task_complete(const activities::ActivityTask& task,
                                          const std::any& result) {
    if (after_task_complete_fn) {
        after_task_complete_fn(task, result);
    }
}

void FuncInterceptor::after_task_failed(const activities::ActivityTask& task,
                                        std::exception_ptr error) {
    if (after_task_failed_fn) {
        after_task_failed_fn(task, error);
    }
}

void FuncInterceptor::after_task_canceled(const activities::ActivityTask& task,
                                          const std::string& details) {
    if (after_task_canceled_fn) {
        after_task_canceled_fn(task, details);
    }
}

}  // namespace swfcoord::worker::interceptors
