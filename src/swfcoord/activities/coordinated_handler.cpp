#include "swfcoord/activities/coordinated_handler.h"

#include <stdexcept>
#include <utility>

namespace swfcoord::activities {

FuncCoordinatedActivityHandler::FuncCoordinatedActivityHandler(
    std::string activity_name, TickFn tick, StartFn start, CancelFn cancel)
    : activity_name_(std::move(activity_name)),
      tick_(std::move(tick)),
      start_(std::move(start)),
      cancel_(std::move(cancel)) {
    if (!tick_) {
        throw std::invalid_argument(
            "Coordinated activity handler requires a tick function");
    }
}

std::any FuncCoordinatedActivityHandler::start(const ActivityTask& task,
                                               const std::any& input) {
    if (!start_) {
        return {};
    }
    return start_(task, input);
}

TickResult FuncCoordinatedActivityHandler::tick(const ActivityTask& task,
                                                const std::any& input) {
    return tick_(task, input);
}

void FuncCoordinatedActivityHandler::cancel(const ActivityTask& task,
                                            const std::any& input) {
    if (cancel_) {
        cancel_(task, input);
    }
}

}  // namespace swfcoord::activities
