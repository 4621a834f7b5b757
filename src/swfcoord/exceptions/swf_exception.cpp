#include "swfcoord/exceptions/swf_exception.h"

#include <utility>

namespace swfcoord::exceptions {

// SwfException

SwfException::SwfException(const std::string& message)
    : std::runtime_error(message) {}

SwfException::SwfException(const std::string& message,
                           std::exception_ptr inner)
    : std::runtime_error(message), inner_(inner) {}

bool SwfException::is_canceled_exception(const std::exception_ptr& e) {
    if (!e) return false;
    try {
        std::rethrow_exception(e);
    } catch (const ActivityTaskCanceledException&) {
        return true;
    } catch (...) {
        return false;
    }
}

// ServiceException

ServiceException::ServiceException(std::string code,
                                   const std::string& message,
                                   std::exception_ptr inner)
    : SwfException(code + ": " + message, inner),
      code_(std::move(code)),
      fault_message_(message) {}

bool ServiceException::is_task_gone() const noexcept {
    return code_ == kUnknownResourceFault &&
           fault_message_.find(kTaskGoneMessage) != std::string::npos;
}

// ActivityTaskCanceledException

ActivityTaskCanceledException::ActivityTaskCanceledException()
    : SwfException("Activity task cancellation requested") {}

// HeartbeatLostException

HeartbeatLostException::HeartbeatLostException(
    std::uint32_t consecutive_failures, std::exception_ptr inner)
    : SwfException("Heartbeat lost after " +
                       std::to_string(consecutive_failures) +
                       " consecutive failures",
                   inner),
      consecutive_failures_(consecutive_failures) {}

std::string describe(const std::exception_ptr& e) {
    if (!e) return {};
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        return ex.what();
    } catch (...) {
        return "unknown exception";
    }
}

std::string describe_chain(const std::exception_ptr& e) {
    if (!e) return {};
    try {
        std::rethrow_exception(e);
    } catch (const SwfException& ex) {
        if (ex.inner()) {
            return std::string(ex.what()) + ": " + describe_chain(ex.inner());
        }
        return ex.what();
    } catch (...) {
        return describe(e);
    }
}

}  // namespace swfcoord::exceptions
