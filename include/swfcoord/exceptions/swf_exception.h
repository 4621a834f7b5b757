#pragma once

/// @file swf_exception.h
/// @brief Exception hierarchy for service faults and activity cancellation.

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace swfcoord::exceptions {

/// Fault code the service returns when a resource it was asked about does
/// not exist.
inline constexpr std::string_view kUnknownResourceFault =
    "UnknownResourceFault";

/// Message fragment identifying an unknown-resource fault raised for an
/// activity task that is closed, timed out or otherwise gone.
inline constexpr std::string_view kTaskGoneMessage = "Unknown activity";

/// Base exception for all custom exceptions thrown by the library.
class SwfException : public std::runtime_error {
public:
    /// Check whether the given exception is the cause of a cancellation the
    /// service requested. A task that is gone cancels with a null cause, so
    /// service faults never match.
    static bool is_canceled_exception(const std::exception_ptr& e);

    /// Returns the inner (cause) exception, if any.
    std::exception_ptr inner() const noexcept { return inner_; }

protected:
    explicit SwfException(const std::string& message);
    SwfException(const std::string& message, std::exception_ptr inner);
    ~SwfException() override = default;

private:
    std::exception_ptr inner_;
};

/// Fault returned by a call to the orchestration service.
class ServiceException : public SwfException {
public:
    ServiceException(std::string code, const std::string& message,
                     std::exception_ptr inner = nullptr);

    /// Service fault code, e.g. "UnknownResourceFault".
    const std::string& code() const noexcept { return code_; }

    /// Message reported by the service, without the code prefix.
    const std::string& fault_message() const noexcept {
        return fault_message_;
    }

    /// Whether this fault means the activity task no longer exists on the
    /// service side.
    bool is_task_gone() const noexcept;

private:
    std::string code_;
    std::string fault_message_;
};

/// Cause attached to a cancellation the service requested through a
/// heartbeat response.
class ActivityTaskCanceledException : public SwfException {
public:
    ActivityTaskCanceledException();
};

/// Raised when the configured bound on consecutive failed heartbeats is
/// reached. The inner exception is the last heartbeat failure.
class HeartbeatLostException : public SwfException {
public:
    HeartbeatLostException(std::uint32_t consecutive_failures,
                           std::exception_ptr inner);

    /// Number of consecutive heartbeat failures observed.
    std::uint32_t consecutive_failures() const noexcept {
        return consecutive_failures_;
    }

private:
    std::uint32_t consecutive_failures_;
};

/// Describe an exception pointer as "<message>", or an empty string when
/// the pointer is null.
std::string describe(const std::exception_ptr& e);

/// Describe an exception pointer followed by its inner exceptions, joined
/// with ": ".
std::string describe_chain(const std::exception_ptr& e);

}  // namespace swfcoord::exceptions
