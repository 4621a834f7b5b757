#pragma once

/// @file coordination_outcome.h
/// @brief Terminal outcome of one coordination session.

#include <any>
#include <exception>
#include <utility>

namespace swfcoord::worker {

/// Exactly one of these is produced per coordinated task.
class CoordinationOutcome {
public:
    enum class Kind : int {
        kCompleted = 0,
        kFailed = 1,
        kCanceled = 2,
    };

    /// The handler finished; result may be empty.
    static CoordinationOutcome completed(std::any result) {
        return CoordinationOutcome(Kind::kCompleted, std::move(result),
                                   nullptr);
    }

    /// Setup, tick or result handling failed with the given error.
    static CoordinationOutcome failed(std::exception_ptr error) {
        return CoordinationOutcome(Kind::kFailed, {}, std::move(error));
    }

    /// The activity was canceled. A null cause means the task disappeared
    /// on the service side.
    static CoordinationOutcome canceled(std::exception_ptr cause = nullptr) {
        return CoordinationOutcome(Kind::kCanceled, {}, std::move(cause));
    }

    Kind kind() const noexcept { return kind_; }
    bool is_completed() const noexcept { return kind_ == Kind::kCompleted; }
    bool is_failed() const noexcept { return kind_ == Kind::kFailed; }
    bool is_canceled() const noexcept { return kind_ == Kind::kCanceled; }

    /// Result of a completed session.
    const std::any& result() const noexcept { return result_; }

    /// Error of a failed session, or cause of a canceled one.
    std::exception_ptr error() const noexcept { return error_; }

private:
    CoordinationOutcome(Kind kind, std::any result, std::exception_ptr error)
        : kind_(kind), result_(std::move(result)), error_(std::move(error)) {}

    Kind kind_;
    std::any result_;
    std::exception_ptr error_;
};

}  // namespace swfcoord::worker
