#pragma once
// Failure taxonomy for units of work
//
// Units of work throw; the scheduler catches at the task boundary and asks a
// RetryClassifier whether to try again. Everything else in hive reports
// through bool / optional returns.

#include <exception>
#include <stdexcept>
#include <string>

namespace hive {

// Network hiccup, upstream 5xx, rate limited by the remote side
class TransientFailure : public std::runtime_error {
public:
    explicit TransientFailure(const std::string& what) : std::runtime_error(what) {}
};

// An attempt outlived its time budget. Always retryable.
class TimeoutFailure : public TransientFailure {
public:
    explicit TimeoutFailure(const std::string& what) : TransientFailure(what) {}
};

// Invalid input or a programming error; retrying cannot help
class FatalFailure : public std::runtime_error {
public:
    explicit FatalFailure(const std::string& what) : std::runtime_error(what) {}
};

// Work was cancelled by its owner; never retried
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& what = "cancelled") : std::runtime_error(what) {}
};

// Human-readable message for a captured exception
inline std::string describe(const std::exception_ptr& error) {
    if (!error) return "unknown error";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace hive
