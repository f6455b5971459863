#pragma once

#include <stdexcept>
#include <string>

namespace motus {

/**
 * Failure categories raised by the job engine.
 *
 * LaunchFailure and ExternalToolError of a transfer are recorded in the job
 * record rather than thrown, because transfers start asynchronously. The
 * remaining kinds are thrown to the synchronous caller. RecoveryConflict is
 * only ever logged.
 */
enum class ErrorKind {
    LaunchFailure,
    InvalidOperation,
    DuplicateJob,
    ExternalToolError,
    Timeout,
    RecoveryConflict,
    JobNotFound,
    NotResumable,
    StoreError
};

const char* error_kind_name(ErrorKind kind);

class MotusError : public std::runtime_error {
public:
    MotusError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace motus
