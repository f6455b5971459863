#include "errors.hpp"

namespace motus {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LaunchFailure:     return "LaunchFailure";
        case ErrorKind::InvalidOperation:  return "InvalidOperation";
        case ErrorKind::DuplicateJob:      return "DuplicateJob";
        case ErrorKind::ExternalToolError: return "ExternalToolError";
        case ErrorKind::Timeout:           return "Timeout";
        case ErrorKind::RecoveryConflict:  return "RecoveryConflict";
        case ErrorKind::JobNotFound:       return "JobNotFound";
        case ErrorKind::NotResumable:      return "NotResumable";
        case ErrorKind::StoreError:        return "StoreError";
    }
    return "Unknown";
}

} // namespace motus
