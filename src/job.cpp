#include "job.hpp"
#include "errors.hpp"

namespace motus {

const char* operation_name(Operation op) {
    switch (op) {
    case Operation::Copy: return "copy";
    case Operation::Move: return "move";
    case Operation::Sync: return "sync";
    case Operation::Check: return "check";
    case Operation::Zip: return "zip";
    }
    return "unknown";
}

Operation parse_operation(const std::string& name) {
    if (name == "copy") return Operation::Copy;
    if (name == "move") return Operation::Move;
    if (name == "sync") return Operation::Sync;
    if (name == "check") return Operation::Check;
    if (name == "zip") return Operation::Zip;
    throw MotusError(ErrorKind::InvalidOperation, "Unknown operation: " + name);
}

const char* status_name(JobStatus status) {
    switch (status) {
    case JobStatus::Pending: return "pending";
    case JobStatus::Running: return "running";
    case JobStatus::Completed: return "completed";
    case JobStatus::Failed: return "failed";
    case JobStatus::Cancelled: return "cancelled";
    case JobStatus::Interrupted: return "interrupted";
    case JobStatus::Resumed: return "resumed";
    }
    return "unknown";
}

JobStatus parse_status(const std::string& name) {
    if (name == "pending") return JobStatus::Pending;
    if (name == "running") return JobStatus::Running;
    if (name == "completed") return JobStatus::Completed;
    if (name == "failed") return JobStatus::Failed;
    if (name == "cancelled") return JobStatus::Cancelled;
    if (name == "interrupted") return JobStatus::Interrupted;
    if (name == "resumed") return JobStatus::Resumed;
    throw MotusError(ErrorKind::StoreError, "Unknown job status: " + name);
}

bool is_terminal(JobStatus status) {
    switch (status) {
    case JobStatus::Completed:
    case JobStatus::Failed:
    case JobStatus::Cancelled:
    case JobStatus::Interrupted:
    case JobStatus::Resumed:
        return true;
    case JobStatus::Pending:
    case JobStatus::Running:
        return false;
    }
    return false;
}

} // namespace motus
