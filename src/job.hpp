#pragma once

#include <string>
#include <cstdint>

namespace motus {

enum class Operation {
    Copy,
    Move,
    Sync,
    Check,
    Zip
};

enum class JobStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
    Interrupted,
    Resumed
};

const char* operation_name(Operation op);
// Throws MotusError(InvalidOperation) for unknown names
Operation parse_operation(const std::string& name);

const char* status_name(JobStatus status);
// Throws MotusError(StoreError) for unknown names
JobStatus parse_status(const std::string& name);

// completed, failed, cancelled, interrupted, resumed
bool is_terminal(JobStatus status);

/**
 * Persisted job record
 */
struct Job {
    int job_id = 0;
    Operation operation = Operation::Copy;
    std::string source;
    std::string destination;
    JobStatus status = JobStatus::Pending;
    int progress = 0;
    std::string status_text;
    std::string error_text;
    std::string log_text;
    int exit_status = -1;
    int resumed_by_job_id = 0;     // 0 = not resumed
    int owner_pid = 0;             // motus process supervising it, 0 = none
    int64_t created_at = 0;        // unix seconds
    int64_t updated_at = 0;
    int64_t finished_at = 0;       // 0 = not finished
};

} // namespace motus
