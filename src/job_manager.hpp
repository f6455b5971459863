#pragma once

#include "job.hpp"
#include "process_supervisor.hpp"
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace motus {

class JobStore;
class RcloneClient;

/**
 * Caller-facing projection of a job: the stored record with live
 * supervisor data merged in while the process runs.
 */
struct JobView {
    Job job;
    bool live = false;       // tracked by the supervisor and not yet terminal
    bool finished = false;   // process observed terminal, or record terminal
};

/**
 * JobManager - bridges the supervisor and the job store
 *
 * Owns job id allocation (max persisted id + 1, under a mutex), startup
 * recovery, fast-finish reconciliation and the resume/stop/clear policy.
 * Records carry the pid of the process supervising them; recovery only
 * touches records whose process is gone.
 *
 * Usage:
 *   JobManager jobs(store, rclone, supervisor);
 *   jobs.initialize();
 *   int id = jobs.copy("/data/photos", "backup:photos");
 *   JobView view = jobs.status(id);
 */
class JobManager {
public:
    using Environment = ProcessSupervisor::Environment;

    JobManager(JobStore& store, RcloneClient& rclone, ProcessSupervisor& supervisor,
               int poll_interval_ms = 200);

    // Startup recovery, id counter, orphaned log sidecars
    void initialize();

    // Start a job and return its id. Timeout/InvalidOperation/DuplicateJob are
    // thrown; launch failures and non-zero exits show up in status().
    int start(Operation operation, const std::string& source, const std::string& destination,
              bool follow_symlinks = false, const Environment& env = {});
    int copy(const std::string& source, const std::string& destination,
             bool follow_symlinks = false, const Environment& env = {});
    // A directory rename waits for the process and removes the emptied source
    int move(const std::string& source, const std::string& destination,
             bool follow_symlinks = false, const Environment& env = {});
    int sync(const std::string& source, const std::string& destination,
             bool follow_symlinks = false, const Environment& env = {});
    int check(const std::string& source, const std::string& destination,
              const Environment& env = {});

    // Throws MotusError(JobNotFound)
    JobView status(int job_id);

    // filter: "" (all), a status name, "aborted" or "resumable"
    std::vector<JobView> list(const std::string& filter = "", int limit = 100, int offset = 0);

    // Returns false if the job was already terminal
    bool stop(int job_id);

    // New copy/sync job for an interrupted or failed job, linked from the
    // original. Throws MotusError(NotResumable) otherwise.
    int resume(int job_id);
    int resync(int job_id);

    std::string log_text(int job_id);

    bool remove(int job_id);
    // Returns the removed ids
    std::vector<int> clear_stopped();

    // Stop every supervised job and record it as interrupted
    int shutdown();

    int peek_next_job_id() const;

private:
    int next_job_id();
    void init_job_counter();
    void advance_job_counter();
    void finalize(Job& job);
    void persist_sidecar(int job_id, bool remove_file);
    void wait_for_exit(int job_id);
    void remove_empty_source(const std::string& path);
    int relaunch(int job_id, Operation operation);
    bool is_running(int job_id) const;

    JobStore& store_;
    RcloneClient& rclone_;
    ProcessSupervisor& supervisor_;
    int poll_interval_ms_;
    int owner_pid_;

    mutable std::mutex id_mutex_;
    int next_job_id_ = 1;

    // Ids being finalized right now
    std::mutex finalized_mutex_;
    std::set<int> finalized_;
};

} // namespace motus
