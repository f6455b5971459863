#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace motus {

/**
 * Runs one external process per job and keeps a live snapshot of its
 * parsed progress.
 *
 * Each job gets two reader threads (stdout, stderr) and an independent
 * liveness thread that polls the child every poll interval, so a silent
 * child is still detected as finished and a chatty one never blocks on a
 * full pipe. All threads are detached and hold only the job entry, never
 * the supervisor.
 *
 * Reads never block and return 0 / "" / "" / -1 / false for unknown jobs.
 */
class ProcessSupervisor {
public:
    using Environment = std::map<std::string, std::string>;

    explicit ProcessSupervisor(int poll_interval_ms = 200, size_t error_text_limit = 10000);

    // Throws MotusError(DuplicateJob) if the id is already tracked.
    // A launch failure is recorded as a finished entry (exit -1, error text).
    void start(const std::vector<std::string>& command, const Environment& env, int job_id);

    int get_percent(int job_id) const;
    std::string get_text(int job_id) const;
    std::string get_error_text(int job_id) const;
    int get_exit_status(int job_id) const;
    bool is_finished(int job_id) const;
    bool is_tracked(int job_id) const;

    // SIGTERM once, if the child is still alive. Idempotent, non-blocking.
    void stop(int job_id);

    // Forget a job. No-op for unknown ids.
    void remove(int job_id);

    // Tracked jobs not yet observed terminal
    std::vector<int> get_running_jobs() const;

    // Stop every running job, returns how many were signalled
    int shutdown_all();

private:
    struct TrackedJob;

    std::shared_ptr<TrackedJob> find(int job_id) const;
    static void read_stream(std::shared_ptr<TrackedJob> job, int fd, bool is_stderr);
    static void watch_process(std::shared_ptr<TrackedJob> job, int poll_interval_ms);

    int poll_interval_ms_;
    size_t error_text_limit_;

    mutable std::mutex mutex_;
    std::map<int, std::shared_ptr<TrackedJob>> jobs_;
};

} // namespace motus
