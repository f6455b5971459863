#pragma once

#include "job.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace motus {

/**
 * Partial update of a job record; unset fields are left alone.
 * Setting a terminal status also stamps finished_at unless it is already set.
 */
struct JobUpdate {
    std::optional<JobStatus> status;
    std::optional<int> progress;
    std::optional<std::string> status_text;
    std::optional<std::string> error_text;
    std::optional<std::string> log_text;
    std::optional<int> exit_status;

    bool empty() const {
        return !status && !progress && !status_text && !error_text && !log_text && !exit_status;
    }
};

/**
 * Durable job table used by the coordinator. Implementations throw
 * MotusError(StoreError) when the backing storage fails.
 */
class JobStore {
public:
    virtual ~JobStore() = default;

    // Throws MotusError(DuplicateJob) if job_id exists
    virtual void create(int job_id, Operation operation, const std::string& source,
                        const std::string& destination, JobStatus status = JobStatus::Pending,
                        int owner_pid = 0) = 0;
    // Returns false for an unknown job
    virtual bool update(int job_id, const JobUpdate& update) = 0;
    virtual std::optional<Job> get(int job_id) = 0;

    // Newest first
    virtual std::vector<Job> list(const std::optional<JobStatus>& status_filter,
                                  int limit = 100, int offset = 0) = 0;
    // failed + interrupted, not yet resumed
    virtual std::vector<Job> list_aborted(int limit = 100, int offset = 0) = 0;
    // interrupted, not yet resumed
    virtual std::vector<Job> list_resumable(int limit = 100, int offset = 0) = 0;

    virtual bool remove(int job_id) = 0;
    // Deletes every job that is neither running nor pending, returns their ids
    virtual std::vector<int> remove_stopped() = 0;
    // 0 for an empty store
    virtual int max_job_id() = 0;
    // Distinct owners of running and pending jobs
    virtual std::vector<int> active_owners() = 0;
    // Running and pending jobs of the given owners become interrupted
    virtual int mark_running_as_interrupted(const std::vector<int>& owner_pids) = 0;
    // Only for interrupted/failed jobs without a link; false otherwise
    virtual bool set_resumed_by(int job_id, int new_job_id) = 0;
    virtual int cleanup_old_jobs(int days) = 0;
};

/**
 * SqliteJobStore - JobStore on a SQLite database (WAL journal).
 * ":memory:" gives a private in-memory database.
 */
class SqliteJobStore : public JobStore {
public:
    // Opens (creating if needed) the database, throws MotusError(StoreError)
    explicit SqliteJobStore(const std::string& db_path);
    ~SqliteJobStore() override;

    SqliteJobStore(const SqliteJobStore&) = delete;
    SqliteJobStore& operator=(const SqliteJobStore&) = delete;

    void create(int job_id, Operation operation, const std::string& source,
                const std::string& destination, JobStatus status = JobStatus::Pending,
                int owner_pid = 0) override;
    bool update(int job_id, const JobUpdate& update) override;
    std::optional<Job> get(int job_id) override;
    std::vector<Job> list(const std::optional<JobStatus>& status_filter,
                          int limit = 100, int offset = 0) override;
    std::vector<Job> list_aborted(int limit = 100, int offset = 0) override;
    std::vector<Job> list_resumable(int limit = 100, int offset = 0) override;
    bool remove(int job_id) override;
    std::vector<int> remove_stopped() override;
    int max_job_id() override;
    std::vector<int> active_owners() override;
    int mark_running_as_interrupted(const std::vector<int>& owner_pids) override;
    bool set_resumed_by(int job_id, int new_job_id) override;
    int cleanup_old_jobs(int days) override;

    const std::string& path() const { return db_path_; }

private:
    void create_tables();
    bool has_column(const char* table, const char* column);
    void exec(const char* sql);
    std::vector<Job> query_jobs(const std::string& where, const std::vector<std::string>& params,
                                int limit, int offset);

    std::string db_path_;
    void* db_ = nullptr;  // sqlite3*
    std::mutex db_mutex_;
};

} // namespace motus
