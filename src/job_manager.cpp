#include "job_manager.hpp"
#include "job_store.hpp"
#include "rclone_client.hpp"
#include "transfer_plan.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <unistd.h>

namespace motus {

static const char* const kShutdownMessage = "Job interrupted by server shutdown";
static const int kIdAttempts = 5;

static std::string tag(int job_id) {
    return "[JobManager] Job " + std::to_string(job_id) + ": ";
}

JobManager::JobManager(JobStore& store, RcloneClient& rclone, ProcessSupervisor& supervisor,
                       int poll_interval_ms)
    : store_(store),
      rclone_(rclone),
      supervisor_(supervisor),
      poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : 200),
      owner_pid_(static_cast<int>(getpid())) {}

void JobManager::initialize() {
    // Jobs of other motus processes are left alone while those processes live
    std::vector<int> dead_owners;
    for (int owner : store_.active_owners()) {
        if (owner != owner_pid_ && !Helpers::process_alive(owner)) {
            dead_owners.push_back(owner);
        }
    }

    for (JobStatus status : {JobStatus::Running, JobStatus::Pending}) {
        for (const auto& job : store_.list(status, -1, 0)) {
            if (job.owner_pid == owner_pid_) {
                // A previous process with our pid, or a job of ours that is gone
                if (supervisor_.is_tracked(job.job_id)) continue;
                JobUpdate update;
                update.status = JobStatus::Interrupted;
                store_.update(job.job_id, update);
            } else if (std::find(dead_owners.begin(), dead_owners.end(), job.owner_pid) == dead_owners.end()) {
                continue;
            }
            Logger::warn(tag(job.job_id) + error_kind_name(ErrorKind::RecoveryConflict) + ": " +
                         status_name(status) + " with no live process (owner " +
                         std::to_string(job.owner_pid) + "), marked interrupted");
        }
    }
    store_.mark_running_as_interrupted(dead_owners);

    init_job_counter();

    for (int job_id : rclone_.list_job_logs()) {
        auto job = store_.get(job_id);
        if (job && !is_terminal(job->status)) {
            // Still being written by its owner
            continue;
        }
        if (job && job->status == JobStatus::Interrupted && job->log_text.empty()) {
            std::string text = rclone_.job_log_text(job_id);
            if (!text.empty()) {
                JobUpdate update;
                update.log_text = text;
                store_.update(job_id, update);
                Logger::info(tag(job_id) + "recovered log from sidecar");
            }
        }
        rclone_.cleanup_job_log(job_id);
    }

    Logger::info("[JobManager] Initialized, next job id " + std::to_string(peek_next_job_id()));
}

void JobManager::init_job_counter() {
    int max_id = store_.max_job_id();
    std::lock_guard<std::mutex> lock(id_mutex_);
    next_job_id_ = max_id + 1;
}

void JobManager::advance_job_counter() {
    int max_id = store_.max_job_id();
    std::lock_guard<std::mutex> lock(id_mutex_);
    next_job_id_ = std::max(next_job_id_, max_id + 1);
}

int JobManager::next_job_id() {
    std::lock_guard<std::mutex> lock(id_mutex_);
    return next_job_id_++;
}

int JobManager::peek_next_job_id() const {
    std::lock_guard<std::mutex> lock(id_mutex_);
    return next_job_id_;
}

bool JobManager::is_running(int job_id) const {
    std::vector<int> running = supervisor_.get_running_jobs();
    return std::find(running.begin(), running.end(), job_id) != running.end();
}

int JobManager::start(Operation operation, const std::string& source, const std::string& destination,
                      bool follow_symlinks, const Environment& env) {
    TransferRequest request;
    request.operation = operation;
    request.source = source;
    request.destination = destination;
    request.follow_symlinks = follow_symlinks;

    // Probing may throw Timeout; planning rejects zip. Both before any id is used.
    PathFacts facts;
    if (operation != Operation::Check && operation != Operation::Zip) {
        facts = gather_facts(request, rclone_);
    }
    TransferPlan plan = plan_transfer(request, facts);

    int job_id = 0;
    for (int attempt = 1;; ++attempt) {
        job_id = next_job_id();
        try {
            store_.create(job_id, operation, source, destination, JobStatus::Pending, owner_pid_);
            break;
        } catch (const MotusError& e) {
            // Another motus process took the id
            if (e.kind() != ErrorKind::DuplicateJob || attempt >= kIdAttempts) throw;
            Logger::debug(tag(job_id) + "id already taken, retrying");
            advance_job_counter();
        }
    }
    Logger::info(tag(job_id) + operation_name(operation) + " " + source + " -> " + destination +
                 " (rclone " + plan.subcommand + " " + plan.source + " " + plan.destination + ")");

    if (!plan.mkdir_before.empty()) {
        try {
            rclone_.mkdir(plan.mkdir_before);
        } catch (const MotusError& e) {
            // rclone may still create it itself
            Logger::warn(tag(job_id) + "could not pre-create " + plan.mkdir_before + ": " + e.what());
        }
    }

    std::vector<std::string> command = rclone_.transfer_command(plan, job_id);
    try {
        supervisor_.start(command, env, job_id);
    } catch (const MotusError& e) {
        JobUpdate update;
        update.status = JobStatus::Failed;
        update.error_text = e.what();
        store_.update(job_id, update);
        throw;
    }

    // A stop may have landed while the process was being launched
    auto current = store_.get(job_id);
    if (current && current->status == JobStatus::Pending) {
        JobUpdate running;
        running.status = JobStatus::Running;
        store_.update(job_id, running);
    } else {
        supervisor_.stop(job_id);
    }

    if (!plan.cleanup_after.empty()) {
        wait_for_exit(job_id);
        JobView done = status(job_id);
        if (done.job.status == JobStatus::Completed) {
            remove_empty_source(plan.cleanup_after);
        } else {
            Logger::info(tag(job_id) + status_name(done.job.status) + " with exit status " +
                         std::to_string(done.job.exit_status) + ", leaving " + plan.cleanup_after + " in place");
        }
    }

    return job_id;
}

int JobManager::copy(const std::string& source, const std::string& destination,
                     bool follow_symlinks, const Environment& env) {
    return start(Operation::Copy, source, destination, follow_symlinks, env);
}

int JobManager::move(const std::string& source, const std::string& destination,
                     bool follow_symlinks, const Environment& env) {
    return start(Operation::Move, source, destination, follow_symlinks, env);
}

int JobManager::sync(const std::string& source, const std::string& destination,
                     bool follow_symlinks, const Environment& env) {
    return start(Operation::Sync, source, destination, follow_symlinks, env);
}

int JobManager::check(const std::string& source, const std::string& destination, const Environment& env) {
    return start(Operation::Check, source, destination, false, env);
}

void JobManager::wait_for_exit(int job_id) {
    while (supervisor_.is_tracked(job_id) && !supervisor_.is_finished(job_id)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms_));
    }
}

void JobManager::remove_empty_source(const std::string& path) {
    try {
        rclone_.rmdir(path);
        Logger::info("[JobManager] Removed emptied source directory " + path);
    } catch (const MotusError& e) {
        Logger::warn("[JobManager] Could not remove source directory " + path + ": " + e.what());
    }
}

void JobManager::persist_sidecar(int job_id, bool remove_file) {
    std::string text = rclone_.job_log_text(job_id);
    if (text.empty()) return;

    JobUpdate update;
    update.log_text = text;
    store_.update(job_id, update);
    if (remove_file) {
        rclone_.cleanup_job_log(job_id);
    }
}

void JobManager::finalize(Job& job) {
    {
        std::lock_guard<std::mutex> lock(finalized_mutex_);
        if (!finalized_.insert(job.job_id).second) return;
    }
    // Another caller may have finished and released the entry first
    if (!supervisor_.is_finished(job.job_id)) {
        std::lock_guard<std::mutex> lock(finalized_mutex_);
        finalized_.erase(job.job_id);
        return;
    }

    int exit_status = supervisor_.get_exit_status(job.job_id);

    JobUpdate update;
    update.progress = supervisor_.get_percent(job.job_id);
    update.status_text = supervisor_.get_text(job.job_id);
    update.exit_status = exit_status;
    std::string error_text = supervisor_.get_error_text(job.job_id);
    if (!error_text.empty() && !(is_terminal(job.status) && !job.error_text.empty())) {
        update.error_text = error_text;
    }
    // A stop already recorded the terminal status
    if (!is_terminal(job.status)) {
        update.status = exit_status == 0 ? JobStatus::Completed : JobStatus::Failed;
    }
    store_.update(job.job_id, update);
    persist_sidecar(job.job_id, true);

    // The record now holds everything the supervisor knew
    supervisor_.remove(job.job_id);
    {
        std::lock_guard<std::mutex> lock(finalized_mutex_);
        finalized_.erase(job.job_id);
    }

    Logger::info(tag(job.job_id) + "finalized with exit status " + std::to_string(exit_status));

    auto refreshed = store_.get(job.job_id);
    if (refreshed) job = *refreshed;
}

JobView JobManager::status(int job_id) {
    auto record = store_.get(job_id);
    if (!record) {
        throw MotusError(ErrorKind::JobNotFound, "Job " + std::to_string(job_id) + " not found");
    }

    JobView view;
    Job& job = *record;

    if (is_running(job_id)) {
        // Cancelled or interrupted from another motus process
        if (is_terminal(job.status)) supervisor_.stop(job_id);

        JobUpdate update;
        update.progress = std::max(job.progress, supervisor_.get_percent(job_id));
        update.status_text = supervisor_.get_text(job_id);
        std::string error_text = supervisor_.get_error_text(job_id);
        if (!error_text.empty()) update.error_text = error_text;
        if (!is_terminal(job.status)) update.status = JobStatus::Running;
        store_.update(job_id, update);

        job.progress = *update.progress;
        job.status_text = *update.status_text;
        if (update.error_text) job.error_text = *update.error_text;
        if (update.status) job.status = *update.status;
        view.live = true;
    } else if (supervisor_.is_finished(job_id)) {
        // Fast finishers, and stopped jobs whose exit has now been observed
        finalize(job);
    } else if (is_terminal(job.status) && job.log_text.empty() &&
               !supervisor_.is_tracked(job_id)) {
        // Finished in an earlier run; a sidecar may still be around
        std::string text = rclone_.job_log_text(job_id);
        if (!text.empty()) {
            JobUpdate update;
            update.log_text = text;
            store_.update(job_id, update);
            rclone_.cleanup_job_log(job_id);
            job.log_text = text;
        }
    }

    view.finished = !view.live && (supervisor_.is_finished(job_id) || is_terminal(job.status));
    view.job = job;
    return view;
}

std::vector<JobView> JobManager::list(const std::string& filter, int limit, int offset) {
    std::vector<Job> jobs;
    if (filter.empty()) {
        jobs = store_.list(std::nullopt, limit, offset);
    } else if (filter == "aborted") {
        jobs = store_.list_aborted(limit, offset);
    } else if (filter == "resumable") {
        jobs = store_.list_resumable(limit, offset);
    } else {
        JobStatus wanted = JobStatus::Pending;
        try {
            wanted = parse_status(filter);
        } catch (const MotusError&) {
            throw MotusError(ErrorKind::InvalidOperation, "Unknown status filter: " + filter);
        }
        jobs = store_.list(wanted, limit, offset);
    }

    std::vector<JobView> views;
    views.reserve(jobs.size());
    for (auto& job : jobs) {
        if (job.status == JobStatus::Running || supervisor_.is_tracked(job.job_id)) {
            views.push_back(status(job.job_id));
        } else {
            JobView view;
            view.job = job;
            view.finished = is_terminal(job.status);
            views.push_back(view);
        }
    }
    return views;
}

bool JobManager::stop(int job_id) {
    auto record = store_.get(job_id);
    if (!record) {
        throw MotusError(ErrorKind::JobNotFound, "Job " + std::to_string(job_id) + " not found");
    }
    if (is_terminal(record->status)) {
        Logger::debug(tag(job_id) + "stop ignored, already " + status_name(record->status));
        return false;
    }

    if (supervisor_.is_tracked(job_id)) {
        supervisor_.stop(job_id);
    } else if (record->owner_pid != owner_pid_ && Helpers::process_alive(record->owner_pid)) {
        Logger::info(tag(job_id) + "owned by process " + std::to_string(record->owner_pid) +
                     ", it stops the transfer on its next status check");
    }

    JobUpdate update;
    update.status = JobStatus::Cancelled;
    update.progress = std::max(record->progress, supervisor_.get_percent(job_id));
    store_.update(job_id, update);
    // The process may still be writing; finalize() stores the complete log
    persist_sidecar(job_id, false);

    Logger::info(tag(job_id) + "cancelled");
    return true;
}

int JobManager::relaunch(int job_id, Operation operation) {
    auto record = store_.get(job_id);
    if (!record) {
        throw MotusError(ErrorKind::JobNotFound, "Job " + std::to_string(job_id) + " not found");
    }
    if ((record->status != JobStatus::Interrupted && record->status != JobStatus::Failed) ||
        record->resumed_by_job_id != 0) {
        throw MotusError(ErrorKind::NotResumable,
                         "Job " + std::to_string(job_id) + " is " + status_name(record->status) +
                         (record->resumed_by_job_id ? " and already resumed" : "") + ", cannot resume");
    }

    int new_job_id = start(operation, record->source, record->destination);
    if (!store_.set_resumed_by(job_id, new_job_id)) {
        Logger::warn(tag(job_id) + "link to job " + std::to_string(new_job_id) + " was not recorded");
    }
    Logger::info(tag(job_id) + "resumed as job " + std::to_string(new_job_id));
    return new_job_id;
}

int JobManager::resume(int job_id) {
    return relaunch(job_id, Operation::Copy);
}

int JobManager::resync(int job_id) {
    return relaunch(job_id, Operation::Sync);
}

std::string JobManager::log_text(int job_id) {
    auto record = store_.get(job_id);
    if (!record) {
        throw MotusError(ErrorKind::JobNotFound, "Job " + std::to_string(job_id) + " not found");
    }
    if (!record->log_text.empty()) {
        return record->log_text;
    }

    std::string text = rclone_.job_log_text(job_id);
    bool process_done = !supervisor_.is_tracked(job_id) || supervisor_.is_finished(job_id);
    if (!text.empty() && is_terminal(record->status) && process_done) {
        JobUpdate update;
        update.log_text = text;
        store_.update(job_id, update);
        rclone_.cleanup_job_log(job_id);
    }
    return text;
}

bool JobManager::remove(int job_id) {
    if (is_running(job_id)) {
        supervisor_.stop(job_id);
    }
    supervisor_.remove(job_id);
    rclone_.cleanup_job_log(job_id);
    bool removed = store_.remove(job_id);
    if (removed) {
        Logger::info(tag(job_id) + "removed");
    }
    return removed;
}

std::vector<int> JobManager::clear_stopped() {
    std::vector<int> removed = store_.remove_stopped();
    for (int job_id : removed) {
        supervisor_.remove(job_id);
        rclone_.cleanup_job_log(job_id);
    }

    init_job_counter();
    Logger::info("[JobManager] Cleared " + std::to_string(removed.size()) + " stopped jobs, next job id " +
                 std::to_string(peek_next_job_id()));
    return removed;
}

int JobManager::shutdown() {
    std::vector<int> running = supervisor_.get_running_jobs();
    supervisor_.shutdown_all();

    for (int job_id : running) {
        try {
            auto record = store_.get(job_id);
            if (!record || is_terminal(record->status)) continue;

            JobUpdate update;
            update.status = JobStatus::Interrupted;
            update.progress = std::max(record->progress, supervisor_.get_percent(job_id));
            update.error_text = kShutdownMessage;
            store_.update(job_id, update);
            persist_sidecar(job_id, false);
        } catch (const MotusError& e) {
            Logger::error(tag(job_id) + "could not record shutdown: " + e.what());
        }
    }

    Logger::info("[JobManager] Shutdown interrupted " + std::to_string(running.size()) + " jobs");
    return static_cast<int>(running.size());
}

} // namespace motus
