#include "process_supervisor.hpp"
#include "progress_parser.hpp"
#include "helpers.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <glib.h>
#include <chrono>
#include <condition_variable>
#include <thread>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace motus {

// Bounded wait for the readers once the child has been reaped
static const int kReaderDrainSeconds = 5;

struct ProcessSupervisor::TrackedJob {
    explicit TrackedJob(int id, size_t error_limit) : job_id(id), progress(error_limit) {}

    const int job_id;
    std::mutex mutex;
    std::condition_variable readers_done;
    ProgressTracker progress;
    GPid pid = 0;
    bool alive = false;           // spawned and not yet reaped
    bool finished = false;        // terminal state published
    bool stop_requested = false;
    int exit_status = -1;
    int open_readers = 0;
};

// Caller holds job->mutex and has checked that the child is unreaped
static void send_sigterm(int job_id, GPid pid) {
    if (kill(pid, SIGTERM) != 0) {
        Logger::warn("[Supervisor] Job " + std::to_string(job_id) +
                     ": SIGTERM failed: " + std::strerror(errno));
    } else {
        Logger::info("[Supervisor] Job " + std::to_string(job_id) + ": stop requested");
    }
}

ProcessSupervisor::ProcessSupervisor(int poll_interval_ms, size_t error_text_limit)
    : poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : 200),
      error_text_limit_(error_text_limit) {}

void ProcessSupervisor::start(const std::vector<std::string>& command, const Environment& env, int job_id) {
    auto job = std::make_shared<TrackedJob>(job_id, error_text_limit_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (jobs_.count(job_id)) {
            throw MotusError(ErrorKind::DuplicateJob,
                             "Job with ID " + std::to_string(job_id) + " already exists");
        }
        jobs_[job_id] = job;
    }

    Logger::info("[Supervisor] Job " + std::to_string(job_id) + ": " +
                 Helpers::describe_command(command, env));

    std::vector<std::string> args = command;
    std::vector<char*> argv = Helpers::to_argv(args);

    gchar** envp = g_get_environ();
    for (const auto& [key, value] : env) {
        envp = g_environ_setenv(envp, key.c_str(), value.c_str(), TRUE);
    }

    GPid pid = 0;
    gint stdin_fd = -1;
    gint stdout_fd = -1;
    gint stderr_fd = -1;
    GError* error = nullptr;

    gboolean ok = FALSE;
    if (!command.empty()) {
        ok = g_spawn_async_with_pipes(nullptr,
                                      argv.data(),
                                      envp,
                                      static_cast<GSpawnFlags>(G_SPAWN_DO_NOT_REAP_CHILD | G_SPAWN_SEARCH_PATH),
                                      nullptr,
                                      nullptr,
                                      &pid,
                                      &stdin_fd,
                                      &stdout_fd,
                                      &stderr_fd,
                                      &error);
    }
    g_strfreev(envp);

    if (!ok) {
        std::string message = error && error->message ? error->message : "Empty command";
        if (error) g_error_free(error);
        Logger::error("[Supervisor] Failed to start job " + std::to_string(job_id) + ": " + message);

        std::lock_guard<std::mutex> lock(job->mutex);
        job->progress.append_error(message);
        job->exit_status = -1;
        job->finished = true;
        return;
    }

    // The child never reads stdin: give it EOF right away
    close(stdin_fd);

    {
        std::lock_guard<std::mutex> lock(job->mutex);
        job->pid = pid;
        job->alive = true;
        job->open_readers = 2;
        // stop() arrived before the pid was known
        if (job->stop_requested) {
            send_sigterm(job_id, pid);
        }
    }

    std::thread(read_stream, job, stdout_fd, false).detach();
    std::thread(read_stream, job, stderr_fd, true).detach();
    std::thread(watch_process, job, poll_interval_ms_).detach();
}

void ProcessSupervisor::read_stream(std::shared_ptr<TrackedJob> job, int fd, bool is_stderr) {
    const std::string tag = "[Supervisor] Job " + std::to_string(job->job_id) + ": ";
    try {
        std::string pending;
        char buffer[4096];
        while (true) {
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR) continue;
                Logger::warn(tag + "read failed: " + std::strerror(errno));
                break;
            }
            if (n == 0) break;
            pending.append(buffer, static_cast<size_t>(n));

            size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, newline);
                pending.erase(0, newline + 1);

                if (is_stderr) {
                    std::string text = strip_repaint(line);
                    if (text.empty()) continue;
                    Logger::warn(tag + text);
                    std::lock_guard<std::mutex> lock(job->mutex);
                    job->progress.append_error(text);
                } else {
                    std::lock_guard<std::mutex> lock(job->mutex);
                    job->progress.feed(line);
                }
            }
        }

        if (!pending.empty()) {
            std::lock_guard<std::mutex> lock(job->mutex);
            if (is_stderr) {
                std::string text = strip_repaint(pending);
                if (!text.empty()) job->progress.append_error(text);
            } else {
                job->progress.feed(pending);
            }
        }
    } catch (const std::exception& e) {
        // The liveness thread still detects termination
        Logger::error(tag + "reader failed: " + e.what());
    }

    close(fd);
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        job->open_readers--;
    }
    job->readers_done.notify_all();
}

void ProcessSupervisor::watch_process(std::shared_ptr<TrackedJob> job, int poll_interval_ms) {
    int exit_status = -1;

    while (true) {
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms));

        std::lock_guard<std::mutex> lock(job->mutex);
        int status = 0;
        pid_t result = waitpid(job->pid, &status, WNOHANG);
        if (result == 0) continue;
        if (result < 0 && errno == EINTR) continue;

        if (result == job->pid) {
            if (WIFEXITED(status)) {
                exit_status = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_status = -WTERMSIG(status);
            }
        } else {
            Logger::warn("[Supervisor] Job " + std::to_string(job->job_id) +
                         ": waitpid failed: " + std::strerror(errno));
        }
        job->alive = false;
        g_spawn_close_pid(job->pid);
        break;
    }

    std::unique_lock<std::mutex> lock(job->mutex);
    bool drained = job->readers_done.wait_for(lock, std::chrono::seconds(kReaderDrainSeconds),
                                              [&job] { return job->open_readers == 0; });
    if (!drained) {
        Logger::warn("[Supervisor] Job " + std::to_string(job->job_id) +
                     ": output still open after exit, publishing anyway");
    }

    job->progress.mark_complete();
    job->exit_status = exit_status;
    job->finished = true;

    Logger::info("[Supervisor] Job " + std::to_string(job->job_id) +
                 " finished with exit status " + std::to_string(exit_status));
}

std::shared_ptr<ProcessSupervisor::TrackedJob> ProcessSupervisor::find(int job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return nullptr;
    return it->second;
}

int ProcessSupervisor::get_percent(int job_id) const {
    auto job = find(job_id);
    if (!job) return 0;
    std::lock_guard<std::mutex> lock(job->mutex);
    return job->progress.percent();
}

std::string ProcessSupervisor::get_text(int job_id) const {
    auto job = find(job_id);
    if (!job) return "";
    std::lock_guard<std::mutex> lock(job->mutex);
    return job->progress.text();
}

std::string ProcessSupervisor::get_error_text(int job_id) const {
    auto job = find(job_id);
    if (!job) return "";
    std::lock_guard<std::mutex> lock(job->mutex);
    return job->progress.error_text();
}

int ProcessSupervisor::get_exit_status(int job_id) const {
    auto job = find(job_id);
    if (!job) return -1;
    std::lock_guard<std::mutex> lock(job->mutex);
    return job->finished ? job->exit_status : -1;
}

bool ProcessSupervisor::is_finished(int job_id) const {
    auto job = find(job_id);
    if (!job) return false;
    std::lock_guard<std::mutex> lock(job->mutex);
    return job->finished;
}

bool ProcessSupervisor::is_tracked(int job_id) const {
    return find(job_id) != nullptr;
}

void ProcessSupervisor::stop(int job_id) {
    auto job = find(job_id);
    if (!job) return;

    std::lock_guard<std::mutex> lock(job->mutex);
    if (job->stop_requested) return;
    job->stop_requested = true;

    // Only while unreaped, so the pid cannot have been reused. Before the
    // launch completes the flag alone is recorded and start() delivers it.
    if (job->alive) {
        send_sigterm(job_id, job->pid);
    }
}

void ProcessSupervisor::remove(int job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.erase(job_id);
}

std::vector<int> ProcessSupervisor::get_running_jobs() const {
    std::vector<std::shared_ptr<TrackedJob>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : jobs_) snapshot.push_back(entry.second);
    }

    std::vector<int> running;
    for (const auto& job : snapshot) {
        std::lock_guard<std::mutex> lock(job->mutex);
        if (!job->finished) running.push_back(job->job_id);
    }
    return running;
}

int ProcessSupervisor::shutdown_all() {
    std::vector<int> running = get_running_jobs();
    Logger::info("[Supervisor] Stopping " + std::to_string(running.size()) + " running jobs");
    for (int job_id : running) {
        stop(job_id);
    }
    return static_cast<int>(running.size());
}

} // namespace motus
