#pragma once

#include "transfer_plan.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace motus {

class Settings;

struct RemoteEntry {
    std::string name;
    std::string path;
    int64_t size = 0;
    bool is_dir = false;
    std::string mod_time;
};

struct RemotePath {
    std::string remote;   // "" for local paths
    std::string path;

    bool is_remote() const { return !remote.empty(); }
};

struct SizeInfo {
    int64_t bytes = 0;
    int64_t count = 0;
};

struct ExecResult {
    int exit_status = -1;
    std::string out;
    std::string err;
};

/**
 * Synchronous rclone invocations (metadata queries) and the command lines
 * for supervised transfers.
 *
 * Every synchronous call runs under a deadline: expiry kills the child and
 * throws MotusError(Timeout); a non-zero exit throws ExternalToolError with
 * the captured stderr; a spawn failure throws LaunchFailure.
 */
class RcloneClient : public PathInspector {
public:
    explicit RcloneClient(const Settings& settings);

    const std::string& rclone_path() const { return rclone_path_; }

    // "rclone version" with a 5 s deadline; throws LaunchFailure
    void verify();

    static RemotePath parse_path(const std::string& path);
    // Argument form of a path: local paths expanded, trailing slash kept
    static std::string command_path(const std::string& path);

    // lsjson of a directory
    std::vector<RemoteEntry> list(const std::string& path);
    static std::vector<RemoteEntry> parse_lsjson(const std::string& json);

    // Local paths hit the file system, remote ones list the parent once
    PathKind inspect(const std::string& path) override;
    bool exists(const std::string& path);
    bool is_directory(const std::string& path);

    void mkdir(const std::string& path);
    // Removes an empty directory only
    void rmdir(const std::string& path);
    // Zeros on failure
    SizeInfo size(const std::string& path);

    // Full argument vector for a supervised job
    std::vector<std::string> transfer_command(const TransferPlan& plan, int job_id) const;
    std::vector<std::string> check_command(const std::string& source,
                                           const std::string& destination,
                                           int job_id) const;

    // Per-job log sidecar (-v --log-file)
    std::string job_log_path(int job_id) const;
    std::string job_log_text(int job_id) const;
    void cleanup_job_log(int job_id) const;
    std::vector<int> list_job_logs() const;

    // Run rclone with the base options and a deadline
    ExecResult run(const std::vector<std::string>& args, int timeout_seconds) const;

private:
    std::vector<std::string> base_command() const;
    std::string parent_of(const std::string& path) const;

    std::string rclone_path_;
    std::string config_file_;
    std::string stats_interval_;
    std::string connect_timeout_;
    std::string logs_dir_;
    int metadata_timeout_seconds_;
};

/**
 * Spawn argv, collect stdout/stderr, and wait at most timeout_seconds.
 * Throws MotusError(LaunchFailure) or MotusError(Timeout); does not look
 * at the exit status.
 */
ExecResult exec_with_timeout(const std::vector<std::string>& argv, int timeout_seconds);

} // namespace motus
