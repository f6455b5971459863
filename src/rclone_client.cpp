#include "rclone_client.hpp"
#include "settings.hpp"
#include "helpers.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <glib.h>
#include <chrono>
#include <thread>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace motus {

static const int kVerifyTimeoutSeconds = 5;
static const int kRmdirTimeoutSeconds = 30;
static const char* const kKeepFileName = ".motus_keep";

static int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

ExecResult exec_with_timeout(const std::vector<std::string>& command, int timeout_seconds) {
    if (command.empty()) {
        throw MotusError(ErrorKind::LaunchFailure, "Empty command");
    }

    std::vector<std::string> args = command;
    std::vector<char*> argv = Helpers::to_argv(args);

    GPid pid = 0;
    gint in_fd = -1;
    gint out_fd = -1;
    gint err_fd = -1;
    GError* error = nullptr;

    gboolean ok = g_spawn_async_with_pipes(nullptr,
                                           argv.data(),
                                           nullptr,
                                           static_cast<GSpawnFlags>(G_SPAWN_DO_NOT_REAP_CHILD | G_SPAWN_SEARCH_PATH),
                                           nullptr,
                                           nullptr,
                                           &pid,
                                           &in_fd,
                                           &out_fd,
                                           &err_fd,
                                           &error);
    if (!ok) {
        std::string message = error && error->message ? error->message : "Failed to start " + command[0];
        if (error) g_error_free(error);
        throw MotusError(ErrorKind::LaunchFailure, message);
    }
    close(in_fd);

    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::seconds(timeout_seconds);
    auto remaining_ms = [&deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        return static_cast<int>(left.count());
    };

    ExecResult result;
    struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* sinks[2] = {&result.out, &result.err};
    int open_fds = 2;
    bool timed_out = false;

    while (open_fds > 0) {
        int wait_ms = remaining_ms();
        if (wait_ms <= 0) {
            timed_out = true;
            break;
        }
        int ready = poll(fds, 2, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::warn(std::string("[Rclone] poll failed: ") + std::strerror(errno));
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            char buffer[4096];
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }

    int status = 0;
    bool reaped = false;
    while (!timed_out) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            reaped = true;
            break;
        }
        if (r < 0 && errno != EINTR) {
            break;
        }
        if (remaining_ms() <= 0) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    for (auto& p : fds) {
        if (p.fd >= 0) close(p.fd);
    }

    if (timed_out) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        g_spawn_close_pid(pid);
        throw MotusError(ErrorKind::Timeout,
                         command[0] + " timed out after " + std::to_string(timeout_seconds) + "s");
    }

    g_spawn_close_pid(pid);
    result.exit_status = reaped ? decode_wait_status(status) : -1;
    return result;
}

RcloneClient::RcloneClient(const Settings& settings)
    : rclone_path_(Helpers::find_rclone(settings.get_rclone_path())),
      config_file_(settings.get_rclone_config_file()),
      stats_interval_(settings.get_stats_interval()),
      connect_timeout_(settings.get_connect_timeout()),
      logs_dir_(settings.get_logs_dir()),
      metadata_timeout_seconds_(settings.get_metadata_timeout_seconds()) {}

void RcloneClient::verify() {
    ExecResult result;
    try {
        result = exec_with_timeout({rclone_path_, "version"}, kVerifyTimeoutSeconds);
    } catch (const MotusError& e) {
        if (e.kind() == ErrorKind::Timeout) {
            throw MotusError(ErrorKind::LaunchFailure, "rclone version check timed out");
        }
        throw MotusError(ErrorKind::LaunchFailure,
                         "rclone not found at " + rclone_path_ + ": " + e.what());
    }

    if (result.exit_status != 0) {
        throw MotusError(ErrorKind::LaunchFailure,
                         "rclone at " + rclone_path_ + " is not working properly");
    }

    std::string first_line = result.out.substr(0, result.out.find('\n'));
    Logger::info("[Rclone] Found " + first_line);
}

RemotePath RcloneClient::parse_path(const std::string& path) {
    RemotePath result;
    size_t colon = path.find(':');
    if (colon != std::string::npos && colon > 0) {
        std::string name = path.substr(0, colon);
        if (name.find_first_of("/\\") == std::string::npos) {
            result.remote = name;
            result.path = path.substr(colon + 1);
            while (!result.path.empty() && result.path.back() == '/') {
                result.path.pop_back();
            }
            return result;
        }
    }

    result.path = Helpers::expand_home(path);
    while (result.path.size() > 1 && result.path.back() == '/') {
        result.path.pop_back();
    }
    return result;
}

std::vector<std::string> RcloneClient::base_command() const {
    std::vector<std::string> cmd = {rclone_path_};
    if (!config_file_.empty()) {
        cmd.push_back("--config");
        cmd.push_back(config_file_);
    }
    return cmd;
}

ExecResult RcloneClient::run(const std::vector<std::string>& args, int timeout_seconds) const {
    std::vector<std::string> cmd = base_command();
    cmd.insert(cmd.end(), args.begin(), args.end());
    Logger::debug("[Rclone] Executing (timeout " + std::to_string(timeout_seconds) + "s): " +
                  Helpers::describe_command(cmd, {}));

    ExecResult result = exec_with_timeout(cmd, timeout_seconds);
    if (result.exit_status != 0) {
        std::string stderr_text = trim(result.err);
        throw MotusError(ErrorKind::ExternalToolError,
                         stderr_text.empty()
                             ? "Command failed with code " + std::to_string(result.exit_status)
                             : stderr_text);
    }
    return result;
}

// Value of "key": in one JSON object, string or bare literal
static std::string json_field(const std::string& obj, const std::string& key) {
    std::string needle = "\"" + key + "\"";
    size_t pos = obj.find(needle);
    if (pos == std::string::npos) return "";
    pos = obj.find(':', pos + needle.size());
    if (pos == std::string::npos) return "";
    pos = obj.find_first_not_of(" \t\r\n", pos + 1);
    if (pos == std::string::npos) return "";

    std::string value;
    if (obj[pos] == '"') {
        for (size_t i = pos + 1; i < obj.size() && obj[i] != '"'; ++i) {
            if (obj[i] == '\\' && i + 1 < obj.size()) {
                ++i;
                switch (obj[i]) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                default: value += obj[i]; break;
                }
                continue;
            }
            value += obj[i];
        }
        return value;
    }

    size_t end = obj.find_first_of(",}", pos);
    return trim(obj.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
}

static int64_t json_int(const std::string& obj, const std::string& key) {
    std::string value = json_field(obj, key);
    if (value.empty()) return 0;
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return 0;
    }
}

std::vector<RemoteEntry> RcloneClient::parse_lsjson(const std::string& json) {
    std::vector<RemoteEntry> entries;

    // Split the array into top-level objects, skipping braces inside strings
    size_t i = 0;
    while (i < json.size()) {
        size_t start = json.find('{', i);
        if (start == std::string::npos) break;

        bool in_string = false;
        int depth = 0;
        size_t end = start;
        for (; end < json.size(); ++end) {
            char c = json[end];
            if (in_string) {
                if (c == '\\') ++end;
                else if (c == '"') in_string = false;
                continue;
            }
            if (c == '"') in_string = true;
            else if (c == '{') ++depth;
            else if (c == '}' && --depth == 0) break;
        }
        if (end >= json.size()) break;

        std::string obj = json.substr(start, end - start + 1);
        RemoteEntry entry;
        entry.name = json_field(obj, "Name");
        entry.path = json_field(obj, "Path");
        entry.size = json_int(obj, "Size");
        entry.is_dir = json_field(obj, "IsDir") == "true";
        entry.mod_time = json_field(obj, "ModTime");
        if (!entry.name.empty()) {
            entries.push_back(entry);
        }
        i = end + 1;
    }
    return entries;
}

std::vector<RemoteEntry> RcloneClient::list(const std::string& path) {
    ExecResult result = run({"lsjson", "--fast-list", "--no-mimetype", path}, metadata_timeout_seconds_);
    std::vector<RemoteEntry> entries = parse_lsjson(result.out);
    Logger::debug("[Rclone] lsjson " + path + " returned " + std::to_string(entries.size()) + " entries");
    return entries;
}

std::string RcloneClient::parent_of(const std::string& path) const {
    RemotePath rp = parse_path(path);
    size_t slash = rp.path.find_last_of('/');
    std::string dir;
    if (slash == 0) {
        dir = "/";
    } else if (slash != std::string::npos) {
        dir = rp.path.substr(0, slash);
    }
    return rp.is_remote() ? rp.remote + ":" + dir : dir;
}

PathKind RcloneClient::inspect(const std::string& path) {
    RemotePath rp = parse_path(path);

    if (!rp.is_remote()) {
        if (Helpers::safe_is_directory(rp.path)) return PathKind::Directory;
        if (Helpers::safe_exists(rp.path)) return PathKind::File;
        return PathKind::Missing;
    }

    try {
        if (rp.path.empty() || rp.path == "/") {
            list(path);
            return PathKind::Directory;
        }

        std::string name = base_name(rp.path);
        for (const auto& entry : list(parent_of(path))) {
            if (entry.name == name) {
                return entry.is_dir ? PathKind::Directory : PathKind::File;
            }
        }
    } catch (const MotusError& e) {
        if (e.kind() == ErrorKind::Timeout) throw;
        Logger::debug("[Rclone] lookup of " + path + " failed: " + e.what());
    }
    return PathKind::Missing;
}

bool RcloneClient::exists(const std::string& path) {
    return inspect(path) != PathKind::Missing;
}

bool RcloneClient::is_directory(const std::string& path) {
    return inspect(path) == PathKind::Directory;
}

void RcloneClient::mkdir(const std::string& path) {
    RemotePath rp = parse_path(path);
    if (!rp.is_remote()) {
        std::error_code ec;
        fs::create_directories(rp.path, ec);
        if (ec) {
            throw MotusError(ErrorKind::ExternalToolError,
                             "Cannot create " + rp.path + ": " + ec.message());
        }
        return;
    }

    // Directories only exist through their content on most remotes
    std::string keep = rp.remote + ":" + (rp.path.empty() ? "" : rp.path + "/") + kKeepFileName;
    run({"touch", keep}, metadata_timeout_seconds_);
    Logger::info("[Rclone] Created " + path);
}

void RcloneClient::rmdir(const std::string& path) {
    RemotePath rp = parse_path(path);
    if (!rp.is_remote()) {
        if (::rmdir(rp.path.c_str()) != 0) {
            throw MotusError(ErrorKind::ExternalToolError,
                             "Cannot remove " + rp.path + ": " + std::strerror(errno));
        }
        return;
    }
    run({"rmdir", path}, kRmdirTimeoutSeconds);
}

SizeInfo RcloneClient::size(const std::string& path) {
    SizeInfo info;
    try {
        ExecResult result = run({"size", "--json", path}, metadata_timeout_seconds_);
        info.count = json_int(result.out, "count");
        info.bytes = json_int(result.out, "bytes");
    } catch (const MotusError& e) {
        Logger::warn("[Rclone] size " + path + " failed: " + e.what());
    }
    return info;
}

std::string RcloneClient::command_path(const std::string& path) {
    RemotePath rp = parse_path(path);
    if (rp.is_remote()) return path;
    // "~" is resolved here, the child runs without a shell
    if (has_trailing_slash(path) && rp.path != "/") return rp.path + "/";
    return rp.path;
}

std::vector<std::string> RcloneClient::transfer_command(const TransferPlan& plan, int job_id) const {
    std::vector<std::string> cmd = base_command();
    cmd.push_back(plan.subcommand);
    cmd.push_back(command_path(plan.source));
    cmd.push_back(command_path(plan.destination));
    cmd.push_back("--progress");
    cmd.push_back("--stats");
    cmd.push_back(stats_interval_);
    cmd.push_back("--contimeout=" + connect_timeout_);

    if (!logs_dir_.empty()) {
        cmd.push_back("-v");
        cmd.push_back("--log-file");
        cmd.push_back(job_log_path(job_id));
    }

    if (plan.follow_symlinks) {
        cmd.push_back("--copy-links");
    }

    // NFS snapshot directories
    if (plan.source_is_directory && !parse_path(plan.source).is_remote()) {
        cmd.push_back("--exclude=.snapshot/");
    }
    return cmd;
}

std::vector<std::string> RcloneClient::check_command(const std::string& source,
                                                     const std::string& destination,
                                                     int job_id) const {
    TransferPlan plan;
    plan.operation = Operation::Check;
    plan.subcommand = "check";
    plan.source = source;
    plan.destination = destination;
    return transfer_command(plan, job_id);
}

std::string RcloneClient::job_log_path(int job_id) const {
    if (logs_dir_.empty()) return "";
    return logs_dir_ + "/job_" + std::to_string(job_id) + ".log";
}

std::string RcloneClient::job_log_text(int job_id) const {
    std::string log_path = job_log_path(job_id);
    if (log_path.empty() || !Helpers::safe_is_regular_file(log_path)) return "";

    std::ifstream file(log_path);
    if (!file.is_open()) {
        Logger::warn("[Rclone] Cannot read " + log_path);
        return "";
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void RcloneClient::cleanup_job_log(int job_id) const {
    std::string log_path = job_log_path(job_id);
    if (log_path.empty()) return;
    std::error_code ec;
    fs::remove(log_path, ec);
    if (ec) {
        Logger::debug("[Rclone] Cannot remove " + log_path + ": " + ec.message());
    }
}

std::vector<int> RcloneClient::list_job_logs() const {
    std::vector<int> ids;
    if (logs_dir_.empty() || !Helpers::safe_is_directory(logs_dir_)) return ids;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(logs_dir_, ec)) {
        std::string name = entry.path().filename().string();
        if (name.size() <= 8 || name.compare(0, 4, "job_") != 0 ||
            name.compare(name.size() - 4, 4, ".log") != 0) {
            continue;
        }
        std::string digits = name.substr(4, name.size() - 8);
        if (digits.find_first_not_of("0123456789") != std::string::npos) continue;
        try {
            ids.push_back(std::stoi(digits));
        } catch (const std::exception&) {
            Logger::debug("[Rclone] Ignoring log file " + name);
        }
    }
    if (ec) {
        Logger::warn("[Rclone] Cannot scan " + logs_dir_ + ": " + ec.message());
    }
    return ids;
}

} // namespace motus
