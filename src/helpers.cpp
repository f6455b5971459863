/**
 * helpers.cpp
 *
 * Small process and filesystem helpers shared by the rclone client and the
 * process supervisor.
 */

#include "helpers.hpp"
#include "logger.hpp"
#include <filesystem>
#include <cstdlib>
#include <cerrno>
#include <csignal>
#include <sys/types.h>

namespace fs = std::filesystem;

namespace motus {
namespace Helpers {

std::string shell_escape(const std::string& arg) {
    // Example: "it's here" -> 'it'"'"'s here'
    std::string result = "'";
    for (char c : arg) {
        if (c == '\'') {
            result += "'\"'\"'";  // End quote, add escaped quote, start new quote
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

std::string find_rclone(const std::string& configured_path) {
    if (!configured_path.empty()) {
        std::string expanded = expand_home(configured_path);
        if (!safe_is_regular_file(expanded)) {
            Logger::warn("[Rclone] Configured rclone_path does not exist: " + expanded);
        }
        return expanded;
    }

    const std::vector<std::string> paths = {
        "/usr/bin/rclone",
        "/usr/local/bin/rclone",
        "/snap/bin/rclone",
    };

    for (const auto& p : paths) {
        if (safe_exists(p)) {
            Logger::info("[Rclone] Using system rclone: " + p);
            return p;
        }
    }

    Logger::info("[Rclone] No explicit path found, using PATH lookup");
    return "rclone";
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;  // ~user is left alone
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string describe_command(const std::vector<std::string>& command,
                             const std::map<std::string, std::string>& env) {
    static const char* clear_suffixes[] = {
        "_TYPE", "_REGION", "_ENDPOINT", "_HOST", "_PORT", "_USER", "_ACCOUNT"
    };

    std::string out;
    for (const auto& [key, value] : env) {
        std::string shown = "***";
        bool in_clear = false;
        for (const char* suffix : clear_suffixes) {
            if (ends_with(key, suffix)) {
                in_clear = true;
                break;
            }
        }
        if (in_clear) {
            shown = value;
        } else if (key.find("_ACCESS_KEY_ID") != std::string::npos ||
                   key.find("_CLIENT_ID") != std::string::npos) {
            if (value.size() > 4) shown = "***" + value.substr(value.size() - 4);
        }
        out += key + "=" + shell_escape(shown) + " ";
    }

    for (size_t i = 0; i < command.size(); ++i) {
        if (i > 0) out += " ";
        out += command[i];
    }
    return out;
}

std::vector<char*> to_argv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return argv;
}

bool process_alive(int pid) {
    if (pid <= 0) return false;
    return kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

// ============================================================================
// Safe filesystem operations (never throw)
// ============================================================================

bool safe_exists(const std::string& path) {
    std::error_code ec;
    bool result = fs::exists(path, ec);
    if (ec) {
        Logger::debug("[FilesystemSafe] exists() I/O error for " + path + ": " + ec.message());
        return false;
    }
    return result;
}

bool safe_is_directory(const std::string& path) {
    std::error_code ec;
    bool result = fs::is_directory(path, ec);
    if (ec) {
        Logger::debug("[FilesystemSafe] is_directory() I/O error for " + path + ": " + ec.message());
        return false;
    }
    return result;
}

bool safe_is_regular_file(const std::string& path) {
    std::error_code ec;
    bool result = fs::is_regular_file(path, ec);
    if (ec) {
        Logger::debug("[FilesystemSafe] is_regular_file() I/O error for " + path + ": " + ec.message());
        return false;
    }
    return result;
}

} // namespace Helpers
} // namespace motus
