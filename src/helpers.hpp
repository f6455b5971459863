#pragma once

#include <string>
#include <map>
#include <vector>

namespace motus {
namespace Helpers {

/**
 * Escape a string for display in a copy-pasteable shell command.
 * Uses single-quoting and escapes embedded single quotes.
 */
std::string shell_escape(const std::string& arg);

/**
 * Locate the rclone binary. A non-empty configured path wins; otherwise the
 * common install locations are checked before falling back to a PATH lookup.
 */
std::string find_rclone(const std::string& configured_path);

/**
 * Expand a leading "~" to $HOME
 */
std::string expand_home(const std::string& path);

/**
 * Render a command line for the log. Credential variables are sanitized:
 * _TYPE/_REGION/_ENDPOINT/_HOST/_PORT/_USER/_ACCOUNT are shown in clear,
 * _ACCESS_KEY_ID/_CLIENT_ID keep their last four characters, anything else
 * becomes ***.
 */
std::string describe_command(const std::vector<std::string>& command,
                             const std::map<std::string, std::string>& env);

/**
 * NULL-terminated argv view over a string vector (for g_spawn_*).
 * The vector must outlive the returned pointers.
 */
std::vector<char*> to_argv(std::vector<std::string>& args);

// True if a process with this pid exists (EPERM counts as alive)
bool process_alive(int pid);

/**
 * Safe filesystem operations that never throw exceptions.
 * These wrappers use std::error_code to handle I/O errors gracefully.
 */

/**
 * Safely check if a path exists (returns false on I/O errors)
 */
bool safe_exists(const std::string& path);

/**
 * Safely check if a path is a directory (returns false on I/O errors)
 */
bool safe_is_directory(const std::string& path);

/**
 * Safely check if a path is a regular file (returns false on I/O errors)
 */
bool safe_is_regular_file(const std::string& path);

} // namespace Helpers
} // namespace motus
