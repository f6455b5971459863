#pragma once

#include <string>
#include <map>
#include <mutex>

namespace motus {

/**
 * Engine settings
 *
 * Flat key/value settings persisted as a JSON object. Every key can be
 * overridden from the environment as MOTUS_<KEY> (upper case), which takes
 * priority over the file; missing keys fall back to XDG-derived defaults:
 *
 *   data_dir       $XDG_DATA_HOME/motus      (database)
 *   cache_dir      $XDG_CACHE_HOME/motus     (log file, job log sidecars)
 *   config_dir     $XDG_CONFIG_HOME/motus    (settings.json)
 */
class Settings {
public:
    // Empty path means <config_dir>/settings.json
    explicit Settings(const std::string& settings_path = "");

    // Load/save settings
    bool load();
    bool save();

    const std::string& path() const { return settings_path_; }

    // Directories
    std::string get_config_dir() const;
    std::string get_data_dir() const;
    std::string get_cache_dir() const;
    std::string get_logs_dir() const;        // job log sidecars, "" disables them
    std::string get_database_path() const;

    // Logging
    std::string get_log_file() const;
    std::string get_log_level() const;

    // External tool
    std::string get_rclone_path() const;     // "" = auto-detect
    std::string get_rclone_config_file() const;
    std::string get_stats_interval() const;
    std::string get_connect_timeout() const;
    int get_metadata_timeout_seconds() const;

    // Supervisor tuning
    int get_poll_interval_ms() const;
    size_t get_error_text_limit() const;

    // Generic getters/setters
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    void set_string(const std::string& key, const std::string& value);

    int get_int(const std::string& key, int default_value = 0) const;
    void set_int(const std::string& key, int value);

    bool get_bool(const std::string& key, bool default_value = false) const;
    void set_bool(const std::string& key, bool value);

    // Make sure data, cache and logs directories exist
    bool ensure_directories() const;

    static std::string env_key(const std::string& key);

private:
    void ensure_defaults();

    mutable std::mutex mutex_;
    std::map<std::string, std::string> settings_;
    std::string settings_path_;
};

} // namespace motus
