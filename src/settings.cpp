#include "settings.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <algorithm>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace motus {

static std::string home_dir() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) : std::string("/tmp");
}

// $XDG_<name> or ~/<fallback>, with /motus appended
static std::string xdg_dir(const char* env_name, const std::string& fallback) {
    const char* value = std::getenv(env_name);
    std::string base = (value && *value) ? std::string(value) : home_dir() + "/" + fallback;
    return base + "/motus";
}

static std::string json_escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

Settings::Settings(const std::string& settings_path) : settings_path_(settings_path) {
    if (settings_path_.empty()) {
        settings_path_ = get_config_dir() + "/settings.json";
    }
}

std::string Settings::env_key(const std::string& key) {
    std::string name = "MOTUS_" + key;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return name;
}

std::string Settings::get_config_dir() const {
    const char* override_dir = std::getenv("MOTUS_CONFIG_DIR");
    if (override_dir && *override_dir) return override_dir;
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::string Settings::get_data_dir() const {
    return get_string("data_dir", xdg_dir("XDG_DATA_HOME", ".local/share"));
}

std::string Settings::get_cache_dir() const {
    return get_string("cache_dir", xdg_dir("XDG_CACHE_HOME", ".cache"));
}

std::string Settings::get_logs_dir() const {
    return get_string("logs_dir", get_cache_dir() + "/logs");
}

std::string Settings::get_database_path() const {
    return get_string("database_path", get_data_dir() + "/motus.db");
}

std::string Settings::get_log_file() const {
    return get_string("log_file", get_cache_dir() + "/motus.log");
}

std::string Settings::get_log_level() const {
    return get_string("log_level", "WARNING");
}

std::string Settings::get_rclone_path() const {
    return get_string("rclone_path");
}

std::string Settings::get_rclone_config_file() const {
    std::string configured = get_string("rclone_config_file");
    if (!configured.empty()) return configured;
    const char* rclone_config = std::getenv("RCLONE_CONFIG");
    return rclone_config ? std::string(rclone_config) : std::string();
}

std::string Settings::get_stats_interval() const {
    return get_string("stats_interval", "2s");
}

std::string Settings::get_connect_timeout() const {
    return get_string("connect_timeout", "5m");
}

int Settings::get_metadata_timeout_seconds() const {
    return get_int("metadata_timeout_seconds", 300);
}

int Settings::get_poll_interval_ms() const {
    return get_int("poll_interval_ms", 200);
}

size_t Settings::get_error_text_limit() const {
    int limit = get_int("error_text_limit", 10000);
    return limit > 0 ? static_cast<size_t>(limit) : 10000;
}

bool Settings::ensure_directories() const {
    bool ok = true;
    std::vector<std::string> dirs = {get_data_dir(), get_cache_dir()};
    std::string logs = get_logs_dir();
    if (!logs.empty()) dirs.push_back(logs);

    for (const auto& dir : dirs) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            Logger::error("[Settings] Cannot create directory " + dir + ": " + ec.message());
            ok = false;
        }
    }
    return ok;
}

void Settings::ensure_defaults() {
    // Only plain values are stored; directory defaults are derived on read
    if (settings_.find("log_level") == settings_.end())
        settings_["log_level"] = "WARNING";
    if (settings_.find("stats_interval") == settings_.end())
        settings_["stats_interval"] = "2s";
    if (settings_.find("connect_timeout") == settings_.end())
        settings_["connect_timeout"] = "5m";
    if (settings_.find("metadata_timeout_seconds") == settings_.end())
        settings_["metadata_timeout_seconds"] = "300";
    if (settings_.find("poll_interval_ms") == settings_.end())
        settings_["poll_interval_ms"] = "200";
    if (settings_.find("error_text_limit") == settings_.end())
        settings_["error_text_limit"] = "10000";
}

bool Settings::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream file(settings_path_);
    if (!file.is_open()) {
        Logger::info("[Settings] No settings file at " + settings_path_ + ", using defaults");
        ensure_defaults();
        return false;
    }

    std::string line;
    std::string content;
    while (std::getline(file, line)) {
        content += line;
    }
    file.close();

    // Flat object only: {"key": "value", "key": 12, "key": true}
    size_t pos = 0;
    while ((pos = content.find('"', pos)) != std::string::npos) {
        size_t key_start = pos + 1;
        size_t key_end = content.find('"', key_start);
        if (key_end == std::string::npos) break;

        std::string key = content.substr(key_start, key_end - key_start);

        size_t colon = content.find(':', key_end);
        if (colon == std::string::npos) break;

        size_t val_start = content.find_first_not_of(" \t\n", colon + 1);
        if (val_start == std::string::npos) break;

        std::string value;
        if (content[val_start] == '"') {
            size_t i = val_start + 1;
            for (; i < content.size() && content[i] != '"'; ++i) {
                if (content[i] == '\\' && i + 1 < content.size()) ++i;
                value += content[i];
            }
            if (i >= content.size()) break;
            pos = i + 1;
        } else {
            size_t val_end = content.find_first_of(",}", val_start);
            if (val_end == std::string::npos) val_end = content.length();
            value = content.substr(val_start, val_end - val_start);
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
                value.pop_back();
            }
            pos = val_end;
        }

        settings_[key] = value;
    }

    ensure_defaults();
    Logger::info("[Settings] Loaded " + std::to_string(settings_.size()) + " settings from " + settings_path_);
    return true;
}

bool Settings::save() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(fs::path(settings_path_).parent_path(), ec);
    if (ec) {
        Logger::error("[Settings] Cannot create settings directory: " + ec.message());
        return false;
    }

    std::ofstream file(settings_path_);
    if (!file.is_open()) {
        Logger::error("[Settings] Failed to open " + settings_path_ + " for writing");
        return false;
    }

    file << "{\n";
    bool first = true;
    for (const auto& [key, value] : settings_) {
        if (!first) file << ",\n";
        first = false;

        bool is_numeric = !value.empty() &&
            std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) || c == '-'; });
        bool is_bool = (value == "true" || value == "false");

        if (is_numeric || is_bool) {
            file << "  \"" << key << "\": " << value;
        } else {
            file << "  \"" << key << "\": \"" << json_escape(value) << "\"";
        }
    }
    file << "\n}\n";
    file.close();

    Logger::info("[Settings] Saved " + std::to_string(settings_.size()) + " settings");
    return true;
}

std::string Settings::get_string(const std::string& key, const std::string& default_value) const {
    const char* env = std::getenv(env_key(key).c_str());
    if (env && *env) {
        return env;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(key);
    if (it != settings_.end() && !it->second.empty()) {
        return it->second;
    }
    return default_value;
}

void Settings::set_string(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[key] = value;
}

int Settings::get_int(const std::string& key, int default_value) const {
    std::string value = get_string(key);
    if (value.empty()) return default_value;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        Logger::warn("[Settings] Ignoring non-numeric value for " + key + ": " + value);
        return default_value;
    }
}

void Settings::set_int(const std::string& key, int value) {
    set_string(key, std::to_string(value));
}

bool Settings::get_bool(const std::string& key, bool default_value) const {
    std::string value = get_string(key);
    if (value.empty()) return default_value;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true" || value == "1" || value == "yes";
}

void Settings::set_bool(const std::string& key, bool value) {
    set_string(key, value ? "true" : "false");
}

} // namespace motus
