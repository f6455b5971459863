#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace motus {

LogLevel Logger::current_level = LogLevel::INFO;
std::ofstream Logger::log_file;
std::mutex Logger::log_mutex;

void Logger::init(LogLevel level, const std::string& log_file_path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
    if (log_file.is_open()) {
        log_file.close();
    }
    if (!log_file_path.empty()) {
        log_file.open(log_file_path, std::ios::app);
        if (!log_file.is_open()) {
            std::cerr << "[Logger] Cannot open log file " << log_file_path
                      << ", logging to console only" << std::endl;
        }
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "error" || lowered == "critical") return LogLevel::ERROR;
    return LogLevel::WARN;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < current_level) return;

    // Timestamp
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::string level_str;
    switch (level) {
        case LogLevel::DEBUG: level_str = "[DEBUG]"; break;
        case LogLevel::INFO:  level_str = "[INFO] "; break;
        case LogLevel::WARN:  level_str = "[WARN] "; break;
        case LogLevel::ERROR: level_str = "[ERROR]"; break;
    }

    if (log_file.is_open()) {
        log_file << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
                 << " " << level_str << " " << message << std::endl;
    }

    std::cout << std::put_time(&local_tm, "%H:%M:%S")
              << " " << level_str << " " << message << std::endl;
}

} // namespace motus
