// src/utils.cpp
// Implementation of utility functions, the system logger and scoped timing

#include "stagewise/utils.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace stagewise {
namespace Utils {

// String utilities
std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::toupper);
    return result;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            oss << separator;
        }
        oss << parts[i];
    }
    return oss.str();
}

// Time utilities
std::string timestamp_to_iso8601(Timestamp timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    auto ms = timestamp_ms % 1000;

    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &seconds);
#else
    gmtime_r(&seconds, &tm_utc);
#endif

    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms << "Z";
    return ss.str();
}

std::string current_iso8601_timestamp() {
    return timestamp_to_iso8601(now_milliseconds());
}

// SystemLogger implementation
SystemLogger::SystemLogger(const LoggingConfig& config) : config_(config) {
    if (config_.log_to_file && !config_.log_file_path.empty()) {
        file_.open(config_.log_file_path, std::ios::out | std::ios::app);
        if (!file_.is_open() && config_.log_to_console) {
            std::cerr << "Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

SystemLogger::~SystemLogger() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void SystemLogger::error(const std::string& component, const std::string& message) const {
    log(SystemLogLevel::ERROR, component, message);
}

void SystemLogger::warn(const std::string& component, const std::string& message) const {
    log(SystemLogLevel::WARN, component, message);
}

void SystemLogger::info(const std::string& component, const std::string& message) const {
    log(SystemLogLevel::INFO, component, message);
}

void SystemLogger::debug(const std::string& component, const std::string& message) const {
    log(SystemLogLevel::DEBUG, component, message);
}

void SystemLogger::trace(const std::string& component, const std::string& message) const {
    log(SystemLogLevel::TRACE, component, message);
}

bool SystemLogger::should_log(SystemLogLevel level) const noexcept {
    return level != SystemLogLevel::NONE &&
           static_cast<uint8_t>(level) <= static_cast<uint8_t>(config_.level);
}

void SystemLogger::log(SystemLogLevel level, const std::string& component,
                       const std::string& message) const {
    if (!should_log(level)) {
        return;
    }

    std::ostringstream line;
    line << "[" << current_iso8601_timestamp() << "] "
         << "[" << log_level_to_string(level) << "] "
         << "[" << component << "] " << message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.log_to_console) {
        std::cerr << line.str() << std::endl;
    }
    if (file_.is_open()) {
        file_ << line.str() << '\n';
    }
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(Duration& output)
    : start_time_(Clock::now()), output_(&output), callback_(nullptr) {}

ScopedTimer::ScopedTimer(std::function<void(Duration)> callback)
    : start_time_(Clock::now()), output_(nullptr), callback_(std::move(callback)) {}

ScopedTimer::~ScopedTimer() {
    Duration elapsed_time = std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
    if (output_) {
        *output_ = elapsed_time;
    }
    if (callback_) {
        callback_(elapsed_time);
    }
}

ScopedTimer::Duration ScopedTimer::elapsed() const {
    return std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
}

} // namespace Utils
} // namespace stagewise
