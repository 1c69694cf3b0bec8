// include/stagewise/utils.hpp
// Purpose: Utility functions and helpers for the stagewise pipeline engine
// Provides string/time helpers, the internal system logger and scoped timing

#pragma once

#include "types.hpp"
#include "config.hpp"
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace stagewise {
namespace Utils {

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Time utilities
std::string timestamp_to_iso8601(Timestamp timestamp_ms);
std::string current_iso8601_timestamp();

// Engine-internal logger; one instance per Pipeline
class SystemLogger {
public:
    explicit SystemLogger(const LoggingConfig& config);
    ~SystemLogger();

    SystemLogger(const SystemLogger&) = delete;
    SystemLogger& operator=(const SystemLogger&) = delete;

    void error(const std::string& component, const std::string& message) const;
    void warn(const std::string& component, const std::string& message) const;
    void info(const std::string& component, const std::string& message) const;
    void debug(const std::string& component, const std::string& message) const;
    void trace(const std::string& component, const std::string& message) const;

    void log(SystemLogLevel level, const std::string& component, const std::string& message) const;
    bool should_log(SystemLogLevel level) const noexcept;
    SystemLogLevel level() const noexcept { return config_.level; }

private:
    LoggingConfig config_;
    mutable std::mutex mutex_;
    mutable std::ofstream file_;
};

// RAII timer for performance measurement
class ScopedTimer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::microseconds;

    explicit ScopedTimer(Duration& output);
    explicit ScopedTimer(std::function<void(Duration)> callback);
    ~ScopedTimer();

    Duration elapsed() const;

private:
    TimePoint start_time_;
    Duration* output_;
    std::function<void(Duration)> callback_;
};

} // namespace Utils
} // namespace stagewise
