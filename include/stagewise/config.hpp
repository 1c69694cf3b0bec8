// include/stagewise/config.hpp
// Purpose: Configuration system for the stagewise pipeline engine
// Execution policies are fixed once a Pipeline is constructed

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace stagewise {

// Logging configuration (for engine internal logging)
enum class SystemLogLevel : uint8_t {
    NONE = 0,       // No engine logging
    ERROR = 1,      // Only errors
    WARN = 2,       // Warnings and errors
    INFO = 3,       // Informational + above
    DEBUG = 4,      // Debug + above
    TRACE = 5       // Everything
};

struct LoggingConfig {
    SystemLogLevel level = SystemLogLevel::WARN;
    bool log_to_console = true;
    bool log_to_file = false;
    std::string log_file_path;
};

// Execution policies for one Pipeline
class PipelineConfig {
public:
    PipelineConfig();

    PipelineConfig(const PipelineConfig& other) = default;
    PipelineConfig& operator=(const PipelineConfig& other) = default;
    PipelineConfig(PipelineConfig&& other) noexcept = default;
    PipelineConfig& operator=(PipelineConfig&& other) noexcept = default;

    // Getters
    bool context_tracking() const noexcept { return enable_context_tracking_; }
    bool error_recovery() const noexcept { return enable_error_recovery_; }
    bool performance_monitoring() const noexcept { return enable_performance_monitoring_; }
    std::chrono::milliseconds max_execution_time() const noexcept { return max_execution_time_; }
    std::chrono::milliseconds context_timeout() const noexcept { return context_timeout_; }
    const Payload& metadata() const noexcept { return metadata_; }
    const LoggingConfig& logging() const noexcept { return logging_; }

    // Setters (fluent interface)
    PipelineConfig& enable_context_tracking(bool enable = true);
    PipelineConfig& enable_error_recovery(bool enable = true);
    PipelineConfig& enable_performance_monitoring(bool enable = true);
    PipelineConfig& set_max_execution_time(std::chrono::milliseconds budget);
    PipelineConfig& set_context_timeout(std::chrono::milliseconds timeout);
    PipelineConfig& set_metadata(const Payload& metadata);
    PipelineConfig& set_metadata_value(const std::string& key, const Payload& value);
    PipelineConfig& set_system_log_level(SystemLogLevel level);
    PipelineConfig& set_log_to_console(bool enable);
    PipelineConfig& set_log_to_file(const std::string& path);

    // Validation
    void validate() const;
    bool is_valid() const noexcept;
    std::vector<std::string> validation_errors() const;

    // Snapshot for introspection
    Payload to_json() const;

    friend class PipelineConfigBuilder;

private:
    bool enable_context_tracking_;
    bool enable_error_recovery_;
    bool enable_performance_monitoring_;
    std::chrono::milliseconds max_execution_time_;
    std::chrono::milliseconds context_timeout_;
    Payload metadata_;
    LoggingConfig logging_;
};

// Configuration builder; build() validates
class PipelineConfigBuilder {
public:
    PipelineConfigBuilder() = default;
    explicit PipelineConfigBuilder(const PipelineConfig& base);

    PipelineConfigBuilder& context_tracking(bool enable);
    PipelineConfigBuilder& error_recovery(bool enable);
    PipelineConfigBuilder& performance_monitoring(bool enable);
    PipelineConfigBuilder& budgets(std::chrono::milliseconds max_execution_time,
                                   std::chrono::milliseconds context_timeout);
    PipelineConfigBuilder& metadata(const Payload& metadata);
    PipelineConfigBuilder& system_logging(SystemLogLevel level, bool console = true);
    PipelineConfigBuilder& file_logging(const std::string& path);

    PipelineConfig build() const;

private:
    PipelineConfig config_;
};

// Environment variable configuration loader
class EnvConfig {
public:
    // Overlays STAGEWISE_* variables on top of the defaults
    // STAGEWISE_ERROR_RECOVERY, STAGEWISE_MAX_EXECUTION_MS, STAGEWISE_LOG_LEVEL, etc.
    static PipelineConfig from_environment();
    static PipelineConfig from_environment(const PipelineConfig& base);

    static std::optional<bool> get_error_recovery();
    static std::optional<bool> get_context_tracking();
    static std::optional<bool> get_performance_monitoring();
    static std::optional<std::chrono::milliseconds> get_max_execution_time();
    static std::optional<std::chrono::milliseconds> get_context_timeout();
    static std::optional<SystemLogLevel> get_log_level();

private:
    static std::optional<std::string> get_env(const std::string& name);
    static std::optional<long long> get_env_int(const std::string& name);
    static std::optional<bool> get_env_bool(const std::string& name);
};

// Log level conversions
std::string log_level_to_string(SystemLogLevel level);
std::optional<SystemLogLevel> string_to_log_level(const std::string& name);

// Configuration presets namespace
namespace Presets {

// Development configuration - verbose logging, short budgets, full tracing
inline PipelineConfig development() {
    return PipelineConfigBuilder()
        .context_tracking(true)
        .error_recovery(true)
        .performance_monitoring(true)
        .budgets(std::chrono::milliseconds(10000), std::chrono::milliseconds(20000))
        .system_logging(SystemLogLevel::DEBUG)
        .build();
}

// Production configuration - recovery on, tracing off, quiet logging
inline PipelineConfig production() {
    return PipelineConfigBuilder()
        .context_tracking(false)
        .error_recovery(true)
        .performance_monitoring(true)
        .budgets(std::chrono::milliseconds(30000), std::chrono::milliseconds(60000))
        .system_logging(SystemLogLevel::ERROR)
        .build();
}

// Strict configuration - every failure propagates to the caller
inline PipelineConfig strict() {
    return PipelineConfigBuilder()
        .context_tracking(true)
        .error_recovery(false)
        .performance_monitoring(false)
        .budgets(std::chrono::milliseconds(5000), std::chrono::milliseconds(10000))
        .system_logging(SystemLogLevel::WARN)
        .build();
}

} // namespace Presets

} // namespace stagewise
