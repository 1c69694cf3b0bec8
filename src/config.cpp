// src/config.cpp
// Implementation of pipeline configuration with validation, env overlay and presets

#include "stagewise/config.hpp"
#include "stagewise/utils.hpp"
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace stagewise {

namespace {

constexpr std::chrono::milliseconds MAX_BUDGET{3600000}; // 1 hour

void check_budgets(std::chrono::milliseconds budget, std::chrono::milliseconds timeout) {
    if (budget.count() < 1 || budget > MAX_BUDGET) {
        throw Errors::invalid_execution_budget(budget);
    }
    if (timeout.count() < 1 || timeout < budget) {
        throw Errors::invalid_context_timeout(timeout, budget);
    }
}

void check_metadata(const Payload& metadata) {
    if (!metadata.is_object()) {
        throw Errors::invalid_metadata(metadata.type_name());
    }
}

} // namespace

// PipelineConfig implementation
PipelineConfig::PipelineConfig()
    : enable_context_tracking_(true)
    , enable_error_recovery_(true)
    , enable_performance_monitoring_(true)
    , max_execution_time_(30000)   // 30 seconds
    , context_timeout_(60000)      // 60 seconds
    , metadata_(Payload::object()) {
    logging_.level = SystemLogLevel::WARN;
    logging_.log_to_console = true;
    logging_.log_to_file = false;
}

PipelineConfig& PipelineConfig::enable_context_tracking(bool enable) {
    enable_context_tracking_ = enable;
    return *this;
}

PipelineConfig& PipelineConfig::enable_error_recovery(bool enable) {
    enable_error_recovery_ = enable;
    return *this;
}

PipelineConfig& PipelineConfig::enable_performance_monitoring(bool enable) {
    enable_performance_monitoring_ = enable;
    return *this;
}

PipelineConfig& PipelineConfig::set_max_execution_time(std::chrono::milliseconds budget) {
    max_execution_time_ = budget;
    return *this;
}

PipelineConfig& PipelineConfig::set_context_timeout(std::chrono::milliseconds timeout) {
    context_timeout_ = timeout;
    return *this;
}

PipelineConfig& PipelineConfig::set_metadata(const Payload& metadata) {
    metadata_ = metadata;
    return *this;
}

PipelineConfig& PipelineConfig::set_metadata_value(const std::string& key, const Payload& value) {
    if (!metadata_.is_object()) {
        metadata_ = Payload::object();
    }
    metadata_[key] = value;
    return *this;
}

PipelineConfig& PipelineConfig::set_system_log_level(SystemLogLevel level) {
    logging_.level = level;
    return *this;
}

PipelineConfig& PipelineConfig::set_log_to_console(bool enable) {
    logging_.log_to_console = enable;
    return *this;
}

PipelineConfig& PipelineConfig::set_log_to_file(const std::string& path) {
    logging_.log_to_file = !path.empty();
    logging_.log_file_path = path;
    return *this;
}

void PipelineConfig::validate() const {
    std::vector<std::string> errors = validation_errors();
    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Configuration validation failed:\n";
        for (const auto& error : errors) {
            oss << "  - " << error << "\n";
        }
        throw ConfigError(ErrorCode::INVALID_CONFIG, "config", oss.str());
    }
}

bool PipelineConfig::is_valid() const noexcept {
    try {
        return validation_errors().empty();
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<std::string> PipelineConfig::validation_errors() const {
    std::vector<std::string> errors;

    try {
        check_budgets(max_execution_time_, context_timeout_);
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        check_metadata(metadata_);
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    if (logging_.log_to_file && logging_.log_file_path.empty()) {
        errors.push_back(ConfigError(ErrorCode::INVALID_CONFIG, "log_file_path",
            "File logging enabled without a path").what());
    }

    return errors;
}

Payload PipelineConfig::to_json() const {
    return Payload{
        {"enable_context_tracking", enable_context_tracking_},
        {"enable_error_recovery", enable_error_recovery_},
        {"enable_performance_monitoring", enable_performance_monitoring_},
        {"max_execution_time_ms", max_execution_time_.count()},
        {"context_timeout_ms", context_timeout_.count()},
        {"metadata", metadata_},
        {"log_level", log_level_to_string(logging_.level)}
    };
}

// PipelineConfigBuilder implementation
PipelineConfigBuilder::PipelineConfigBuilder(const PipelineConfig& base) : config_(base) {}

PipelineConfigBuilder& PipelineConfigBuilder::context_tracking(bool enable) {
    config_.enable_context_tracking_ = enable;
    return *this;
}

PipelineConfigBuilder& PipelineConfigBuilder::error_recovery(bool enable) {
    config_.enable_error_recovery_ = enable;
    return *this;
}

PipelineConfigBuilder& PipelineConfigBuilder::performance_monitoring(bool enable) {
    config_.enable_performance_monitoring_ = enable;
    return *this;
}

PipelineConfigBuilder& PipelineConfigBuilder::budgets(std::chrono::milliseconds max_execution_time,
                                                      std::chrono::milliseconds context_timeout) {
    config_.max_execution_time_ = max_execution_time;
    config_.context_timeout_ = context_timeout;
    return *this;
}

PipelineConfigBuilder& PipelineConfigBuilder::metadata(const Payload& metadata) {
    config_.metadata_ = metadata;
    return *this;
}

PipelineConfigBuilder& PipelineConfigBuilder::system_logging(SystemLogLevel level, bool console) {
    config_.logging_.level = level;
    config_.logging_.log_to_console = console;
    return *this;
}

PipelineConfigBuilder& PipelineConfigBuilder::file_logging(const std::string& path) {
    config_.logging_.log_to_file = true;
    config_.logging_.log_file_path = path;
    return *this;
}

PipelineConfig PipelineConfigBuilder::build() const {
    PipelineConfig config = config_;
    config.validate(); // Ensure the built config is valid
    return config;
}

// EnvConfig implementation
PipelineConfig EnvConfig::from_environment() {
    return from_environment(PipelineConfig());
}

PipelineConfig EnvConfig::from_environment(const PipelineConfig& base) {
    PipelineConfigBuilder builder(base);

    if (auto recovery = get_error_recovery()) {
        builder.error_recovery(*recovery);
    }
    if (auto tracking = get_context_tracking()) {
        builder.context_tracking(*tracking);
    }
    if (auto monitoring = get_performance_monitoring()) {
        builder.performance_monitoring(*monitoring);
    }

    auto budget = get_max_execution_time().value_or(base.max_execution_time());
    auto timeout = get_context_timeout().value_or(base.context_timeout());
    builder.budgets(budget, timeout);

    if (auto level = get_log_level()) {
        builder.system_logging(*level, base.logging().log_to_console);
    }

    return builder.build();
}

std::optional<bool> EnvConfig::get_error_recovery() {
    return get_env_bool("STAGEWISE_ERROR_RECOVERY");
}

std::optional<bool> EnvConfig::get_context_tracking() {
    return get_env_bool("STAGEWISE_CONTEXT_TRACKING");
}

std::optional<bool> EnvConfig::get_performance_monitoring() {
    return get_env_bool("STAGEWISE_PERFORMANCE_MONITORING");
}

std::optional<std::chrono::milliseconds> EnvConfig::get_max_execution_time() {
    if (auto ms = get_env_int("STAGEWISE_MAX_EXECUTION_MS")) {
        return std::chrono::milliseconds(*ms);
    }
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> EnvConfig::get_context_timeout() {
    if (auto ms = get_env_int("STAGEWISE_CONTEXT_TIMEOUT_MS")) {
        return std::chrono::milliseconds(*ms);
    }
    return std::nullopt;
}

std::optional<SystemLogLevel> EnvConfig::get_log_level() {
    if (auto level_str = get_env("STAGEWISE_LOG_LEVEL")) {
        return string_to_log_level(*level_str);
    }
    return std::nullopt;
}

std::optional<std::string> EnvConfig::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value && std::strlen(value) > 0) {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<long long> EnvConfig::get_env_int(const std::string& name) {
    if (auto str = get_env(name)) {
        try {
            return std::stoll(*str);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> EnvConfig::get_env_bool(const std::string& name) {
    if (auto str = get_env(name)) {
        std::string lower = Utils::to_lower(Utils::trim(*str));
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    }
    return std::nullopt;
}

// Log level conversions
std::string log_level_to_string(SystemLogLevel level) {
    switch (level) {
        case SystemLogLevel::NONE: return "NONE";
        case SystemLogLevel::ERROR: return "ERROR";
        case SystemLogLevel::WARN: return "WARN";
        case SystemLogLevel::INFO: return "INFO";
        case SystemLogLevel::DEBUG: return "DEBUG";
        case SystemLogLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

std::optional<SystemLogLevel> string_to_log_level(const std::string& name) {
    std::string upper = Utils::to_upper(Utils::trim(name));

    if (upper == "NONE") return SystemLogLevel::NONE;
    if (upper == "ERROR") return SystemLogLevel::ERROR;
    if (upper == "WARN" || upper == "WARNING") return SystemLogLevel::WARN;
    if (upper == "INFO") return SystemLogLevel::INFO;
    if (upper == "DEBUG") return SystemLogLevel::DEBUG;
    if (upper == "TRACE") return SystemLogLevel::TRACE;
    return std::nullopt;
}

} // namespace stagewise
