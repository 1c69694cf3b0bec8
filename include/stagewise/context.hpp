// include/stagewise/context.hpp
// Purpose: Per-request execution context shared by every middleware of one execute() call
// Carries identity, timing, the deadline, captured errors, metadata and a middleware-scoped store

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <any>
#include <chrono>
#include <exception>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stagewise {

// Per-context limits and tracing switches derived from PipelineConfig
struct ContextOptions {
    std::chrono::milliseconds max_execution_time{30000};
    std::chrono::milliseconds context_timeout{60000};
    bool track_middleware = true;   // middleware_chain / skipped_middlewares
    bool track_timings = true;      // per-middleware durations
};

// An error recorded while the request was being processed
struct CapturedError {
    ErrorCode code = ErrorCode::UNKNOWN_ERROR;
    std::string category;
    std::string message;
    std::optional<Stage> stage;
    std::string middleware;
    Timestamp timestamp = 0;
    std::exception_ptr exception;
};

class Context {
public:
    using Clock = SteadyClock;

    explicit Context(ContextOptions options = {});
    Context(RequestId request_id, ContextOptions options);

    // Non-copyable; one instance per execute() call
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    // Identity and timing
    const RequestId& request_id() const noexcept { return request_id_; }
    SteadyTimePoint start_time() const noexcept { return start_time_; }
    Timestamp started_at() const noexcept { return started_at_; }
    std::chrono::milliseconds get_processing_time() const;

    // Request / response
    const Payload& request() const noexcept { return request_; }
    void set_request(const Payload& request) { request_ = request; }
    const Payload& response() const noexcept { return response_; }
    bool has_response() const noexcept { return has_response_; }
    void set_response(const Payload& response);

    Stage current_stage() const noexcept { return current_stage_; }
    void set_current_stage(Stage stage) noexcept { current_stage_ = stage; }

    // Error accumulation
    void add_error(const Error& error, std::exception_ptr exception = nullptr);
    const std::vector<CapturedError>& errors() const noexcept { return errors_; }
    bool has_errors() const noexcept { return !errors_.empty(); }
    size_t error_count() const noexcept { return errors_.size(); }

    // General metadata (for middleware communication)
    void set_metadata(const std::string& key, std::any value);
    std::any get_metadata(const std::string& key) const;
    bool has_metadata(const std::string& key) const;
    void remove_metadata(const std::string& key);

    template<typename T>
    std::optional<T> get_metadata_as(const std::string& key) const {
        auto it = metadata_.find(key);
        if (it == metadata_.end()) {
            return std::nullopt;
        }
        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

    // Middleware-scoped store, keyed by (middleware name, key)
    void set_scoped(const std::string& middleware, const std::string& key, std::any value);
    std::any get_scoped(const std::string& middleware, const std::string& key) const;
    bool has_scoped(const std::string& middleware, const std::string& key) const;
    void clear_scoped(const std::string& middleware);

    template<typename T>
    std::optional<T> get_scoped_as(const std::string& middleware, const std::string& key) const {
        std::any value = get_scoped(middleware, key);
        if (const T* typed = std::any_cast<T>(&value)) {
            return *typed;
        }
        return std::nullopt;
    }

    // Execution trace
    void record_middleware(const std::string& name);
    void record_skipped(const std::string& name);
    void record_timing(const std::string& name, std::chrono::microseconds duration);
    const std::vector<std::string>& middleware_chain() const noexcept { return middleware_chain_; }
    const std::vector<std::string>& skipped_middlewares() const noexcept { return skipped_middlewares_; }
    const std::map<std::string, std::chrono::microseconds>& timings() const noexcept { return timings_; }

    // Deadline and validity window
    SteadyTimePoint deadline() const noexcept { return deadline_; }
    std::chrono::milliseconds max_execution_time() const noexcept { return options_.max_execution_time; }
    bool is_expired() const;
    std::chrono::milliseconds remaining_time() const;
    void throw_if_expired() const;
    bool is_stale(SteadyTimePoint now = Clock::now()) const;

    // Summary for logs and diagnostics
    Payload to_json() const;

private:
    RequestId request_id_;
    ContextOptions options_;
    SteadyTimePoint start_time_;
    SteadyTimePoint deadline_;
    Timestamp started_at_;

    Payload request_;
    Payload response_;
    bool has_response_ = false;
    Stage current_stage_ = Stage::PRE_PROCESSING;

    std::vector<CapturedError> errors_;
    std::unordered_map<std::string, std::any> metadata_;
    std::unordered_map<std::string, std::unordered_map<std::string, std::any>> scoped_;

    std::vector<std::string> middleware_chain_;
    std::vector<std::string> skipped_middlewares_;
    std::map<std::string, std::chrono::microseconds> timings_;
};

} // namespace stagewise
