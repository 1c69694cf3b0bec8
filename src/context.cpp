// src/context.cpp
// Implementation of the per-request execution context

#include "stagewise/context.hpp"
#include <algorithm>

namespace stagewise {

Context::Context(ContextOptions options)
    : Context(Utils::generate_request_id(), options) {}

Context::Context(RequestId request_id, ContextOptions options)
    : request_id_(std::move(request_id))
    , options_(options)
    , start_time_(Clock::now())
    , deadline_(start_time_ + options.max_execution_time)
    , started_at_(Utils::now_milliseconds()) {}

std::chrono::milliseconds Context::get_processing_time() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time_);
}

void Context::set_response(const Payload& response) {
    response_ = response;
    has_response_ = true;
}

void Context::add_error(const Error& error, std::exception_ptr exception) {
    CapturedError captured;
    captured.code = error.code();
    captured.category = error.category();
    captured.message = error.what();
    captured.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        error.timestamp().time_since_epoch()).count();
    captured.exception = std::move(exception);

    if (auto* stage_error = dynamic_cast<const StageMiddlewareError*>(&error)) {
        captured.stage = stage_error->stage();
        captured.middleware = stage_error->middleware();
    } else if (auto* execution_error = dynamic_cast<const ExecutionError*>(&error)) {
        captured.stage = current_stage_;
        captured.middleware = execution_error->middleware();
    } else {
        captured.stage = current_stage_;
    }

    errors_.push_back(std::move(captured));
}

// Metadata
void Context::set_metadata(const std::string& key, std::any value) {
    metadata_[key] = std::move(value);
}

std::any Context::get_metadata(const std::string& key) const {
    auto it = metadata_.find(key);
    return it != metadata_.end() ? it->second : std::any{};
}

bool Context::has_metadata(const std::string& key) const {
    return metadata_.find(key) != metadata_.end();
}

void Context::remove_metadata(const std::string& key) {
    metadata_.erase(key);
}

// Middleware-scoped store
void Context::set_scoped(const std::string& middleware, const std::string& key, std::any value) {
    scoped_[middleware][key] = std::move(value);
}

std::any Context::get_scoped(const std::string& middleware, const std::string& key) const {
    auto outer = scoped_.find(middleware);
    if (outer == scoped_.end()) {
        return std::any{};
    }
    auto inner = outer->second.find(key);
    return inner != outer->second.end() ? inner->second : std::any{};
}

bool Context::has_scoped(const std::string& middleware, const std::string& key) const {
    auto outer = scoped_.find(middleware);
    return outer != scoped_.end() && outer->second.find(key) != outer->second.end();
}

void Context::clear_scoped(const std::string& middleware) {
    scoped_.erase(middleware);
}

// Execution trace
void Context::record_middleware(const std::string& name) {
    if (options_.track_middleware) {
        middleware_chain_.push_back(name);
    }
}

void Context::record_skipped(const std::string& name) {
    if (options_.track_middleware) {
        skipped_middlewares_.push_back(name);
    }
}

void Context::record_timing(const std::string& name, std::chrono::microseconds duration) {
    if (options_.track_timings) {
        timings_[name] += duration;
    }
}

// Deadline and validity window
bool Context::is_expired() const {
    return Clock::now() >= deadline_;
}

std::chrono::milliseconds Context::remaining_time() const {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
    return std::max(remaining, std::chrono::milliseconds(0));
}

void Context::throw_if_expired() const {
    if (is_expired()) {
        throw Errors::pipeline_timeout(request_id_, options_.max_execution_time);
    }
}

bool Context::is_stale(SteadyTimePoint now) const {
    return now - start_time_ >= options_.context_timeout;
}

Payload Context::to_json() const {
    Payload errors = Payload::array();
    for (const auto& error : errors_) {
        Payload entry{
            {"code", static_cast<int>(error.code)},
            {"category", error.category},
            {"message", error.message},
            {"middleware", error.middleware},
            {"timestamp", error.timestamp}
        };
        if (error.stage) {
            entry["stage"] = Utils::stage_to_string(*error.stage);
        }
        errors.push_back(std::move(entry));
    }

    Payload timings = Payload::object();
    for (const auto& [name, duration] : timings_) {
        timings[name] = duration.count();
    }

    return Payload{
        {"request_id", request_id_},
        {"started_at", started_at_},
        {"processing_time_ms", get_processing_time().count()},
        {"current_stage", Utils::stage_to_string(current_stage_)},
        {"errors", errors},
        {"middleware_chain", middleware_chain_},
        {"skipped_middlewares", skipped_middlewares_},
        {"timings_us", timings}
    };
}

} // namespace stagewise
