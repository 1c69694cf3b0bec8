// include/stagewise/errors.hpp
// Purpose: Error hierarchy for the stagewise pipeline engine
// Provides typed failures for each pipeline phase plus std::error_code interop

#pragma once

#include "types.hpp"
#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>

namespace stagewise {

// Error category for stagewise errors
class StagewiseErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "stagewise";
    }

    std::string message(int ev) const override;
};

// Global error category instance
const StagewiseErrorCategory& stagewise_error_category();

// Error codes enum
enum class ErrorCode {
    // Success
    SUCCESS = 0,

    // Configuration errors (1-99)
    INVALID_CONFIG = 1,
    INVALID_EXECUTION_BUDGET = 2,
    INVALID_CONTEXT_TIMEOUT = 3,
    INVALID_METADATA = 4,

    // Registration errors (100-199)
    STAGE_MISMATCH = 100,
    NULL_MIDDLEWARE = 101,
    NULL_HANDLER = 102,

    // Validation errors (200-299)
    VALIDATION_FAILED = 200,
    INVALID_METHOD = 201,
    MISSING_FIELD = 202,
    INVALID_REQUEST = 203,

    // Execution errors (300-399)
    STAGE_MIDDLEWARE_FAILED = 300,
    HANDLER_CHAIN_FAILED = 301,
    ERROR_HANDLER_FAILED = 302,
    CLEANUP_FAILED = 303,

    // Unknown/Generic errors (800+)
    UNKNOWN_ERROR = 800,
    OPERATION_CANCELLED = 801,
    TIMEOUT = 802
};

// Create error codes
std::error_code make_error_code(ErrorCode ec);

// Base exception class for all stagewise errors
class Error : public std::exception {
public:
    explicit Error(const std::string& message)
        : message_(message)
        , error_code_(ErrorCode::UNKNOWN_ERROR)
        , timestamp_(std::chrono::system_clock::now()) {}

    Error(ErrorCode code, const std::string& message)
        : message_(message)
        , error_code_(code)
        , timestamp_(std::chrono::system_clock::now()) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    ErrorCode code() const noexcept {
        return error_code_;
    }

    std::error_code error_code() const {
        return make_error_code(error_code_);
    }

    std::chrono::system_clock::time_point timestamp() const noexcept {
        return timestamp_;
    }

    virtual std::string category() const {
        return "stagewise::Error";
    }

protected:
    std::string message_;
    ErrorCode error_code_;
    std::chrono::system_clock::time_point timestamp_;
};

// Configuration-related errors
class ConfigError : public Error {
public:
    ConfigError(ErrorCode code, const std::string& field, const std::string& message)
        : Error(code, "Configuration error in '" + field + "': " + message)
        , field_(field) {}

    const std::string& field() const noexcept {
        return field_;
    }

    std::string category() const override {
        return "stagewise::ConfigError";
    }

private:
    std::string field_;
};

// Middleware registration errors
class RegistrationError : public Error {
public:
    RegistrationError(ErrorCode code, Stage stage, const std::string& middleware,
                      const std::string& message)
        : Error(code, "Registration error for '" + middleware + "' in stage '" +
               Utils::stage_to_string(stage) + "': " + message)
        , stage_(stage)
        , middleware_(middleware) {}

    Stage stage() const noexcept {
        return stage_;
    }

    const std::string& middleware() const noexcept {
        return middleware_;
    }

    std::string category() const override {
        return "stagewise::RegistrationError";
    }

private:
    Stage stage_;
    std::string middleware_;
};

// Request validation errors (raised by validation middleware)
class ValidationError : public Error {
public:
    ValidationError(ErrorCode code, const std::string& field, const std::string& message)
        : Error(code, "Validation error in '" + field + "': " + message)
        , field_(field) {}

    ValidationError(ErrorCode code, const std::string& field, const std::string& message,
                    const std::string& value)
        : Error(code, "Validation error in '" + field + "': " + message + " (value: '" + value + "')")
        , field_(field)
        , value_(value) {}

    const std::string& field() const noexcept {
        return field_;
    }

    const std::string& value() const noexcept {
        return value_;
    }

    std::string category() const override {
        return "stagewise::ValidationError";
    }

private:
    std::string field_;
    std::string value_;
};

// Failures raised while running middleware; keeps the original exception
class ExecutionError : public Error {
public:
    ExecutionError(ErrorCode code, const std::string& middleware, const std::string& message,
                   std::exception_ptr cause)
        : Error(code, message)
        , middleware_(middleware)
        , cause_(std::move(cause)) {}

    // Name of the middleware (or "handler") the failure originated in
    const std::string& middleware() const noexcept {
        return middleware_;
    }

    std::exception_ptr cause() const noexcept {
        return cause_;
    }

    bool has_cause() const noexcept {
        return static_cast<bool>(cause_);
    }

    // Rethrows the original exception; no-op when there is none
    void rethrow_cause() const {
        if (cause_) {
            std::rethrow_exception(cause_);
        }
    }

    std::string category() const override {
        return "stagewise::ExecutionError";
    }

private:
    std::string middleware_;
    std::exception_ptr cause_;
};

// A pre- or post-processing transform failed
class StageMiddlewareError : public ExecutionError {
public:
    StageMiddlewareError(Stage stage, const std::string& middleware, const std::string& message,
                         std::exception_ptr cause = nullptr)
        : ExecutionError(ErrorCode::STAGE_MIDDLEWARE_FAILED, middleware,
                         "Middleware '" + middleware + "' failed in stage '" +
                         Utils::stage_to_string(stage) + "': " + message,
                         std::move(cause))
        , stage_(stage) {}

    Stage stage() const noexcept {
        return stage_;
    }

    std::string category() const override {
        return "stagewise::StageMiddlewareError";
    }

private:
    Stage stage_;
};

// An interceptor or the terminal handler failed inside the built chain
class HandlerChainError : public ExecutionError {
public:
    HandlerChainError(const std::string& middleware, const std::string& message,
                      std::exception_ptr cause = nullptr)
        : ExecutionError(ErrorCode::HANDLER_CHAIN_FAILED, middleware,
                         "Handler chain failed at '" + middleware + "': " + message,
                         std::move(cause)) {}

    std::string category() const override {
        return "stagewise::HandlerChainError";
    }
};

// An error handler itself failed; never propagated past the error phase
class ErrorHandlerFailure : public ExecutionError {
public:
    ErrorHandlerFailure(const std::string& middleware, const std::string& message,
                        std::exception_ptr cause = nullptr)
        : ExecutionError(ErrorCode::ERROR_HANDLER_FAILED, middleware,
                         "Error handler '" + middleware + "' failed: " + message,
                         std::move(cause)) {}

    std::string category() const override {
        return "stagewise::ErrorHandlerFailure";
    }
};

// A cleanup handler failed; never propagated past the cleanup phase
class CleanupFailure : public ExecutionError {
public:
    CleanupFailure(const std::string& middleware, const std::string& message,
                   std::exception_ptr cause = nullptr)
        : ExecutionError(ErrorCode::CLEANUP_FAILED, middleware,
                         "Cleanup handler '" + middleware + "' failed: " + message,
                         std::move(cause)) {}

    std::string category() const override {
        return "stagewise::CleanupFailure";
    }
};

// Timeout-related errors
class TimeoutError : public Error {
public:
    TimeoutError(const std::string& operation, std::chrono::milliseconds timeout)
        : Error(ErrorCode::TIMEOUT, "Operation '" + operation + "' timed out after " +
               std::to_string(timeout.count()) + "ms")
        , operation_(operation)
        , timeout_(timeout) {}

    const std::string& operation() const noexcept {
        return operation_;
    }

    std::chrono::milliseconds timeout() const noexcept {
        return timeout_;
    }

    std::string category() const override {
        return "stagewise::TimeoutError";
    }

private:
    std::string operation_;
    std::chrono::milliseconds timeout_;
};

// The whole-call execution budget of a request expired
class PipelineTimeout : public TimeoutError {
public:
    PipelineTimeout(const RequestId& request_id, std::chrono::milliseconds budget)
        : TimeoutError("execute " + request_id, budget)
        , request_id_(request_id) {}

    const RequestId& request_id() const noexcept {
        return request_id_;
    }

    std::string category() const override {
        return "stagewise::PipelineTimeout";
    }

private:
    RequestId request_id_;
};

// Error factory functions for common error scenarios
namespace Errors {

// Configuration errors
ConfigError invalid_execution_budget(std::chrono::milliseconds budget);
ConfigError invalid_context_timeout(std::chrono::milliseconds timeout,
                                    std::chrono::milliseconds budget);
ConfigError invalid_metadata(const std::string& type_name);

// Registration errors
RegistrationError stage_mismatch(Stage stage, const std::string& middleware, StageFamily actual);
RegistrationError null_middleware(Stage stage);
RegistrationError null_handler();

// Validation errors
ValidationError invalid_method(const std::string& method);
ValidationError missing_field(const std::string& field);
ValidationError invalid_request(const std::string& reason);

// Execution errors
StageMiddlewareError stage_middleware_failed(Stage stage, const std::string& middleware,
                                             const std::string& reason, std::exception_ptr cause);
HandlerChainError handler_chain_failed(const std::string& middleware, const std::string& reason,
                                       std::exception_ptr cause);
ErrorHandlerFailure error_handler_failed(const std::string& middleware, const std::string& reason,
                                         std::exception_ptr cause);
CleanupFailure cleanup_failed(const std::string& middleware, const std::string& reason,
                              std::exception_ptr cause);
PipelineTimeout pipeline_timeout(const RequestId& request_id, std::chrono::milliseconds budget);

} // namespace Errors

} // namespace stagewise

// Enable std::error_code support
namespace std {
template <>
struct is_error_code_enum<stagewise::ErrorCode> : true_type {};
}
