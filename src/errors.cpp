// src/errors.cpp
// Implementation of error messages and factory functions

#include "stagewise/errors.hpp"
#include <sstream>

namespace stagewise {

// Error category implementation
std::string StagewiseErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::SUCCESS:
            return "Success";

        // Configuration errors (1-99)
        case ErrorCode::INVALID_CONFIG:
            return "Invalid configuration";
        case ErrorCode::INVALID_EXECUTION_BUDGET:
            return "Invalid execution time budget";
        case ErrorCode::INVALID_CONTEXT_TIMEOUT:
            return "Invalid context timeout";
        case ErrorCode::INVALID_METADATA:
            return "Invalid configuration metadata";

        // Registration errors (100-199)
        case ErrorCode::STAGE_MISMATCH:
            return "Middleware shape does not match stage";
        case ErrorCode::NULL_MIDDLEWARE:
            return "Null middleware";
        case ErrorCode::NULL_HANDLER:
            return "Null handler";

        // Validation errors (200-299)
        case ErrorCode::VALIDATION_FAILED:
            return "Request validation failed";
        case ErrorCode::INVALID_METHOD:
            return "Request method not allowed";
        case ErrorCode::MISSING_FIELD:
            return "Required request field missing";
        case ErrorCode::INVALID_REQUEST:
            return "Invalid request";

        // Execution errors (300-399)
        case ErrorCode::STAGE_MIDDLEWARE_FAILED:
            return "Stage middleware failed";
        case ErrorCode::HANDLER_CHAIN_FAILED:
            return "Handler chain failed";
        case ErrorCode::ERROR_HANDLER_FAILED:
            return "Error handler failed";
        case ErrorCode::CLEANUP_FAILED:
            return "Cleanup handler failed";

        // Unknown/Generic errors (800+)
        case ErrorCode::UNKNOWN_ERROR:
            return "Unknown error";
        case ErrorCode::OPERATION_CANCELLED:
            return "Operation cancelled";
        case ErrorCode::TIMEOUT:
            return "Operation timeout";

        default:
            return "Unknown error code";
    }
}

const StagewiseErrorCategory& stagewise_error_category() {
    static const StagewiseErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode ec) {
    return std::error_code{static_cast<int>(ec), stagewise_error_category()};
}

// Error factory functions implementation
namespace Errors {

// Configuration errors
ConfigError invalid_execution_budget(std::chrono::milliseconds budget) {
    return ConfigError(ErrorCode::INVALID_EXECUTION_BUDGET, "max_execution_time",
        "Execution budget must be between 1ms and 3600s, got: " + std::to_string(budget.count()) + "ms");
}

ConfigError invalid_context_timeout(std::chrono::milliseconds timeout,
                                    std::chrono::milliseconds budget) {
    std::ostringstream oss;
    oss << "Context timeout must be at least the execution budget (" << budget.count()
        << "ms), got: " << timeout.count() << "ms";
    return ConfigError(ErrorCode::INVALID_CONTEXT_TIMEOUT, "context_timeout", oss.str());
}

ConfigError invalid_metadata(const std::string& type_name) {
    return ConfigError(ErrorCode::INVALID_METADATA, "metadata",
        "Metadata must be a JSON object, got: " + type_name);
}

// Registration errors
RegistrationError stage_mismatch(Stage stage, const std::string& middleware, StageFamily actual) {
    return RegistrationError(ErrorCode::STAGE_MISMATCH, stage, middleware,
        "stage expects a " + Utils::stage_family_to_string(Utils::stage_family(stage)) +
        " but got a " + Utils::stage_family_to_string(actual));
}

RegistrationError null_middleware(Stage stage) {
    return RegistrationError(ErrorCode::NULL_MIDDLEWARE, stage, "<null>",
        "middleware must not be null");
}

RegistrationError null_handler() {
    return RegistrationError(ErrorCode::NULL_HANDLER, Stage::REQUEST_HANDLING, "handler",
        "terminal handler must be callable");
}

// Validation errors
ValidationError invalid_method(const std::string& method) {
    if (method.empty()) {
        return ValidationError(ErrorCode::INVALID_METHOD, "method", "Request method cannot be empty");
    }
    return ValidationError(ErrorCode::INVALID_METHOD, "method", "Method not allowed", method);
}

ValidationError missing_field(const std::string& field) {
    return ValidationError(ErrorCode::MISSING_FIELD, field, "Required field is missing");
}

ValidationError invalid_request(const std::string& reason) {
    return ValidationError(ErrorCode::INVALID_REQUEST, "request", reason);
}

// Execution errors
StageMiddlewareError stage_middleware_failed(Stage stage, const std::string& middleware,
                                             const std::string& reason, std::exception_ptr cause) {
    return StageMiddlewareError(stage, middleware, reason, std::move(cause));
}

HandlerChainError handler_chain_failed(const std::string& middleware, const std::string& reason,
                                       std::exception_ptr cause) {
    return HandlerChainError(middleware, reason, std::move(cause));
}

ErrorHandlerFailure error_handler_failed(const std::string& middleware, const std::string& reason,
                                         std::exception_ptr cause) {
    return ErrorHandlerFailure(middleware, reason, std::move(cause));
}

CleanupFailure cleanup_failed(const std::string& middleware, const std::string& reason,
                              std::exception_ptr cause) {
    return CleanupFailure(middleware, reason, std::move(cause));
}

PipelineTimeout pipeline_timeout(const RequestId& request_id, std::chrono::milliseconds budget) {
    return PipelineTimeout(request_id, budget);
}

} // namespace Errors
} // namespace stagewise
