// src/builtin.cpp
// Implementation of the built-in middleware

#include "stagewise/builtin.hpp"

namespace stagewise {

// RequestValidationMiddleware implementation
RequestValidationMiddleware::RequestValidationMiddleware(std::vector<std::string> allowed_methods,
                                                         std::vector<std::string> required_fields)
    : required_fields_(std::move(required_fields)) {
    for (const auto& method : allowed_methods) {
        allowed_methods_.insert(Utils::to_upper(Utils::trim(method)));
    }
}

void RequestValidationMiddleware::add_validator(const std::string& field, FieldValidator validator) {
    validators_.emplace_back(field, std::move(validator));
}

Payload RequestValidationMiddleware::transform(Payload payload, Context& /*context*/) {
    if (!payload.is_object()) {
        throw Errors::invalid_request(std::string("Request must be an object, got: ") + payload.type_name());
    }

    for (const auto& field : required_fields_) {
        if (!payload.contains(field) || payload[field].is_null()) {
            throw Errors::missing_field(field);
        }
    }

    auto method = payload.find("method");
    if (method != payload.end()) {
        if (!method->is_string()) {
            throw Errors::invalid_method(method->dump());
        }
        std::string name = method->get<std::string>();
        if (allowed_methods_.count(Utils::to_upper(name)) == 0) {
            throw Errors::invalid_method(name);
        }
    }

    for (const auto& [field, validator] : validators_) {
        auto value = payload.find(field);
        if (value != payload.end() && !validator(*value)) {
            throw ValidationError(ErrorCode::VALIDATION_FAILED, field, "Validation failed", value->dump());
        }
    }

    return payload;
}

// TimingInterceptor implementation
TimingInterceptor::TimingInterceptor(std::string name, Sink sink)
    : name_(std::move(name)), sink_(std::move(sink)) {}

Payload TimingInterceptor::intercept(const Payload& request, Context& context, const Next& next) {
    Utils::ScopedTimer::Duration elapsed{0};
    Payload result;
    {
        Utils::ScopedTimer timer(elapsed);
        result = next(request);
    }

    context.set_scoped(name_, "elapsed_us", static_cast<int64_t>(elapsed.count()));
    // A handler-owned "timings_us" of another type is left untouched
    if (result.is_object()) {
        auto timings = result.find("timings_us");
        if (timings == result.end() || timings->is_null()) {
            result["timings_us"] = Payload::object();
            timings = result.find("timings_us");
        }
        if (timings->is_object()) {
            (*timings)[name_] = elapsed.count();
        }
    }
    if (sink_) {
        sink_(name_, elapsed);
    }
    return result;
}

// LoggingInterceptor implementation
LoggingInterceptor::LoggingInterceptor(std::string name, const LoggingConfig& config)
    : name_(std::move(name)), logger_(config) {}

Payload LoggingInterceptor::intercept(const Payload& request, Context& context, const Next& next) {
    std::string method = "UNKNOWN";
    std::string path = "/";
    if (request.is_object()) {
        method = request.value("method", method);
        path = request.value("path", path);
    }

    logger_.info(name_, "Processing request " + context.request_id() + ": " + method + " " + path);

    Payload response = next(request);

    int status = 200;
    if (response.is_object() && response.contains("status") && response["status"].is_number_integer()) {
        status = response["status"].get<int>();
    }
    logger_.info(name_, "Request " + context.request_id() + " completed with status: " +
                 std::to_string(status));
    return response;
}

// HeaderAuthInterceptor implementation
HeaderAuthInterceptor::HeaderAuthInterceptor(std::string header, int status)
    : header_(Utils::to_lower(std::move(header))), status_(status) {}

bool HeaderAuthInterceptor::has_header(const Payload& request) const {
    if (!request.is_object()) {
        return false;
    }
    auto headers = request.find("headers");
    if (headers == request.end() || !headers->is_object()) {
        return false;
    }
    // Header names compare case-insensitively
    for (auto it = headers->begin(); it != headers->end(); ++it) {
        if (Utils::to_lower(it.key()) == header_ && !it.value().is_null()) {
            return true;
        }
    }
    return false;
}

Payload HeaderAuthInterceptor::intercept(const Payload& request, Context& context, const Next& next) {
    if (!has_header(request)) {
        context.set_scoped(get_name(), "rejected", true);
        return Payload{{"status", status_}};
    }
    return next(request);
}

// RequestIdMiddleware implementation
Payload RequestIdMiddleware::transform(Payload payload, Context& context) {
    if (payload.is_object() && !payload.contains("request_id")) {
        payload["request_id"] = context.request_id();
    }
    return payload;
}

// Factory functions
namespace MiddlewareFactory {

std::shared_ptr<RequestValidationMiddleware> create_validation_middleware(
    std::vector<std::string> allowed_methods, std::vector<std::string> required_fields) {
    return std::make_shared<RequestValidationMiddleware>(std::move(allowed_methods),
                                                         std::move(required_fields));
}

std::shared_ptr<TimingInterceptor> create_timing_middleware(const std::string& name,
                                                            TimingInterceptor::Sink sink) {
    return std::make_shared<TimingInterceptor>(name, std::move(sink));
}

std::shared_ptr<LoggingInterceptor> create_logging_middleware(const std::string& name,
                                                              SystemLogLevel level) {
    LoggingConfig config;
    config.level = level;
    config.log_to_console = true;
    return std::make_shared<LoggingInterceptor>(name, config);
}

std::shared_ptr<HeaderAuthInterceptor> create_header_auth_middleware(const std::string& header,
                                                                     int status) {
    return std::make_shared<HeaderAuthInterceptor>(header, status);
}

std::shared_ptr<RequestIdMiddleware> create_request_id_middleware() {
    return std::make_shared<RequestIdMiddleware>();
}

} // namespace MiddlewareFactory

} // namespace stagewise
