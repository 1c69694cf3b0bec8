// include/stagewise/builtin.hpp
// Purpose: Ready-made middleware for common request pipelines
// Requests are JSON objects shaped like {"method", "path", "headers": {...}, ...}

#pragma once

#include "middleware.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace stagewise {

// PRE_PROCESSING: rejects requests with a disallowed method or missing/invalid fields
class RequestValidationMiddleware : public TransformMiddleware {
public:
    using FieldValidator = std::function<bool(const Payload&)>;

    RequestValidationMiddleware(std::vector<std::string> allowed_methods,
                                std::vector<std::string> required_fields);

    // Runs only when the field is present in the request
    void add_validator(const std::string& field, FieldValidator validator);

    Payload transform(Payload payload, Context& context) override;
    std::string get_name() const override { return "request_validation"; }

    const std::set<std::string>& allowed_methods() const noexcept { return allowed_methods_; }

private:
    std::set<std::string> allowed_methods_;
    std::vector<std::string> required_fields_;
    std::vector<std::pair<std::string, FieldValidator>> validators_;
};

// REQUEST_HANDLING: measures everything downstream
class TimingInterceptor : public Interceptor {
public:
    using Sink = std::function<void(const std::string&, std::chrono::microseconds)>;

    explicit TimingInterceptor(std::string name, Sink sink = nullptr);

    // Elapsed time lands in the scoped store under (name, "elapsed_us") and,
    // for object results, in result["timings_us"][name] unless the result
    // already carries a non-object "timings_us"
    Payload intercept(const Payload& request, Context& context, const Next& next) override;
    std::string get_name() const override { return name_; }

private:
    std::string name_;
    Sink sink_;
};

// REQUEST_HANDLING: logs request start and completion status
class LoggingInterceptor : public Interceptor {
public:
    LoggingInterceptor(std::string name, const LoggingConfig& config);

    Payload intercept(const Payload& request, Context& context, const Next& next) override;
    std::string get_name() const override { return name_; }

private:
    std::string name_;
    Utils::SystemLogger logger_;
};

// REQUEST_HANDLING: short-circuits with {"status": status} when the header is absent
class HeaderAuthInterceptor : public Interceptor {
public:
    HeaderAuthInterceptor(std::string header, int status);

    Payload intercept(const Payload& request, Context& context, const Next& next) override;
    std::string get_name() const override { return "header_auth"; }

    bool has_header(const Payload& request) const;

private:
    std::string header_;
    int status_;
};

// POST_PROCESSING: stamps the request id on object results
class RequestIdMiddleware : public TransformMiddleware {
public:
    Payload transform(Payload payload, Context& context) override;
    std::string get_name() const override { return "request_id"; }
};

// Factory for common middleware configurations
namespace MiddlewareFactory {

std::shared_ptr<RequestValidationMiddleware> create_validation_middleware(
    std::vector<std::string> allowed_methods = {"GET", "POST", "PUT", "DELETE"},
    std::vector<std::string> required_fields = {});

std::shared_ptr<TimingInterceptor> create_timing_middleware(
    const std::string& name = "timing", TimingInterceptor::Sink sink = nullptr);

std::shared_ptr<LoggingInterceptor> create_logging_middleware(
    const std::string& name = "pipeline", SystemLogLevel level = SystemLogLevel::INFO);

std::shared_ptr<HeaderAuthInterceptor> create_header_auth_middleware(
    const std::string& header = "Authorization", int status = 401);

std::shared_ptr<RequestIdMiddleware> create_request_id_middleware();

} // namespace MiddlewareFactory

} // namespace stagewise
