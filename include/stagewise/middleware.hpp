// include/stagewise/middleware.hpp
// Purpose: The four middleware shapes and the function adapters that build them
// Each stage accepts exactly one shape; see Utils::stage_family()

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "context.hpp"
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>

namespace stagewise {

// Continuation handed to an interceptor; calling it runs the rest of the chain
using Next = std::function<Payload(const Payload&)>;

// Terminal request handler at the core of the chain
using Handler = std::function<Payload(const Payload&)>;

// Common base for every middleware shape
class MiddlewareBase {
public:
    virtual ~MiddlewareBase() = default;

    // Middleware identification
    virtual std::string get_name() const = 0;

    // Lifecycle
    virtual void initialize() {}
    virtual void shutdown() {}
};

// PRE_PROCESSING / POST_PROCESSING: payload in, payload out
class TransformMiddleware : public MiddlewareBase {
public:
    virtual Payload transform(Payload payload, Context& context) = 0;
};

// REQUEST_HANDLING: wraps everything downstream; may return without calling next
class Interceptor : public MiddlewareBase {
public:
    virtual Payload intercept(const Payload& request, Context& context, const Next& next) = 0;
};

// ERROR_HANDLING: observes the failure, best effort
class ErrorHandler : public MiddlewareBase {
public:
    virtual void handle_error(const Error& error, Context& context) = 0;
};

// CLEANUP: always runs, best effort
class CleanupHandler : public MiddlewareBase {
public:
    virtual void cleanup(Context& context) = 0;
};

// Tagged union over the four shapes
using Middleware = std::variant<
    std::shared_ptr<TransformMiddleware>,
    std::shared_ptr<Interceptor>,
    std::shared_ptr<ErrorHandler>,
    std::shared_ptr<CleanupHandler>
>;

// Shape and name of a middleware value
StageFamily middleware_family(const Middleware& middleware);
std::string middleware_name(const Middleware& middleware);
bool is_null(const Middleware& middleware);
MiddlewareBase* middleware_base(const Middleware& middleware);

// Function adapters
class FunctionTransform : public TransformMiddleware {
public:
    using Fn = std::function<Payload(Payload, Context&)>;

    FunctionTransform(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    Payload transform(Payload payload, Context& context) override {
        return fn_(std::move(payload), context);
    }

    std::string get_name() const override { return name_; }

private:
    std::string name_;
    Fn fn_;
};

class FunctionInterceptor : public Interceptor {
public:
    using Fn = std::function<Payload(const Payload&, Context&, const Next&)>;

    FunctionInterceptor(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    Payload intercept(const Payload& request, Context& context, const Next& next) override {
        return fn_(request, context, next);
    }

    std::string get_name() const override { return name_; }

private:
    std::string name_;
    Fn fn_;
};

class FunctionErrorHandler : public ErrorHandler {
public:
    using Fn = std::function<void(const Error&, Context&)>;

    FunctionErrorHandler(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    void handle_error(const Error& error, Context& context) override {
        fn_(error, context);
    }

    std::string get_name() const override { return name_; }

private:
    std::string name_;
    Fn fn_;
};

class FunctionCleanup : public CleanupHandler {
public:
    using Fn = std::function<void(Context&)>;

    FunctionCleanup(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    void cleanup(Context& context) override {
        fn_(context);
    }

    std::string get_name() const override { return name_; }

private:
    std::string name_;
    Fn fn_;
};

// Factory functions
std::shared_ptr<TransformMiddleware> make_transform(const std::string& name, FunctionTransform::Fn fn);
std::shared_ptr<Interceptor> make_interceptor(const std::string& name, FunctionInterceptor::Fn fn);
std::shared_ptr<ErrorHandler> make_error_handler(const std::string& name, FunctionErrorHandler::Fn fn);
std::shared_ptr<CleanupHandler> make_cleanup(const std::string& name, FunctionCleanup::Fn fn);

// A middleware bound to the stage it should be registered in
struct StagedMiddleware {
    Stage stage;
    Middleware middleware;
};

// Build the adapter matching the callable's signature and tag it with a stage.
// The stage/shape pairing is checked again at registration.
template<typename Fn>
StagedMiddleware make_middleware(Stage stage, const std::string& name, Fn&& fn) {
    if constexpr (std::is_invocable_r_v<Payload, Fn, const Payload&, Context&, const Next&>) {
        return {stage, make_interceptor(name, std::forward<Fn>(fn))};
    } else if constexpr (std::is_invocable_r_v<Payload, Fn, Payload, Context&>) {
        return {stage, make_transform(name, std::forward<Fn>(fn))};
    } else if constexpr (std::is_invocable_v<Fn, const Error&, Context&>) {
        return {stage, make_error_handler(name, std::forward<Fn>(fn))};
    } else {
        static_assert(std::is_invocable_v<Fn, Context&>,
                      "callable does not match any middleware shape");
        return {stage, make_cleanup(name, std::forward<Fn>(fn))};
    }
}

} // namespace stagewise
