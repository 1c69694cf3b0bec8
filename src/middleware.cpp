// src/middleware.cpp
// Implementation of middleware variant helpers and adapter factories

#include "stagewise/middleware.hpp"

namespace stagewise {

StageFamily middleware_family(const Middleware& middleware) {
    switch (middleware.index()) {
        case 0: return StageFamily::TRANSFORM;
        case 1: return StageFamily::INTERCEPTOR;
        case 2: return StageFamily::ERROR_HANDLER;
        default: return StageFamily::CLEANUP;
    }
}

MiddlewareBase* middleware_base(const Middleware& middleware) {
    return std::visit([](const auto& ptr) -> MiddlewareBase* { return ptr.get(); }, middleware);
}

bool is_null(const Middleware& middleware) {
    return middleware_base(middleware) == nullptr;
}

std::string middleware_name(const Middleware& middleware) {
    MiddlewareBase* base = middleware_base(middleware);
    return base ? base->get_name() : "<null>";
}

std::shared_ptr<TransformMiddleware> make_transform(const std::string& name, FunctionTransform::Fn fn) {
    return std::make_shared<FunctionTransform>(name, std::move(fn));
}

std::shared_ptr<Interceptor> make_interceptor(const std::string& name, FunctionInterceptor::Fn fn) {
    return std::make_shared<FunctionInterceptor>(name, std::move(fn));
}

std::shared_ptr<ErrorHandler> make_error_handler(const std::string& name, FunctionErrorHandler::Fn fn) {
    return std::make_shared<FunctionErrorHandler>(name, std::move(fn));
}

std::shared_ptr<CleanupHandler> make_cleanup(const std::string& name, FunctionCleanup::Fn fn) {
    return std::make_shared<FunctionCleanup>(name, std::move(fn));
}

} // namespace stagewise
