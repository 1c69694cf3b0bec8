// src/conditional.cpp
// Implementation of the predicate-gated interceptor

#include "stagewise/conditional.hpp"

namespace stagewise {

ConditionalInterceptor::ConditionalInterceptor(Predicate predicate, std::shared_ptr<Interceptor> inner)
    : predicate_(std::move(predicate)), inner_(std::move(inner)) {
    if (!inner_) {
        throw Errors::null_middleware(Stage::REQUEST_HANDLING);
    }
    if (!predicate_) {
        throw RegistrationError(ErrorCode::NULL_MIDDLEWARE, Stage::REQUEST_HANDLING,
                                get_name(), "predicate must be callable");
    }
}

Payload ConditionalInterceptor::intercept(const Payload& request, Context& context, const Next& next) {
    if (predicate_(request)) {
        return inner_->intercept(request, context, next);
    }
    context.record_skipped(inner_->get_name());
    return next(request);
}

std::string ConditionalInterceptor::get_name() const {
    return "conditional(" + inner_->get_name() + ")";
}

void ConditionalInterceptor::initialize() {
    inner_->initialize();
}

void ConditionalInterceptor::shutdown() {
    inner_->shutdown();
}

std::shared_ptr<Interceptor> conditional(ConditionalInterceptor::Predicate predicate,
                                         std::shared_ptr<Interceptor> inner) {
    return std::make_shared<ConditionalInterceptor>(std::move(predicate), std::move(inner));
}

} // namespace stagewise
