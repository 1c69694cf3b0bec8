// include/stagewise/conditional.hpp
// Purpose: Interceptor gated by a request predicate

#pragma once

#include "middleware.hpp"
#include <functional>
#include <memory>

namespace stagewise {

class ConditionalInterceptor : public Interceptor {
public:
    using Predicate = std::function<bool(const Payload&)>;

    ConditionalInterceptor(Predicate predicate, std::shared_ptr<Interceptor> inner);

    // Delegates to the inner interceptor when the predicate holds, otherwise calls next directly
    Payload intercept(const Payload& request, Context& context, const Next& next) override;

    std::string get_name() const override;
    void initialize() override;
    void shutdown() override;

    const std::shared_ptr<Interceptor>& inner() const noexcept { return inner_; }

private:
    Predicate predicate_;
    std::shared_ptr<Interceptor> inner_;
};

std::shared_ptr<Interceptor> conditional(ConditionalInterceptor::Predicate predicate,
                                         std::shared_ptr<Interceptor> inner);

} // namespace stagewise
