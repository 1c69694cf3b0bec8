// include/stagewise/registry.hpp
// Purpose: Ordered per-stage middleware collections
// Populated during setup; read without locking once traffic starts

#pragma once

#include "middleware.hpp"
#include <array>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace stagewise {

class StageRegistry {
public:
    using Transforms = std::vector<std::shared_ptr<TransformMiddleware>>;
    using Interceptors = std::vector<std::shared_ptr<Interceptor>>;
    using ErrorHandlers = std::vector<std::shared_ptr<ErrorHandler>>;
    using CleanupHandlers = std::vector<std::shared_ptr<CleanupHandler>>;

    // Appends to the stage's list; throws RegistrationError on a null value
    // or on a shape the stage cannot run
    void register_middleware(Stage stage, const Middleware& middleware);

    // Typed accessors, in registration order
    const Transforms& transforms(Stage stage) const;
    const Interceptors& interceptors() const noexcept { return interceptors_; }
    const ErrorHandlers& error_handlers() const noexcept { return error_handlers_; }
    const CleanupHandlers& cleanup_handlers() const noexcept { return cleanup_handlers_; }

    size_t count(Stage stage) const;
    std::array<size_t, STAGE_COUNT> counts() const;
    std::vector<std::string> names(Stage stage) const;
    size_t total() const;

    // Visit every registered middleware, stage by stage
    void for_each(const std::function<void(Stage, MiddlewareBase&)>& visitor) const;

private:
    Transforms pre_processing_;
    Interceptors interceptors_;
    Transforms post_processing_;
    ErrorHandlers error_handlers_;
    CleanupHandlers cleanup_handlers_;
};

} // namespace stagewise
