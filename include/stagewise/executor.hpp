// include/stagewise/executor.hpp
// Purpose: Stage execution models
// TransformExecutor runs PRE/POST_PROCESSING sequentially; ChainBuilder folds
// REQUEST_HANDLING interceptors around the terminal handler

#pragma once

#include "config.hpp"
#include "context.hpp"
#include "middleware.hpp"
#include "observability.hpp"
#include "registry.hpp"
#include "utils.hpp"
#include <optional>
#include <string>

namespace stagewise {

// Collaborators every execution model needs; all references outlive execute()
struct ExecutionEnvironment {
    const PipelineConfig& config;
    const Utils::SystemLogger& logger;
    MetricsRegistry& metrics;
};

// RAII record of one middleware invocation: trace entry on construction,
// timing and histograms on destruction when performance monitoring is on.
// For interceptors the measured time includes everything downstream.
class MiddlewareRun {
public:
    MiddlewareRun(const ExecutionEnvironment& env, Stage stage, const std::string& name,
                  Context& context, bool trace = true);

    MiddlewareRun(const MiddlewareRun&) = delete;
    MiddlewareRun& operator=(const MiddlewareRun&) = delete;

private:
    std::optional<Utils::ScopedTimer> timer_;
};

class TransformExecutor {
public:
    explicit TransformExecutor(const ExecutionEnvironment& env) : env_(env) {}

    // Threads the payload through each transform in order. A failing transform
    // is recorded as StageMiddlewareError; with recovery on the payload from
    // before it carries on, otherwise the error propagates. A ValidationError
    // always propagates.
    Payload run(Stage stage, const StageRegistry::Transforms& transforms,
                Payload payload, Context& context) const;

private:
    void handle_failure(Stage stage, const std::string& middleware, const std::string& reason,
                        std::exception_ptr cause, Context& context, bool halt = false) const;

    ExecutionEnvironment env_;
};

class ChainBuilder {
public:
    explicit ChainBuilder(const ExecutionEnvironment& env) : env_(env) {}

    // Right fold: wrapped = H; wrapped = bind(Mi, wrapped) for i = n..1.
    // The returned callable borrows context and must not outlive it.
    Handler build(const StageRegistry::Interceptors& interceptors, Handler handler,
                  Context& context) const;

private:
    Handler terminal(Handler handler, Context& context) const;
    Handler bind(std::shared_ptr<Interceptor> interceptor, Handler downstream, Context& context) const;

    ExecutionEnvironment env_;
};

} // namespace stagewise
