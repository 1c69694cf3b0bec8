// src/executor.cpp
// Implementation of the transform executor and the interceptor chain builder

#include "stagewise/executor.hpp"

namespace stagewise {

// MiddlewareRun implementation
MiddlewareRun::MiddlewareRun(const ExecutionEnvironment& env, Stage stage, const std::string& name,
                             Context& context, bool trace) {
    if (trace) {
        context.record_middleware(name);
    }
    if (!env.config.performance_monitoring()) {
        return;
    }

    MetricsRegistry& metrics = env.metrics;
    timer_.emplace([&metrics, &context, stage, name](Utils::ScopedTimer::Duration elapsed) {
        context.record_timing(name, elapsed);
        double us = static_cast<double>(elapsed.count());
        metrics.histogram("stage." + Utils::stage_to_string(stage) + ".duration_us")->observe(us);
        metrics.histogram("middleware." + name + ".duration_us")->observe(us);
    });
}

// TransformExecutor implementation
Payload TransformExecutor::run(Stage stage, const StageRegistry::Transforms& transforms,
                               Payload payload, Context& context) const {
    context.set_current_stage(stage);

    for (const auto& middleware : transforms) {
        context.throw_if_expired();
        const std::string name = middleware->get_name();

        try {
            MiddlewareRun run(env_, stage, name, context);
            payload = middleware->transform(payload, context);
        } catch (const PipelineTimeout&) {
            throw;
        } catch (const ValidationError& e) {
            // A rejected request never continues, whatever the recovery policy
            handle_failure(stage, name, e.what(), std::current_exception(), context, true);
        } catch (const std::exception& e) {
            handle_failure(stage, name, e.what(), std::current_exception(), context);
        } catch (...) {
            handle_failure(stage, name, "unknown exception", std::current_exception(), context);
        }
    }

    return payload;
}

void TransformExecutor::handle_failure(Stage stage, const std::string& middleware,
                                       const std::string& reason, std::exception_ptr cause,
                                       Context& context, bool halt) const {
    auto error = Errors::stage_middleware_failed(stage, middleware, reason, std::move(cause));
    context.add_error(error, std::make_exception_ptr(error));
    env_.metrics.counter("stage." + Utils::stage_to_string(stage) + ".failures")->increment();

    if (halt || !env_.config.error_recovery()) {
        throw error;
    }

    env_.logger.warn("transform", std::string(error.what()) + " (request " +
                     context.request_id() + ", continuing)");
}

// ChainBuilder implementation
Handler ChainBuilder::build(const StageRegistry::Interceptors& interceptors, Handler handler,
                            Context& context) const {
    if (!handler) {
        throw Errors::null_handler();
    }

    Handler wrapped = terminal(std::move(handler), context);
    for (auto it = interceptors.rbegin(); it != interceptors.rend(); ++it) {
        wrapped = bind(*it, std::move(wrapped), context);
    }
    return wrapped;
}

Handler ChainBuilder::terminal(Handler handler, Context& context) const {
    ExecutionEnvironment env = env_;
    return [env, handler = std::move(handler), &context](const Payload& request) -> Payload {
        context.throw_if_expired();

        Payload result;
        try {
            MiddlewareRun run(env, Stage::REQUEST_HANDLING, "handler", context, false);
            result = handler(request);
        } catch (const PipelineTimeout&) {
            throw;
        } catch (const HandlerChainError&) {
            throw;
        } catch (const std::exception& e) {
            throw Errors::handler_chain_failed("handler", e.what(), std::current_exception());
        } catch (...) {
            throw Errors::handler_chain_failed("handler", "unknown exception", std::current_exception());
        }

        context.throw_if_expired();
        return result;
    };
}

Handler ChainBuilder::bind(std::shared_ptr<Interceptor> interceptor, Handler downstream,
                           Context& context) const {
    ExecutionEnvironment env = env_;
    return [env, interceptor = std::move(interceptor), downstream = std::move(downstream),
            &context](const Payload& request) -> Payload {
        context.throw_if_expired();
        const std::string name = interceptor->get_name();

        // Every hop re-checks the deadline before descending
        Next next = [&downstream, &context](const Payload& forwarded) -> Payload {
            context.throw_if_expired();
            return downstream(forwarded);
        };

        try {
            MiddlewareRun run(env, Stage::REQUEST_HANDLING, name, context);
            return interceptor->intercept(request, context, next);
        } catch (const PipelineTimeout&) {
            throw;
        } catch (const HandlerChainError&) {
            throw;
        } catch (const std::exception& e) {
            throw Errors::handler_chain_failed(name, e.what(), std::current_exception());
        } catch (...) {
            throw Errors::handler_chain_failed(name, "unknown exception", std::current_exception());
        }
    };
}

} // namespace stagewise
