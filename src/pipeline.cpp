// src/pipeline.cpp
// Implementation of the staged pipeline orchestrator

#include "stagewise/pipeline.hpp"
#include "stagewise/active_contexts.hpp"
#include "stagewise/executor.hpp"
#include "stagewise/observability.hpp"
#include "stagewise/registry.hpp"
#include "stagewise/utils.hpp"
#include <condition_variable>
#include <mutex>
#include <optional>
#include <system_error>

namespace stagewise {

namespace {

constexpr const char* INTERNAL_ERROR_MESSAGE =
    "An internal error occurred while processing the request";
constexpr const char* TIMEOUT_MESSAGE =
    "Request processing exceeded the execution time budget";

bool is_timeout(const Error& error) {
    return dynamic_cast<const TimeoutError*>(&error) != nullptr;
}

// Removes the context from the active registry on every exit path
class ContextRegistration {
public:
    ContextRegistration(ActiveContextRegistry& registry, const std::shared_ptr<Context>& context)
        : registry_(registry), request_id_(context->request_id()) {
        registry_.insert(context);
    }

    ~ContextRegistration() {
        registry_.remove(request_id_);
    }

    ContextRegistration(const ContextRegistration&) = delete;
    ContextRegistration& operator=(const ContextRegistration&) = delete;

private:
    ActiveContextRegistry& registry_;
    RequestId request_id_;
};

} // namespace

// ExecutionCounters implementation
void ExecutionCounters::reset() {
    requests_started.store(0);
    requests_succeeded.store(0);
    requests_failed.store(0);
    requests_recovered.store(0);
    requests_timed_out.store(0);
    total_processing_time_ms.store(0);
}

ExecutionCounters::Snapshot ExecutionCounters::snapshot() const {
    Snapshot s;
    s.requests_started = requests_started.load();
    s.requests_succeeded = requests_succeeded.load();
    s.requests_failed = requests_failed.load();
    s.requests_recovered = requests_recovered.load();
    s.requests_timed_out = requests_timed_out.load();
    s.total_processing_time_ms = total_processing_time_ms.load();
    return s;
}

Payload PipelineStats::to_json() const {
    Payload stages = Payload::object();
    for (Stage stage : ALL_STAGES) {
        stages[Utils::stage_to_string(stage)] = count(stage);
    }

    return Payload{
        {"active_contexts", active_contexts},
        {"stale_contexts", stale_contexts},
        {"stages", stages},
        {"config", config},
        {"counters", {
            {"requests_started", counters.requests_started},
            {"requests_succeeded", counters.requests_succeeded},
            {"requests_failed", counters.requests_failed},
            {"requests_recovered", counters.requests_recovered},
            {"requests_timed_out", counters.requests_timed_out},
            {"success_rate", counters.get_success_rate()},
            {"average_processing_time_ms", counters.get_average_processing_time_ms()}
        }}
    };
}

class Pipeline::Impl {
public:
    explicit Impl(const PipelineConfig& config)
        : config_(config)
        , logger_(config_.logging())
        , env_{config_, logger_, metrics_} {
        config_.validate();
    }

    // Runs on destruction and on move-assignment of the owning Pipeline
    ~Impl() {
        wait_for_async();
        shutdown();
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    PipelineConfig config_;
    Utils::SystemLogger logger_;
    MetricsRegistry metrics_;
    ExecutionEnvironment env_;
    StageRegistry registry_;
    ActiveContextRegistry contexts_;
    ExecutionCounters counters_;
    bool initialized_ = false;

    std::mutex async_mutex_;
    std::condition_variable async_done_;
    size_t async_in_flight_ = 0;

    void begin_async() {
        std::lock_guard<std::mutex> lock(async_mutex_);
        async_in_flight_++;
    }

    // Notifies under the lock so a waiting destructor cannot free the condition variable first
    void end_async() {
        std::lock_guard<std::mutex> lock(async_mutex_);
        async_in_flight_--;
        async_done_.notify_all();
    }

    void wait_for_async() {
        std::unique_lock<std::mutex> lock(async_mutex_);
        async_done_.wait(lock, [this] { return async_in_flight_ == 0; });
    }

    void register_middleware(Stage stage, const Middleware& middleware) {
        registry_.register_middleware(stage, middleware);
        logger_.debug("registry", "registered '" + middleware_name(middleware) + "' in stage '" +
                      Utils::stage_to_string(stage) + "'");
        if (initialized_) {
            middleware_base(middleware)->initialize();
        }
    }

    ContextOptions context_options() const {
        ContextOptions options;
        options.max_execution_time = config_.max_execution_time();
        options.context_timeout = config_.context_timeout();
        options.track_middleware = config_.context_tracking();
        options.track_timings = config_.performance_monitoring();
        return options;
    }

    Payload execute(const Payload& request, const Handler& handler) {
        if (!handler) {
            throw Errors::null_handler();
        }

        auto context = std::make_shared<Context>(context_options());
        ContextRegistration registration(contexts_, context);
        counters_.requests_started++;

        std::optional<MetricTimer> request_timer;
        if (config_.performance_monitoring()) {
            request_timer.emplace(metrics_.histogram("pipeline.request.duration_us"));
        }
        logger_.debug("execute", "started request " + context->request_id());

        std::optional<Payload> outcome;
        std::exception_ptr failure;

        try {
            outcome = run_stages(request, handler, *context);
            counters_.requests_succeeded++;
        } catch (const Error& error) {
            failure = std::current_exception();
            outcome = fail(error, failure, *context);
        } catch (const std::exception& e) {
            auto wrapped = Errors::handler_chain_failed("pipeline", e.what(), std::current_exception());
            failure = std::make_exception_ptr(wrapped);
            context->add_error(wrapped, failure);
            outcome = fail(wrapped, failure, *context);
        } catch (...) {
            auto wrapped = Errors::handler_chain_failed("pipeline", "unknown exception", std::current_exception());
            failure = std::make_exception_ptr(wrapped);
            context->add_error(wrapped, failure);
            outcome = fail(wrapped, failure, *context);
        }

        run_cleanup(*context);
        if (request_timer) {
            request_timer->finish();
        }

        auto elapsed = context->get_processing_time();
        counters_.total_processing_time_ms += static_cast<uint64_t>(elapsed.count());
        if (logger_.should_log(SystemLogLevel::DEBUG)) {
            logger_.debug("execute", "finished request " + context->request_id() + " in " +
                          std::to_string(elapsed.count()) + "ms" + (failure ? " (failed)" : "") +
                          " via [" + Utils::join(context->middleware_chain(), " -> ") + "]");
        }

        if (failure && !config_.error_recovery()) {
            std::rethrow_exception(failure);
        }
        return outcome.value_or(Payload());
    }

    Payload run_stages(const Payload& request, const Handler& handler, Context& context) {
        TransformExecutor transforms(env_);
        ChainBuilder chains(env_);

        context.set_request(request);
        Payload processed = transforms.run(Stage::PRE_PROCESSING,
                                           registry_.transforms(Stage::PRE_PROCESSING),
                                           request, context);
        context.set_request(processed);
        context.throw_if_expired();

        context.set_current_stage(Stage::REQUEST_HANDLING);
        Handler chain = chains.build(registry_.interceptors(), handler, context);
        Payload result = dispatch(chain, processed, context);
        context.throw_if_expired();
        context.set_response(result);

        result = transforms.run(Stage::POST_PROCESSING,
                                registry_.transforms(Stage::POST_PROCESSING),
                                std::move(result), context);
        context.throw_if_expired();
        context.set_response(result);
        return result;
    }

    Payload dispatch(const Handler& chain, const Payload& request, Context& context) {
        try {
            return chain(request);
        } catch (const PipelineTimeout&) {
            throw;
        } catch (const HandlerChainError& error) {
            context.add_error(error, std::current_exception());
            throw;
        } catch (const std::exception& e) {
            auto wrapped = Errors::handler_chain_failed("handler", e.what(), std::current_exception());
            context.add_error(wrapped, std::make_exception_ptr(wrapped));
            throw wrapped;
        }
    }

    // Failure path: record, run error handlers, build the recovery payload
    Payload fail(const Error& error, const std::exception_ptr& exception, Context& context) {
        counters_.requests_failed++;

        // Execution errors were recorded where they were raised
        if (dynamic_cast<const ExecutionError*>(&error) == nullptr) {
            context.add_error(error, exception);
        }

        if (is_timeout(error)) {
            counters_.requests_timed_out++;
            logger_.warn("execute", std::string(error.what()) + " after " +
                         std::to_string(context.get_processing_time().count()) + "ms");
        } else {
            logger_.info("execute", "request " + context.request_id() + " failed: " + error.what());
        }

        context.set_current_stage(Stage::ERROR_HANDLING);
        run_error_handlers(error, context);

        if (!config_.error_recovery()) {
            return Payload();
        }
        counters_.requests_recovered++;
        return recovery_payload(error, context);
    }

    void run_error_handlers(const Error& error, Context& context) {
        for (const auto& handler : registry_.error_handlers()) {
            const std::string name = handler->get_name();
            try {
                MiddlewareRun run(env_, Stage::ERROR_HANDLING, name, context);
                handler->handle_error(error, context);
            } catch (const std::exception& e) {
                report_failure(Errors::error_handler_failed(name, e.what(), std::current_exception()), context);
            } catch (...) {
                report_failure(Errors::error_handler_failed(name, "unknown exception", std::current_exception()), context);
            }
        }
    }

    void run_cleanup(Context& context) {
        context.set_current_stage(Stage::CLEANUP);
        for (const auto& handler : registry_.cleanup_handlers()) {
            const std::string name = handler->get_name();
            try {
                MiddlewareRun run(env_, Stage::CLEANUP, name, context);
                handler->cleanup(context);
            } catch (const std::exception& e) {
                report_failure(Errors::cleanup_failed(name, e.what(), std::current_exception()), context);
            } catch (...) {
                report_failure(Errors::cleanup_failed(name, "unknown exception", std::current_exception()), context);
            }
        }
    }

    // Best-effort phase failures are logged and kept on the context, never rethrown
    void report_failure(const ExecutionError& error, Context& context) {
        context.add_error(error, std::make_exception_ptr(error));
        metrics_.counter("stage." + Utils::stage_to_string(context.current_stage()) + ".failures")->increment();
        logger_.error(Utils::stage_to_string(context.current_stage()),
                      std::string(error.what()) + " (request " + context.request_id() + ")");
    }

    Payload recovery_payload(const Error& error, const Context& context) const {
        bool timeout = is_timeout(error);
        return Payload{
            {"error", timeout ? "timeout" : "internal_error"},
            {"message", timeout ? TIMEOUT_MESSAGE : INTERNAL_ERROR_MESSAGE},
            {"request_id", context.request_id()},
            {"timestamp", Utils::now_milliseconds()}
        };
    }

    void initialize() {
        if (initialized_) {
            return;
        }
        registry_.for_each([](Stage, MiddlewareBase& middleware) {
            middleware.initialize();
        });
        initialized_ = true;
        logger_.info("pipeline", "initialized with " + std::to_string(registry_.total()) + " middleware");
    }

    void shutdown() {
        if (!initialized_) {
            return;
        }
        registry_.for_each([this](Stage stage, MiddlewareBase& middleware) {
            try {
                middleware.shutdown();
            } catch (const std::exception& e) {
                logger_.error(Utils::stage_to_string(stage),
                              "shutdown of '" + middleware.get_name() + "' failed: " + e.what());
            }
        });
        initialized_ = false;
    }
};

// Pipeline implementation
Pipeline::Pipeline() : pimpl_(std::make_unique<Impl>(PipelineConfig())) {}

Pipeline::Pipeline(const PipelineConfig& config) : pimpl_(std::make_unique<Impl>(config)) {}

Pipeline::~Pipeline() = default;

Pipeline::Pipeline(Pipeline&&) noexcept = default;
Pipeline& Pipeline::operator=(Pipeline&&) noexcept = default;

Pipeline& Pipeline::register_middleware(Stage stage, const Middleware& middleware) {
    pimpl_->register_middleware(stage, middleware);
    return *this;
}

Pipeline& Pipeline::register_middleware(const StagedMiddleware& staged) {
    return register_middleware(staged.stage, staged.middleware);
}

Pipeline& Pipeline::use(const Middleware& middleware, Stage stage) {
    return register_middleware(stage, middleware);
}

Pipeline& Pipeline::pre_processing(const Middleware& middleware) {
    return register_middleware(Stage::PRE_PROCESSING, middleware);
}

Pipeline& Pipeline::post_processing(const Middleware& middleware) {
    return register_middleware(Stage::POST_PROCESSING, middleware);
}

Pipeline& Pipeline::error_handling(const Middleware& middleware) {
    return register_middleware(Stage::ERROR_HANDLING, middleware);
}

Pipeline& Pipeline::cleanup(const Middleware& middleware) {
    return register_middleware(Stage::CLEANUP, middleware);
}

Payload Pipeline::execute(const Payload& request, const Handler& handler) {
    return pimpl_->execute(request, handler);
}

// Destroying or replacing the pipeline waits for these executions to finish
std::future<Payload> Pipeline::execute_async(Payload request, Handler handler) {
    // Marks the execution finished on every exit path
    class AsyncCompletion {
    public:
        explicit AsyncCompletion(Impl& impl) : impl_(impl) {}
        ~AsyncCompletion() { impl_.end_async(); }

        AsyncCompletion(const AsyncCompletion&) = delete;
        AsyncCompletion& operator=(const AsyncCompletion&) = delete;

    private:
        Impl& impl_;
    };

    Impl* impl = pimpl_.get();
    impl->begin_async();
    try {
        return std::async(std::launch::async,
            [impl, request = std::move(request), handler = std::move(handler)]() {
                AsyncCompletion completion(*impl);
                return impl->execute(request, handler);
            });
    } catch (const std::system_error&) {
        impl->end_async();
        throw;
    }
}

PipelineStats Pipeline::get_stats() const {
    PipelineStats stats;
    stats.active_contexts = pimpl_->contexts_.size();
    stats.stale_contexts = pimpl_->contexts_.count_stale();
    stats.stage_counts = pimpl_->registry_.counts();
    stats.config = pimpl_->config_.to_json();
    stats.counters = pimpl_->counters_.snapshot();
    return stats;
}

Payload Pipeline::export_metrics() const {
    pimpl_->metrics_.gauge("contexts.active")->set(static_cast<double>(pimpl_->contexts_.size()));
    return pimpl_->metrics_.export_json();
}

std::vector<std::string> Pipeline::get_middleware_names(Stage stage) const {
    return pimpl_->registry_.names(stage);
}

void Pipeline::reset_stats() {
    pimpl_->counters_.reset();
    pimpl_->metrics_.reset_all();
}

size_t Pipeline::purge_stale_contexts() {
    size_t removed = pimpl_->contexts_.purge_stale();
    if (removed > 0) {
        pimpl_->logger_.warn("pipeline", "purged " + std::to_string(removed) + " stale contexts");
    }
    return removed;
}

const PipelineConfig& Pipeline::config() const {
    return pimpl_->config_;
}

void Pipeline::initialize() {
    pimpl_->initialize();
}

void Pipeline::shutdown() {
    pimpl_->shutdown();
}

bool Pipeline::is_initialized() const {
    return pimpl_->initialized_;
}

} // namespace stagewise
