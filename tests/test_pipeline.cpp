// tests/test_pipeline.cpp
// End-to-end tests for Pipeline execution, recovery, timeouts and introspection

#include <gtest/gtest.h>
#include "stagewise/stagewise.hpp"
#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace stagewise;

namespace {

// Interceptor counting lifecycle calls
class LifecycleProbe : public Interceptor {
public:
    Payload intercept(const Payload& request, Context&, const Next& next) override {
        return next(request);
    }
    std::string get_name() const override { return "probe"; }
    void initialize() override { initialized++; }
    void shutdown() override { shut_down++; }

    int initialized = 0;
    int shut_down = 0;
};

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    PipelineConfig quiet_config() {
        PipelineConfig config;
        config.set_system_log_level(SystemLogLevel::NONE);
        return config;
    }

    Handler echo() {
        return [this](const Payload& request) {
            handler_calls_++;
            return Payload{{"status", 200}, {"echo", request}};
        };
    }

    // Cleanup handler copying the context state the test wants to inspect
    std::shared_ptr<CleanupHandler> observer() {
        return make_cleanup("observer", [this](Context& context) {
            cleanup_calls_++;
            observed_errors_ = context.error_count();
            observed_chain_ = context.middleware_chain();
            observed_id_ = context.request_id();
        });
    }

    std::atomic<int> handler_calls_{0};
    std::atomic<int> cleanup_calls_{0};
    size_t observed_errors_ = 0;
    std::vector<std::string> observed_chain_;
    RequestId observed_id_;
};

TEST_F(PipelineTest, TestEmptyPipelineRunsHandler) {
    Pipeline pipeline(quiet_config());
    Payload result = pipeline.execute({{"method", "GET"}}, echo());

    EXPECT_EQ(result["status"], 200);
    EXPECT_EQ(result["echo"]["method"], "GET");
    EXPECT_EQ(handler_calls_.load(), 1);

    PipelineStats stats = pipeline.get_stats();
    for (Stage stage : ALL_STAGES) {
        EXPECT_EQ(stats.count(stage), 0u);
    }
    EXPECT_EQ(stats.active_contexts, 0u);
    EXPECT_EQ(stats.counters.requests_succeeded, 1u);
}

TEST_F(PipelineTest, TestStageOrder) {
    std::vector<std::string> log;
    Pipeline pipeline(quiet_config());
    pipeline.pre_processing(make_transform("pre", [&log](Payload payload, Context&) {
                log.push_back("pre");
                payload["seen_pre"] = true;
                return payload;
            }))
            .use(make_interceptor("outer", [&log](const Payload& request, Context&, const Next& next) {
                log.push_back("outer:in");
                Payload result = next(request);
                log.push_back("outer:out");
                return result;
            }))
            .use(make_interceptor("inner", [&log](const Payload& request, Context&, const Next& next) {
                log.push_back("inner:in");
                Payload result = next(request);
                log.push_back("inner:out");
                return result;
            }))
            .post_processing(make_transform("post", [&log](Payload payload, Context&) {
                log.push_back("post");
                payload["seen_post"] = true;
                return payload;
            }))
            .cleanup(observer());

    Payload result = pipeline.execute(Payload::object(), [&log](const Payload& request) {
        log.push_back("handler");
        return Payload{{"request", request}};
    });

    EXPECT_EQ(log, (std::vector<std::string>{"pre", "outer:in", "inner:in", "handler",
                                             "inner:out", "outer:out", "post"}));
    EXPECT_EQ(result["request"]["seen_pre"], true);
    EXPECT_EQ(result["seen_post"], true);
    EXPECT_EQ(observed_chain_, (std::vector<std::string>{"pre", "outer", "inner", "post", "observer"}));
}

TEST_F(PipelineTest, TestShortCircuitSkipsHandler) {
    Pipeline pipeline(quiet_config());
    pipeline.use(make_interceptor("gate", [](const Payload&, Context&, const Next&) {
        return Payload{{"status", 403}};
    }));

    Payload result = pipeline.execute(Payload::object(), echo());
    EXPECT_EQ(result, (Payload{{"status", 403}}));
    EXPECT_EQ(handler_calls_.load(), 0);
}

TEST_F(PipelineTest, TestContextRemovedAfterEveryCall) {
    PipelineConfig config = quiet_config();
    config.enable_error_recovery(false);
    Pipeline pipeline(config);

    pipeline.execute(Payload::object(), echo());
    EXPECT_EQ(pipeline.get_stats().active_contexts, 0u);

    EXPECT_THROW(pipeline.execute(Payload::object(), [](const Payload&) -> Payload {
        throw std::runtime_error("handler exploded");
    }), HandlerChainError);
    EXPECT_EQ(pipeline.get_stats().active_contexts, 0u);
}

TEST_F(PipelineTest, TestTransformFailureRecovered) {
    Pipeline pipeline(quiet_config());
    pipeline.pre_processing(make_transform("t1", [](Payload, Context&) -> Payload {
                throw std::runtime_error("t1 exploded");
            }))
            .pre_processing(make_transform("t2", [](Payload payload, Context&) {
                payload["markers"].push_back("x");
                return payload;
            }))
            .cleanup(observer());

    Payload result = pipeline.execute(Payload::object(), echo());
    EXPECT_EQ(result["echo"]["markers"], (Payload{"x"}));
    EXPECT_EQ(observed_errors_, 1u);
    EXPECT_EQ(pipeline.get_stats().counters.requests_succeeded, 1u);
}

TEST_F(PipelineTest, TestHandlerFailureRecovered) {
    std::vector<ErrorCode> seen;
    Pipeline pipeline(quiet_config());
    pipeline.error_handling(make_error_handler("capture", [&seen](const Error& error, Context&) {
                seen.push_back(error.code());
            }))
            .cleanup(observer());

    Payload result = pipeline.execute(Payload::object(), [](const Payload&) -> Payload {
        throw std::runtime_error("database unavailable");
    });

    EXPECT_EQ(result["error"], "internal_error");
    EXPECT_EQ(result["request_id"], observed_id_);
    EXPECT_TRUE(result.contains("timestamp"));
    // The raw exception text stays out of the response
    EXPECT_EQ(result["message"].get<std::string>().find("database"), std::string::npos);
    EXPECT_EQ(seen, std::vector<ErrorCode>{ErrorCode::HANDLER_CHAIN_FAILED});
    EXPECT_EQ(cleanup_calls_.load(), 1);

    auto counters = pipeline.get_stats().counters;
    EXPECT_EQ(counters.requests_failed, 1u);
    EXPECT_EQ(counters.requests_recovered, 1u);
}

TEST_F(PipelineTest, TestFailurePropagatesWithoutRecovery) {
    PipelineConfig config = quiet_config();
    config.enable_error_recovery(false);
    int error_handler_calls = 0;

    Pipeline pipeline(config);
    pipeline.error_handling(make_error_handler("count", [&error_handler_calls](const Error&, Context&) {
                error_handler_calls++;
            }))
            .cleanup(observer());

    try {
        pipeline.execute(Payload::object(), [](const Payload&) -> Payload {
            throw std::runtime_error("handler exploded");
        });
        FAIL() << "expected HandlerChainError";
    } catch (const HandlerChainError& e) {
        EXPECT_EQ(e.middleware(), "handler");
        EXPECT_THROW(e.rethrow_cause(), std::runtime_error);
    }
    EXPECT_EQ(error_handler_calls, 1);
    EXPECT_EQ(cleanup_calls_.load(), 1);
}

TEST_F(PipelineTest, TestValidationRejectsRequest) {
    Pipeline pipeline(quiet_config());
    pipeline.pre_processing(MiddlewareFactory::create_validation_middleware());

    Payload result = pipeline.execute({{"method", "TRACE"}, {"path", "/"}}, echo());
    EXPECT_EQ(result["error"], "internal_error");
    EXPECT_TRUE(result["request_id"].is_string());
    EXPECT_EQ(handler_calls_.load(), 0);

    Payload accepted = pipeline.execute({{"method", "get"}, {"path", "/"}}, echo());
    EXPECT_EQ(accepted["status"], 200);
    EXPECT_EQ(handler_calls_.load(), 1);
}

TEST_F(PipelineTest, TestAuthShortCircuit) {
    Pipeline pipeline(quiet_config());
    pipeline.use(MiddlewareFactory::create_header_auth_middleware());

    Payload denied = pipeline.execute({{"method", "GET"}, {"headers", Payload::object()}}, echo());
    EXPECT_EQ(denied, (Payload{{"status", 401}}));
    EXPECT_EQ(handler_calls_.load(), 0);

    Payload allowed = pipeline.execute(
        {{"method", "GET"}, {"headers", {{"authorization", "Bearer t"}}}}, echo());
    EXPECT_EQ(allowed["status"], 200);
}

TEST_F(PipelineTest, TestTimeoutRunsErrorHandlingOnce) {
    PipelineConfig config = quiet_config();
    config.set_max_execution_time(std::chrono::milliseconds(20))
          .set_context_timeout(std::chrono::milliseconds(40));
    std::vector<ErrorCode> seen;

    Pipeline pipeline(config);
    pipeline.error_handling(make_error_handler("capture", [&seen](const Error& error, Context&) {
                seen.push_back(error.code());
            }))
            .cleanup(observer());

    Payload result = pipeline.execute(Payload::object(), [](const Payload&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return Payload{{"status", 200}};
    });

    EXPECT_EQ(result["error"], "timeout");
    EXPECT_EQ(seen, std::vector<ErrorCode>{ErrorCode::TIMEOUT});
    EXPECT_EQ(cleanup_calls_.load(), 1);
    EXPECT_EQ(pipeline.get_stats().counters.requests_timed_out, 1u);
}

TEST_F(PipelineTest, TestTimeoutPropagatesWithoutRecovery) {
    PipelineConfig config = quiet_config();
    config.enable_error_recovery(false)
          .set_max_execution_time(std::chrono::milliseconds(10))
          .set_context_timeout(std::chrono::milliseconds(20));

    Pipeline pipeline(config);
    pipeline.use(make_interceptor("slow", [](const Payload& request, Context&, const Next& next) {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        return next(request);
    }));

    EXPECT_THROW(pipeline.execute(Payload::object(), echo()), PipelineTimeout);
    EXPECT_EQ(handler_calls_.load(), 0);
}

TEST_F(PipelineTest, TestErrorHandlerAndCleanupFailuresContained) {
    Pipeline pipeline(quiet_config());
    pipeline.error_handling(make_error_handler("broken", [](const Error&, Context&) {
                throw std::runtime_error("handler of handlers exploded");
            }))
            .cleanup(make_cleanup("leaky", [](Context&) {
                throw std::runtime_error("cleanup exploded");
            }))
            .cleanup(observer());

    Payload result = pipeline.execute(Payload::object(), [](const Payload&) -> Payload {
        throw std::runtime_error("handler exploded");
    });

    EXPECT_EQ(result["error"], "internal_error");
    EXPECT_EQ(cleanup_calls_.load(), 1);
    // Handler failure, error handler failure and cleanup failure
    EXPECT_EQ(observed_errors_, 3u);

    Payload metrics = pipeline.export_metrics();
    EXPECT_EQ(metrics["stage.error_handling.failures"]["value"], 1.0);
    EXPECT_EQ(metrics["stage.cleanup.failures"]["value"], 1.0);
}

TEST_F(PipelineTest, TestCleanupFailureKeepsSuccessfulResult) {
    Pipeline pipeline(quiet_config());
    pipeline.cleanup(make_cleanup("leaky", [](Context&) {
        throw std::runtime_error("cleanup exploded");
    }));

    Payload result = pipeline.execute(Payload::object(), echo());
    EXPECT_EQ(result["status"], 200);
    EXPECT_EQ(pipeline.get_stats().counters.requests_failed, 0u);
}

TEST_F(PipelineTest, TestRegistrationWrappers) {
    Pipeline pipeline(quiet_config());
    pipeline.register_middleware(make_middleware(Stage::PRE_PROCESSING, "normalize",
                                                 [](Payload payload, Context&) { return payload; }))
            .use(MiddlewareFactory::create_timing_middleware())
            .post_processing(MiddlewareFactory::create_request_id_middleware())
            .error_handling(make_error_handler("report", [](const Error&, Context&) {}))
            .cleanup(make_cleanup("release", [](Context&) {}));

    EXPECT_EQ(pipeline.get_middleware_names(Stage::PRE_PROCESSING), std::vector<std::string>{"normalize"});
    EXPECT_EQ(pipeline.get_middleware_names(Stage::REQUEST_HANDLING), std::vector<std::string>{"timing"});
    EXPECT_EQ(pipeline.get_middleware_names(Stage::POST_PROCESSING), std::vector<std::string>{"request_id"});

    PipelineStats stats = pipeline.get_stats();
    for (Stage stage : ALL_STAGES) {
        EXPECT_EQ(stats.count(stage), 1u);
    }
    EXPECT_EQ(stats.to_json()["stages"]["cleanup"], 1);

    EXPECT_THROW(pipeline.register_middleware(Stage::CLEANUP, make_transform("t", [](Payload p, Context&) {
        return p;
    })), RegistrationError);
    EXPECT_EQ(pipeline.get_stats().count(Stage::CLEANUP), 1u);
}

TEST_F(PipelineTest, TestNullHandlerRejected) {
    Pipeline pipeline(quiet_config());
    EXPECT_THROW(pipeline.execute(Payload::object(), Handler()), RegistrationError);
    EXPECT_EQ(pipeline.get_stats().counters.requests_started, 0u);
}

TEST_F(PipelineTest, TestInvalidConfigRejected) {
    PipelineConfig config = quiet_config();
    config.set_max_execution_time(std::chrono::milliseconds(0));
    EXPECT_THROW(Pipeline pipeline(config), ConfigError);
}

TEST_F(PipelineTest, TestPerformanceMonitoringMetrics) {
    Pipeline pipeline(quiet_config());
    pipeline.use(make_interceptor("pass", [](const Payload& request, Context&, const Next& next) {
        return next(request);
    }));
    pipeline.execute(Payload::object(), echo());

    Payload metrics = pipeline.export_metrics();
    EXPECT_EQ(metrics["middleware.pass.duration_us"]["count"], 1u);
    EXPECT_EQ(metrics["stage.request_handling.duration_us"]["type"], "histogram");
    EXPECT_EQ(metrics["contexts.active"]["value"], 0.0);
}

TEST_F(PipelineTest, TestTrackingDisabledLeavesTraceEmpty) {
    PipelineConfig config = quiet_config();
    config.enable_context_tracking(false).enable_performance_monitoring(false);
    Pipeline pipeline(config);
    pipeline.use(make_interceptor("pass", [](const Payload& request, Context&, const Next& next) {
                return next(request);
            }))
            .cleanup(observer());

    pipeline.execute(Payload::object(), echo());
    EXPECT_TRUE(observed_chain_.empty());
    EXPECT_FALSE(pipeline.export_metrics().contains("middleware.pass.duration_us"));
}

TEST_F(PipelineTest, TestLifecycle) {
    auto probe = std::make_shared<LifecycleProbe>();
    auto late = std::make_shared<LifecycleProbe>();
    {
        Pipeline pipeline(quiet_config());
        pipeline.use(probe);
        EXPECT_FALSE(pipeline.is_initialized());

        pipeline.initialize();
        pipeline.initialize();
        EXPECT_TRUE(pipeline.is_initialized());
        EXPECT_EQ(probe->initialized, 1);

        // Registered after initialize(): initialized on registration
        pipeline.use(late);
        EXPECT_EQ(late->initialized, 1);
    }
    EXPECT_EQ(probe->shut_down, 1);
    EXPECT_EQ(late->shut_down, 1);
}

TEST_F(PipelineTest, TestMoveAssignShutsDownReplacedPipeline) {
    auto probe = std::make_shared<LifecycleProbe>();
    Pipeline pipeline(quiet_config());
    pipeline.use(probe);
    pipeline.initialize();

    pipeline = Pipeline(quiet_config());
    EXPECT_EQ(probe->shut_down, 1);
    EXPECT_FALSE(pipeline.is_initialized());
    EXPECT_EQ(pipeline.get_stats().count(Stage::REQUEST_HANDLING), 0u);
}

TEST_F(PipelineTest, TestMoveAssignWaitsForAsyncExecution) {
    Pipeline pipeline(quiet_config());
    std::promise<void> entered;
    std::atomic<bool> finished{false};
    auto future = pipeline.execute_async(Payload::object(), [&entered, &finished](const Payload&) {
        entered.set_value();
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        finished = true;
        return Payload{{"status", 200}};
    });
    entered.get_future().wait();

    // Replacing the pipeline blocks until the in-flight execution is done with it
    pipeline = Pipeline(quiet_config());
    EXPECT_TRUE(finished.load());
    EXPECT_EQ(future.get()["status"], 200);
}

TEST_F(PipelineTest, TestDebugLogShowsMiddlewareChain) {
    PipelineConfig config = quiet_config();
    config.set_system_log_level(SystemLogLevel::DEBUG);
    Pipeline pipeline(config);
    pipeline.pre_processing(make_transform("normalize", [](Payload payload, Context&) { return payload; }))
            .use(make_interceptor("auth", [](const Payload& request, Context&, const Next& next) {
                return next(request);
            }));

    testing::internal::CaptureStderr();
    pipeline.execute(Payload::object(), echo());
    std::string output = testing::internal::GetCapturedStderr();
    EXPECT_NE(output.find("via [normalize -> auth]"), std::string::npos);
}

TEST_F(PipelineTest, TestExecuteAsync) {
    Pipeline pipeline(quiet_config());
    pipeline.post_processing(MiddlewareFactory::create_request_id_middleware());

    auto future = pipeline.execute_async({{"method", "GET"}}, echo());
    Payload result = future.get();
    EXPECT_EQ(result["status"], 200);
    EXPECT_TRUE(result["request_id"].is_string());
}

TEST_F(PipelineTest, TestPurgeStaleContexts) {
    PipelineConfig config = quiet_config();
    config.set_max_execution_time(std::chrono::milliseconds(10))
          .set_context_timeout(std::chrono::milliseconds(20));
    Pipeline pipeline(config);
    EXPECT_EQ(pipeline.purge_stale_contexts(), 0u);
    EXPECT_EQ(pipeline.get_stats().stale_contexts, 0u);

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    auto future = pipeline.execute_async(Payload::object(), [&entered, released](const Payload&) {
        entered.set_value();
        released.wait();
        return Payload{{"status", 200}};
    });

    entered.get_future().wait();
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    EXPECT_EQ(pipeline.get_stats().stale_contexts, 1u);
    EXPECT_EQ(pipeline.purge_stale_contexts(), 1u);
    EXPECT_EQ(pipeline.get_stats().active_contexts, 0u);

    // The held request still completes, past its budget
    release.set_value();
    EXPECT_EQ(future.get()["error"], "timeout");
    EXPECT_EQ(pipeline.get_stats().active_contexts, 0u);
}

TEST_F(PipelineTest, TestResetStats) {
    Pipeline pipeline(quiet_config());
    pipeline.execute(Payload::object(), echo());
    pipeline.execute(Payload::object(), [](const Payload&) -> Payload {
        throw std::runtime_error("handler exploded");
    });

    EXPECT_EQ(pipeline.export_metrics()["pipeline.request.duration_us"]["count"], 2u);
    EXPECT_EQ(pipeline.get_stats().counters.requests_started, 2u);

    pipeline.reset_stats();
    auto counters = pipeline.get_stats().counters;
    EXPECT_EQ(counters.requests_started, 0u);
    EXPECT_EQ(counters.requests_failed, 0u);
    EXPECT_EQ(pipeline.export_metrics()["pipeline.request.duration_us"]["count"], 0u);
}
