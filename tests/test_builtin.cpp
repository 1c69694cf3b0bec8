// tests/test_builtin.cpp
// Tests for the ready-made middleware

#include <gtest/gtest.h>
#include "stagewise/stagewise.hpp"
#include <thread>

using namespace stagewise;

class BuiltinTest : public ::testing::Test {
protected:
    static Next responder(int status) {
        return [status](const Payload& request) {
            return Payload{{"status", status}, {"path", request.value("path", "/")}};
        };
    }

    Context context_;
};

// Request validation
TEST_F(BuiltinTest, TestValidationAcceptsAllowedMethod) {
    auto validation = MiddlewareFactory::create_validation_middleware();
    EXPECT_EQ(validation->get_name(), "request_validation");
    EXPECT_EQ(validation->allowed_methods().size(), 4u);

    Payload request{{"method", "post"}, {"path", "/orders"}};
    EXPECT_EQ(validation->transform(request, context_), request);
}

TEST_F(BuiltinTest, TestValidationRejections) {
    auto validation = MiddlewareFactory::create_validation_middleware({"GET"}, {"path"});

    try {
        validation->transform({{"method", "TRACE"}, {"path", "/"}}, context_);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_METHOD);
        EXPECT_EQ(e.field(), "method");
    }

    EXPECT_THROW(validation->transform({{"method", "GET"}}, context_), ValidationError);
    EXPECT_THROW(validation->transform(Payload("GET /"), context_), ValidationError);
    EXPECT_THROW(validation->transform({{"method", 7}, {"path", "/"}}, context_), ValidationError);
}

TEST_F(BuiltinTest, TestValidationCustomValidator) {
    auto validation = MiddlewareFactory::create_validation_middleware();
    validation->add_validator("quantity", [](const Payload& value) {
        return value.is_number_integer() && value.get<int>() > 0;
    });

    EXPECT_NO_THROW(validation->transform({{"method", "PUT"}, {"quantity", 3}}, context_));
    EXPECT_NO_THROW(validation->transform({{"method", "PUT"}}, context_));

    try {
        validation->transform({{"method", "PUT"}, {"quantity", -1}}, context_);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::VALIDATION_FAILED);
        EXPECT_EQ(e.field(), "quantity");
    }
}

// Timing
TEST_F(BuiltinTest, TestTimingRecordsElapsed) {
    std::string reported;
    std::chrono::microseconds reported_elapsed{0};
    auto timing = MiddlewareFactory::create_timing_middleware("timing",
        [&](const std::string& name, std::chrono::microseconds elapsed) {
            reported = name;
            reported_elapsed = elapsed;
        });

    Payload result = timing->intercept(Payload::object(), context_, [](const Payload&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return Payload{{"status", 200}};
    });

    EXPECT_EQ(result["status"], 200);
    EXPECT_GE(result["timings_us"]["timing"].get<int64_t>(), 2000);
    EXPECT_GE(context_.get_scoped_as<int64_t>("timing", "elapsed_us").value(), 2000);
    EXPECT_EQ(reported, "timing");
    EXPECT_GE(reported_elapsed.count(), 2000);
}

TEST_F(BuiltinTest, TestTimingLeavesNonObjectResultAlone) {
    auto timing = MiddlewareFactory::create_timing_middleware("render");
    Payload result = timing->intercept(Payload::object(), context_, [](const Payload&) {
        return Payload("<html/>");
    });
    EXPECT_EQ(result, Payload("<html/>"));
    EXPECT_TRUE(context_.has_scoped("render", "elapsed_us"));
}

TEST_F(BuiltinTest, TestTimingKeepsForeignTimingsField) {
    auto timing = MiddlewareFactory::create_timing_middleware();
    Payload result = timing->intercept(Payload::object(), context_, [](const Payload&) {
        return Payload{{"status", 200}, {"timings_us", 17}};
    });

    EXPECT_EQ(result, (Payload{{"status", 200}, {"timings_us", 17}}));
    EXPECT_TRUE(context_.has_scoped("timing", "elapsed_us"));
}

TEST_F(BuiltinTest, TestTimingMergesIntoExistingTimings) {
    auto timing = MiddlewareFactory::create_timing_middleware("outer");
    Payload result = timing->intercept(Payload::object(), context_, [](const Payload&) {
        return Payload{{"timings_us", {{"db", 40}}}};
    });

    EXPECT_EQ(result["timings_us"]["db"], 40);
    EXPECT_TRUE(result["timings_us"].contains("outer"));
}

// Logging
TEST_F(BuiltinTest, TestLoggingWritesStartAndCompletion) {
    auto logging = MiddlewareFactory::create_logging_middleware("access");

    testing::internal::CaptureStderr();
    logging->intercept({{"method", "GET"}, {"path", "/orders"}}, context_, responder(204));
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("[INFO] [access] Processing request " + context_.request_id() + ": GET /orders"),
              std::string::npos);
    EXPECT_NE(output.find("completed with status: 204"), std::string::npos);
}

TEST_F(BuiltinTest, TestLoggingRespectsLevel) {
    auto logging = MiddlewareFactory::create_logging_middleware("access", SystemLogLevel::WARN);

    testing::internal::CaptureStderr();
    logging->intercept(Payload::object(), context_, responder(200));
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
}

// Header auth
TEST_F(BuiltinTest, TestHeaderAuth) {
    auto auth = MiddlewareFactory::create_header_auth_middleware();
    EXPECT_EQ(auth->get_name(), "header_auth");

    Payload denied = auth->intercept({{"method", "GET"}}, context_, responder(200));
    EXPECT_EQ(denied, (Payload{{"status", 401}}));
    EXPECT_EQ(context_.get_scoped_as<bool>("header_auth", "rejected").value(), true);

    Payload allowed = auth->intercept({{"headers", {{"AUTHORIZATION", "Bearer t"}}}}, context_, responder(200));
    EXPECT_EQ(allowed["status"], 200);
}

TEST_F(BuiltinTest, TestHeaderAuthCustomHeader) {
    auto auth = MiddlewareFactory::create_header_auth_middleware("X-Api-Key", 403);
    EXPECT_TRUE(auth->has_header({{"headers", {{"x-api-key", "k"}}}}));
    EXPECT_FALSE(auth->has_header({{"headers", {{"x-api-key", nullptr}}}}));
    EXPECT_FALSE(auth->has_header({{"headers", "x-api-key"}}));

    Payload denied = auth->intercept({{"headers", Payload::object()}}, context_, responder(200));
    EXPECT_EQ(denied["status"], 403);
}

// Request id
TEST_F(BuiltinTest, TestRequestIdStamp) {
    auto stamp = MiddlewareFactory::create_request_id_middleware();

    Payload stamped = stamp->transform({{"status", 200}}, context_);
    EXPECT_EQ(stamped["request_id"], context_.request_id());

    Payload kept = stamp->transform({{"request_id", "upstream"}}, context_);
    EXPECT_EQ(kept["request_id"], "upstream");

    EXPECT_EQ(stamp->transform(Payload(42), context_), Payload(42));
}

// Built-ins assembled into one pipeline
TEST_F(BuiltinTest, TestServicePipeline) {
    PipelineConfig config;
    config.set_system_log_level(SystemLogLevel::NONE);

    Pipeline pipeline(config);
    pipeline.pre_processing(MiddlewareFactory::create_validation_middleware())
            .use(MiddlewareFactory::create_timing_middleware())
            .use(conditional([](const Payload& request) { return request.value("path", "") != "/health"; },
                             MiddlewareFactory::create_header_auth_middleware()))
            .post_processing(MiddlewareFactory::create_request_id_middleware());

    Payload health = pipeline.execute({{"method", "GET"}, {"path", "/health"}},
                                      [](const Payload&) { return Payload{{"status", 200}}; });
    EXPECT_EQ(health["status"], 200);
    EXPECT_TRUE(health["timings_us"].contains("timing"));
    EXPECT_TRUE(health["request_id"].is_string());

    Payload denied = pipeline.execute({{"method", "GET"}, {"path", "/orders"}},
                                      [](const Payload&) { return Payload{{"status", 200}}; });
    EXPECT_EQ(denied["status"], 401);
}
