// basic_pipeline.cpp
// Getting Started with stagewise

#include <iostream>
#include "stagewise/stagewise.hpp"

using namespace stagewise;

int main() {
    std::cout << "🚀 stagewise - Getting Started\n" << std::endl;

    try {
        // Configure the pipeline
        PipelineConfig config = PipelineConfigBuilder()
            .budgets(std::chrono::milliseconds(1000), std::chrono::milliseconds(5000))
            .system_logging(SystemLogLevel::WARN)
            .build();
        Pipeline pipeline(config);

        // Normalize the request before it reaches the handler
        pipeline.pre_processing(make_transform("normalize", [](Payload request, Context&) {
            request["name"] = Utils::trim(request.value("name", std::string("world")));
            return request;
        }));

        // Wrap the handler, onion style
        pipeline.use(make_interceptor("greeting_log", [](const Payload& request, Context& context, const Next& next) {
            std::cout << "  -> " << context.request_id() << " entering handler" << std::endl;
            Payload result = next(request);
            std::cout << "  <- " << context.request_id() << " leaving handler" << std::endl;
            return result;
        }));

        pipeline.post_processing(MiddlewareFactory::create_request_id_middleware());

        pipeline.cleanup(make_cleanup("summary", [](Context& context) {
            std::cout << "  chain: " << Utils::join(context.middleware_chain(), " -> ") << std::endl;
        }));

        pipeline.initialize();

        Payload result = pipeline.execute({{"name", "  stagewise  "}}, [](const Payload& request) {
            return Payload{{"greeting", "Hello, " + request["name"].get<std::string>() + "!"}};
        });
        std::cout << "✅ Result: " << result.dump() << std::endl;

        // A failing handler yields the recovery payload
        Payload recovered = pipeline.execute(Payload::object(), [](const Payload&) -> Payload {
            throw std::runtime_error("handler failed");
        });
        std::cout << "⚠️  Recovered: " << recovered.dump() << std::endl;

        std::cout << "\n📊 Stats: " << pipeline.get_stats().to_json().dump(2) << std::endl;

        pipeline.shutdown();

    } catch (const std::exception& e) {
        std::cerr << "❌ Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
