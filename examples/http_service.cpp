// http_service.cpp
// An HTTP-shaped request pipeline built from the ready-made middleware

#include <iostream>
#include <vector>
#include "stagewise/stagewise.hpp"

using namespace stagewise;

namespace {

Payload route(const Payload& request) {
    const std::string path = request.value("path", std::string("/"));
    if (path == "/health") {
        return {{"status", 200}, {"body", "ok"}};
    }
    if (path == "/orders") {
        return {{"status", 200}, {"body", Payload::array({Payload{{"id", 1}, {"item", "book"}}})}};
    }
    if (path == "/crash") {
        throw std::runtime_error("order store unreachable");
    }
    return {{"status", 404}};
}

} // namespace

int main() {
    std::cout << "🌐 stagewise - HTTP Service Example\n" << std::endl;

    try {
        Pipeline pipeline(Presets::development().set_system_log_level(SystemLogLevel::WARN));

        pipeline.pre_processing(MiddlewareFactory::create_validation_middleware({"GET", "POST"}, {"path"}))
                .use(MiddlewareFactory::create_logging_middleware("access"))
                .use(MiddlewareFactory::create_timing_middleware())
                .use(conditional([](const Payload& request) {
                         return request.value("path", std::string()) != "/health";
                     }, MiddlewareFactory::create_header_auth_middleware()))
                .post_processing(MiddlewareFactory::create_request_id_middleware())
                .error_handling(make_error_handler("alert", [](const Error& error, Context& context) {
                    std::cerr << "🚨 " << context.request_id() << ": " << error.what() << std::endl;
                }));

        pipeline.initialize();

        std::vector<Payload> requests = {
            {{"method", "GET"}, {"path", "/health"}},
            {{"method", "GET"}, {"path", "/orders"}},
            {{"method", "GET"}, {"path", "/orders"}, {"headers", {{"Authorization", "Bearer demo"}}}},
            {{"method", "DELETE"}, {"path", "/orders"}},
            {{"method", "GET"}, {"path", "/crash"}, {"headers", {{"Authorization", "Bearer demo"}}}},
        };

        for (const auto& request : requests) {
            Payload response = pipeline.execute(request, route);
            std::cout << request["method"].get<std::string>() << " " << request["path"].get<std::string>()
                      << " => " << response.dump() << "\n" << std::endl;
        }

        auto counters = pipeline.get_stats().counters;
        std::cout << "📊 " << counters.requests_succeeded << " succeeded, "
                  << counters.requests_failed << " failed, success rate "
                  << counters.get_success_rate() * 100.0 << "%" << std::endl;
        std::cout << "📈 Metrics: " << pipeline.export_metrics().dump(2) << std::endl;

        pipeline.shutdown();

    } catch (const std::exception& e) {
        std::cerr << "❌ Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
