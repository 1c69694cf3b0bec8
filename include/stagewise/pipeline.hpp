// include/stagewise/pipeline.hpp
// Purpose: Staged middleware pipeline - registration, execution and introspection
// One Context per execute(); error handlers and cleanup run exactly once per failing call

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "context.hpp"
#include "middleware.hpp"
#include <array>
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace stagewise {

// Execution counters
struct ExecutionCounters {
    std::atomic<uint64_t> requests_started{0};
    std::atomic<uint64_t> requests_succeeded{0};
    std::atomic<uint64_t> requests_failed{0};
    std::atomic<uint64_t> requests_recovered{0};
    std::atomic<uint64_t> requests_timed_out{0};
    std::atomic<uint64_t> total_processing_time_ms{0};

    void reset();

    struct Snapshot {
        uint64_t requests_started = 0;
        uint64_t requests_succeeded = 0;
        uint64_t requests_failed = 0;
        uint64_t requests_recovered = 0;
        uint64_t requests_timed_out = 0;
        uint64_t total_processing_time_ms = 0;

        double get_success_rate() const {
            uint64_t total = requests_succeeded + requests_failed;
            return total > 0 ? static_cast<double>(requests_succeeded) / total : 1.0;
        }

        double get_average_processing_time_ms() const {
            uint64_t total = requests_succeeded + requests_failed;
            return total > 0 ? static_cast<double>(total_processing_time_ms) / total : 0.0;
        }
    };

    Snapshot snapshot() const;
};

// Read-only view returned by Pipeline::get_stats()
struct PipelineStats {
    size_t active_contexts = 0;
    size_t stale_contexts = 0;
    std::array<size_t, STAGE_COUNT> stage_counts{};
    Payload config;
    ExecutionCounters::Snapshot counters;

    size_t count(Stage stage) const {
        return stage_counts[static_cast<size_t>(stage)];
    }

    Payload to_json() const;
};

class Pipeline {
public:
    Pipeline();
    explicit Pipeline(const PipelineConfig& config);  // validates config
    ~Pipeline();

    // Non-copyable, movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) noexcept;
    Pipeline& operator=(Pipeline&&) noexcept;

    // Registration (setup time, before concurrent traffic)
    Pipeline& register_middleware(Stage stage, const Middleware& middleware);
    Pipeline& register_middleware(const StagedMiddleware& staged);
    Pipeline& use(const Middleware& middleware, Stage stage = Stage::REQUEST_HANDLING);
    Pipeline& pre_processing(const Middleware& middleware);
    Pipeline& post_processing(const Middleware& middleware);
    Pipeline& error_handling(const Middleware& middleware);
    Pipeline& cleanup(const Middleware& middleware);

    // Execution. With recovery enabled failures yield the recovery payload,
    // otherwise the recorded error is rethrown after error handling and cleanup.
    Payload execute(const Payload& request, const Handler& handler);
    std::future<Payload> execute_async(Payload request, Handler handler);

    // Introspection
    PipelineStats get_stats() const;
    Payload export_metrics() const;
    std::vector<std::string> get_middleware_names(Stage stage) const;
    size_t purge_stale_contexts();
    void reset_stats();  // zeroes counters and metrics
    const PipelineConfig& config() const;

    // Lifecycle
    void initialize();
    void shutdown();
    bool is_initialized() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace stagewise
