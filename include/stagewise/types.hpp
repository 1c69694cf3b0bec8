// include/stagewise/types.hpp
// Purpose: Core types, constants, and enums for the stagewise pipeline engine
// Payloads flowing through the pipeline are dynamic JSON documents

#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace stagewise {

// Type aliases for clarity
using Payload = nlohmann::json;
using RequestId = std::string;
using Timestamp = uint64_t;
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

// Pipeline execution stages, in execution order
enum class Stage : uint8_t {
    PRE_PROCESSING = 0,    // Sequential transforms over the request
    REQUEST_HANDLING = 1,  // Onion chain of interceptors around the handler
    POST_PROCESSING = 2,   // Sequential transforms over the result
    ERROR_HANDLING = 3,    // Best-effort handlers, run only on failure
    CLEANUP = 4            // Best-effort handlers, always run
};

constexpr size_t STAGE_COUNT = 5;

constexpr std::array<Stage, STAGE_COUNT> ALL_STAGES = {
    Stage::PRE_PROCESSING,
    Stage::REQUEST_HANDLING,
    Stage::POST_PROCESSING,
    Stage::ERROR_HANDLING,
    Stage::CLEANUP
};

// Execution model a stage runs its middleware under
enum class StageFamily : uint8_t {
    TRANSFORM = 0,      // (payload, context) -> payload
    INTERCEPTOR = 1,    // (request, context, next) -> result
    ERROR_HANDLER = 2,  // (error, context) -> void
    CLEANUP = 3         // (context) -> void
};

namespace Utils {

// Get current wall-clock timestamp in milliseconds
inline Timestamp now_milliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Stage conversions
std::string stage_to_string(Stage stage);
std::optional<Stage> string_to_stage(const std::string& name);
StageFamily stage_family(Stage stage);
std::string stage_family_to_string(StageFamily family);

// Generate a process-unique request identifier ("req_<ms>_<seq>_<rand>")
RequestId generate_request_id();

} // namespace Utils

} // namespace stagewise
