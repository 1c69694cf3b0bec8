// src/types.cpp
// Implementation of stage conversions and request identifier generation

#include "stagewise/types.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace stagewise {
namespace Utils {

std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::PRE_PROCESSING: return "pre_processing";
        case Stage::REQUEST_HANDLING: return "request_handling";
        case Stage::POST_PROCESSING: return "post_processing";
        case Stage::ERROR_HANDLING: return "error_handling";
        case Stage::CLEANUP: return "cleanup";
        default: return "unknown";
    }
}

std::optional<Stage> string_to_stage(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    for (Stage stage : ALL_STAGES) {
        if (stage_to_string(stage) == lower) {
            return stage;
        }
    }
    return std::nullopt;
}

StageFamily stage_family(Stage stage) {
    switch (stage) {
        case Stage::PRE_PROCESSING:
        case Stage::POST_PROCESSING:
            return StageFamily::TRANSFORM;
        case Stage::REQUEST_HANDLING:
            return StageFamily::INTERCEPTOR;
        case Stage::ERROR_HANDLING:
            return StageFamily::ERROR_HANDLER;
        case Stage::CLEANUP:
        default:
            return StageFamily::CLEANUP;
    }
}

std::string stage_family_to_string(StageFamily family) {
    switch (family) {
        case StageFamily::TRANSFORM: return "transform";
        case StageFamily::INTERCEPTOR: return "interceptor";
        case StageFamily::ERROR_HANDLER: return "error_handler";
        case StageFamily::CLEANUP: return "cleanup";
        default: return "unknown";
    }
}

RequestId generate_request_id() {
    static std::atomic<uint64_t> sequence{0};
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    static thread_local std::uniform_int_distribution<uint32_t> dis;

    // The sequence number alone keeps ids unique within the process
    std::ostringstream oss;
    oss << "req_" << now_milliseconds()
        << "_" << sequence.fetch_add(1, std::memory_order_relaxed)
        << "_" << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    return oss.str();
}

} // namespace Utils
} // namespace stagewise
