// include/stagewise/stagewise.hpp
// Purpose: Main header file for the stagewise pipeline engine
// This is the primary include for users of the library

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "context.hpp"
#include "middleware.hpp"
#include "conditional.hpp"
#include "pipeline.hpp"
#include "builtin.hpp"
#include "utils.hpp"

namespace stagewise {

// Version information
constexpr const char* VERSION = "1.0.0";
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

// Get library version
inline std::string version() {
    return VERSION;
}

} // namespace stagewise
