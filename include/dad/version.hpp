#pragma once

/// @file version.hpp
/// @brief Project version information and top-level namespace.

#define DAD_VERSION_MAJOR 0
#define DAD_VERSION_MINOR 1
#define DAD_VERSION_PATCH 0
#define DAD_VERSION_STRING "0.1.0"

namespace dad {

/// Compile-time project version.
struct Version {
    static constexpr int major = DAD_VERSION_MAJOR;
    static constexpr int minor = DAD_VERSION_MINOR;
    static constexpr int patch = DAD_VERSION_PATCH;
    static constexpr const char* string = DAD_VERSION_STRING;
};

} // namespace dad
