#pragma once

/// @file version.hpp
/// @brief Library version information.

#define CSA_VERSION_MAJOR 0
#define CSA_VERSION_MINOR 3
#define CSA_VERSION_PATCH 0
#define CSA_VERSION_STRING "0.3.0"

namespace csa {

/// Library version information at compile time.
struct Version {
    static constexpr int major = CSA_VERSION_MAJOR;
    static constexpr int minor = CSA_VERSION_MINOR;
    static constexpr int patch = CSA_VERSION_PATCH;
    static constexpr const char* string = CSA_VERSION_STRING;
};

} // namespace csa
