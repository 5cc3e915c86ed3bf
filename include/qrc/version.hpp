#pragma once

/// @file version.hpp
/// @brief Library version information and root namespace definition.

#define QRC_VERSION_MAJOR 0
#define QRC_VERSION_MINOR 3
#define QRC_VERSION_PATCH 0
#define QRC_VERSION_STRING "0.3.0"

namespace qrc {

/// Library version information at compile time.
struct Version {
    static constexpr int major = QRC_VERSION_MAJOR;
    static constexpr int minor = QRC_VERSION_MINOR;
    static constexpr int patch = QRC_VERSION_PATCH;
    static constexpr const char* string = QRC_VERSION_STRING;
};

} // namespace qrc
