#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the query result cache.

#include <cstdint>
#include <string_view>

namespace qrc::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Cache (0x0100 - 0x01FF)
    InvalidShape = 0x0100,
    InvalidNamespace = 0x0101,
    InvalidTtl = 0x0102,
    ValueDecodeFailed = 0x0103,

    // Persistence (0x0200 - 0x02FF)
    PersistenceUnavailable = 0x0200,
    PersistenceNotInitialized = 0x0201,

    // Database (0x0300 - 0x03FF)
    DatabaseError = 0x0300,
    QueryFailed = 0x0301,
    ConnectionPoolExhausted = 0x0302,
    NotConnected = 0x0303,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Cache";
        case 0x0200: return "Persistence";
        case 0x0300: return "Database";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace qrc::foundation
