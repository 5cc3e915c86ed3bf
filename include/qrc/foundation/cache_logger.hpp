#pragma once

/// @file cache_logger.hpp
/// @brief CacheLogger wrapping kcenon logger interfaces for category-based,
///        structured logging of cache activity.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "qrc/foundation/cache_result.hpp"

namespace qrc::foundation {

/// Log severity levels.
///
/// Maps 1:1 onto kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per cache subsystem.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Coordinator and key derivation
    FastTier    = 1, ///< In-process store and its sweeper
    DurableTier = 2, ///< Durable store and its reaper
    Database    = 3, ///< Database adapter
    Config      = 4  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "FastTier", "DurableTier", "Database", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.cacheNamespace = "prices";
///   ctx.extra["error"] = std::string(err.message());
///   logger.logWithContext(LogLevel::Warning, LogCategory::DurableTier,
///                         "durable write failed", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> cacheNamespace;
    std::optional<std::string> cacheKey;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger forwarding to kcenon's GlobalLoggerRegistry.
///
/// Each category has its own runtime minimum level. Messages are written
/// as "[Category] message {key=value, ...}" to the logger registered under
/// "qrc.<Category>", or to the registry's default logger.
///
/// Default levels:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | FastTier    | Info          |
/// | DurableTier | Info          |
/// | Database    | Info          |
/// | Config      | Info          |
class CacheLogger {
public:
    CacheLogger();
    ~CacheLogger();

    CacheLogger(const CacheLogger&) = delete;
    CacheLogger& operator=(const CacheLogger&) = delete;
    CacheLogger(CacheLogger&&) noexcept;
    CacheLogger& operator=(CacheLogger&&) noexcept;

    /// Log a message. No-op if the level is below the category's minimum.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    CacheResult<void> flush();

    /// Process-wide instance used by the QRC_LOG macros.
    static CacheLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace qrc::foundation

/// @name QRC_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define QRC_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace ... 6=Off).
/// @{

#ifndef QRC_MIN_LOG_LEVEL
    #define QRC_MIN_LOG_LEVEL 0
#endif

#define QRC_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= QRC_MIN_LOG_LEVEL &&                       \
            ::qrc::foundation::CacheLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::qrc::foundation::CacheLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define QRC_LOG_CTX(level, cat, msg, ctx)                                         \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= QRC_MIN_LOG_LEVEL &&                       \
            ::qrc::foundation::CacheLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::qrc::foundation::CacheLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                    \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define QRC_LOG_DEBUG(cat, msg) \
    QRC_LOG(::qrc::foundation::LogLevel::Debug, (cat), (msg))

#define QRC_LOG_INFO(cat, msg) \
    QRC_LOG(::qrc::foundation::LogLevel::Info, (cat), (msg))

#define QRC_LOG_WARN(cat, msg) \
    QRC_LOG(::qrc::foundation::LogLevel::Warning, (cat), (msg))

#define QRC_LOG_ERROR(cat, msg) \
    QRC_LOG(::qrc::foundation::LogLevel::Error, (cat), (msg))

/// @}
