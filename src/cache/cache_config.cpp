/// @file cache_config.cpp
/// @brief loadCacheConfig implementation.

#include "qrc/cache/cache_config.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "qrc/foundation/cache_logger.hpp"

namespace qrc::cache {

using qrc::foundation::CacheError;
using qrc::foundation::CacheResult;
using qrc::foundation::ConfigManager;
using qrc::foundation::DatabaseType;
using qrc::foundation::ErrorCode;

namespace {

/// Overwrite @p out only when @p key is present; a wrong type is an error.
template <typename T>
CacheResult<void> readOptional(const ConfigManager& config,
                               const std::string& key, T& out) {
    if (!config.hasKey(key)) {
        return CacheResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (value.hasError()) {
        return CacheResult<void>::err(value.error());
    }
    out = std::move(value).value();
    return CacheResult<void>::ok();
}

CacheResult<DatabaseType> parseDatabaseType(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (name == "postgresql" || name == "postgres") {
        return CacheResult<DatabaseType>::ok(DatabaseType::PostgreSQL);
    }
    if (name == "mysql") {
        return CacheResult<DatabaseType>::ok(DatabaseType::MySQL);
    }
    if (name == "sqlite") {
        return CacheResult<DatabaseType>::ok(DatabaseType::SQLite);
    }
    return CacheResult<DatabaseType>::err(
        CacheError(ErrorCode::ConfigTypeMismatch, "unknown database type: " + name));
}

CacheResult<void> checkNonNegative(const std::string& key, int64_t value) {
    if (value < 0) {
        return CacheResult<void>::err(
            CacheError(ErrorCode::InvalidArgument, key + " must not be negative"));
    }
    return CacheResult<void>::ok();
}

CacheResult<void> checkInterval(const std::string& key, int64_t value) {
    if (value > kMaxScheduleInterval.count()) {
        return CacheResult<void>::err(CacheError(
            ErrorCode::InvalidArgument,
            key + " must not exceed " + std::to_string(kMaxScheduleInterval.count())));
    }
    return CacheResult<void>::ok();
}

} // namespace

CacheResult<CacheConfig> loadCacheConfig(const ConfigManager& config,
                                         std::string_view prefix) {
    const std::string base = prefix.empty() ? std::string() : std::string(prefix) + ".";
    CacheConfig result;

    int64_t defaultTtl = std::chrono::duration_cast<std::chrono::seconds>(
                             result.defaultTtl).count();
    int64_t sweepInterval = result.sweepInterval.count();
    int64_t reapInterval = result.durable.reapInterval.count();
    int64_t connectionTimeout = result.durable.database.connectionTimeout.count();
    std::string dbType;

    CacheResult<void> steps[] = {
        readOptional(config, base + "default_ttl_seconds", defaultTtl),
        readOptional(config, base + "sweep_interval_seconds", sweepInterval),
        readOptional(config, base + "durable.enabled", result.durable.enabled),
        readOptional(config, base + "durable.table", result.durable.table),
        readOptional(config, base + "durable.reap_interval_seconds", reapInterval),
        readOptional(config, base + "database.connection_string",
                     result.durable.database.connectionString),
        readOptional(config, base + "database.type", dbType),
        readOptional(config, base + "database.min_connections",
                     result.durable.database.minConnections),
        readOptional(config, base + "database.max_connections",
                     result.durable.database.maxConnections),
        readOptional(config, base + "database.connection_timeout_seconds",
                     connectionTimeout),
        checkNonNegative(base + "sweep_interval_seconds", sweepInterval),
        checkNonNegative(base + "durable.reap_interval_seconds", reapInterval),
        checkNonNegative(base + "database.connection_timeout_seconds",
                         connectionTimeout),
        checkInterval(base + "sweep_interval_seconds", sweepInterval),
        checkInterval(base + "durable.reap_interval_seconds", reapInterval),
    };
    for (const auto& step : steps) {
        if (step.hasError()) {
            QRC_LOG_ERROR(qrc::foundation::LogCategory::Config,
                          std::string(step.error().message()));
            return CacheResult<CacheConfig>::err(step.error());
        }
    }

    if (defaultTtl <= 0) {
        return CacheResult<CacheConfig>::err(
            CacheError(ErrorCode::InvalidTtl,
                       base + "default_ttl_seconds must be positive"));
    }
    if (defaultTtl > std::chrono::duration_cast<std::chrono::seconds>(kMaxTtl).count()) {
        return CacheResult<CacheConfig>::err(CacheError(
            ErrorCode::InvalidTtl,
            base + "default_ttl_seconds must not exceed " +
                std::to_string(
                    std::chrono::duration_cast<std::chrono::seconds>(kMaxTtl).count())));
    }

    if (!dbType.empty()) {
        auto parsed = parseDatabaseType(dbType);
        if (parsed.hasError()) {
            return CacheResult<CacheConfig>::err(parsed.error());
        }
        result.durable.database.dbType = parsed.value();
    }

    result.defaultTtl = std::chrono::seconds(defaultTtl);
    result.sweepInterval = std::chrono::seconds(sweepInterval);
    result.durable.reapInterval = std::chrono::seconds(reapInterval);
    result.durable.database.connectionTimeout = std::chrono::seconds(connectionTimeout);

    return CacheResult<CacheConfig>::ok(std::move(result));
}

} // namespace qrc::cache
