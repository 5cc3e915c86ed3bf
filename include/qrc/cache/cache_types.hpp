#pragma once

/// @file cache_types.hpp
/// @brief Core types for the two-tier query result cache.
///
/// Defines the cache entry record, coordinator configuration, and the
/// statistics snapshots exposed by the coordinator and durable tier.

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "qrc/cache/clock.hpp"
#include "qrc/foundation/database.hpp"

namespace qrc::cache {

/// Millisecond TTL used throughout the cache.
using Ttl = std::chrono::milliseconds;

/// Largest TTL the coordinator and config loader accept (100 years).
inline constexpr Ttl kMaxTtl = std::chrono::hours(24 * 365 * 100);

/// Largest sweep or reap interval the config loader accepts (1 year).
inline constexpr std::chrono::seconds kMaxScheduleInterval = std::chrono::hours(24 * 365);

/// now + ttl, saturated at TimePoint::max() instead of overflowing.
/// A non-positive @p ttl expires at @p now.
[[nodiscard]] inline TimePoint expiryFor(TimePoint now, Ttl ttl) noexcept {
    if (ttl <= Ttl::zero()) {
        return now;
    }
    auto headroom = std::chrono::duration_cast<Ttl>(TimePoint::max() - now);
    if (ttl >= headroom) {
        return TimePoint::max();
    }
    return now + ttl;
}

/// One cached value as held by the durable tier.
struct CacheEntry {
    std::string key;     ///< Derived key: namespace ':' hex digest.
    std::string ns;      ///< Namespace tag used for bulk invalidation.
    std::string value;   ///< Opaque serialized payload.
    TimePoint createdAt; ///< Time of the last write.
    TimePoint expiresAt; ///< createdAt + ttl.
};

/// Settings for the SQL-backed durable tier.
struct DurableConfig {
    bool enabled = true;                           ///< Use the durable tier at all.
    std::string table = "query_cache";             ///< Cache table name.
    std::chrono::seconds reapInterval{60};         ///< Scheduled reaper period (0 = off).
    qrc::foundation::DatabaseConfig database;      ///< Backing database connection.
};

/// Configuration for a CacheCoordinator and its tiers.
struct CacheConfig {
    Ttl defaultTtl{std::chrono::seconds(300)};      ///< TTL for put/readThrough without one.
    std::chrono::seconds sweepInterval{60};         ///< FastStore sweep period (0 = off).
    DurableConfig durable;                          ///< Durable tier settings.

    /// Preset for expensive computed analyses: 24 h TTL, hourly sweep.
    static CacheConfig computedResultDefaults() {
        CacheConfig config;
        config.defaultTtl = std::chrono::hours(24);
        config.sweepInterval = std::chrono::hours(1);
        config.durable.reapInterval = std::chrono::hours(1);
        return config;
    }
};

/// Snapshot of coordinator activity.
struct CacheStats {
    uint64_t fastHits = 0;            ///< Reads answered by the fast tier.
    uint64_t durableHits = 0;         ///< Reads answered by the durable tier (promoted).
    uint64_t misses = 0;              ///< Reads answered by neither tier.
    uint64_t persistenceFailures = 0; ///< Durable operations that failed.
    std::size_t fastEntries = 0;      ///< Current fast-tier entry count.

    /// Fraction of reads answered by either tier (0.0 - 1.0).
    [[nodiscard]] double hitRate() const {
        auto total = fastHits + durableHits + misses;
        if (total == 0) {
            return 0.0;
        }
        return static_cast<double>(fastHits + durableHits) /
               static_cast<double>(total);
    }
};

/// Snapshot of the durable tier's contents.
struct DurableStats {
    std::size_t totalEntries = 0;
    std::map<std::string, std::size_t> entriesByNamespace;
    std::optional<TimePoint> oldestEntry;  ///< Earliest createdAt.
    std::optional<TimePoint> newestEntry;  ///< Latest createdAt.
};

} // namespace qrc::cache
