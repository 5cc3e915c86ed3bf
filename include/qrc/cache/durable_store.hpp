#pragma once

/// @file durable_store.hpp
/// @brief Abstract persistent second tier of the cache.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "qrc/cache/cache_types.hpp"
#include "qrc/foundation/cache_result.hpp"

namespace qrc::cache {

/// Persistent tier shared across processes and restarts.
///
/// Every write carries an explicit expiry. A read that finds an expired
/// entry deletes it and reports absent, so callers never observe stale data
/// regardless of whether the backend reaps on its own schedule.
///
/// Backend failures are reported as ErrorCode::PersistenceUnavailable with
/// the underlying CacheError attached as context.
///
/// Implementations must be safe for concurrent use from multiple threads.
class IDurableStore {
public:
    virtual ~IDurableStore() = default;

    [[nodiscard]] virtual qrc::foundation::CacheResult<std::optional<CacheEntry>> get(
        std::string_view key) = 0;

    /// Atomic upsert: createdAt = now, expiresAt = now + @p ttl.
    [[nodiscard]] virtual qrc::foundation::CacheResult<void> put(
        std::string_view key, std::string_view value, std::string_view ns, Ttl ttl) = 0;

    [[nodiscard]] virtual qrc::foundation::CacheResult<void> removeByKey(
        std::string_view key) = 0;

    /// Remove every entry tagged with namespace @p ns.
    [[nodiscard]] virtual qrc::foundation::CacheResult<void> removeByNamespace(
        std::string_view ns) = 0;

    [[nodiscard]] virtual qrc::foundation::CacheResult<void> removeAll() = 0;

    /// Delete every entry with expiresAt <= now. Returns the number deleted.
    [[nodiscard]] virtual qrc::foundation::CacheResult<std::size_t> reapExpired() = 0;

    [[nodiscard]] virtual qrc::foundation::CacheResult<DurableStats> stats() = 0;
};

} // namespace qrc::cache
