#pragma once

/// @file in_memory_durable_store.hpp
/// @brief Map-backed IDurableStore for testing and development.

#include <memory>

#include "qrc/cache/clock.hpp"
#include "qrc/cache/durable_store.hpp"

namespace qrc::cache {

/// In-memory durable tier (no persistence).
///
/// Honors the full IDurableStore contract, including delete-on-read of
/// expired entries, so coordinator behavior can be exercised without a
/// database.
class InMemoryDurableStore final : public IDurableStore {
public:
    explicit InMemoryDurableStore(std::shared_ptr<Clock> clock = systemClock());
    ~InMemoryDurableStore() override;

    InMemoryDurableStore(const InMemoryDurableStore&) = delete;
    InMemoryDurableStore& operator=(const InMemoryDurableStore&) = delete;

    [[nodiscard]] qrc::foundation::CacheResult<std::optional<CacheEntry>> get(
        std::string_view key) override;
    [[nodiscard]] qrc::foundation::CacheResult<void> put(
        std::string_view key, std::string_view value, std::string_view ns,
        Ttl ttl) override;
    [[nodiscard]] qrc::foundation::CacheResult<void> removeByKey(
        std::string_view key) override;
    [[nodiscard]] qrc::foundation::CacheResult<void> removeByNamespace(
        std::string_view ns) override;
    [[nodiscard]] qrc::foundation::CacheResult<void> removeAll() override;
    [[nodiscard]] qrc::foundation::CacheResult<std::size_t> reapExpired() override;
    [[nodiscard]] qrc::foundation::CacheResult<DurableStats> stats() override;

    /// Number of stored entries, including expired ones not yet reaped.
    [[nodiscard]] std::size_t size() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace qrc::cache
