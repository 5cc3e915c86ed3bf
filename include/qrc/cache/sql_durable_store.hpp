#pragma once

/// @file sql_durable_store.hpp
/// @brief IDurableStore backed by a relational database.
///
/// Entries are kept in a single table (default "query_cache"):
///
/// | Column     | Type                    | Notes                      |
/// |------------|-------------------------|----------------------------|
/// | cache_key  | TEXT / VARCHAR(255)     | primary key                |
/// | namespace  | TEXT / VARCHAR(255)     | indexed                    |
/// | value      | TEXT / LONGTEXT         | opaque payload             |
/// | created_at | BIGINT                  | epoch milliseconds         |
/// | expires_at | BIGINT                  | epoch milliseconds, indexed|
///
/// VARCHAR/LONGTEXT are used on MySQL, which cannot index unbounded text.

#include <memory>
#include <string_view>

#include "qrc/cache/cache_types.hpp"
#include "qrc/cache/clock.hpp"
#include "qrc/cache/durable_store.hpp"
#include "qrc/foundation/database.hpp"

namespace qrc::cache {

/// SQL durable tier over the Database adapter.
///
/// Call initialize() once before use: it validates the table name, creates
/// the schema if missing and starts the scheduled reaper. Operations on an
/// uninitialized store fail with PersistenceUnavailable.
///
/// Example:
/// @code
///   auto db = std::make_shared<qrc::foundation::Database>();
///   (void)db->connect(config.durable.database);
///   auto store = std::make_shared<SqlDurableStore>(db, config.durable);
///   if (auto init = store->initialize(); !init) { ... }
/// @endcode
class SqlDurableStore final : public IDurableStore {
public:
    SqlDurableStore(std::shared_ptr<qrc::foundation::Database> db,
                    DurableConfig config,
                    std::shared_ptr<Clock> clock = systemClock());
    ~SqlDurableStore() override;

    SqlDurableStore(const SqlDurableStore&) = delete;
    SqlDurableStore& operator=(const SqlDurableStore&) = delete;

    /// Connect a fresh Database from @p config.database and initialize.
    [[nodiscard]] static qrc::foundation::CacheResult<std::shared_ptr<SqlDurableStore>> open(
        const DurableConfig& config, std::shared_ptr<Clock> clock = systemClock());

    /// Create the table and indexes and start the reaper.
    [[nodiscard]] qrc::foundation::CacheResult<void> initialize();

    /// Stop the reaper thread (idempotent).
    void stop();

    [[nodiscard]] bool isInitialized() const noexcept;

    /// True for a plain SQL identifier: [A-Za-z_][A-Za-z0-9_]*, at most 63 chars.
    [[nodiscard]] static bool isValidTableName(std::string_view name) noexcept;

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

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace qrc::cache
