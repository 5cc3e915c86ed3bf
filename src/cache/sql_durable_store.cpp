/// @file sql_durable_store.cpp
/// @brief SqlDurableStore implementation.

#include "qrc/cache/sql_durable_store.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <type_traits>
#include <variant>

#include "qrc/foundation/cache_logger.hpp"

namespace qrc::cache {

using qrc::foundation::CacheError;
using qrc::foundation::CacheResult;
using qrc::foundation::Database;
using qrc::foundation::DatabaseType;
using qrc::foundation::DbRow;
using qrc::foundation::ErrorCode;
using qrc::foundation::LogCategory;
using qrc::foundation::LogContext;
using qrc::foundation::LogLevel;
using qrc::foundation::PreparedStatement;

namespace {

constexpr std::size_t kMaxTableNameLength = 63;

std::int64_t toEpochMs(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch())
        .count();
}

TimePoint fromEpochMs(std::int64_t ms) {
    constexpr auto kLimit =
        std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::max());
    if (ms >= kLimit.count()) {
        return TimePoint::max();
    }
    if (ms <= -kLimit.count()) {
        return TimePoint::min();
    }
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(ms)));
}

/// Wrap a backend error as PersistenceUnavailable, keeping the cause.
CacheError unavailable(std::string_view operation, const CacheError& cause) {
    std::string message = "durable ";
    message += operation;
    message += " failed: ";
    message += cause.message();
    return CacheError(ErrorCode::PersistenceUnavailable, std::move(message), cause);
}

// Drivers disagree on how BIGINT and COUNT(*) come back, so accept
// integers, doubles and numeric text alike.
std::optional<std::int64_t> readInt(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) {
        return std::nullopt;
    }
    return std::visit([](auto&& arg) -> std::optional<std::int64_t> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::int64_t>) {
            return arg;
        } else if constexpr (std::is_same_v<T, double>) {
            return static_cast<std::int64_t>(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
            if (ec != std::errc() || ptr != arg.data() + arg.size()) {
                return std::nullopt;
            }
            return value;
        } else {
            return std::nullopt;
        }
    }, it->second);
}

std::optional<std::string> readText(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) {
        return std::nullopt;
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        return *text;
    }
    return std::nullopt;
}

} // namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct SqlDurableStore::Impl {
    std::shared_ptr<Database> db;
    DurableConfig config;
    std::shared_ptr<Clock> clock;
    std::atomic<bool> initialized{false};

    std::atomic<bool> running{false};
    std::mutex wakeMutex;
    std::condition_variable wake;
    std::thread reaper;

    [[nodiscard]] const std::string& table() const { return config.table; }

    [[nodiscard]] DatabaseType dialect() const { return db->type(); }

    template <typename T>
    CacheResult<T> notInitialized() const {
        return CacheResult<T>::err(CacheError(
            ErrorCode::PersistenceUnavailable, "durable store not initialized",
            CacheError(ErrorCode::PersistenceNotInitialized,
                       "initialize() has not succeeded")));
    }

    CacheResult<void> run(std::string_view operation, const PreparedStatement& stmt) {
        auto result = db->execute(stmt);
        if (result.hasError()) {
            return CacheResult<void>::err(unavailable(operation, result.error()));
        }
        return CacheResult<void>::ok();
    }

    std::string createTableSql() const {
        if (dialect() == DatabaseType::MySQL) {
            return "CREATE TABLE IF NOT EXISTS " + table() +
                   " (cache_key VARCHAR(255) NOT NULL PRIMARY KEY,"
                   " namespace VARCHAR(255) NOT NULL,"
                   " value LONGTEXT NOT NULL,"
                   " created_at BIGINT NOT NULL,"
                   " expires_at BIGINT NOT NULL,"
                   " INDEX " + table() + "_namespace_idx (namespace),"
                   " INDEX " + table() + "_expires_idx (expires_at))";
        }
        return "CREATE TABLE IF NOT EXISTS " + table() +
               " (cache_key TEXT NOT NULL PRIMARY KEY,"
               " namespace TEXT NOT NULL,"
               " value TEXT NOT NULL,"
               " created_at BIGINT NOT NULL,"
               " expires_at BIGINT NOT NULL)";
    }

    std::string upsertSql() const {
        std::string sql = "INSERT INTO " + table() +
                          " (cache_key, namespace, value, created_at, expires_at)"
                          " VALUES ($key, $ns, $value, $created, $expires)";
        if (dialect() == DatabaseType::MySQL) {
            sql += " ON DUPLICATE KEY UPDATE namespace = VALUES(namespace),"
                   " value = VALUES(value), created_at = VALUES(created_at),"
                   " expires_at = VALUES(expires_at)";
        } else {
            sql += " ON CONFLICT (cache_key) DO UPDATE SET namespace = excluded.namespace,"
                   " value = excluded.value, created_at = excluded.created_at,"
                   " expires_at = excluded.expires_at";
        }
        return sql;
    }

    void reapLoop(SqlDurableStore& owner) {
        auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::min(config.reapInterval, kMaxScheduleInterval));
        std::unique_lock lock(wakeMutex);
        while (running.load()) {
            wake.wait_for(lock, interval, [this] { return !running.load(); });
            if (!running.load()) {
                break;
            }
            lock.unlock();
            auto reaped = owner.reapExpired();
            if (reaped.hasError()) {
                LogContext ctx;
                ctx.extra["table"] = config.table;
                ctx.extra["error"] = std::string(reaped.error().message());
                QRC_LOG_CTX(LogLevel::Warning, LogCategory::DurableTier,
                            "scheduled reap failed", ctx);
            } else if (reaped.value() > 0) {
                QRC_LOG_DEBUG(LogCategory::DurableTier,
                              "reaped " + std::to_string(reaped.value()) +
                                  " expired rows");
            }
            lock.lock();
        }
    }
};

// ---------------------------------------------------------------------------
// Construction / lifecycle
// ---------------------------------------------------------------------------

SqlDurableStore::SqlDurableStore(std::shared_ptr<Database> db, DurableConfig config,
                                 std::shared_ptr<Clock> clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->db = std::move(db);
    impl_->config = std::move(config);
    impl_->clock = clock ? std::move(clock) : systemClock();
}

SqlDurableStore::~SqlDurableStore() {
    stop();
}

CacheResult<std::shared_ptr<SqlDurableStore>> SqlDurableStore::open(
    const DurableConfig& config, std::shared_ptr<Clock> clock) {
    auto db = std::make_shared<Database>();
    auto connected = db->connect(config.database);
    if (connected.hasError()) {
        return CacheResult<std::shared_ptr<SqlDurableStore>>::err(
            unavailable("connect", connected.error()));
    }

    auto store = std::make_shared<SqlDurableStore>(std::move(db), config, std::move(clock));
    auto init = store->initialize();
    if (init.hasError()) {
        return CacheResult<std::shared_ptr<SqlDurableStore>>::err(init.error());
    }
    return CacheResult<std::shared_ptr<SqlDurableStore>>::ok(std::move(store));
}

CacheResult<void> SqlDurableStore::initialize() {
    if (impl_->initialized.load()) {
        return CacheResult<void>::ok();
    }
    if (!isValidTableName(impl_->config.table)) {
        return CacheResult<void>::err(CacheError(
            ErrorCode::InvalidArgument,
            "invalid durable table name '" + impl_->config.table + "'"));
    }
    if (!impl_->db) {
        return CacheResult<void>::err(CacheError(
            ErrorCode::PersistenceUnavailable, "no database configured"));
    }

    auto created = impl_->run("schema creation",
                              PreparedStatement(impl_->createTableSql()));
    if (created.hasError()) {
        return created;
    }

    // MySQL declares its indexes inline; it has no CREATE INDEX IF NOT EXISTS.
    if (impl_->dialect() != DatabaseType::MySQL) {
        const auto& t = impl_->table();
        auto nsIndex = impl_->run(
            "schema creation",
            PreparedStatement("CREATE INDEX IF NOT EXISTS " + t + "_namespace_idx ON " +
                              t + " (namespace)"));
        if (nsIndex.hasError()) {
            return nsIndex;
        }
        auto expiresIndex = impl_->run(
            "schema creation",
            PreparedStatement("CREATE INDEX IF NOT EXISTS " + t + "_expires_idx ON " +
                              t + " (expires_at)"));
        if (expiresIndex.hasError()) {
            return expiresIndex;
        }
    }

    impl_->initialized.store(true);

    if (impl_->config.reapInterval > std::chrono::seconds::zero()) {
        impl_->running.store(true);
        impl_->reaper = std::thread([this] { impl_->reapLoop(*this); });
    }

    QRC_LOG_INFO(LogCategory::DurableTier,
                 "durable store ready on table " + impl_->config.table);
    return CacheResult<void>::ok();
}

void SqlDurableStore::stop() {
    {
        std::lock_guard lock(impl_->wakeMutex);
        if (!impl_->running.exchange(false)) {
            return;
        }
    }
    impl_->wake.notify_all();
    if (impl_->reaper.joinable()) {
        impl_->reaper.join();
    }
}

bool SqlDurableStore::isInitialized() const noexcept {
    return impl_->initialized.load();
}

bool SqlDurableStore::isValidTableName(std::string_view name) noexcept {
    if (name.empty() || name.size() > kMaxTableNameLength) {
        return false;
    }
    auto first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (char c : name) {
        auto u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && u != '_') {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// IDurableStore
// ---------------------------------------------------------------------------

CacheResult<std::optional<CacheEntry>> SqlDurableStore::get(std::string_view key) {
    using R = CacheResult<std::optional<CacheEntry>>;
    if (!impl_->initialized.load()) {
        return impl_->notInitialized<std::optional<CacheEntry>>();
    }

    PreparedStatement select(
        "SELECT cache_key, namespace, value, created_at, expires_at FROM " +
        impl_->table() + " WHERE cache_key = $key");
    select.bindString("key", std::string(key));

    auto rows = impl_->db->query(select);
    if (rows.hasError()) {
        return R::err(unavailable("read", rows.error()));
    }
    if (rows.value().empty()) {
        return R::ok(std::nullopt);
    }

    const auto& row = rows.value().front();
    auto ns = readText(row, "namespace");
    auto value = readText(row, "value");
    auto createdAt = readInt(row, "created_at");
    auto expiresAt = readInt(row, "expires_at");
    if (!ns || !value || !createdAt || !expiresAt) {
        return R::err(CacheError(ErrorCode::PersistenceUnavailable,
                                 "durable read returned a malformed row"));
    }

    auto now = toEpochMs(impl_->clock->now());
    if (*expiresAt <= now) {
        // Only drop the row if nobody rewrote it since we looked.
        PreparedStatement del("DELETE FROM " + impl_->table() +
                              " WHERE cache_key = $key AND expires_at <= $now");
        del.bindString("key", std::string(key)).bindInt("now", now);
        auto removed = impl_->run("expired-row delete", del);
        if (removed.hasError()) {
            return R::err(removed.error());
        }
        return R::ok(std::nullopt);
    }

    return R::ok(CacheEntry{std::string(key), std::move(*ns), std::move(*value),
                            fromEpochMs(*createdAt), fromEpochMs(*expiresAt)});
}

CacheResult<void> SqlDurableStore::put(std::string_view key, std::string_view value,
                                       std::string_view ns, Ttl ttl) {
    if (!impl_->initialized.load()) {
        return impl_->notInitialized<void>();
    }

    auto now = impl_->clock->now();
    PreparedStatement upsert(impl_->upsertSql());
    upsert.bindString("key", std::string(key))
        .bindString("ns", std::string(ns))
        .bindString("value", std::string(value))
        .bindInt("created", toEpochMs(now))
        .bindInt("expires", toEpochMs(expiryFor(now, ttl)));
    return impl_->run("write", upsert);
}

CacheResult<void> SqlDurableStore::removeByKey(std::string_view key) {
    if (!impl_->initialized.load()) {
        return impl_->notInitialized<void>();
    }
    PreparedStatement del("DELETE FROM " + impl_->table() + " WHERE cache_key = $key");
    del.bindString("key", std::string(key));
    return impl_->run("delete", del);
}

CacheResult<void> SqlDurableStore::removeByNamespace(std::string_view ns) {
    if (!impl_->initialized.load()) {
        return impl_->notInitialized<void>();
    }
    PreparedStatement del("DELETE FROM " + impl_->table() + " WHERE namespace = $ns");
    del.bindString("ns", std::string(ns));
    return impl_->run("namespace delete", del);
}

CacheResult<void> SqlDurableStore::removeAll() {
    if (!impl_->initialized.load()) {
        return impl_->notInitialized<void>();
    }
    return impl_->run("clear", PreparedStatement("DELETE FROM " + impl_->table()));
}

CacheResult<std::size_t> SqlDurableStore::reapExpired() {
    if (!impl_->initialized.load()) {
        return impl_->notInitialized<std::size_t>();
    }

    auto now = toEpochMs(impl_->clock->now());

    // database_system reports no affected-row count, so count first.
    PreparedStatement count("SELECT COUNT(*) AS expired FROM " + impl_->table() +
                            " WHERE expires_at <= $now");
    count.bindInt("now", now);
    auto counted = impl_->db->query(count);
    if (counted.hasError()) {
        return CacheResult<std::size_t>::err(unavailable("reap", counted.error()));
    }
    std::int64_t expired = 0;
    if (!counted.value().empty()) {
        expired = readInt(counted.value().front(), "expired").value_or(0);
    }
    if (expired == 0) {
        return CacheResult<std::size_t>::ok(0);
    }

    PreparedStatement del("DELETE FROM " + impl_->table() + " WHERE expires_at <= $now");
    del.bindInt("now", now);
    auto removed = impl_->run("reap", del);
    if (removed.hasError()) {
        return CacheResult<std::size_t>::err(removed.error());
    }
    return CacheResult<std::size_t>::ok(static_cast<std::size_t>(expired));
}

CacheResult<DurableStats> SqlDurableStore::stats() {
    if (!impl_->initialized.load()) {
        return impl_->notInitialized<DurableStats>();
    }

    auto rows = impl_->db->query(
        "SELECT namespace, COUNT(*) AS entries, MIN(created_at) AS oldest,"
        " MAX(created_at) AS newest FROM " + impl_->table() + " GROUP BY namespace");
    if (rows.hasError()) {
        return CacheResult<DurableStats>::err(unavailable("stats", rows.error()));
    }

    DurableStats stats;
    for (const auto& row : rows.value()) {
        auto ns = readText(row, "namespace");
        auto entries = readInt(row, "entries");
        if (!ns || !entries) {
            continue;
        }
        stats.entriesByNamespace[*ns] = static_cast<std::size_t>(*entries);
        stats.totalEntries += static_cast<std::size_t>(*entries);

        if (auto oldest = readInt(row, "oldest")) {
            auto tp = fromEpochMs(*oldest);
            if (!stats.oldestEntry || tp < *stats.oldestEntry) {
                stats.oldestEntry = tp;
            }
        }
        if (auto newest = readInt(row, "newest")) {
            auto tp = fromEpochMs(*newest);
            if (!stats.newestEntry || tp > *stats.newestEntry) {
                stats.newestEntry = tp;
            }
        }
    }
    return CacheResult<DurableStats>::ok(std::move(stats));
}

} // namespace qrc::cache
