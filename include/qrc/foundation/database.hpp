#pragma once

/// @file database.hpp
/// @brief Database adapter wrapping kcenon database_system with a small
///        connection pool and named-parameter statements.
///
/// This is the durable-store client the SQL-backed cache tier is built on.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "qrc/foundation/cache_result.hpp"

namespace qrc::foundation {

// ── Database values ─────────────────────────────────────────────────────────

/// Sentinel type representing SQL NULL.
struct DbNull {
    bool operator==(const DbNull&) const noexcept { return true; }
};

/// A single column value.
using DbValue = std::variant<DbNull, std::string, std::int64_t, double, bool>;

/// A single row: column name → value.
using DbRow = std::unordered_map<std::string, DbValue>;

/// Complete result set of a SELECT.
using QueryResult = std::vector<DbRow>;

// ── Configuration ───────────────────────────────────────────────────────────

enum class DatabaseType : uint8_t {
    PostgreSQL,
    MySQL,
    SQLite
};

struct DatabaseConfig {
    std::string connectionString;
    DatabaseType dbType = DatabaseType::PostgreSQL;
    uint32_t minConnections = 1;
    uint32_t maxConnections = 8;
    std::chrono::seconds connectionTimeout{10};
};

// ── PreparedStatement ───────────────────────────────────────────────────────

/// SQL template with $name placeholders bound by name.
///
/// Example:
/// @code
///   PreparedStatement stmt("DELETE FROM query_cache WHERE namespace = $ns");
///   stmt.bindString("ns", "prices");
///   auto affected = db.execute(stmt);
/// @endcode
class PreparedStatement {
public:
    explicit PreparedStatement(std::string sql);

    PreparedStatement& bindString(std::string_view name, std::string value);

    PreparedStatement& bindInt(std::string_view name, std::int64_t value);

    PreparedStatement& bindDouble(std::string_view name, double value);

    PreparedStatement& bindBool(std::string_view name, bool value);

    PreparedStatement& bindNull(std::string_view name);

    [[nodiscard]] std::string_view sql() const noexcept;

    /// Substitute every bound parameter into the template.
    /// String values are single-quoted with embedded quotes doubled; for
    /// MySQL backslashes are doubled as well. Unbound placeholders are kept.
    [[nodiscard]] std::string resolve(DatabaseType dialect = DatabaseType::PostgreSQL) const;

    void clearBindings();

private:
    std::string sql_;
    std::unordered_map<std::string, DbValue> params_;
};

// ── Database ────────────────────────────────────────────────────────────────

/// Pooled database handle over kcenon's database_system.
///
/// Connections are created lazily up to maxConnections; callers block up to
/// connectionTimeout waiting for a free connection. That timeout is the
/// only time limit applied to durable-tier operations.
class Database {
public:
    Database();
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) noexcept;
    Database& operator=(Database&&) noexcept;

    /// Connect and open minConnections pooled connections.
    [[nodiscard]] CacheResult<void> connect(const DatabaseConfig& config);

    void disconnect();

    [[nodiscard]] bool isConnected() const noexcept;

    /// Backend type of the current (or last) connection.
    [[nodiscard]] DatabaseType type() const noexcept;

    /// Execute a SELECT and return its rows.
    [[nodiscard]] CacheResult<QueryResult> query(std::string_view sql);

    /// Execute a command (INSERT/UPDATE/DELETE/DDL).
    [[nodiscard]] CacheResult<uint64_t> execute(std::string_view sql);

    [[nodiscard]] CacheResult<QueryResult> query(const PreparedStatement& stmt);

    [[nodiscard]] CacheResult<uint64_t> execute(const PreparedStatement& stmt);

    /// Number of connections currently checked out.
    [[nodiscard]] std::size_t activeConnections() const noexcept;

    [[nodiscard]] std::size_t poolSize() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace qrc::foundation
