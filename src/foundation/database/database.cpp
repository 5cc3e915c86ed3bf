/// @file database.cpp
/// @brief Database implementation wrapping kcenon database_system.

#include "qrc/foundation/database.hpp"

// kcenon database_system headers (hidden behind PIMPL)
#include <database_manager.h>
#include <core/database_backend.h>
#include <core/database_context.h>
#include <database_types.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <mutex>
#include <type_traits>

#include "qrc/foundation/cache_logger.hpp"

namespace qrc::foundation {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ::database::database_types toKcenon(DatabaseType type) {
    switch (type) {
        case DatabaseType::PostgreSQL: return ::database::database_types::postgres;
        case DatabaseType::MySQL:      return ::database::database_types::mysql;
        case DatabaseType::SQLite:     return ::database::database_types::sqlite;
    }
    return ::database::database_types::postgres;
}

static QueryResult convertResult(
    const ::database::core::database_result& kcResult) {
    QueryResult result;
    result.reserve(kcResult.size());

    for (const auto& kcRow : kcResult) {
        DbRow row;
        for (const auto& [col, val] : kcRow) {
            std::visit([&](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::string> ||
                              std::is_same_v<T, std::int64_t> ||
                              std::is_same_v<T, double> ||
                              std::is_same_v<T, bool>) {
                    row[col] = arg;
                } else {
                    row[col] = DbNull{};
                }
            }, val);
        }
        result.push_back(std::move(row));
    }
    return result;
}

static std::string quoteString(const std::string& value, DatabaseType dialect) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped += '\'';
    for (char c : value) {
        if (c == '\'') {
            escaped += "''";
        } else if (c == '\\' && dialect == DatabaseType::MySQL) {
            escaped += "\\\\";
        } else {
            escaped += c;
        }
    }
    escaped += '\'';
    return escaped;
}

// ---------------------------------------------------------------------------
// PreparedStatement
// ---------------------------------------------------------------------------

PreparedStatement::PreparedStatement(std::string sql)
    : sql_(std::move(sql)) {}

PreparedStatement& PreparedStatement::bindString(
    std::string_view name, std::string value) {
    params_[std::string(name)] = std::move(value);
    return *this;
}

PreparedStatement& PreparedStatement::bindInt(
    std::string_view name, std::int64_t value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindDouble(
    std::string_view name, double value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindBool(
    std::string_view name, bool value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindNull(std::string_view name) {
    params_[std::string(name)] = DbNull{};
    return *this;
}

std::string_view PreparedStatement::sql() const noexcept {
    return sql_;
}

std::string PreparedStatement::resolve(DatabaseType dialect) const {
    auto isNameChar = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };

    // Single left-to-right pass: substituted text is never rescanned, so a
    // bound value containing "$name" stays literal.
    std::string resolved;
    resolved.reserve(sql_.size());

    std::size_t pos = 0;
    while (pos < sql_.size()) {
        if (sql_[pos] != '$') {
            resolved += sql_[pos++];
            continue;
        }
        auto nameEnd = pos + 1;
        while (nameEnd < sql_.size() && isNameChar(sql_[nameEnd])) {
            ++nameEnd;
        }
        auto it = params_.find(sql_.substr(pos + 1, nameEnd - pos - 1));
        if (it == params_.end()) {
            resolved.append(sql_, pos, nameEnd - pos);
        } else {
            resolved += std::visit([dialect](auto&& arg) -> std::string {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, DbNull>) {
                    return "NULL";
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return quoteString(arg, dialect);
                } else if constexpr (std::is_same_v<T, bool>) {
                    return arg ? "TRUE" : "FALSE";
                } else {
                    return std::to_string(arg);
                }
            }, it->second);
        }
        pos = nameEnd;
    }

    return resolved;
}

void PreparedStatement::clearBindings() {
    params_.clear();
}

// ---------------------------------------------------------------------------
// Database::Impl
// ---------------------------------------------------------------------------

struct PooledConnection {
    std::shared_ptr<::database::database_context> context;
    std::shared_ptr<::database::database_manager> manager;
    bool inUse = false;
};

struct Database::Impl {
    DatabaseConfig config;

    std::vector<PooledConnection> pool;
    mutable std::mutex poolMutex;
    std::condition_variable poolCv;
    std::atomic<bool> connected{false};

    // Blocks up to connectionTimeout; nullptr when the pool stays exhausted.
    std::shared_ptr<::database::database_manager> checkout() {
        std::unique_lock lock(poolMutex);
        auto deadline = std::chrono::steady_clock::now() + config.connectionTimeout;

        while (true) {
            for (auto& conn : pool) {
                if (!conn.inUse) {
                    conn.inUse = true;
                    return conn.manager;
                }
            }

            if (pool.size() < config.maxConnections) {
                auto conn = createConnection();
                if (conn.manager) {
                    conn.inUse = true;
                    auto mgr = conn.manager;
                    pool.push_back(std::move(conn));
                    return mgr;
                }
            }

            if (poolCv.wait_until(lock, deadline) == std::cv_status::timeout) {
                return nullptr;
            }
        }
    }

    void checkin(::database::database_manager* mgr) {
        std::lock_guard lock(poolMutex);
        for (auto& conn : pool) {
            if (conn.manager.get() == mgr) {
                conn.inUse = false;
                poolCv.notify_one();
                return;
            }
        }
    }

    PooledConnection createConnection() {
        PooledConnection conn;
        conn.context = std::make_shared<::database::database_context>();
        conn.manager = std::make_shared<::database::database_manager>(conn.context);

        if (!conn.manager->set_mode(toKcenon(config.dbType))) {
            conn.manager.reset();
            return conn;
        }

        auto result = conn.manager->connect_result(config.connectionString);
        if (!result.is_ok()) {
            LogContext ctx;
            ctx.extra["error"] = result.error().message;
            QRC_LOG_CTX(LogLevel::Warning, LogCategory::Database,
                        "database connection failed", ctx);
            conn.manager.reset();
            return conn;
        }

        return conn;
    }

    template <typename T>
    CacheResult<T> notConnected() const {
        return CacheResult<T>::err(
            CacheError(ErrorCode::NotConnected, "not connected to database"));
    }

    template <typename T>
    CacheResult<T> poolExhausted() const {
        return CacheResult<T>::err(
            CacheError(ErrorCode::ConnectionPoolExhausted,
                       "no available connections in pool"));
    }
};

// ---------------------------------------------------------------------------
// Construction / destruction / move
// ---------------------------------------------------------------------------

Database::Database()
    : impl_(std::make_unique<Impl>()) {}

Database::~Database() {
    if (impl_) {
        disconnect();
    }
}

Database::Database(Database&&) noexcept = default;

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            disconnect();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

// ---------------------------------------------------------------------------
// Connection management
// ---------------------------------------------------------------------------

CacheResult<void> Database::connect(const DatabaseConfig& config) {
    if (impl_->connected.load()) {
        return CacheResult<void>::err(
            CacheError(ErrorCode::AlreadyExists, "already connected"));
    }

    impl_->config = config;

    {
        std::lock_guard lock(impl_->poolMutex);
        for (uint32_t i = 0; i < config.minConnections; ++i) {
            auto conn = impl_->createConnection();
            if (!conn.manager) {
                for (auto& open : impl_->pool) {
                    (void)open.manager->disconnect_result();
                }
                impl_->pool.clear();
                return CacheResult<void>::err(
                    CacheError(ErrorCode::DatabaseError,
                               "failed to create connection " +
                                   std::to_string(i + 1) + "/" +
                                   std::to_string(config.minConnections)));
            }
            impl_->pool.push_back(std::move(conn));
        }
    }

    impl_->connected.store(true);
    QRC_LOG_INFO(LogCategory::Database, "database connected");
    return CacheResult<void>::ok();
}

void Database::disconnect() {
    bool wasConnected = impl_->connected.exchange(false);

    std::lock_guard lock(impl_->poolMutex);
    for (auto& conn : impl_->pool) {
        if (conn.manager) {
            (void)conn.manager->disconnect_result();
        }
    }
    impl_->pool.clear();

    if (wasConnected) {
        QRC_LOG_INFO(LogCategory::Database, "database disconnected");
    }
}

bool Database::isConnected() const noexcept {
    return impl_->connected.load();
}

DatabaseType Database::type() const noexcept {
    return impl_->config.dbType;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

CacheResult<QueryResult> Database::query(std::string_view sql) {
    if (!impl_->connected.load()) {
        return impl_->notConnected<QueryResult>();
    }

    auto mgr = impl_->checkout();
    if (!mgr) {
        return impl_->poolExhausted<QueryResult>();
    }

    auto result = mgr->select_query_result(std::string(sql));
    impl_->checkin(mgr.get());

    if (!result.is_ok()) {
        return CacheResult<QueryResult>::err(
            CacheError(ErrorCode::QueryFailed, result.error().message));
    }

    return CacheResult<QueryResult>::ok(convertResult(result.value()));
}

CacheResult<uint64_t> Database::execute(std::string_view sql) {
    if (!impl_->connected.load()) {
        return impl_->notConnected<uint64_t>();
    }

    auto mgr = impl_->checkout();
    if (!mgr) {
        return impl_->poolExhausted<uint64_t>();
    }

    auto result = mgr->execute_query_result(std::string(sql));
    impl_->checkin(mgr.get());

    if (!result.is_ok()) {
        return CacheResult<uint64_t>::err(
            CacheError(ErrorCode::QueryFailed, result.error().message));
    }

    // database_system does not report affected rows.
    return CacheResult<uint64_t>::ok(0);
}

CacheResult<QueryResult> Database::query(const PreparedStatement& stmt) {
    return query(stmt.resolve(impl_->config.dbType));
}

CacheResult<uint64_t> Database::execute(const PreparedStatement& stmt) {
    return execute(stmt.resolve(impl_->config.dbType));
}

// ---------------------------------------------------------------------------
// Pool information
// ---------------------------------------------------------------------------

std::size_t Database::activeConnections() const noexcept {
    std::lock_guard lock(impl_->poolMutex);
    return static_cast<std::size_t>(std::count_if(
        impl_->pool.begin(), impl_->pool.end(),
        [](const PooledConnection& c) { return c.inUse; }));
}

std::size_t Database::poolSize() const noexcept {
    std::lock_guard lock(impl_->poolMutex);
    return impl_->pool.size();
}

} // namespace qrc::foundation
