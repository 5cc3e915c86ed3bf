/// @file cache_coordinator.cpp
/// @brief CacheCoordinator implementation.

#include "qrc/cache/cache_coordinator.hpp"

#include "qrc/cache/key_deriver.hpp"
#include "qrc/cache/sql_durable_store.hpp"
#include "qrc/foundation/cache_logger.hpp"

namespace qrc::cache {

using qrc::foundation::CacheError;
using qrc::foundation::CacheResult;
using qrc::foundation::ErrorCode;
using qrc::foundation::LogCategory;
using qrc::foundation::LogContext;
using qrc::foundation::LogLevel;

CacheCoordinator::CacheCoordinator(CacheConfig config,
                                   std::shared_ptr<IFastStore> fast,
                                   std::shared_ptr<IDurableStore> durable,
                                   std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      fast_(fast ? std::move(fast)
                 : std::make_shared<InMemoryFastStore>(
                       clock, std::chrono::duration_cast<std::chrono::milliseconds>(
                                  config_.sweepInterval))),
      durable_(config_.durable.enabled ? std::move(durable) : nullptr),
      clock_(clock ? std::move(clock) : systemClock()) {}

CacheCoordinator::~CacheCoordinator() = default;

std::unique_ptr<CacheCoordinator> CacheCoordinator::create(const CacheConfig& config,
                                                           std::shared_ptr<Clock> clock) {
    if (!clock) {
        clock = systemClock();
    }

    auto fast = std::make_shared<InMemoryFastStore>(
        clock, std::chrono::duration_cast<std::chrono::milliseconds>(config.sweepInterval));

    std::shared_ptr<IDurableStore> durable;
    if (config.durable.enabled) {
        auto opened = SqlDurableStore::open(config.durable, clock);
        if (opened.hasError()) {
            LogContext ctx;
            ctx.extra["table"] = config.durable.table;
            ctx.extra["error"] = std::string(opened.error().message());
            QRC_LOG_CTX(LogLevel::Warning, LogCategory::Core,
                        "durable tier unavailable, running fast tier only", ctx);
        } else {
            durable = std::move(opened).value();
        }
    }

    QRC_LOG_INFO(LogCategory::Core,
                 durable ? "cache started with durable tier"
                         : "cache started without durable tier");
    return std::make_unique<CacheCoordinator>(config, std::move(fast), std::move(durable),
                                              std::move(clock));
}

// ---------------------------------------------------------------------------
// Raw payload access
// ---------------------------------------------------------------------------

CacheResult<std::optional<std::string>> CacheCoordinator::get(std::string_view ns,
                                                              const QueryShape& shape) {
    using R = CacheResult<std::optional<std::string>>;

    auto key = KeyDeriver::deriveKey(ns, shape);
    if (key.hasError()) {
        return R::err(key.error());
    }

    if (auto hit = fast_->get(key.value())) {
        fastHits_.fetch_add(1, std::memory_order_relaxed);
        return R::ok(std::move(hit));
    }

    if (!durable_) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return R::ok(std::nullopt);
    }

    auto stored = durable_->get(key.value());
    if (stored.hasError()) {
        recordPersistenceFailure("read", ns, key.value(), stored.error());
        misses_.fetch_add(1, std::memory_order_relaxed);
        return R::ok(std::nullopt);
    }
    if (!stored.value()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return R::ok(std::nullopt);
    }

    // Compare time points directly: a live entry with under a millisecond
    // left must not be treated as expired.
    auto& entry = *stored.value();
    auto now = clock_->now();
    if (entry.expiresAt <= now) {
        auto removed = durable_->removeByKey(key.value());
        if (removed.hasError()) {
            recordPersistenceFailure("expired-entry delete", ns, key.value(),
                                     removed.error());
        }
        misses_.fetch_add(1, std::memory_order_relaxed);
        return R::ok(std::nullopt);
    }

    // Promote for the remaining lifetime only, rounded up so a live entry
    // never gets a zero TTL.
    fast_->set(key.value(), entry.value, std::chrono::ceil<Ttl>(entry.expiresAt - now));
    durableHits_.fetch_add(1, std::memory_order_relaxed);
    return R::ok(std::move(entry.value));
}

CacheResult<void> CacheCoordinator::put(std::string_view ns, const QueryShape& shape,
                                        std::string value, Ttl ttl) {
    if (auto valid = validateTtl(ttl); valid.hasError()) {
        return valid;
    }

    auto key = KeyDeriver::deriveKey(ns, shape);
    if (key.hasError()) {
        return CacheResult<void>::err(key.error());
    }

    fast_->set(key.value(), value, ttl);

    if (durable_) {
        auto written = durable_->put(key.value(), value, ns, ttl);
        if (written.hasError()) {
            recordPersistenceFailure("write", ns, key.value(), written.error());
        }
    }
    return CacheResult<void>::ok();
}

CacheResult<void> CacheCoordinator::put(std::string_view ns, const QueryShape& shape,
                                        std::string value) {
    return put(ns, shape, std::move(value), config_.defaultTtl);
}

CacheResult<void> CacheCoordinator::invalidate(std::string_view ns) {
    if (auto valid = KeyDeriver::validateNamespace(ns); valid.hasError()) {
        return valid;
    }

    auto prefix = KeyDeriver::prefixFor(ns);
    auto removed = fast_->removeIf(
        [&prefix](std::string_view key) { return key.starts_with(prefix); });

    if (durable_) {
        auto dropped = durable_->removeByNamespace(ns);
        if (dropped.hasError()) {
            recordPersistenceFailure("namespace delete", ns, {}, dropped.error());
        }
    }

    LogContext ctx;
    ctx.cacheNamespace = std::string(ns);
    ctx.extra["fast_removed"] = std::to_string(removed);
    QRC_LOG_CTX(LogLevel::Debug, LogCategory::Core, "namespace invalidated", ctx);
    return CacheResult<void>::ok();
}

void CacheCoordinator::invalidateAll() {
    fast_->clear();
    if (durable_) {
        auto cleared = durable_->removeAll();
        if (cleared.hasError()) {
            recordPersistenceFailure("clear", {}, {}, cleared.error());
        }
    }
    QRC_LOG_INFO(LogCategory::Core, "all cache entries invalidated");
}

CacheResult<std::string> CacheCoordinator::readThrough(std::string_view ns,
                                                       const QueryShape& shape, Ttl ttl,
                                                       const ComputeFn& compute) {
    using R = CacheResult<std::string>;
    if (auto valid = validateTtl(ttl); valid.hasError()) {
        return R::err(valid.error());
    }

    auto cached = get(ns, shape);
    if (cached.hasError()) {
        return R::err(cached.error());
    }
    if (cached.value()) {
        return R::ok(std::move(*cached.value()));
    }

    auto computed = compute();
    if (computed.hasError()) {
        return computed;
    }
    auto stored = put(ns, shape, computed.value(), ttl);
    if (stored.hasError()) {
        return R::err(stored.error());
    }
    return computed;
}

CacheResult<std::string> CacheCoordinator::readThrough(std::string_view ns,
                                                       const QueryShape& shape,
                                                       const ComputeFn& compute) {
    return readThrough(ns, shape, config_.defaultTtl, compute);
}

// ---------------------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------------------

CacheStats CacheCoordinator::stats() const {
    CacheStats stats;
    stats.fastHits = fastHits_.load(std::memory_order_relaxed);
    stats.durableHits = durableHits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.persistenceFailures = persistenceFailures_.load(std::memory_order_relaxed);
    stats.fastEntries = fast_->size();
    return stats;
}

DurableStats CacheCoordinator::durableStats() const {
    if (!durable_) {
        return {};
    }
    auto stats = durable_->stats();
    if (stats.hasError()) {
        recordPersistenceFailure("stats", {}, {}, stats.error());
        return {};
    }
    return std::move(stats).value();
}

bool CacheCoordinator::hasDurableTier() const noexcept {
    return durable_ != nullptr;
}

CacheResult<void> CacheCoordinator::validateTtl(Ttl ttl) {
    if (ttl <= Ttl::zero()) {
        return CacheResult<void>::err(CacheError(
            ErrorCode::InvalidTtl,
            "ttl must be positive, got " + std::to_string(ttl.count()) + " ms"));
    }
    if (ttl > kMaxTtl) {
        return CacheResult<void>::err(CacheError(
            ErrorCode::InvalidTtl,
            "ttl exceeds the maximum of " + std::to_string(kMaxTtl.count()) + " ms, got " +
                std::to_string(ttl.count()) + " ms"));
    }
    return CacheResult<void>::ok();
}

void CacheCoordinator::recordPersistenceFailure(std::string_view operation,
                                                std::string_view ns,
                                                std::string_view key,
                                                const CacheError& error) const {
    persistenceFailures_.fetch_add(1, std::memory_order_relaxed);

    LogContext ctx;
    if (!ns.empty()) {
        ctx.cacheNamespace = std::string(ns);
    }
    if (!key.empty()) {
        ctx.cacheKey = std::string(key);
    }
    ctx.extra["operation"] = std::string(operation);
    ctx.extra["error"] = std::string(error.message());
    QRC_LOG_CTX(LogLevel::Warning, LogCategory::DurableTier,
                "durable tier operation failed", ctx);
}

} // namespace qrc::cache
