#pragma once

/// @file cache_coordinator.hpp
/// @brief Two-tier read-through cache over a FastStore and a DurableStore.
///
/// Lookup order is fast tier, then durable tier, then the caller's compute
/// function. A durable hit is promoted into the fast tier for its remaining
/// lifetime only, so promotion never extends an entry's life.
///
/// The durable tier is best-effort: its failures are logged and counted but
/// never surface to callers. Only key-derivation, TTL and decode errors do.

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "qrc/cache/cache_types.hpp"
#include "qrc/cache/clock.hpp"
#include "qrc/cache/durable_store.hpp"
#include "qrc/cache/fast_store.hpp"
#include "qrc/cache/query_shape.hpp"
#include "qrc/cache/value_codec.hpp"
#include "qrc/foundation/cache_result.hpp"

namespace qrc::cache {

/// Coordinates reads and writes across both tiers.
///
/// Thread-safe: the tiers serialize their own operations and the
/// coordinator holds no lock of its own. Concurrent misses on the same key
/// may each run the compute function.
///
/// Example:
/// @code
///   auto cache = CacheCoordinator::create(config);
///   QueryShape shape;
///   shape.setString("symbol", "A1");
///   auto price = cache->readThroughAs<std::int64_t>(
///       "prices", shape, std::chrono::seconds(5),
///       [&] { return fetchPrice("A1"); });
/// @endcode
class CacheCoordinator {
public:
    using ComputeFn = std::function<qrc::foundation::CacheResult<std::string>()>;

    /// @param durable Null for a fast-tier-only cache.
    CacheCoordinator(CacheConfig config,
                     std::shared_ptr<IFastStore> fast,
                     std::shared_ptr<IDurableStore> durable = nullptr,
                     std::shared_ptr<Clock> clock = systemClock());
    ~CacheCoordinator();

    CacheCoordinator(const CacheCoordinator&) = delete;
    CacheCoordinator& operator=(const CacheCoordinator&) = delete;

    /// Build both tiers from @p config.
    ///
    /// The fast tier sweeps on config.sweepInterval. When the durable tier
    /// is enabled but cannot be opened, the failure is logged and the
    /// coordinator runs fast-tier-only.
    [[nodiscard]] static std::unique_ptr<CacheCoordinator> create(
        const CacheConfig& config, std::shared_ptr<Clock> clock = systemClock());

    // ── Raw payload access ─────────────────────────────────────────────

    [[nodiscard]] qrc::foundation::CacheResult<std::optional<std::string>> get(
        std::string_view ns, const QueryShape& shape);

    /// Store @p value in both tiers for @p ttl.
    /// @return InvalidTtl when @p ttl is not positive or exceeds kMaxTtl.
    [[nodiscard]] qrc::foundation::CacheResult<void> put(
        std::string_view ns, const QueryShape& shape, std::string value, Ttl ttl);

    /// put() with config().defaultTtl.
    [[nodiscard]] qrc::foundation::CacheResult<void> put(
        std::string_view ns, const QueryShape& shape, std::string value);

    /// Drop every entry under @p ns from both tiers.
    ///
    /// Not atomic with concurrent reads: a get() that fetched a durable entry
    /// before this call removed it may still promote that value into the fast
    /// tier afterwards, where it lives out its remaining TTL. Callers that
    /// need a hard cutoff should invalidate after their writers have stopped.
    [[nodiscard]] qrc::foundation::CacheResult<void> invalidate(std::string_view ns);

    void invalidateAll();

    /// Cached value, or the result of @p compute stored for @p ttl.
    /// Errors from @p compute are returned unchanged and nothing is cached.
    [[nodiscard]] qrc::foundation::CacheResult<std::string> readThrough(
        std::string_view ns, const QueryShape& shape, Ttl ttl, const ComputeFn& compute);

    [[nodiscard]] qrc::foundation::CacheResult<std::string> readThrough(
        std::string_view ns, const QueryShape& shape, const ComputeFn& compute);

    // ── Typed access ───────────────────────────────────────────────────

    template <typename T>
    [[nodiscard]] qrc::foundation::CacheResult<std::optional<T>> getAs(
        std::string_view ns, const QueryShape& shape) {
        using R = qrc::foundation::CacheResult<std::optional<T>>;
        auto raw = get(ns, shape);
        if (raw.hasError()) {
            return R::err(raw.error());
        }
        if (!raw.value()) {
            return R::ok(std::nullopt);
        }
        auto decoded = ValueCodec<T>::decode(*raw.value());
        if (decoded.hasError()) {
            return R::err(decoded.error());
        }
        return R::ok(std::optional<T>(std::move(decoded).value()));
    }

    template <typename T>
    [[nodiscard]] qrc::foundation::CacheResult<void> putAs(
        std::string_view ns, const QueryShape& shape, const T& value, Ttl ttl) {
        auto encoded = ValueCodec<T>::encode(value);
        if (encoded.hasError()) {
            return qrc::foundation::CacheResult<void>::err(encoded.error());
        }
        return put(ns, shape, std::move(encoded).value(), ttl);
    }

    template <typename T>
    [[nodiscard]] qrc::foundation::CacheResult<void> putAs(
        std::string_view ns, const QueryShape& shape, const T& value) {
        return putAs<T>(ns, shape, value, config_.defaultTtl);
    }

    template <typename T>
    [[nodiscard]] qrc::foundation::CacheResult<T> readThroughAs(
        std::string_view ns, const QueryShape& shape, Ttl ttl,
        const std::function<qrc::foundation::CacheResult<T>()>& compute) {
        using R = qrc::foundation::CacheResult<T>;
        if (auto valid = validateTtl(ttl); valid.hasError()) {
            return R::err(valid.error());
        }

        auto cached = getAs<T>(ns, shape);
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
        auto stored = putAs<T>(ns, shape, computed.value(), ttl);
        if (stored.hasError()) {
            return R::err(stored.error());
        }
        return computed;
    }

    template <typename T>
    [[nodiscard]] qrc::foundation::CacheResult<T> readThroughAs(
        std::string_view ns, const QueryShape& shape,
        const std::function<qrc::foundation::CacheResult<T>()>& compute) {
        return readThroughAs<T>(ns, shape, config_.defaultTtl, compute);
    }

    // ── Introspection ──────────────────────────────────────────────────

    [[nodiscard]] CacheStats stats() const;

    /// Durable tier contents; empty when there is no durable tier or it
    /// cannot be queried.
    [[nodiscard]] DurableStats durableStats() const;

    [[nodiscard]] bool hasDurableTier() const noexcept;

    [[nodiscard]] const CacheConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] static qrc::foundation::CacheResult<void> validateTtl(Ttl ttl);

    void recordPersistenceFailure(std::string_view operation, std::string_view ns,
                                  std::string_view key,
                                  const qrc::foundation::CacheError& error) const;

    CacheConfig config_;
    std::shared_ptr<IFastStore> fast_;
    std::shared_ptr<IDurableStore> durable_;
    std::shared_ptr<Clock> clock_;

    std::atomic<uint64_t> fastHits_{0};
    std::atomic<uint64_t> durableHits_{0};
    std::atomic<uint64_t> misses_{0};
    mutable std::atomic<uint64_t> persistenceFailures_{0};
};

} // namespace qrc::cache
