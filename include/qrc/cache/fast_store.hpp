#pragma once

/// @file fast_store.hpp
/// @brief In-process TTL store forming the first cache tier.
///
/// Entries live in memory only and are lost on restart. Expired entries are
/// never returned: get() drops them on access, and an optional background
/// sweeper removes the ones nobody asks for.

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "qrc/cache/cache_types.hpp"
#include "qrc/cache/clock.hpp"

namespace qrc::cache {

/// Abstract fast tier.
///
/// Implementations must be safe for concurrent use from multiple threads.
class IFastStore {
public:
    virtual ~IFastStore() = default;

    /// Value for @p key, or nullopt if absent or expired.
    [[nodiscard]] virtual std::optional<std::string> get(std::string_view key) = 0;

    /// Insert or replace @p key with a fresh expiry of now + @p ttl.
    virtual void set(std::string_view key, std::string value, Ttl ttl) = 0;

    /// Remove @p key. Returns true if an entry was removed.
    virtual bool remove(std::string_view key) = 0;

    /// Remove every entry whose key satisfies @p predicate.
    /// Returns the number of entries removed.
    virtual std::size_t removeIf(
        const std::function<bool(std::string_view)>& predicate) = 0;

    virtual void clear() = 0;

    /// Number of stored entries, including expired ones not yet swept.
    [[nodiscard]] virtual std::size_t size() const = 0;

    /// Drop every expired entry. Returns the number removed.
    virtual std::size_t sweepExpired() = 0;
};

/// Mutex-guarded hash map implementation of IFastStore.
///
/// When constructed with a non-zero sweep interval a background thread
/// calls sweepExpired() on that period until stop() or destruction.
class InMemoryFastStore final : public IFastStore {
public:
    explicit InMemoryFastStore(std::shared_ptr<Clock> clock = systemClock(),
                               std::chrono::milliseconds sweepInterval =
                                   std::chrono::milliseconds::zero());
    ~InMemoryFastStore() override;

    InMemoryFastStore(const InMemoryFastStore&) = delete;
    InMemoryFastStore& operator=(const InMemoryFastStore&) = delete;

    [[nodiscard]] std::optional<std::string> get(std::string_view key) override;
    void set(std::string_view key, std::string value, Ttl ttl) override;
    bool remove(std::string_view key) override;
    std::size_t removeIf(
        const std::function<bool(std::string_view)>& predicate) override;
    void clear() override;
    [[nodiscard]] std::size_t size() const override;
    std::size_t sweepExpired() override;

    /// Stop the sweeper thread (idempotent).
    void stop();

    [[nodiscard]] bool isSweeping() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace qrc::cache
