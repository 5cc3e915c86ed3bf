/// @file in_memory_durable_store.cpp
/// @brief InMemoryDurableStore implementation.

#include "qrc/cache/in_memory_durable_store.hpp"

#include <mutex>
#include <unordered_map>

namespace qrc::cache {

using qrc::foundation::CacheResult;

struct InMemoryDurableStore::Impl {
    std::shared_ptr<Clock> clock;
    mutable std::mutex mutex;
    std::unordered_map<std::string, CacheEntry> entries;
};

InMemoryDurableStore::InMemoryDurableStore(std::shared_ptr<Clock> clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->clock = clock ? std::move(clock) : systemClock();
}

InMemoryDurableStore::~InMemoryDurableStore() = default;

CacheResult<std::optional<CacheEntry>> InMemoryDurableStore::get(std::string_view key) {
    auto now = impl_->clock->now();
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->entries.find(std::string(key));
    if (it == impl_->entries.end()) {
        return CacheResult<std::optional<CacheEntry>>::ok(std::nullopt);
    }
    if (it->second.expiresAt <= now) {
        impl_->entries.erase(it);
        return CacheResult<std::optional<CacheEntry>>::ok(std::nullopt);
    }
    return CacheResult<std::optional<CacheEntry>>::ok(it->second);
}

CacheResult<void> InMemoryDurableStore::put(std::string_view key, std::string_view value,
                                            std::string_view ns, Ttl ttl) {
    auto now = impl_->clock->now();
    CacheEntry entry{std::string(key), std::string(ns), std::string(value), now,
                     expiryFor(now, ttl)};

    std::lock_guard lock(impl_->mutex);
    impl_->entries.insert_or_assign(std::string(key), std::move(entry));
    return CacheResult<void>::ok();
}

CacheResult<void> InMemoryDurableStore::removeByKey(std::string_view key) {
    std::lock_guard lock(impl_->mutex);
    impl_->entries.erase(std::string(key));
    return CacheResult<void>::ok();
}

CacheResult<void> InMemoryDurableStore::removeByNamespace(std::string_view ns) {
    std::lock_guard lock(impl_->mutex);
    std::erase_if(impl_->entries, [ns](const auto& item) { return item.second.ns == ns; });
    return CacheResult<void>::ok();
}

CacheResult<void> InMemoryDurableStore::removeAll() {
    std::lock_guard lock(impl_->mutex);
    impl_->entries.clear();
    return CacheResult<void>::ok();
}

CacheResult<std::size_t> InMemoryDurableStore::reapExpired() {
    auto now = impl_->clock->now();
    std::lock_guard lock(impl_->mutex);
    auto removed = std::erase_if(impl_->entries, [now](const auto& item) {
        return item.second.expiresAt <= now;
    });
    return CacheResult<std::size_t>::ok(static_cast<std::size_t>(removed));
}

CacheResult<DurableStats> InMemoryDurableStore::stats() {
    std::lock_guard lock(impl_->mutex);
    DurableStats stats;
    stats.totalEntries = impl_->entries.size();
    for (const auto& [key, entry] : impl_->entries) {
        ++stats.entriesByNamespace[entry.ns];
        if (!stats.oldestEntry || entry.createdAt < *stats.oldestEntry) {
            stats.oldestEntry = entry.createdAt;
        }
        if (!stats.newestEntry || entry.createdAt > *stats.newestEntry) {
            stats.newestEntry = entry.createdAt;
        }
    }
    return CacheResult<DurableStats>::ok(std::move(stats));
}

std::size_t InMemoryDurableStore::size() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->entries.size();
}

} // namespace qrc::cache
