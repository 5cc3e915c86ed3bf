/// @file fast_store.cpp
/// @brief InMemoryFastStore implementation.

#include "qrc/cache/fast_store.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "qrc/foundation/cache_logger.hpp"

namespace qrc::cache {

using qrc::foundation::LogCategory;

namespace {

struct FastEntry {
    std::string value;
    TimePoint expiresAt;
};

/// Transparent hash so lookups by string_view avoid a temporary string.
struct KeyHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view key) const noexcept {
        return std::hash<std::string_view>{}(key);
    }
};

} // namespace

struct InMemoryFastStore::Impl {
    std::shared_ptr<Clock> clock;
    std::chrono::milliseconds sweepInterval;

    mutable std::mutex mutex;
    std::unordered_map<std::string, FastEntry, KeyHash, std::equal_to<>> entries;

    std::atomic<bool> running{false};
    std::mutex wakeMutex;
    std::condition_variable wake;
    std::thread sweeper;

    void sweepLoop(InMemoryFastStore& owner) {
        std::unique_lock lock(wakeMutex);
        while (running.load()) {
            wake.wait_for(lock, sweepInterval, [this] { return !running.load(); });
            if (!running.load()) {
                break;
            }
            lock.unlock();
            auto removed = owner.sweepExpired();
            if (removed > 0) {
                QRC_LOG_DEBUG(LogCategory::FastTier,
                              "swept " + std::to_string(removed) + " expired entries");
            }
            lock.lock();
        }
    }
};

InMemoryFastStore::InMemoryFastStore(std::shared_ptr<Clock> clock,
                                     std::chrono::milliseconds sweepInterval)
    : impl_(std::make_unique<Impl>()) {
    impl_->clock = clock ? std::move(clock) : systemClock();
    impl_->sweepInterval = std::min<std::chrono::milliseconds>(sweepInterval,
                                                               kMaxScheduleInterval);

    if (sweepInterval > std::chrono::milliseconds::zero()) {
        impl_->running.store(true);
        impl_->sweeper = std::thread([this] { impl_->sweepLoop(*this); });
        QRC_LOG_DEBUG(LogCategory::FastTier,
                      "sweeper started, interval " +
                          std::to_string(impl_->sweepInterval.count()) + " ms");
    }
}

InMemoryFastStore::~InMemoryFastStore() {
    stop();
}

void InMemoryFastStore::stop() {
    {
        std::lock_guard lock(impl_->wakeMutex);
        if (!impl_->running.exchange(false)) {
            return;
        }
    }
    impl_->wake.notify_all();
    if (impl_->sweeper.joinable()) {
        impl_->sweeper.join();
    }
}

bool InMemoryFastStore::isSweeping() const noexcept {
    return impl_->running.load();
}

std::optional<std::string> InMemoryFastStore::get(std::string_view key) {
    auto now = impl_->clock->now();
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->entries.find(key);
    if (it == impl_->entries.end()) {
        return std::nullopt;
    }
    if (it->second.expiresAt <= now) {
        impl_->entries.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void InMemoryFastStore::set(std::string_view key, std::string value, Ttl ttl) {
    auto expiresAt = expiryFor(impl_->clock->now(), ttl);
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->entries.find(key);
    if (it != impl_->entries.end()) {
        it->second.value = std::move(value);
        it->second.expiresAt = expiresAt;
        return;
    }
    impl_->entries.emplace(std::string(key), FastEntry{std::move(value), expiresAt});
}

bool InMemoryFastStore::remove(std::string_view key) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->entries.find(key);
    if (it == impl_->entries.end()) {
        return false;
    }
    impl_->entries.erase(it);
    return true;
}

std::size_t InMemoryFastStore::removeIf(
    const std::function<bool(std::string_view)>& predicate) {
    std::lock_guard lock(impl_->mutex);
    std::size_t removed = 0;
    for (auto it = impl_->entries.begin(); it != impl_->entries.end();) {
        if (predicate(it->first)) {
            it = impl_->entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void InMemoryFastStore::clear() {
    std::lock_guard lock(impl_->mutex);
    impl_->entries.clear();
}

std::size_t InMemoryFastStore::size() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->entries.size();
}

std::size_t InMemoryFastStore::sweepExpired() {
    auto now = impl_->clock->now();
    std::lock_guard lock(impl_->mutex);
    std::size_t removed = 0;
    for (auto it = impl_->entries.begin(); it != impl_->entries.end();) {
        if (it->second.expiresAt <= now) {
            it = impl_->entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace qrc::cache
