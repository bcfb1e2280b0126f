/**
 * LruCache.hpp - Bounded strict-LRU memo, single writer / many readers
 *
 * Readers take a shared lock and stamp the entry with a tick from a global
 * counter; the writer takes the exclusive lock and evicts the entry with the
 * smallest tick. No TTL.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <tuple>
#include <unordered_map>
#include <utility>

namespace xvc::wakeword {

template <typename Key, typename Value>
class LruCache {
public:
    explicit LruCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    std::optional<Value> get(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++misses_;
            return std::nullopt;
        }
        it->second.tick.store(++clock_);
        ++hits_;
        return it->second.value;
    }

    void put(const Key& key, Value value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.value = std::move(value);
            it->second.tick.store(++clock_);
            return;
        }

        if (entries_.size() >= capacity_) {
            evictOldest();
        }
        entries_.emplace(std::piecewise_construct,
                         std::forward_as_tuple(key),
                         std::forward_as_tuple(std::move(value), ++clock_));
    }

    bool contains(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.count(key) > 0;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    size_t capacity() const { return capacity_; }
    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.clear();
    }

private:
    struct Entry {
        Entry(Value v, uint64_t t) : value(std::move(v)), tick(t) {}
        Value value;
        mutable std::atomic<uint64_t> tick;
    };

    void evictOldest() {
        auto oldest = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->second.tick.load() < oldest->second.tick.load()) {
                oldest = it;
            }
        }
        if (oldest != entries_.end()) {
            entries_.erase(oldest);
        }
    }

    const size_t capacity_;
    std::unordered_map<Key, Entry> entries_;
    mutable std::shared_mutex mutex_;
    mutable std::atomic<uint64_t> clock_{0};
    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
};

} // namespace xvc::wakeword
