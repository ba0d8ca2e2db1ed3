// File: src/storage/lru_cache.hpp
#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace engram {

/// Bounded LRU (Least Recently Used) cache
///
/// O(1) get and put. Every operation takes the cache mutex, so a value is
/// never observed half-written. Put on a full cache evicts the least
/// recently used entry; the cache never grows past its capacity.
///
/// @tparam Key Key type (must be hashable with Hash)
/// @tparam Value Value type (copied out on Get)
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class LRUCache {
public:
    /// @param capacity Maximum number of entries, at least 1
    explicit LRUCache(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;

    /// Look up and mark as most recently used
    std::optional<Value> Get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        hits_.fetch_add(1, std::memory_order_relaxed);
        entries_.splice(entries_.begin(), entries_, it->second);
        return it->second->second;
    }

    /// Insert or replace; evicts the least recently used entry when full
    void Put(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }

        while (entries_.size() >= capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        entries_.emplace_front(key, std::move(value));
        index_.emplace(key, entries_.begin());
    }

    /// Drop every entry and reset counters
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);

        entries_.clear();
        index_.clear();
        hits_.store(0, std::memory_order_relaxed);
        misses_.store(0, std::memory_order_relaxed);
        evictions_.store(0, std::memory_order_relaxed);
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t Capacity() const { return capacity_; }

    /// Statistics structure
    struct Stats {
        size_t size{0};
        size_t capacity{0};
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
        float hit_rate{0.0f};
    };

    Stats GetStats() const {
        std::lock_guard<std::mutex> lock(mutex_);

        Stats stats;
        stats.size = entries_.size();
        stats.capacity = capacity_;
        stats.hits = hits_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        stats.evictions = evictions_.load(std::memory_order_relaxed);

        uint64_t lookups = stats.hits + stats.misses;
        if (lookups > 0) {
            stats.hit_rate = static_cast<float>(stats.hits) / static_cast<float>(lookups);
        }
        return stats;
    }

private:
    using Entry = std::pair<Key, Value>;

    const size_t capacity_;

    // Most recently used at the front
    std::list<Entry> entries_;
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;

    mutable std::mutex mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace engram
