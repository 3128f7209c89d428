// File: src/storage/lru_cache.hpp
#pragma once

#include <unordered_map>
#include <list>
#include <optional>
#include <mutex>
#include <atomic>
#include <utility>
#include <vector>

namespace patex {

/// LRU (Least Recently Used) Cache
///
/// O(1) get/put, mutex protected. Used for the hot-tier recency order
/// (ID -> slot) and as the ephemeral tier itself.
///
/// @tparam Key Key type (must be hashable)
/// @tparam Value Value type (must be copyable)
template<typename Key, typename Value>
class LRUCache {
public:
    using Entry = std::pair<Key, Value>;

    /// @param capacity Maximum number of items; 0 is raised to 1
    explicit LRUCache(size_t capacity)
        : capacity_(capacity) {
        if (capacity_ == 0) {
            capacity_ = 1;  // Minimum capacity
        }
    }

    /// Get value and mark it most recently used
    /// @return Value if found, std::nullopt otherwise
    std::optional<Value> Get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        hits_.fetch_add(1, std::memory_order_relaxed);
        items_.splice(items_.begin(), items_, map_it->second);

        return map_it->second->second;
    }

    /// Get value without changing recency or statistics
    std::optional<Value> Peek(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            return std::nullopt;
        }
        return map_it->second->second;
    }

    /// Mark key most recently used
    /// @return false if key is absent
    bool Touch(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            return false;
        }
        items_.splice(items_.begin(), items_, map_it->second);
        return true;
    }

    /// Insert or update; on a full cache the least recently used entry is evicted
    /// @return The evicted entry, if any
    std::optional<Entry> Put(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);

        // Key already exists, update and move to front
        if (map_it != map_.end()) {
            map_it->second->second = value;
            items_.splice(items_.begin(), items_, map_it->second);
            return std::nullopt;
        }

        std::optional<Entry> evicted;
        if (items_.size() >= capacity_) {
            evicted = PopBackLocked();
        }

        items_.emplace_front(key, value);
        map_[key] = items_.begin();
        return evicted;
    }

    /// Remove and return the least recently used entry
    std::optional<Entry> EvictLeastRecent() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        return PopBackLocked();
    }

    /// @return true if removed, false if not found
    bool Remove(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            return false;
        }

        items_.erase(map_it->second);
        map_.erase(map_it);
        return true;
    }

    /// Clear all items and statistics
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);

        items_.clear();
        map_.clear();

        hits_.store(0, std::memory_order_relaxed);
        misses_.store(0, std::memory_order_relaxed);
        evictions_.store(0, std::memory_order_relaxed);
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t Capacity() const {
        return capacity_;
    }

    bool Contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /// Keys ordered most recently used first
    std::vector<Key> Keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Key> keys;
        keys.reserve(items_.size());
        for (const auto& item : items_) {
            keys.push_back(item.first);
        }
        return keys;
    }

    /// @return Hit rate [0.0, 1.0]
    float HitRate() const {
        uint64_t total_hits = hits_.load(std::memory_order_relaxed);
        uint64_t total_misses = misses_.load(std::memory_order_relaxed);
        uint64_t total = total_hits + total_misses;

        if (total == 0) {
            return 0.0f;
        }

        return static_cast<float>(total_hits) / static_cast<float>(total);
    }

    uint64_t Hits() const {
        return hits_.load(std::memory_order_relaxed);
    }

    uint64_t Misses() const {
        return misses_.load(std::memory_order_relaxed);
    }

    uint64_t Evictions() const {
        return evictions_.load(std::memory_order_relaxed);
    }

    struct Stats {
        size_t size{0};
        size_t capacity{0};
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
        float hit_rate{0.0f};
        float utilization{0.0f};  // size / capacity
    };

    Stats GetStats() const {
        std::lock_guard<std::mutex> lock(mutex_);

        Stats stats;
        stats.size = items_.size();
        stats.capacity = capacity_;
        stats.hits = hits_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        stats.evictions = evictions_.load(std::memory_order_relaxed);
        stats.hit_rate = HitRate();
        stats.utilization = static_cast<float>(stats.size) / static_cast<float>(capacity_);

        return stats;
    }

private:
    Entry PopBackLocked() {
        Entry lru = std::move(items_.back());
        map_.erase(lru.first);
        items_.pop_back();
        evictions_.fetch_add(1, std::memory_order_relaxed);
        return lru;
    }

    size_t capacity_;

    /// Front = most recently used, back = least recently used
    std::list<Entry> items_;

    std::unordered_map<Key, typename std::list<Entry>::iterator> map_;

    mutable std::mutex mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace patex
