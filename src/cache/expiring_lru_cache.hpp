#pragma once
#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace Robocache {
namespace Cache {

struct CacheStats {
    size_t hits        = 0;
    size_t misses      = 0;
    size_t evictions   = 0;
    size_t expirations = 0;
    size_t entries     = 0;
};

/**
 * Thread-safe, size-bounded key/value map with a write-time TTL.
 *
 * - put() replaces any existing entry and restarts its TTL.
 * - get() refreshes recency (LRU order) but never the expiration time.
 * - An entry is expired once `now >= inserted_at + ttl`; expired entries are
 *   dropped by the lookup that finds them.
 * - When a put() pushes the size past capacity, the least recently used
 *   entries are evicted. A capacity of 0 disables the cache.
 *
 * The `now` arguments exist so that callers (and tests) can evaluate a
 * lookup "as if" at a given instant without a clock indirection.
 */
template <typename K, typename V, typename Clock = std::chrono::steady_clock>
class ExpiringLruCache {
public:
    using clock_type = Clock;
    using time_point = typename Clock::time_point;
    using duration   = typename Clock::duration;

    ExpiringLruCache(size_t capacity, duration ttl) : capacity_(capacity), ttl_(ttl) {}

    ExpiringLruCache(const ExpiringLruCache&)            = delete;
    ExpiringLruCache& operator=(const ExpiringLruCache&) = delete;

    std::optional<V> get(const K& key, time_point now = Clock::now()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = index_.find(key);
        if (it == index_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        if (now >= it->second->expires_at) {
            lru_.erase(it->second);
            index_.erase(it);
            ++stats_.expirations;
            ++stats_.misses;
            return std::nullopt;
        }
        lru_.splice(lru_.begin(), lru_, it->second);
        ++stats_.hits;
        return it->second->value;
    }

    void put(const K& key, V value, time_point now = Clock::now()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ == 0)
            return;

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->value      = std::move(value);
            it->second->expires_at = now + ttl_;
            lru_.splice(lru_.begin(), lru_, it->second);
            return;
        }

        lru_.push_front(Entry{key, std::move(value), now + ttl_});
        index_.emplace(key, lru_.begin());
        evict_overflow();
    }

    // Presence check that neither touches recency nor the statistics.
    bool contains(const K& key, time_point now = Clock::now()) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = index_.find(key);
        return it != index_.end() && now < it->second->expires_at;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats                  s = stats_;
        s.entries                     = index_.size();
        return s;
    }

private:
    struct Entry {
        K          key;
        V          value;
        time_point expires_at;
    };

    using EntryList = std::list<Entry>;

    // Lock must be held.
    void evict_overflow() {
        while (index_.size() > capacity_ && !lru_.empty()) {
            index_.erase(lru_.back().key);
            lru_.pop_back();
            ++stats_.evictions;
        }
    }

    const size_t   capacity_;
    const duration ttl_;

    mutable std::mutex                                    mutex_;
    EntryList                                             lru_;
    std::unordered_map<K, typename EntryList::iterator> index_;
    CacheStats                                            stats_;
};

}  // namespace Cache
}  // namespace Robocache
