/**
 * @file ttl_cache.hpp
 * @brief Size-bounded cache with per-entry time-to-live
 *
 * Entries expire ttl after they were loaded. The cache keeps an approximate
 * byte budget; inserting past it evicts the oldest entries (by loaded_at) in
 * rounds of about 25% of the entries, at least one per round, until the new
 * entry fits or the cache is empty. An entry larger than the whole budget is
 * admitted alone. Entries the pin predicate holds are never evicted for size;
 * when only pinned entries remain the new entry is admitted over budget.
 *
 * Thread-safe. Eviction listeners run after the internal lock is released.
 */

#ifndef LIVERUN_TTL_CACHE_HPP
#define LIVERUN_TTL_CACHE_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace liverun {

/**
 * @brief Cached value with its bookkeeping
 */
template <typename T>
struct CacheEntry {
    T data;
    std::chrono::steady_clock::time_point loaded_at;
    std::chrono::milliseconds ttl;
    size_t approx_size_bytes;
};

/**
 * @brief Cache counters
 */
struct CacheStats {
    size_t hits;
    size_t misses;
    size_t expirations;
    size_t evictions;         ///< Removed to respect the size budget

    CacheStats() : hits(0), misses(0), expirations(0), evictions(0) {}
};

/**
 * @brief TTL cache keyed by string
 *
 * Usage Example:
 *   @code
 *   TtlCache<EngineHandle> cache(50 * 1024 * 1024, std::chrono::minutes(30));
 *   cache.set("python", handle, std::chrono::milliseconds(0), 40 * 1024 * 1024);
 *   if (auto hit = cache.get("python")) {
 *       use(*hit);
 *   }
 *   @endcode
 */
template <typename T>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Time source (replaceable in tests)
     */
    using TimeSource = std::function<Clock::time_point()>;

    /**
     * @brief Called for every removed entry
     *
     * reason is "expired", "size_budget", "invalidated" or "replaced".
     */
    using EvictionListener =
        std::function<void(const std::string& key, const T& data, const std::string& reason, size_t size_bytes)>;

    /**
     * @brief Returns true for data that must survive size-budget eviction
     *
     * Called with the cache lock held.
     */
    using PinPredicate = std::function<bool(const T& data)>;

    TtlCache(size_t max_size_bytes, std::chrono::milliseconds default_ttl,
             TimeSource now = TimeSource())
        : max_size_bytes_(max_size_bytes),
          default_ttl_(default_ttl),
          now_(now ? std::move(now) : TimeSource([]() { return Clock::now(); })),
          total_size_bytes_(0) {}

    void set_eviction_listener(EvictionListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = std::move(listener);
    }

    void set_pin_predicate(PinPredicate pinned) {
        std::lock_guard<std::mutex> lock(mutex_);
        pinned_ = std::move(pinned);
    }

    /**
     * @brief Fetch a live entry
     *
     * @return The data if now - loaded_at <= ttl, otherwise empty (the
     *         expired entry is dropped)
     */
    std::optional<T> get(const std::string& key) {
        std::vector<Removed> removed;
        std::optional<T> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                stats_.misses++;
            } else if (is_expired(it->second, now_())) {
                stats_.misses++;
                stats_.expirations++;
                removed.push_back(take(it, "expired"));
            } else {
                stats_.hits++;
                result = it->second.data;
            }
        }
        notify(removed);
        return result;
    }

    /**
     * @brief Insert or replace an entry
     *
     * @param ttl Lifetime; zero selects the default ttl
     * @param approx_size_bytes Cost charged against the budget
     */
    void set(const std::string& key, T data, std::chrono::milliseconds ttl, size_t approx_size_bytes) {
        std::vector<Removed> removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto existing = entries_.find(key);
            if (existing != entries_.end()) {
                removed.push_back(take(existing, "replaced"));
            }

            while (!entries_.empty() && total_size_bytes_ + approx_size_bytes > max_size_bytes_) {
                if (!evict_oldest_round(removed)) {
                    break;
                }
            }

            CacheEntry<T> entry{std::move(data), now_(),
                                ttl.count() > 0 ? ttl : default_ttl_, approx_size_bytes};
            total_size_bytes_ += approx_size_bytes;
            entries_.emplace(key, std::move(entry));
        }
        notify(removed);
    }

    /**
     * @brief Remove an entry
     * @return True if it was present
     */
    bool remove(const std::string& key) {
        return remove_if(key, [](const T&) { return true; });
    }

    /**
     * @brief Remove an entry only if its data satisfies predicate
     */
    bool remove_if(const std::string& key, const std::function<bool(const T&)>& predicate) {
        std::vector<Removed> removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end() || !predicate(it->second.data)) {
                return false;
            }
            removed.push_back(take(it, "invalidated"));
        }
        notify(removed);
        return true;
    }

    /**
     * @brief Drop every expired entry
     * @return Number of entries removed
     */
    size_t sweep() {
        std::vector<Removed> removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Clock::time_point now = now_();
            for (auto it = entries_.begin(); it != entries_.end();) {
                if (is_expired(it->second, now)) {
                    stats_.expirations++;
                    removed.push_back(take(it++, "expired"));
                } else {
                    ++it;
                }
            }
        }
        notify(removed);
        return removed.size();
    }

    void clear() {
        std::vector<Removed> removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            while (!entries_.empty()) {
                removed.push_back(take(entries_.begin(), "invalidated"));
            }
        }
        notify(removed);
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        return it != entries_.end() && !is_expired(it->second, now_());
    }

    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& pair : entries_) {
            result.push_back(pair.first);
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t total_size_bytes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_size_bytes_;
    }

    size_t max_size_bytes() const { return max_size_bytes_; }

    CacheStats get_stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    struct Removed {
        std::string key;
        T data;
        std::string reason;
        size_t size_bytes;
    };

    using EntryMap = std::map<std::string, CacheEntry<T>>;

    size_t max_size_bytes_;
    std::chrono::milliseconds default_ttl_;
    TimeSource now_;

    mutable std::mutex mutex_;
    EntryMap entries_;
    size_t total_size_bytes_;
    CacheStats stats_;
    EvictionListener listener_;
    PinPredicate pinned_;

    static bool is_expired(const CacheEntry<T>& entry, Clock::time_point now) {
        return now - entry.loaded_at > entry.ttl;
    }

    Removed take(typename EntryMap::iterator it, const std::string& reason) {
        Removed removed{it->first, std::move(it->second.data), reason, it->second.approx_size_bytes};
        total_size_bytes_ -= it->second.approx_size_bytes;
        entries_.erase(it);
        return removed;
    }

    // Returns false when every entry is pinned
    bool evict_oldest_round(std::vector<Removed>& removed) {
        std::vector<typename EntryMap::iterator> by_age;
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (!pinned_ || !pinned_(it->second.data)) {
                by_age.push_back(it);
            }
        }
        if (by_age.empty()) {
            return false;
        }
        std::sort(by_age.begin(), by_age.end(),
                  [](typename EntryMap::iterator a, typename EntryMap::iterator b) {
                      return a->second.loaded_at < b->second.loaded_at;
                  });

        size_t count = std::max<size_t>(1, by_age.size() / 4);
        for (size_t i = 0; i < count; ++i) {
            stats_.evictions++;
            removed.push_back(take(by_age[i], "size_budget"));
        }
        return true;
    }

    void notify(std::vector<Removed>& removed) {
        if (removed.empty()) {
            return;
        }
        EvictionListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listener = listener_;
        }
        if (listener) {
            for (const auto& entry : removed) {
                listener(entry.key, entry.data, entry.reason, entry.size_bytes);
            }
        }
    }
};

} // namespace liverun

#endif // LIVERUN_TTL_CACHE_HPP
