#pragma once

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <utility>

namespace oryx::cache {

/// Counters reported by LoadingCache::stats(). Observational only.
struct CacheStats {
    std::uint64_t hit_count = 0;
    std::uint64_t miss_count = 0;
    std::uint64_t load_success_count = 0;
    std::uint64_t load_exception_count = 0;
    std::uint64_t eviction_count = 0;
    std::chrono::nanoseconds total_load_time{0};

    [[nodiscard]] auto request_count() const noexcept -> std::uint64_t {
        return hit_count + miss_count;
    }
    /// 1.0 when no request has been made.
    [[nodiscard]] auto hit_rate() const noexcept -> double {
        const auto requests = request_count();
        return requests == 0 ? 1.0 : static_cast<double>(hit_count) / static_cast<double>(requests);
    }
    [[nodiscard]] auto miss_rate() const noexcept -> double {
        const auto requests = request_count();
        return requests == 0 ? 0.0
                             : static_cast<double>(miss_count) / static_cast<double>(requests);
    }
    /// Mean load time in nanoseconds over successful and failed loads.
    [[nodiscard]] auto average_load_penalty() const noexcept -> double {
        const auto loads = load_success_count + load_exception_count;
        return loads == 0 ? 0.0
                          : static_cast<double>(total_load_time.count()) /
                                static_cast<double>(loads);
    }
};

/// A bounded, thread-safe memoizing map with single-flight loads.
///
/// - get() returns the cached value or runs the loader. Concurrent callers for
///   a key that is still loading wait for that load and share its outcome
///   (value or exception); they count as hits.
/// - Failures are not retained: the entry is dropped once the failing load
///   completes, so a later get() loads again.
/// - At most `max_size` resolved entries are kept; the least recently used is
///   evicted first. With `max_size == 0` every loaded value is evicted at once
///   and each request loads.
/// - The loader runs outside the lock; only the index is guarded.
///
/// Values are handed out by copy, so eviction never invalidates a value a
/// caller already holds when V is a shared_ptr.
template <typename K, typename V, typename Hash = robin_hood::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class LoadingCache {
   public:
    using Loader = std::function<V(const K&)>;

    LoadingCache(std::size_t max_size, Loader loader)
        : max_size_(max_size), loader_(std::move(loader)) {}

    LoadingCache(const LoadingCache&) = delete;
    auto operator=(const LoadingCache&) -> LoadingCache& = delete;

    /// Look up `key`, loading it on a miss. Rethrows the loader's exception.
    [[nodiscard]] auto get(const K& key) -> V {
        std::promise<V> promise;
        std::shared_future<V> in_flight;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                ++stats_.hit_count;
                auto& entry = it->second;
                if (entry.ready) {
                    lru_.splice(lru_.begin(), lru_, entry.lru);
                    return entry.value.get();
                }
                in_flight = entry.value;
            } else {
                ++stats_.miss_count;
                entries_.emplace(key, Entry{promise.get_future().share()});
            }
        }
        if (in_flight.valid()) {
            spdlog::trace("loading cache: waiting on in-flight load");
            return in_flight.get();
        }
        return load(key, promise);
    }

    /// Number of resolved entries (in-flight loads are not counted).
    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return lru_.size();
    }

    [[nodiscard]] auto max_size() const noexcept -> std::size_t { return max_size_; }

    [[nodiscard]] auto stats() const -> CacheStats {
        std::lock_guard lock(mutex_);
        return stats_;
    }

    /// Drop every resolved entry. In-flight loads complete and are retained.
    void invalidate_all() {
        std::lock_guard lock(mutex_);
        while (!lru_.empty()) {
            K key = *lru_.back();
            lru_.pop_back();
            entries_.erase(key);
        }
    }

   private:
    struct Entry {
        std::shared_future<V> value;
        bool ready = false;
        typename std::list<const K*>::iterator lru{};
    };

    auto load(const K& key, std::promise<V>& promise) -> V {
        const auto start = std::chrono::steady_clock::now();
        try {
            V value = loader_(key);
            const auto elapsed = std::chrono::steady_clock::now() - start;
            promise.set_value(value);
            std::lock_guard lock(mutex_);
            ++stats_.load_success_count;
            stats_.total_load_time += std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed);
            auto it = entries_.find(key);
            if (it != entries_.end() && !it->second.ready) {
                it->second.ready = true;
                lru_.push_front(&it->first);
                it->second.lru = lru_.begin();
                evict_excess();
            }
            return value;
        } catch (...) {
            const auto elapsed = std::chrono::steady_clock::now() - start;
            promise.set_exception(std::current_exception());
            {
                std::lock_guard lock(mutex_);
                ++stats_.load_exception_count;
                stats_.total_load_time +=
                    std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed);
                auto it = entries_.find(key);
                if (it != entries_.end() && !it->second.ready) {
                    entries_.erase(it);
                }
            }
            throw;
        }
    }

    // Requires mutex_.
    void evict_excess() {
        while (lru_.size() > max_size_) {
            K victim = *lru_.back();
            lru_.pop_back();
            entries_.erase(victim);
            ++stats_.eviction_count;
            spdlog::trace("loading cache: evicted least recently used entry ({} retained)",
                          lru_.size());
        }
    }

    const std::size_t max_size_;
    Loader loader_;

    mutable std::mutex mutex_;
    // Node map: keys stay at a fixed address, so the LRU list can point at them.
    robin_hood::unordered_node_map<K, Entry, Hash, KeyEqual> entries_;
    std::list<const K*> lru_;
    CacheStats stats_;
};

}  // namespace oryx::cache
