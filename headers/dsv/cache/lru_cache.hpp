//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_LRU_CACHE_HPP
#define DEPSIEVE_LRU_CACHE_HPP

/**
 * @file lru_cache.hpp
 * @brief Bounded, thread-safe cache with LRU eviction and a time-to-live.
 *
 * Entries expire @p ttl after they were last written. Expired and evicted
 * entries are never returned. Concurrent writers to the same key race
 * benignly: the last write wins.
 *
 * @code
 *     LruCache<bool> usage(2000, std::chrono::seconds(300));
 *     const auto key = cache_key({"lodash", "/repo/src/a.js"});
 *     if (auto hit = usage.get(key)) {
 *         return *hit;
 *     }
 *     usage.put(key, scan());
 * @endcode
 */

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dsv::cache {

    /**
     * Joins key parts with a unit separator so ("a/b", "c") and ("a", "b/c")
     * stay distinct.
     */
    inline std::string cache_key(std::initializer_list<std::string_view> parts) {
        std::string key;
        bool first = true;
        for (const auto part : parts) {
            if (!first) {
                key += '\x1f';
            }
            key.append(part);
            first = false;
        }
        return key;
    }

    struct CacheStats {
        std::size_t hits = 0;
        std::size_t misses = 0;
        std::size_t evictions = 0;
        std::size_t expirations = 0;
        std::size_t size = 0;
        std::size_t capacity = 0;

        [[nodiscard]] double hit_rate() const noexcept {
            const std::size_t total = hits + misses;
            return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
        }
    };

    /**
     * @tparam V Cached value type. Copied out on get().
     * @tparam Clock Type with a static now(); replaced by a manual clock in tests.
     */
    template<typename V, typename Clock = std::chrono::steady_clock>
    class LruCache {
    public:
        using value_type = V;
        using clock_type = Clock;
        using duration = typename Clock::duration;

        LruCache(const std::size_t capacity, const duration ttl)
            : capacity_(capacity > 0 ? capacity : 1)
            , ttl_(ttl) {}

        LruCache(const LruCache&) = delete;
        LruCache& operator=(const LruCache&) = delete;

        [[nodiscard]] std::optional<V> get(const std::string& key) {
            std::lock_guard lock(mutex_);

            const auto it = entries_.find(key);
            if (it == entries_.end()) {
                ++stats_.misses;
                return std::nullopt;
            }

            if (Clock::now() - it->second.written >= ttl_) {
                order_.erase(it->second.position);
                entries_.erase(it);
                ++stats_.expirations;
                ++stats_.misses;
                return std::nullopt;
            }

            order_.splice(order_.begin(), order_, it->second.position);
            ++stats_.hits;
            return it->second.value;
        }

        void put(const std::string& key, V value) {
            std::lock_guard lock(mutex_);

            if (const auto it = entries_.find(key); it != entries_.end()) {
                it->second.value = std::move(value);
                it->second.written = Clock::now();
                order_.splice(order_.begin(), order_, it->second.position);
                return;
            }

            while (entries_.size() >= capacity_ && !order_.empty()) {
                entries_.erase(order_.back());
                order_.pop_back();
                ++stats_.evictions;
            }

            order_.push_front(key);
            entries_.emplace(key, Entry{std::move(value), Clock::now(), order_.begin()});
        }

        /**
         * Returns the cached value or computes, stores and returns it.
         * @p compute runs without the lock held.
         */
        template<typename F>
        V get_or_compute(const std::string& key, F&& compute) {
            if (auto hit = get(key)) {
                return std::move(*hit);
            }
            V value = std::forward<F>(compute)();
            put(key, value);
            return value;
        }

        void clear() {
            std::lock_guard lock(mutex_);
            entries_.clear();
            order_.clear();
        }

        [[nodiscard]] std::size_t size() const {
            std::lock_guard lock(mutex_);
            return entries_.size();
        }

        [[nodiscard]] std::size_t capacity() const noexcept {
            return capacity_;
        }

        [[nodiscard]] CacheStats stats() const {
            std::lock_guard lock(mutex_);
            CacheStats out = stats_;
            out.size = entries_.size();
            out.capacity = capacity_;
            return out;
        }

    private:
        struct Entry {
            V value;
            typename Clock::time_point written;
            std::list<std::string>::iterator position;
        };

        std::size_t capacity_;
        duration ttl_;
        mutable std::mutex mutex_;
        std::list<std::string> order_;
        std::unordered_map<std::string, Entry> entries_;
        CacheStats stats_;
    };

}  // namespace dsv::cache

#endif //DEPSIEVE_LRU_CACHE_HPP
