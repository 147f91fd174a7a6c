#pragma once

/**
 * @file dispatch_cache.hpp
 * @brief Bounded cache of type-erased invokers keyed by type pair
 *
 * The inferred call forms only know their types at runtime. For each
 * (source, destination) pair the Mapper builds a closure once and stores it
 * here; later calls for the same pair are a hash lookup plus a call.
 *
 * Growth is bounded by a soft ceiling: when an insert pushes the entry count
 * above max_entries the whole cache is cleared and entries are rebuilt on
 * demand (no LRU ordering is kept).
 *
 * Thread Safety:
 * - Lookups take a shared lock; insert and clear take an exclusive lock
 * - The invoker is built outside the lock; concurrent misses on one key may
 *   each build, but the first insert wins and all callers get the stored copy
 */

#include <mapr/common/debug.hpp>
#include <mapr/core/mapping/type_pair_key.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

namespace mapr::core {

/**
 * @brief Configuration for dispatch caches
 */
struct DispatchCacheConfig {
    /// Soft ceiling; exceeding it clears the cache
    size_t max_entries = 2048;
};

/**
 * @brief Statistics for dispatch cache monitoring
 */
struct DispatchCacheStats {
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> builds{0};
    std::atomic<uint64_t> clears{0};

    double hit_rate() const noexcept {
        auto total = hits.load() + misses.load();
        return total > 0 ? static_cast<double>(hits.load()) / total * 100.0 : 0.0;
    }

    void reset() noexcept {
        hits.store(0);
        misses.store(0);
        builds.store(0);
        clears.store(0);
    }
};

template<typename Invoker>
class DispatchCache {
public:
    DispatchCache() = default;
    explicit DispatchCache(DispatchCacheConfig config) : config_(config) {}

    DispatchCache(const DispatchCache&)            = delete;
    DispatchCache& operator=(const DispatchCache&) = delete;

    /**
     * @brief Get the invoker for @p key, building it with @p build on a miss
     *
     * @param build Callable `Invoker(const TypePairKey&)`; must not touch this cache
     * @return A copy of the stored invoker (stays valid across clears)
     */
    template<typename Build>
    Invoker get_or_create(const TypePairKey& key, Build&& build) {
        // Fast path: shared lock
        {
            std::shared_lock lock(mutex_);
            auto it = entries_.find(key);
            if (MAPR_LIKELY(it != entries_.end())) {
                stats_.hits.fetch_add(1, std::memory_order_relaxed);
                return it->second;
            }
        }

        stats_.misses.fetch_add(1, std::memory_order_relaxed);

        Invoker built = std::forward<Build>(build)(key);
        stats_.builds.fetch_add(1, std::memory_order_relaxed);

        std::unique_lock lock(mutex_);
        auto [it, inserted] = entries_.try_emplace(key, std::move(built));
        Invoker result      = it->second;

        if (inserted) {
            MAPR_LOG_TRACE(common::debug::category::DISPATCH, "Cached invoker for " << key);
        }

        if (entries_.size() > config_.max_entries) {
            auto dropped = entries_.size();
            entries_.clear();
            stats_.clears.fetch_add(1, std::memory_order_relaxed);
            MAPR_LOG_DEBUG(common::debug::category::DISPATCH,
                           "Dispatch cache exceeded " << config_.max_entries << " entries, dropped "
                                                      << dropped);
        }
        return result;
    }

    bool contains(const TypePairKey& key) const {
        std::shared_lock lock(mutex_);
        return entries_.find(key) != entries_.end();
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        entries_.clear();
    }

    const DispatchCacheConfig& config() const noexcept { return config_; }

    const DispatchCacheStats& stats() const noexcept { return stats_; }

    void reset_stats() noexcept { stats_.reset(); }

private:
    DispatchCacheConfig config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<TypePairKey, Invoker, TypePairKeyHash> entries_;

    DispatchCacheStats stats_;
};

}  // namespace mapr::core
