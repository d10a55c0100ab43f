#ifndef LUMEN_STATS_TRACKER_H
#define LUMEN_STATS_TRACKER_H

#include "../models/cache_entry.h"
#include <atomic>
#include <cstdint>

namespace lumen {

/**
 * @brief Process-wide cache counters
 *
 * Lock-free; one instance is shared by the cache store and everything that
 * reports through it.
 */
class StatsTracker {
public:
    StatsTracker() = default;

    StatsTracker(const StatsTracker&) = delete;
    StatsTracker& operator=(const StatsTracker&) = delete;

    void recordHit() { hits_.fetch_add(1, std::memory_order_relaxed); }
    void recordMiss() { misses_.fetch_add(1, std::memory_order_relaxed); }

    // A new entry of size_bytes was stored
    void recordInsert(uint64_t size_bytes);

    // An existing entry was overwritten in place
    void recordReplace(uint64_t old_size_bytes, uint64_t new_size_bytes);

    // An entry of size_bytes was removed
    void recordRemove(uint64_t size_bytes);

    CacheStats snapshot() const;

private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> entries_{0};
    std::atomic<uint64_t> total_bytes_{0};
};

} // namespace lumen

#endif // LUMEN_STATS_TRACKER_H
