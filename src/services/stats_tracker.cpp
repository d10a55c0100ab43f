#include "stats_tracker.h"

namespace lumen {

void StatsTracker::recordInsert(uint64_t size_bytes) {
    entries_.fetch_add(1, std::memory_order_relaxed);
    total_bytes_.fetch_add(size_bytes, std::memory_order_relaxed);
}

void StatsTracker::recordReplace(uint64_t old_size_bytes, uint64_t new_size_bytes) {
    if (new_size_bytes >= old_size_bytes) {
        total_bytes_.fetch_add(new_size_bytes - old_size_bytes, std::memory_order_relaxed);
    } else {
        total_bytes_.fetch_sub(old_size_bytes - new_size_bytes, std::memory_order_relaxed);
    }
}

void StatsTracker::recordRemove(uint64_t size_bytes) {
    entries_.fetch_sub(1, std::memory_order_relaxed);
    total_bytes_.fetch_sub(size_bytes, std::memory_order_relaxed);
}

CacheStats StatsTracker::snapshot() const {
    CacheStats stats;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.entries = entries_.load(std::memory_order_relaxed);
    stats.total_bytes = total_bytes_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace lumen
