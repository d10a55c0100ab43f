#ifndef LUMEN_CACHE_STORE_H
#define LUMEN_CACHE_STORE_H

#include "stats_tracker.h"
#include "../interfaces/clock_interface.h"
#include "../models/cache_entry.h"
#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lumen {

/**
 * @brief Disk-backed key -> bytes store with TTL expiry
 *
 * Layout: <root>/<key[0..1]>/<key>.bin holds the payload and
 * <root>/<key[0..1]>/<key>.json its CacheEntry sidecar. The in-memory index is
 * split into shards with one mutex each, so operations on different keys do
 * not contend on a single lock. Payload and sidecar are written to temporary
 * files first and renamed into place, so readers never see partial data.
 *
 * Every hit, miss, insert and removal is reported to the StatsTracker.
 */
class CacheStore {
public:
    /**
     * @brief Open (or create) a store rooted at root_path
     *
     * Existing sidecars are adopted into the index; leftover temporary files
     * and payloads without a valid sidecar are deleted.
     * Throws CacheWriteException if the root cannot be created.
     */
    CacheStore(const std::string& root_path,
               std::shared_ptr<StatsTracker> stats,
               std::shared_ptr<ClockInterface> clock);

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    // Payload and metadata, or std::nullopt when absent or expired
    std::optional<CachedPayload> get(const std::string& key);

    // Same as get() but records neither a hit nor a miss
    std::optional<CachedPayload> recheck(const std::string& key);

    /**
     * @brief Store bytes under key for ttl
     *
     * Replaces an existing entry. Throws CacheWriteException on I/O failure;
     * the index is unchanged in that case.
     */
    CacheEntry put(const std::string& key, const std::vector<char>& bytes,
                   const std::string& content_type, std::chrono::milliseconds ttl);

    // True if an entry was removed; false (no-op) if it was already gone
    bool remove(const std::string& key);

    // Keys whose expiresAt <= now
    std::vector<std::string> listExpired(TimePoint now) const;

    // Remove every entry, returns the number removed
    size_t clear();

    // Metadata without touching hit/miss counters or lastAccessedAt
    std::optional<CacheEntry> peek(const std::string& key) const;

    CacheStats stats() const { return stats_->snapshot(); }

    size_t size() const;

    const std::string& getRootPath() const { return root_path_; }

    // Adopted from disk by the constructor
    size_t reindexedCount() const { return reindexed_; }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, CacheEntry> entries;
    };

    static constexpr size_t SHARD_COUNT = 16;

    std::string root_path_;
    std::shared_ptr<StatsTracker> stats_;
    std::shared_ptr<ClockInterface> clock_;
    std::array<Shard, SHARD_COUNT> shards_;
    size_t reindexed_;

    Shard& shardFor(const std::string& key);
    const Shard& shardFor(const std::string& key) const;

    std::filesystem::path directoryFor(const std::string& key) const;
    std::filesystem::path payloadPath(const std::string& key) const;
    std::filesystem::path metadataPath(const std::string& key) const;

    // Keys become file names; throws InvalidRequestException for unsafe keys
    static void validateKey(const std::string& key);

    // Drop an index entry if it still is the given generation
    void evictStale(const std::string& key, TimePoint created_at);

    // Caller holds the shard lock
    void deleteFiles(const std::string& key) const;

    size_t reindex();

    std::optional<CachedPayload> lookup(const std::string& key, bool record_stats);
};

} // namespace lumen

#endif // LUMEN_CACHE_STORE_H
