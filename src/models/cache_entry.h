#ifndef LUMEN_CACHE_ENTRY_H
#define LUMEN_CACHE_ENTRY_H

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace lumen {

using TimePoint = std::chrono::system_clock::time_point;

struct CacheEntry {
    std::string key;
    std::string payload_path;      // absolute path of the payload file
    std::string content_type;
    uint64_t size_bytes;
    TimePoint created_at;
    TimePoint last_accessed_at;
    TimePoint expires_at;          // never earlier than created_at

    CacheEntry();

    // Expired entries are logically absent
    bool isExpired(TimePoint now) const { return expires_at <= now; }

    // Sidecar representation, timestamps as milliseconds since the epoch
    nlohmann::json toJson() const;

    // Throws nlohmann::json::exception on malformed input
    static CacheEntry fromJson(const nlohmann::json& j);

    static int64_t toEpochMillis(TimePoint tp);
    static TimePoint fromEpochMillis(int64_t ms);
};

// Payload plus metadata returned by a cache hit
struct CachedPayload {
    CacheEntry entry;
    std::vector<char> bytes;
};

struct CacheStats {
    uint64_t hits;
    uint64_t misses;
    uint64_t entries;
    uint64_t total_bytes;

    CacheStats() : hits(0), misses(0), entries(0), total_bytes(0) {}

    double hitRate() const {
        uint64_t probes = hits + misses;
        return probes == 0 ? 0.0 : static_cast<double>(hits) / probes;
    }

    nlohmann::json toJson() const;
};

} // namespace lumen

#endif // LUMEN_CACHE_ENTRY_H
