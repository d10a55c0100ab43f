#include "cache_entry.h"

namespace lumen {

CacheEntry::CacheEntry()
    : key(""), payload_path(""), content_type(""), size_bytes(0),
      created_at(), last_accessed_at(), expires_at() {}

int64_t CacheEntry::toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

TimePoint CacheEntry::fromEpochMillis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(ms)));
}

nlohmann::json CacheEntry::toJson() const {
    nlohmann::json j;
    j["key"] = key;
    j["payloadPath"] = payload_path;
    j["contentType"] = content_type;
    j["sizeBytes"] = size_bytes;
    j["createdAt"] = toEpochMillis(created_at);
    j["lastAccessedAt"] = toEpochMillis(last_accessed_at);
    j["expiresAt"] = toEpochMillis(expires_at);
    return j;
}

CacheEntry CacheEntry::fromJson(const nlohmann::json& j) {
    CacheEntry entry;
    entry.key = j.at("key").get<std::string>();
    entry.payload_path = j.at("payloadPath").get<std::string>();
    entry.content_type = j.at("contentType").get<std::string>();
    entry.size_bytes = j.at("sizeBytes").get<uint64_t>();
    entry.created_at = fromEpochMillis(j.at("createdAt").get<int64_t>());
    entry.last_accessed_at = fromEpochMillis(
        j.value("lastAccessedAt", j.at("createdAt").get<int64_t>()));
    entry.expires_at = fromEpochMillis(j.at("expiresAt").get<int64_t>());

    if (entry.expires_at < entry.created_at) {
        entry.expires_at = entry.created_at;
    }
    return entry;
}

nlohmann::json CacheStats::toJson() const {
    return {
        {"hits", hits},
        {"misses", misses},
        {"entries", entries},
        {"totalBytes", total_bytes},
        {"hitRate", hitRate()}
    };
}

} // namespace lumen
