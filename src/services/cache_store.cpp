#include "cache_store.h"
#include "../exceptions/media_exceptions.h"
#include "../utils/file_utils.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <system_error>

namespace lumen {

CacheStore::CacheStore(const std::string& root_path,
                       std::shared_ptr<StatsTracker> stats,
                       std::shared_ptr<ClockInterface> clock)
    : root_path_(root_path),
      stats_(std::move(stats)),
      clock_(std::move(clock)),
      reindexed_(0) {

    std::error_code ec;
    std::filesystem::create_directories(root_path_, ec);
    if (ec) {
        LOG_ERROR("Failed to create cache directory {}: {}", root_path_, ec.message());
        throw exceptions::CacheWriteException("Failed to initialize cache at " + root_path_);
    }

    reindexed_ = reindex();
    Logger::log_structured(spdlog::level::info, "Cache store opened", {
        {"cache_path", root_path_},
        {"adopted_entries", reindexed_}
    });
}

CacheStore::Shard& CacheStore::shardFor(const std::string& key) {
    return shards_[std::hash<std::string>{}(key) % SHARD_COUNT];
}

const CacheStore::Shard& CacheStore::shardFor(const std::string& key) const {
    return shards_[std::hash<std::string>{}(key) % SHARD_COUNT];
}

std::filesystem::path CacheStore::directoryFor(const std::string& key) const {
    return std::filesystem::path(root_path_) / key.substr(0, 2);
}

std::filesystem::path CacheStore::payloadPath(const std::string& key) const {
    return directoryFor(key) / (key + ".bin");
}

std::filesystem::path CacheStore::metadataPath(const std::string& key) const {
    return directoryFor(key) / (key + ".json");
}

void CacheStore::validateKey(const std::string& key) {
    if (key.size() < 2 || key.size() > 128) {
        throw exceptions::InvalidRequestException("Cache key must be 2-128 characters");
    }
    bool safe = std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
    if (!safe) {
        throw exceptions::InvalidRequestException("Cache key contains unsupported characters");
    }
}

std::optional<CachedPayload> CacheStore::get(const std::string& key) {
    return lookup(key, true);
}

std::optional<CachedPayload> CacheStore::recheck(const std::string& key) {
    return lookup(key, false);
}

std::optional<CachedPayload> CacheStore::lookup(const std::string& key, bool record_stats) {
    validateKey(key);
    TimePoint now = clock_->now();

    CacheEntry entry;
    {
        Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it == shard.entries.end() || it->second.isExpired(now)) {
            if (record_stats) {
                stats_->recordMiss();
                METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "get"}, {"status", "miss"}});
            }
            return std::nullopt;
        }
        entry = it->second;
    }

    // Read outside the lock; a concurrent remove only makes this a miss
    auto bytes = utils::FileUtils::readFile(entry.payload_path);
    if (!bytes || bytes->size() != entry.size_bytes) {
        Logger::log_structured(spdlog::level::warn, "Cache payload unreadable, dropping entry", {
            {"cache_key", key},
            {"payload_path", entry.payload_path},
            {"expected_bytes", entry.size_bytes}
        });
        evictStale(key, entry.created_at);
        if (record_stats) {
            stats_->recordMiss();
            METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "get"}, {"status", "miss"}});
        }
        return std::nullopt;
    }

    {
        Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it != shard.entries.end() && it->second.created_at == entry.created_at) {
            it->second.last_accessed_at = now;
            entry.last_accessed_at = now;
        }
    }

    if (record_stats) {
        stats_->recordHit();
        METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "get"}, {"status", "hit"}});
    }

    CachedPayload payload;
    payload.entry = std::move(entry);
    payload.bytes = std::move(*bytes);
    return payload;
}

CacheEntry CacheStore::put(const std::string& key, const std::vector<char>& bytes,
                           const std::string& content_type, std::chrono::milliseconds ttl) {
    validateKey(key);
    METRICS_TIMER("CacheDuration", {{"operation", "put"}});

    if (ttl.count() < 0) {
        ttl = std::chrono::milliseconds(0);
    }

    TimePoint now = clock_->now();
    CacheEntry entry;
    entry.key = key;
    entry.payload_path = payloadPath(key).string();
    entry.content_type = content_type;
    entry.size_bytes = bytes.size();
    entry.created_at = now;
    entry.last_accessed_at = now;
    entry.expires_at = now + std::chrono::duration_cast<TimePoint::duration>(ttl);

    std::error_code ec;
    std::filesystem::create_directories(directoryFor(key), ec);
    if (ec) {
        METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "put"}, {"status", "failure"}});
        throw exceptions::CacheWriteException(
            "Failed to create cache directory for " + key + ": " + ec.message());
    }

    // Heavy I/O happens before taking the shard lock
    auto payload_temp = utils::FileUtils::writeTempFile(payloadPath(key), bytes);
    if (!payload_temp) {
        METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "put"}, {"status", "failure"}});
        throw exceptions::CacheWriteException("Failed to write cache payload for " + key);
    }

    std::string sidecar = entry.toJson().dump();
    auto metadata_temp = utils::FileUtils::writeTempFile(
        metadataPath(key), std::vector<char>(sidecar.begin(), sidecar.end()));
    if (!metadata_temp) {
        utils::FileUtils::deleteFile(*payload_temp);
        METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "put"}, {"status", "failure"}});
        throw exceptions::CacheWriteException("Failed to write cache metadata for " + key);
    }

    {
        Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);

        if (!utils::FileUtils::commitTempFile(*payload_temp, payloadPath(key))) {
            utils::FileUtils::deleteFile(*metadata_temp);
            METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "put"}, {"status", "failure"}});
            throw exceptions::CacheWriteException("Failed to commit cache payload for " + key);
        }

        if (!utils::FileUtils::commitTempFile(*metadata_temp, metadataPath(key))) {
            // The payload on disk no longer matches any indexed entry
            auto it = shard.entries.find(key);
            if (it != shard.entries.end()) {
                stats_->recordRemove(it->second.size_bytes);
                shard.entries.erase(it);
            }
            deleteFiles(key);
            METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "put"}, {"status", "failure"}});
            throw exceptions::CacheWriteException("Failed to commit cache metadata for " + key);
        }

        auto it = shard.entries.find(key);
        if (it != shard.entries.end()) {
            stats_->recordReplace(it->second.size_bytes, entry.size_bytes);
            it->second = entry;
        } else {
            stats_->recordInsert(entry.size_bytes);
            shard.entries.emplace(key, entry);
        }
    }

    Logger::log_structured(spdlog::level::debug, "Cached thumbnail", {
        {"cache_key", key},
        {"content_type", content_type},
        {"size_bytes", entry.size_bytes},
        {"ttl_ms", ttl.count()}
    });
    METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "put"}, {"status", "success"}});

    return entry;
}

bool CacheStore::remove(const std::string& key) {
    validateKey(key);

    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        return false;
    }

    uint64_t size_bytes = it->second.size_bytes;
    shard.entries.erase(it);
    stats_->recordRemove(size_bytes);

    // Under the shard lock so a concurrent put cannot lose its fresh files
    deleteFiles(key);

    METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "remove"}, {"status", "success"}});
    return true;
}

void CacheStore::evictStale(const std::string& key, TimePoint created_at) {
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it == shard.entries.end() || it->second.created_at != created_at) {
        return;
    }

    stats_->recordRemove(it->second.size_bytes);
    shard.entries.erase(it);
    deleteFiles(key);
}

void CacheStore::deleteFiles(const std::string& key) const {
    std::error_code ec;
    std::filesystem::remove(payloadPath(key), ec);
    if (ec) {
        LOG_WARN("Failed to delete cache payload {}: {}", payloadPath(key).string(), ec.message());
    }
    std::filesystem::remove(metadataPath(key), ec);
    if (ec) {
        LOG_WARN("Failed to delete cache metadata {}: {}", metadataPath(key).string(), ec.message());
    }
}

std::vector<std::string> CacheStore::listExpired(TimePoint now) const {
    std::vector<std::string> expired;

    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [key, entry] : shard.entries) {
            if (entry.isExpired(now)) {
                expired.push_back(key);
            }
        }
    }

    return expired;
}

size_t CacheStore::clear() {
    std::vector<std::string> keys;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [key, entry] : shard.entries) {
            keys.push_back(key);
        }
    }

    size_t removed = 0;
    for (const auto& key : keys) {
        if (remove(key)) {
            ++removed;
        }
    }

    LOG_INFO("Cache cleared: {} entries removed", removed);
    return removed;
}

std::optional<CacheEntry> CacheStore::peek(const std::string& key) const {
    const Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t CacheStore::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

size_t CacheStore::reindex() {
    namespace fs = std::filesystem;

    std::vector<fs::path> sidecars;
    std::vector<fs::path> payloads;
    std::error_code ec;

    for (fs::recursive_directory_iterator it(root_path_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        const fs::path& path = it->path();
        if (utils::FileUtils::isTemporaryFile(path)) {
            // Interrupted write from a previous run
            utils::FileUtils::deleteFile(path);
        } else if (path.extension() == ".json") {
            sidecars.push_back(path);
        } else if (path.extension() == ".bin") {
            payloads.push_back(path);
        }
    }
    if (ec) {
        LOG_WARN("Cache reindex stopped early: {}", ec.message());
    }

    size_t adopted = 0;
    for (const auto& sidecar : sidecars) {
        std::string key = sidecar.stem().string();
        try {
            validateKey(key);

            auto raw = utils::FileUtils::readFile(sidecar);
            if (!raw) {
                throw exceptions::CacheWriteException("unreadable sidecar");
            }

            CacheEntry entry = CacheEntry::fromJson(nlohmann::json::parse(raw->begin(), raw->end()));
            entry.key = key;
            entry.payload_path = payloadPath(key).string();

            std::error_code size_ec;
            auto on_disk = fs::file_size(entry.payload_path, size_ec);
            if (size_ec || on_disk != entry.size_bytes) {
                throw exceptions::CacheWriteException("payload missing or truncated");
            }

            Shard& shard = shardFor(key);
            std::lock_guard<std::mutex> lock(shard.mutex);
            if (shard.entries.emplace(key, entry).second) {
                stats_->recordInsert(entry.size_bytes);
                ++adopted;
            }
        } catch (const std::exception& e) {
            Logger::log_structured(spdlog::level::warn, "Discarding invalid cache entry", {
                {"sidecar", sidecar.string()},
                {"error", e.what()}
            });
            utils::FileUtils::deleteFile(sidecar);
            utils::FileUtils::deleteFile(directoryFor(key) / (key + ".bin"));
        }
    }

    for (const auto& payload : payloads) {
        std::string key = payload.stem().string();
        if (!peek(key)) {
            utils::FileUtils::deleteFile(payload);
        }
    }

    return adopted;
}

} // namespace lumen
