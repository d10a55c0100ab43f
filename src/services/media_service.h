#ifndef LUMEN_MEDIA_SERVICE_H
#define LUMEN_MEDIA_SERVICE_H

#include "../interfaces/media_service_interface.h"
#include "../interfaces/source_storage_interface.h"
#include "../interfaces/image_transformer_interface.h"
#include "cache_store.h"
#include "eviction_sweeper.h"
#include "request_coalescer.h"
#include "size_policy.h"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace lumen {

/**
 * @brief Thumbnail facade: size policy -> key -> cache -> single-flight render
 *
 * On a miss exactly one caller per key loads the source and renders it; the
 * result is cached (best effort) and handed to every caller that joined in
 * the meantime. Rendering runs on a worker thread bounded by the transform
 * timeout; when the timeout wins, the leader and its followers all get a
 * TransformException and the late result is discarded.
 *
 * A worker that outlives its timeout keeps its key blocked until it returns,
 * and at most MAX_ABANDONED_WORKERS such workers may exist at once; further
 * transforms fail fast with a TransformException instead of spawning threads.
 */
class MediaService : public MediaServiceInterface {
public:
    MediaService(std::shared_ptr<SourceStorageInterface> storage,
                 std::shared_ptr<ImageTransformerInterface> transformer,
                 std::shared_ptr<CacheStore> cache_store,
                 std::shared_ptr<EvictionSweeper> sweeper,
                 SizePolicy size_policy,
                 std::chrono::milliseconds cache_ttl,
                 std::chrono::milliseconds transform_timeout);

    Thumbnail getThumbnail(const std::string& source_path,
                           const std::optional<std::string>& width,
                           const std::optional<std::string>& height) override;

    // Typed overload for in-process callers
    Thumbnail getThumbnail(const std::string& source_path,
                           std::optional<int> width,
                           std::optional<int> height);

    SourceAsset resolveSource(const std::string& source_path) override;

    nlohmann::json listAllowedSizes() const override;

    CacheStats getCacheStats() const override;

    size_t clearExpired() override;

    const RequestCoalescer& getCoalescer() const { return coalescer_; }

    // Transform workers still running, abandoned ones included
    size_t runningWorkers() const;

    // Workers that outlived their timeout and have not returned yet
    size_t abandonedWorkers() const;

    // Block until every worker has returned or timeout elapses; true if none remain
    bool waitForWorkers(std::chrono::milliseconds timeout) const;

    static constexpr size_t MAX_ABANDONED_WORKERS = 16;

    std::chrono::milliseconds getCacheTtl() const { return cache_ttl_; }

private:
    // Shared with the worker threads, which may outlive the service
    struct WorkerRegistry {
        mutable std::mutex mutex;
        mutable std::condition_variable finished;
        size_t running = 0;
        std::unordered_set<std::string> abandoned;
    };

    std::shared_ptr<SourceStorageInterface> storage_;
    std::shared_ptr<ImageTransformerInterface> transformer_;
    std::shared_ptr<CacheStore> cache_store_;
    std::shared_ptr<EvictionSweeper> sweeper_;
    SizePolicy size_policy_;
    std::chrono::milliseconds cache_ttl_;
    std::chrono::milliseconds transform_timeout_;
    RequestCoalescer coalescer_;
    std::shared_ptr<WorkerRegistry> workers_;

    Thumbnail serve(const std::string& source_path, const Dimensions& size);

    // Leader path: load, render, cache
    TransformedImage renderAndStore(const std::string& normalized_path,
                                    const Dimensions& size,
                                    const std::string& expected_fingerprint);

    TransformedImage transformWithTimeout(const std::string& key, std::vector<char> source_bytes,
                                          const Dimensions& size);
};

} // namespace lumen

#endif // LUMEN_MEDIA_SERVICE_H
