#include "media_service.h"
#include "cache_key_deriver.h"
#include "../exceptions/media_exceptions.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"
#include <future>
#include <system_error>
#include <thread>

namespace lumen {

MediaService::MediaService(std::shared_ptr<SourceStorageInterface> storage,
                           std::shared_ptr<ImageTransformerInterface> transformer,
                           std::shared_ptr<CacheStore> cache_store,
                           std::shared_ptr<EvictionSweeper> sweeper,
                           SizePolicy size_policy,
                           std::chrono::milliseconds cache_ttl,
                           std::chrono::milliseconds transform_timeout)
    : storage_(std::move(storage)),
      transformer_(std::move(transformer)),
      cache_store_(std::move(cache_store)),
      sweeper_(std::move(sweeper)),
      size_policy_(std::move(size_policy)),
      cache_ttl_(cache_ttl),
      transform_timeout_(transform_timeout),
      workers_(std::make_shared<WorkerRegistry>()) {
}

Thumbnail MediaService::getThumbnail(const std::string& source_path,
                                     const std::optional<std::string>& width,
                                     const std::optional<std::string>& height) {
    return serve(source_path, size_policy_.normalize(width, height));
}

Thumbnail MediaService::getThumbnail(const std::string& source_path,
                                     std::optional<int> width,
                                     std::optional<int> height) {
    return serve(source_path, size_policy_.normalize(width, height));
}

Thumbnail MediaService::serve(const std::string& source_path, const Dimensions& size) {
    std::string path = CacheKeyDeriver::normalizePath(source_path);
    std::string fingerprint = storage_->fingerprint(path);
    std::string key = CacheKeyDeriver::deriveKey(path, size.width, size.height, fingerprint);

    if (auto cached = cache_store_->get(key)) {
        METRICS_COUNT("ThumbnailRequests", 1.0, "Count", {{"cache", "hit"}});
        LOG_DEBUG("Cache hit for {} at {}", path, size.toString());
        return Thumbnail(std::move(cached->bytes), cached->entry.content_type, true);
    }

    METRICS_COUNT("ThumbnailRequests", 1.0, "Count", {{"cache", "miss"}});

    bool stored_meanwhile = false;
    auto outcome = coalescer_.run(key, [this, &key, &path, &size, &fingerprint, &stored_meanwhile]() {
        // A previous leader may have stored the result between our probe and now
        if (auto cached = cache_store_->recheck(key)) {
            stored_meanwhile = true;
            LOG_DEBUG("Cache filled while joining for {} at {}", path, size.toString());
            return TransformedImage{std::move(cached->bytes), cached->entry.content_type};
        }
        return renderAndStore(path, size, fingerprint);
    });

    bool from_cache = outcome.leader && stored_meanwhile;
    return Thumbnail(std::move(outcome.image.bytes), outcome.image.content_type, from_cache);
}

TransformedImage MediaService::renderAndStore(const std::string& normalized_path,
                                              const Dimensions& size,
                                              const std::string& expected_fingerprint) {
    SourceAsset source = storage_->resolve(normalized_path);

    // The source may have changed since the fingerprint probe; key by what was rendered
    std::string key = CacheKeyDeriver::deriveKey(normalized_path, size.width, size.height,
                                                 source.fingerprint);
    if (source.fingerprint != expected_fingerprint) {
        Logger::log_structured(spdlog::level::info, "Source changed during request", {
            {"source_path", normalized_path},
            {"expected_fingerprint", expected_fingerprint},
            {"fingerprint", source.fingerprint}
        });
    }

    auto started = std::chrono::steady_clock::now();
    TransformedImage image = transformWithTimeout(key, std::move(source.bytes), size);
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    Logger::log_structured(spdlog::level::info, "Thumbnail generated", {
        {"source_path", normalized_path},
        {"width", size.width},
        {"height", size.height},
        {"content_type", image.content_type},
        {"size_bytes", image.bytes.size()},
        {"duration_ms", elapsed_ms}
    });

    try {
        cache_store_->put(key, image.bytes, image.content_type, cache_ttl_);
    } catch (const exceptions::CacheWriteException& e) {
        // Serving still succeeds; the next request recomputes
        Logger::log_error("Failed to cache thumbnail", e, {
            {"cache_key", key},
            {"source_path", normalized_path}
        });
        METRICS_COUNT("CacheWriteErrors", 1.0, "Count");
    }

    return image;
}

TransformedImage MediaService::transformWithTimeout(const std::string& key,
                                                    std::vector<char> source_bytes,
                                                    const Dimensions& size) {
    auto transformer = transformer_;
    auto workers = workers_;
    int width = size.width;
    int height = size.height;

    {
        std::lock_guard<std::mutex> lock(workers->mutex);
        if (workers->abandoned.count(key) > 0) {
            METRICS_COUNT("ImageTransformations", 1.0, "Count", {{"status", "rejected"}});
            throw exceptions::TransformException(
                "Previous transformation of this thumbnail is still running");
        }
        if (workers->abandoned.size() >= MAX_ABANDONED_WORKERS) {
            METRICS_COUNT("ImageTransformations", 1.0, "Count", {{"status", "rejected"}});
            throw exceptions::TransformException("Too many stalled transformations");
        }
        workers->running++;
    }

    // The worker owns everything it touches, so it may outlive this call
    auto task = std::make_shared<std::packaged_task<TransformedImage()>>(
        [transformer, bytes = std::move(source_bytes), width, height]() {
            return transformer->transform(bytes, width, height);
        });
    std::future<TransformedImage> result = task->get_future();

    try {
        std::thread([task, workers, key]() {
            (*task)();
            std::lock_guard<std::mutex> lock(workers->mutex);
            workers->running--;
            workers->abandoned.erase(key);
            workers->finished.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lock(workers->mutex);
            workers->running--;
        }
        Logger::log_error("Failed to start transform worker", e, {{"cache_key", key}});
        throw exceptions::TransformException(std::string("Failed to start transform worker: ") + e.what());
    }

    if (result.wait_for(transform_timeout_) == std::future_status::timeout) {
        {
            std::lock_guard<std::mutex> lock(workers->mutex);
            // The worker may have returned between the wait and this lock
            if (result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                workers->abandoned.insert(key);
            }
        }
        Logger::log_structured(spdlog::level::err, "Image transformation timed out", {
            {"cache_key", key},
            {"width", width},
            {"height", height},
            {"timeout_ms", transform_timeout_.count()}
        });
        METRICS_COUNT("ImageTransformations", 1.0, "Count", {{"status", "timeout"}});
        throw exceptions::TransformException(
            "Image transformation timed out after " +
            std::to_string(transform_timeout_.count()) + " ms");
    }

    return result.get();
}

size_t MediaService::runningWorkers() const {
    std::lock_guard<std::mutex> lock(workers_->mutex);
    return workers_->running;
}

size_t MediaService::abandonedWorkers() const {
    std::lock_guard<std::mutex> lock(workers_->mutex);
    return workers_->abandoned.size();
}

bool MediaService::waitForWorkers(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(workers_->mutex);
    return workers_->finished.wait_for(lock, timeout, [this] { return workers_->running == 0; });
}

SourceAsset MediaService::resolveSource(const std::string& source_path) {
    return storage_->resolve(CacheKeyDeriver::normalizePath(source_path));
}

nlohmann::json MediaService::listAllowedSizes() const {
    return size_policy_.listAllowed();
}

CacheStats MediaService::getCacheStats() const {
    return cache_store_->stats();
}

size_t MediaService::clearExpired() {
    return sweeper_->sweepOnce();
}

} // namespace lumen
