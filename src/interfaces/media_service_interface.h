#ifndef LUMEN_MEDIA_SERVICE_INTERFACE_H
#define LUMEN_MEDIA_SERVICE_INTERFACE_H

#include "../models/cache_entry.h"
#include "../models/thumbnail.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace lumen {

/**
 * @brief Capabilities the HTTP layer needs from the media core
 */
class MediaServiceInterface {
public:
    virtual ~MediaServiceInterface() = default;

    /**
     * @brief Thumbnail of source_path fitting width x height
     *
     * Width and height are raw query values; both absent selects the default
     * size. Throws InvalidRequestException, SizePolicyViolationException,
     * NotFoundException, TransformException or StorageUnavailableException.
     */
    virtual Thumbnail getThumbnail(const std::string& source_path,
                                   const std::optional<std::string>& width,
                                   const std::optional<std::string>& height) = 0;

    // Original bytes and fingerprint of a (not yet normalized) source path
    virtual SourceAsset resolveSource(const std::string& source_path) = 0;

    // Size policy description
    virtual nlohmann::json listAllowedSizes() const = 0;

    virtual CacheStats getCacheStats() const = 0;

    // Synchronous sweep; returns the number of expired entries removed
    virtual size_t clearExpired() = 0;
};

} // namespace lumen

#endif // LUMEN_MEDIA_SERVICE_INTERFACE_H
