#ifndef LUMEN_MEDIA_CONFIG_H
#define LUMEN_MEDIA_CONFIG_H

#include "thumbnail.h"
#include <string>
#include <vector>
#include <chrono>

namespace lumen {

struct MediaConfig {
    int port;
    std::string storage_path;           // root of the original assets
    std::string source_prefix;          // prepended to request paths lacking it
    std::string cache_path;             // root of the thumbnail cache
    std::chrono::milliseconds cache_ttl;
    std::chrono::milliseconds sweep_interval;
    std::chrono::milliseconds transform_timeout;

    // Size policy
    bool strict_sizes;
    std::vector<Dimensions> allowed_sizes;
    int min_width;
    int max_width;
    int min_height;
    int max_height;
    Dimensions default_size;

    // Encoder
    int quality;                        // 1-100, JPEG/WebP/HEIF
    bool allow_upscale;

    // Defaults: port 4003, one-week TTL, hourly sweep
    MediaConfig()
        : port(4003),
          storage_path("./storage"),
          source_prefix("uploads/"),
          cache_path("./storage/media/cache"),
          cache_ttl(604800000),
          sweep_interval(3600000),
          transform_timeout(30000),
          strict_sizes(false),
          allowed_sizes({{100, 100}, {200, 200}, {400, 400}, {800, 800}, {1200, 1200}}),
          min_width(1),
          max_width(2048),
          min_height(1),
          max_height(2048),
          default_size(800, 800),
          quality(85),
          allow_upscale(false) {}

    // Factory method reading MEDIA_* environment variables over the defaults.
    // Throws ConfigurationException on unparsable values.
    static MediaConfig fromEnvironment();

    // Parse "100x100,200x200"; throws ConfigurationException on malformed items
    static std::vector<Dimensions> parseSizeList(const std::string& value);

    // Throws ConfigurationException describing the first inconsistency
    void validate() const;

    bool isValid() const;
};

} // namespace lumen

#endif // LUMEN_MEDIA_CONFIG_H
