#ifndef LUMEN_TEST_HELPERS_TEST_BUILDERS_H
#define LUMEN_TEST_HELPERS_TEST_BUILDERS_H

#include "models/media_config.h"
#include "services/size_policy.h"
#include "test_constants.h"
#include <stdexcept>
#include <string>
#include <vector>
#include <vips/vips8>

namespace lumen {
namespace test_builders {

/**
 * @brief Builder for MediaConfig objects
 *
 * Starts from the production defaults.
 *
 * Example:
 *   auto config = MediaConfigBuilder()
 *       .strict({{100, 100}, {400, 400}})
 *       .withDefaultSize(400, 400)
 *       .build();
 */
class MediaConfigBuilder {
public:
    MediaConfigBuilder& strict(const std::vector<Dimensions>& sizes) {
        config_.strict_sizes = true;
        config_.allowed_sizes = sizes;
        return *this;
    }

    MediaConfigBuilder& bounded(int min_width, int max_width, int min_height, int max_height) {
        config_.strict_sizes = false;
        config_.min_width = min_width;
        config_.max_width = max_width;
        config_.min_height = min_height;
        config_.max_height = max_height;
        return *this;
    }

    MediaConfigBuilder& withDefaultSize(int width, int height) {
        config_.default_size = Dimensions(width, height);
        return *this;
    }

    MediaConfigBuilder& withCacheTtl(std::chrono::milliseconds ttl) {
        config_.cache_ttl = ttl;
        return *this;
    }

    MediaConfigBuilder& withQuality(int quality) {
        config_.quality = quality;
        return *this;
    }

    MediaConfig build() const {
        return config_;
    }

private:
    MediaConfig config_;
};

/**
 * @brief Factory for the size policies used across tests
 */
class SizePolicyBuilder {
public:
    // Production default: any size within 1-2048 on both axes, 800x800 default
    static SizePolicy defaultBounded() {
        return SizePolicy::bounded(
            SizePolicy::Bounds{test_constants::MIN_DIMENSION, test_constants::MAX_DIMENSION,
                               test_constants::MIN_DIMENSION, test_constants::MAX_DIMENSION},
            Dimensions(test_constants::DEFAULT_SIZE, test_constants::DEFAULT_SIZE));
    }

    // Stock allow-list: 100, 200, 400, 800 and 1200 squares
    static SizePolicy defaultStrict() {
        return SizePolicy::strict(
            {{100, 100}, {200, 200}, {400, 400}, {800, 800}, {1200, 1200}},
            Dimensions(test_constants::DEFAULT_SIZE, test_constants::DEFAULT_SIZE));
    }
};

/**
 * @brief Builder for encoded test images, rendered with libvips
 *
 * libvips must be initialized by the calling suite.
 */
class TestImageBuilder {
public:
    // Solid red image encoded with the given suffix (".png", ".jpg", ".webp")
    static std::vector<char> create(int width, int height, const std::string& suffix) {
        vips::VImage image = vips::VImage::black(width, height, vips::VImage::option()
            ->set("bands", test_constants::RGB_BANDS));
        image = image.new_from_image({255.0, 0.0, 0.0});
        image = image.cast(VIPS_FORMAT_UCHAR);

        void* buffer = nullptr;
        size_t length = 0;
        image.write_to_buffer(suffix.c_str(), &buffer, &length);

        std::vector<char> bytes(static_cast<char*>(buffer), static_cast<char*>(buffer) + length);
        g_free(buffer);
        return bytes;
    }

    static std::vector<char> createPng(int width, int height) {
        return create(width, height, ".png");
    }

    static std::vector<char> createJpeg(int width, int height) {
        return create(width, height, ".jpg");
    }
};

/**
 * @brief Builder for raw test data
 */
class TestDataBuilder {
public:
    static std::vector<char> createData(size_t size, char fill = 'x') {
        return std::vector<char>(size, fill);
    }

    static std::vector<char> createBinaryData(size_t size) {
        std::vector<char> data;
        data.reserve(size);
        for (size_t i = 0; i < size; ++i) {
            data.push_back(static_cast<char>(i % 256));
        }
        return data;
    }

    static std::vector<char> createTextData(const std::string& text) {
        return std::vector<char>(text.begin(), text.end());
    }
};

} // namespace test_builders
} // namespace lumen

#endif // LUMEN_TEST_HELPERS_TEST_BUILDERS_H
