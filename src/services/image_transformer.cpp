#include "image_transformer.h"
#include "../exceptions/media_exceptions.h"
#include "../utils/file_utils.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"
#include <algorithm>
#include <cmath>

namespace lumen {

ImageTransformer::ImageTransformer(int quality, bool allow_upscale)
    : quality_(quality), allow_upscale_(allow_upscale) {
}

bool ImageTransformer::initialize() {
    if (VIPS_INIT("lumen")) {
        LOG_CRITICAL("Failed to initialize libvips");
        METRICS_COUNT("LibVipsErrors", 1.0, "Count", {{"error_type", "init_failed"}});
        return false;
    }
    LOG_INFO("libvips initialized successfully");
    return true;
}

void ImageTransformer::shutdown() {
    vips_shutdown();
}

TransformedImage ImageTransformer::transform(const std::vector<char>& source_bytes,
                                             int target_width, int target_height) {
    if (source_bytes.empty()) {
        throw exceptions::TransformException("Source image is empty");
    }
    if (target_width <= 0 || target_height <= 0) {
        throw exceptions::TransformException("Target dimensions must be positive");
    }

    std::string format = detectFormat(source_bytes);

    METRICS_TIMER("ImageProcessingDuration", {
        {"operation", "transform"},
        {"format", format}
    });

    try {
        vips::VImage image = vips::VImage::new_from_buffer(
            source_bytes.data(), source_bytes.size(), "",
            vips::VImage::option()->set("access", VIPS_ACCESS_SEQUENTIAL));

        int original_width = image.width();
        int original_height = image.height();

        int width = 0;
        int height = 0;
        calculateDimensions(original_width, original_height, target_width, target_height,
                            allow_upscale_, width, height);

        if (width != original_width || height != original_height) {
            double h_scale = static_cast<double>(width) / original_width;
            double v_scale = static_cast<double>(height) / original_height;

            image = image.resize(h_scale, vips::VImage::option()
                ->set("vscale", v_scale)
                ->set("kernel", VIPS_KERNEL_LANCZOS3));
        }

        void* buffer = nullptr;
        size_t length = 0;
        image.write_to_buffer(formatToSuffix(format).c_str(), &buffer, &length,
                              saveOptions(format));

        TransformedImage result;
        result.bytes.assign(static_cast<char*>(buffer), static_cast<char*>(buffer) + length);
        result.content_type = utils::FileUtils::getMimeType(format);
        g_free(buffer);

        METRICS_COUNT("ImageTransformations", 1.0, "Count", {
            {"format", format},
            {"status", "success"}
        });

        return result;

    } catch (vips::VError& e) {
        Logger::log_structured(spdlog::level::err, "Image transformation failed", {
            {"format", format},
            {"source_bytes", source_bytes.size()},
            {"target_width", target_width},
            {"target_height", target_height},
            {"error", e.what()}
        });
        METRICS_COUNT("ImageTransformations", 1.0, "Count", {
            {"format", format},
            {"status", "error"}
        });
        throw exceptions::TransformException(std::string("Failed to process image: ") + e.what());
    }
}

ImageInfo ImageTransformer::probe(const std::vector<char>& bytes) const {
    ImageInfo info;
    if (bytes.empty()) {
        return info;
    }

    const char* loader = vips_foreign_find_load_buffer(bytes.data(), bytes.size());
    if (!loader) {
        return info;
    }

    try {
        vips::VImage image = vips::VImage::new_from_buffer(bytes.data(), bytes.size(), "");

        info.width = image.width();
        info.height = image.height();
        info.format = loaderToFormat(loader);
        info.is_valid = true;

    } catch (vips::VError& e) {
        Logger::log_structured(spdlog::level::warn, "Failed to probe image", {
            {"bytes", bytes.size()},
            {"error", e.what()}
        });
    }

    return info;
}

void ImageTransformer::calculateDimensions(int original_width, int original_height,
                                           int box_width, int box_height, bool allow_upscale,
                                           int& target_width, int& target_height) {
    double scale = std::min(static_cast<double>(box_width) / original_width,
                            static_cast<double>(box_height) / original_height);

    if (!allow_upscale) {
        scale = std::min(scale, 1.0);
    }

    target_width = std::min(box_width, std::max(1, static_cast<int>(std::lround(original_width * scale))));
    target_height = std::min(box_height, std::max(1, static_cast<int>(std::lround(original_height * scale))));

    if (!allow_upscale) {
        target_width = std::min(target_width, original_width);
        target_height = std::min(target_height, original_height);
    }
}

std::string ImageTransformer::loaderToFormat(const std::string& loader) {
    std::string lower = loader;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower.find("jpeg") != std::string::npos) return "jpeg";
    if (lower.find("png") != std::string::npos) return "png";
    if (lower.find("webp") != std::string::npos) return "webp";
    if (lower.find("gif") != std::string::npos) return "gif";
    if (lower.find("tiff") != std::string::npos) return "tiff";

    return "";
}

std::string ImageTransformer::detectFormat(const std::vector<char>& bytes) {
    const char* loader = vips_foreign_find_load_buffer(bytes.data(), bytes.size());
    if (!loader) {
        vips_error_clear();
        throw exceptions::TransformException("Unsupported or corrupt image data");
    }

    std::string format = loaderToFormat(loader);
    if (format.empty()) {
        throw exceptions::TransformException(
            std::string("No encoder for source format (loader ") + loader + ")");
    }
    return format;
}

vips::VOption* ImageTransformer::saveOptions(const std::string& format) const {
    vips::VOption* options = vips::VImage::option();

    // Metadata is never carried into thumbnails
    options->set("strip", true);

    if (format == "jpeg") {
        options->set("Q", quality_);
        options->set("optimize_coding", true);
    } else if (format == "png") {
        options->set("compression", 6);
    } else if (format == "webp") {
        options->set("Q", quality_);
    }

    return options;
}

std::string ImageTransformer::formatToSuffix(const std::string& format) {
    if (format == "jpeg") return ".jpg";
    if (format == "png") return ".png";
    if (format == "webp") return ".webp";
    if (format == "gif") return ".gif";
    if (format == "tiff") return ".tif";

    throw exceptions::TransformException("Unsupported output format: " + format);
}

} // namespace lumen
