#ifndef LUMEN_IMAGE_TRANSFORMER_H
#define LUMEN_IMAGE_TRANSFORMER_H

#include "../interfaces/image_transformer_interface.h"
#include <string>
#include <vector>
#include <vips/vips8>

namespace lumen {

struct ImageInfo {
    int width;
    int height;
    std::string format;
    bool is_valid;

    ImageInfo() : width(0), height(0), is_valid(false) {}
};

/**
 * @brief libvips-backed thumbnail renderer
 *
 * Output format always equals the source format. Sources smaller than the
 * target box are re-encoded at native size unless allow_upscale is set.
 */
class ImageTransformer : public ImageTransformerInterface {
public:
    explicit ImageTransformer(int quality = 85, bool allow_upscale = false);
    ~ImageTransformer() override = default;

    // Initialize libvips (call once at startup)
    static bool initialize();

    // Shutdown libvips (call once at shutdown)
    static void shutdown();

    TransformedImage transform(const std::vector<char>& source_bytes,
                               int target_width, int target_height) override;

    // Header-only inspection; is_valid is false for undecodable input
    ImageInfo probe(const std::vector<char>& bytes) const;

    // Largest size inside the box with the source aspect ratio, at least 1x1
    static void calculateDimensions(int original_width, int original_height,
                                    int box_width, int box_height, bool allow_upscale,
                                    int& target_width, int& target_height);

    // Format name ("jpeg", "png", ...) for a libvips loader, empty if unsupported
    static std::string loaderToFormat(const std::string& loader);

    int getQuality() const { return quality_; }
    bool allowsUpscale() const { return allow_upscale_; }

private:
    int quality_;
    bool allow_upscale_;

    // Detect the source format; throws TransformException when unsupported
    static std::string detectFormat(const std::vector<char>& bytes);

    // Saver options for the format
    vips::VOption* saveOptions(const std::string& format) const;

    // Convert format name to libvips suffix
    static std::string formatToSuffix(const std::string& format);
};

} // namespace lumen

#endif // LUMEN_IMAGE_TRANSFORMER_H
