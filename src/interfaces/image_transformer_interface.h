#ifndef LUMEN_IMAGE_TRANSFORMER_INTERFACE_H
#define LUMEN_IMAGE_TRANSFORMER_INTERFACE_H

#include "../models/thumbnail.h"
#include <vector>

namespace lumen {

/**
 * @brief Abstract interface for thumbnail rendering
 *
 * Implementations know nothing about caching. Failures are reported as
 * TransformException.
 */
class ImageTransformerInterface {
public:
    virtual ~ImageTransformerInterface() = default;

    // Fit the source inside target_width x target_height, preserving aspect ratio
    virtual TransformedImage transform(const std::vector<char>& source_bytes,
                                       int target_width, int target_height) = 0;
};

} // namespace lumen

#endif // LUMEN_IMAGE_TRANSFORMER_INTERFACE_H
