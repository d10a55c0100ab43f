#ifndef LUMEN_THUMBNAIL_H
#define LUMEN_THUMBNAIL_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lumen {

// Requested thumbnail box in pixels
struct Dimensions {
    int width;
    int height;

    Dimensions() : width(0), height(0) {}
    Dimensions(int w, int h) : width(w), height(h) {}

    bool operator==(const Dimensions& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Dimensions& other) const { return !(*this == other); }
    bool operator<(const Dimensions& other) const {
        return width != other.width ? width < other.width : height < other.height;
    }

    std::string toString() const {
        return std::to_string(width) + "x" + std::to_string(height);
    }

    nlohmann::json toJson() const {
        return {{"width", width}, {"height", height}};
    }
};

// Original asset as handed over by the source storage
struct SourceAsset {
    std::vector<char> bytes;
    std::string fingerprint;    // changes whenever the content changes
};

// Encoded output of the image transformer
struct TransformedImage {
    std::vector<char> bytes;
    std::string content_type;
};

struct Thumbnail {
    std::vector<char> bytes;
    std::string content_type;
    bool served_from_cache;

    Thumbnail() : served_from_cache(false) {}
    Thumbnail(std::vector<char> data, const std::string& type, bool from_cache)
        : bytes(std::move(data)), content_type(type), served_from_cache(from_cache) {}
};

} // namespace lumen

#endif // LUMEN_THUMBNAIL_H
