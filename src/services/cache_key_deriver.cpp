#include "cache_key_deriver.h"
#include "../exceptions/media_exceptions.h"
#include "../utils/file_utils.h"
#include <sstream>
#include <vector>

namespace lumen {

std::string CacheKeyDeriver::normalizePath(const std::string& source_path) {
    std::vector<std::string> segments;
    std::string segment;

    for (char c : source_path) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            throw exceptions::InvalidRequestException("Image path contains control characters");
        }
        if (c == '\\') {
            throw exceptions::InvalidRequestException("Image path must not contain backslashes");
        }
    }

    std::stringstream ss(source_path);
    while (std::getline(ss, segment, '/')) {
        if (segment.empty()) {
            continue;
        }
        if (segment == "." || segment == "..") {
            throw exceptions::InvalidRequestException(
                "Image path must not contain '.' or '..' segments");
        }
        segments.push_back(segment);
    }

    if (segments.empty()) {
        throw exceptions::InvalidRequestException("Image path is required");
    }

    std::string normalized;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            normalized += '/';
        }
        normalized += segments[i];
    }
    return normalized;
}

std::string CacheKeyDeriver::encodeFields(const std::string& normalized_path, int width,
                                          int height, const std::string& fingerprint) {
    std::ostringstream oss;
    oss << KEY_VERSION << '\n'
        << "path:" << normalized_path.size() << ':' << normalized_path << '\n'
        << "width:" << width << '\n'
        << "height:" << height << '\n'
        << "fingerprint:" << fingerprint.size() << ':' << fingerprint;
    return oss.str();
}

std::string CacheKeyDeriver::deriveKey(const std::string& source_path, int width, int height,
                                       const std::string& fingerprint) {
    std::string normalized = normalizePath(source_path);
    return utils::FileUtils::calculateSHA256(encodeFields(normalized, width, height, fingerprint));
}

} // namespace lumen
