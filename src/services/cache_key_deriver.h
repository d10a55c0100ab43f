#ifndef LUMEN_CACHE_KEY_DERIVER_H
#define LUMEN_CACHE_KEY_DERIVER_H

#include <string>

namespace lumen {

/**
 * @brief Derives cache keys for thumbnails
 *
 * Pure functions: no I/O, no shared state.
 */
class CacheKeyDeriver {
public:
    /**
     * @brief Canonical form of a source path
     *
     * Strips leading slashes and collapses repeated slashes. Empty paths,
     * "." or ".." segments, backslashes and control characters throw
     * InvalidRequestException. Case is preserved.
     */
    static std::string normalizePath(const std::string& source_path);

    /**
     * @brief SHA256 (hex) over the normalized path, dimensions and fingerprint
     *
     * Fields are length-prefixed so that no two distinct tuples share an
     * encoding. A changed fingerprint always yields a different key.
     */
    static std::string deriveKey(const std::string& source_path, int width, int height,
                                 const std::string& fingerprint);

    // Unhashed field encoding fed to the digest
    static std::string encodeFields(const std::string& normalized_path, int width, int height,
                                    const std::string& fingerprint);

    static constexpr const char* KEY_VERSION = "lumen-thumb-v1";
};

} // namespace lumen

#endif // LUMEN_CACHE_KEY_DERIVER_H
