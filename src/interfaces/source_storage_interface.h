#ifndef LUMEN_SOURCE_STORAGE_INTERFACE_H
#define LUMEN_SOURCE_STORAGE_INTERFACE_H

#include "../models/thumbnail.h"
#include <string>

namespace lumen {

/**
 * @brief Abstract interface for the store of original images
 *
 * Allows different backends (local filesystem, object store) behind the
 * media service. Paths are already normalized by the caller.
 */
class SourceStorageInterface {
public:
    virtual ~SourceStorageInterface() = default;

    /**
     * @brief Cheap identity of the current content (no payload read)
     * @throws NotFoundException if the source does not exist
     * @throws StorageUnavailableException on backend failure
     */
    virtual std::string fingerprint(const std::string& source_path) = 0;

    /**
     * @brief Load the source bytes together with their fingerprint
     * @throws NotFoundException if the source does not exist
     * @throws StorageUnavailableException on backend failure
     */
    virtual SourceAsset resolve(const std::string& source_path) = 0;

    // Storage root or bucket name, for health output
    virtual const std::string& getStorageName() const = 0;
};

} // namespace lumen

#endif // LUMEN_SOURCE_STORAGE_INTERFACE_H
