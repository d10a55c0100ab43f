#ifndef LUMEN_LOCAL_SOURCE_STORAGE_H
#define LUMEN_LOCAL_SOURCE_STORAGE_H

#include "../interfaces/source_storage_interface.h"
#include <filesystem>

namespace lumen {

/**
 * @brief Local filesystem implementation of the source storage
 *
 * Source paths are resolved beneath storage_path. The fingerprint is
 * "<size>-<mtime in nanoseconds>", so any rewrite of the file changes it.
 */
class LocalSourceStorage : public SourceStorageInterface {
public:
    /**
     * @brief Constructor
     * @param storage_path Root directory of the original images
     */
    explicit LocalSourceStorage(const std::string& storage_path);

    ~LocalSourceStorage() override = default;

    std::string fingerprint(const std::string& source_path) override;

    SourceAsset resolve(const std::string& source_path) override;

    const std::string& getStorageName() const override { return storage_path_; }

private:
    std::string storage_path_;

    std::filesystem::path getFilePath(const std::string& source_path) const;

    // stat() the file; throws NotFound / StorageUnavailable
    std::string statFingerprint(const std::filesystem::path& file_path,
                                const std::string& source_path) const;
};

} // namespace lumen

#endif // LUMEN_LOCAL_SOURCE_STORAGE_H
