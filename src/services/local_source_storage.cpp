#include "local_source_storage.h"
#include "../exceptions/media_exceptions.h"
#include "../utils/file_utils.h"
#include "../utils/logger.h"
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace lumen {

LocalSourceStorage::LocalSourceStorage(const std::string& storage_path)
    : storage_path_(storage_path) {

    std::error_code ec;
    std::filesystem::create_directories(storage_path_, ec);
    if (ec) {
        LOG_ERROR("Failed to create storage directory: {}", ec.message());
        throw std::runtime_error("Failed to initialize local source storage");
    }
    LOG_INFO("Local source storage initialized at: {}", storage_path_);
}

std::filesystem::path LocalSourceStorage::getFilePath(const std::string& source_path) const {
    return std::filesystem::path(storage_path_) / source_path;
}

std::string LocalSourceStorage::statFingerprint(const std::filesystem::path& file_path,
                                                const std::string& source_path) const {
    struct stat stat_buf;
    if (::stat(file_path.c_str(), &stat_buf) != 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            throw exceptions::NotFoundException("Image not found: " + source_path);
        }
        Logger::log_structured(spdlog::level::err, "Source stat failed", {
            {"source_path", source_path},
            {"error", std::strerror(err)}
        });
        throw exceptions::StorageUnavailableException(
            "Source storage unavailable: " + std::string(std::strerror(err)));
    }

    if (!S_ISREG(stat_buf.st_mode)) {
        throw exceptions::NotFoundException("Image not found: " + source_path);
    }

    std::ostringstream oss;
    oss << stat_buf.st_size << "-" << stat_buf.st_mtim.tv_sec
        << std::setw(9) << std::setfill('0') << stat_buf.st_mtim.tv_nsec;
    return oss.str();
}

std::string LocalSourceStorage::fingerprint(const std::string& source_path) {
    return statFingerprint(getFilePath(source_path), source_path);
}

SourceAsset LocalSourceStorage::resolve(const std::string& source_path) {
    auto file_path = getFilePath(source_path);

    SourceAsset asset;
    asset.fingerprint = statFingerprint(file_path, source_path);

    auto bytes = utils::FileUtils::readFile(file_path);
    if (!bytes) {
        // Deleted between stat and read counts as absent
        std::error_code ec;
        if (!std::filesystem::exists(file_path, ec) && !ec) {
            throw exceptions::NotFoundException("Image not found: " + source_path);
        }
        throw exceptions::StorageUnavailableException("Failed to read source image: " + source_path);
    }
    asset.bytes = std::move(*bytes);

    LOG_DEBUG("Source resolved: {} ({} bytes)", source_path, asset.bytes.size());
    return asset;
}

} // namespace lumen
