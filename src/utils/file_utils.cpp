#include "file_utils.h"
#include "logger.h"
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <system_error>
#include <unistd.h>
#include <cstdlib>
#include <cerrno>
#include <cstring>

namespace lumen {
namespace utils {

namespace {

std::string digestToHex(const unsigned char* hash, unsigned int hash_len) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256(const void* data, size_t size) {
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (!mdctx) {
        return "";
    }

    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(mdctx, data, size) != 1) {
        EVP_MD_CTX_free(mdctx);
        return "";
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
        EVP_MD_CTX_free(mdctx);
        return "";
    }

    EVP_MD_CTX_free(mdctx);
    return digestToHex(hash, hash_len);
}

} // namespace

std::string FileUtils::calculateSHA256(const std::vector<char>& data) {
    return sha256(data.data(), data.size());
}

std::string FileUtils::calculateSHA256(const std::string& data) {
    return sha256(data.data(), data.size());
}

std::optional<std::filesystem::path> FileUtils::writeTempFile(const std::filesystem::path& target,
                                                              const std::vector<char>& data) {
    std::string temp_template = target.string() + TEMP_MARKER + "XXXXXX";
    std::vector<char> temp_path(temp_template.begin(), temp_template.end());
    temp_path.push_back('\0');

    int fd = mkstemp(temp_path.data());
    if (fd == -1) {
        Logger::log_structured(spdlog::level::err, "Failed to create temporary file", {
            {"path", target.string()},
            {"error", std::strerror(errno)}
        });
        return std::nullopt;
    }

    const char* cursor = data.data();
    size_t remaining = data.size();
    int write_errno = 0;
    while (remaining > 0) {
        ssize_t written = ::write(fd, cursor, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            write_errno = errno;
            break;
        }
        cursor += written;
        remaining -= static_cast<size_t>(written);
    }

    if (write_errno == 0 && ::fsync(fd) != 0) {
        write_errno = errno;
    }
    if (::close(fd) != 0 && write_errno == 0) {
        write_errno = errno;
    }

    if (write_errno != 0) {
        Logger::log_structured(spdlog::level::err, "Failed to write temporary file", {
            {"path", target.string()},
            {"bytes", data.size()},
            {"error", std::strerror(write_errno)}
        });
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path.data(), cleanup_ec);
        return std::nullopt;
    }

    return std::filesystem::path(temp_path.data());
}

bool FileUtils::commitTempFile(const std::filesystem::path& temp,
                               const std::filesystem::path& target) {
    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        Logger::log_structured(spdlog::level::err, "Failed to commit temporary file", {
            {"temp_path", temp.string()},
            {"path", target.string()},
            {"error", ec.message()}
        });
        std::error_code cleanup_ec;
        std::filesystem::remove(temp, cleanup_ec);
        return false;
    }
    return true;
}

std::optional<std::vector<char>> FileUtils::readFile(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary | std::ios::ate);
    if (!file) {
        return std::nullopt;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(buffer.data(), size)) {
        return std::nullopt;
    }

    return buffer;
}

bool FileUtils::deleteFile(const std::filesystem::path& filepath) {
    std::error_code ec;
    bool removed = std::filesystem::remove(filepath, ec);
    if (ec) {
        LOG_WARN("Failed to delete {}: {}", filepath.string(), ec.message());
        return false;
    }
    return removed;
}

bool FileUtils::isTemporaryFile(const std::filesystem::path& filepath) {
    return filepath.filename().string().find(TEMP_MARKER) != std::string::npos;
}

std::string FileUtils::getMimeType(const std::string& format) {
    std::string lower_ext = format;
    std::transform(lower_ext.begin(), lower_ext.end(), lower_ext.begin(), ::tolower);

    if (lower_ext == "jpg" || lower_ext == "jpeg") return "image/jpeg";
    if (lower_ext == "png") return "image/png";
    if (lower_ext == "gif") return "image/gif";
    if (lower_ext == "tiff" || lower_ext == "tif") return "image/tiff";
    if (lower_ext == "webp") return "image/webp";
    if (lower_ext == "heif" || lower_ext == "heic") return "image/heif";
    if (lower_ext == "avif") return "image/avif";

    return "application/octet-stream";
}

} // namespace utils
} // namespace lumen
