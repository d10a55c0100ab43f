#ifndef LUMEN_FILE_UTILS_H
#define LUMEN_FILE_UTILS_H

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace lumen {
namespace utils {

class FileUtils {
public:
    // SHA256 of binary data as lower-case hex
    static std::string calculateSHA256(const std::vector<char>& data);

    // SHA256 of a string as lower-case hex
    static std::string calculateSHA256(const std::string& data);

    // Write data to a synced sibling temporary of target. Renaming it with
    // commitTempFile() means readers see either the old file or the new one.
    static std::optional<std::filesystem::path> writeTempFile(const std::filesystem::path& target,
                                                              const std::vector<char>& data);

    // Rename temp over target, removing temp on failure
    static bool commitTempFile(const std::filesystem::path& temp,
                               const std::filesystem::path& target);

    // Read a whole file; std::nullopt if it cannot be opened or read
    static std::optional<std::vector<char>> readFile(const std::filesystem::path& filepath);

    // Delete file; false if it did not exist or could not be removed
    static bool deleteFile(const std::filesystem::path& filepath);

    // True for names produced by writeTempFile that were never renamed
    static bool isTemporaryFile(const std::filesystem::path& filepath);

    // Get MIME type from a format name or extension
    static std::string getMimeType(const std::string& format);

private:
    static constexpr const char* TEMP_MARKER = ".tmp-";
};

} // namespace utils
} // namespace lumen

#endif // LUMEN_FILE_UTILS_H
