#ifndef LUMEN_EXCEPTIONS_MEDIA_EXCEPTIONS_H
#define LUMEN_EXCEPTIONS_MEDIA_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace lumen {
namespace exceptions {

/**
 * @brief Exception thrown when a request is malformed (bad path, bad dimensions)
 */
class InvalidRequestException : public std::runtime_error {
public:
    explicit InvalidRequestException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when width/height are missing, non-numeric or non-positive
 */
class InvalidDimensionsException : public InvalidRequestException {
public:
    explicit InvalidDimensionsException(const std::string& message)
        : InvalidRequestException(message) {}
};

/**
 * @brief Exception thrown when well-formed dimensions are not permitted by the size policy
 */
class SizePolicyViolationException : public std::runtime_error {
public:
    explicit SizePolicyViolationException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when the requested source asset does not exist
 */
class NotFoundException : public std::runtime_error {
public:
    explicit NotFoundException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when decoding, resizing or encoding fails, or times out
 */
class TransformException : public std::runtime_error {
public:
    explicit TransformException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when a cache entry cannot be persisted
 *
 * Non-fatal: the caller still receives the computed bytes.
 */
class CacheWriteException : public std::runtime_error {
public:
    explicit CacheWriteException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when the source storage backend fails
 */
class StorageUnavailableException : public std::runtime_error {
public:
    explicit StorageUnavailableException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when the service configuration is inconsistent
 */
class ConfigurationException : public std::runtime_error {
public:
    explicit ConfigurationException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace exceptions
} // namespace lumen

#endif // LUMEN_EXCEPTIONS_MEDIA_EXCEPTIONS_H
