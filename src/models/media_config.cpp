#include "media_config.h"
#include "../exceptions/media_exceptions.h"
#include <cstdlib>
#include <limits>
#include <sstream>

namespace lumen {

namespace {

long parseLong(const char* name, const std::string& value) {
    try {
        size_t consumed = 0;
        long parsed = std::stol(value, &consumed);
        if (consumed != value.size()) {
            throw exceptions::ConfigurationException(
                std::string(name) + " must be an integer, got '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw exceptions::ConfigurationException(
            std::string(name) + " must be an integer, got '" + value + "'");
    }
}

int parseInt(const char* name, const std::string& value) {
    long parsed = parseLong(name, value);
    if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        throw exceptions::ConfigurationException(
            std::string(name) + " is out of range, got '" + value + "'");
    }
    return static_cast<int>(parsed);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

MediaConfig MediaConfig::fromEnvironment() {
    MediaConfig config;

    if (const char* v = env("MEDIA_SERVER_PORT")) {
        config.port = parseInt("MEDIA_SERVER_PORT", v);
    }
    if (const char* v = env("MEDIA_STORAGE_PATH")) {
        config.storage_path = v;
    }
    if (const char* v = std::getenv("MEDIA_SOURCE_PREFIX")) {
        // Empty disables prefixing
        config.source_prefix = v;
    }
    if (const char* v = env("MEDIA_CACHE_PATH")) {
        config.cache_path = v;
    }
    if (const char* v = env("MEDIA_CACHE_TTL")) {
        config.cache_ttl = std::chrono::milliseconds(parseLong("MEDIA_CACHE_TTL", v));
    }
    if (const char* v = env("MEDIA_SWEEP_INTERVAL")) {
        config.sweep_interval = std::chrono::milliseconds(parseLong("MEDIA_SWEEP_INTERVAL", v));
    }
    if (const char* v = env("MEDIA_TRANSFORM_TIMEOUT")) {
        config.transform_timeout = std::chrono::milliseconds(parseLong("MEDIA_TRANSFORM_TIMEOUT", v));
    }
    if (const char* v = env("MEDIA_STRICT_SIZES")) {
        config.strict_sizes = parseBool(v);
    }
    if (const char* v = env("MEDIA_ALLOWED_SIZES")) {
        config.allowed_sizes = parseSizeList(v);
    }
    if (const char* v = env("MEDIA_MIN_WIDTH")) {
        config.min_width = parseInt("MEDIA_MIN_WIDTH", v);
    }
    if (const char* v = env("MEDIA_MAX_WIDTH")) {
        config.max_width = parseInt("MEDIA_MAX_WIDTH", v);
    }
    if (const char* v = env("MEDIA_MIN_HEIGHT")) {
        config.min_height = parseInt("MEDIA_MIN_HEIGHT", v);
    }
    if (const char* v = env("MEDIA_MAX_HEIGHT")) {
        config.max_height = parseInt("MEDIA_MAX_HEIGHT", v);
    }
    if (const char* v = env("MEDIA_DEFAULT_WIDTH")) {
        config.default_size.width = parseInt("MEDIA_DEFAULT_WIDTH", v);
    }
    if (const char* v = env("MEDIA_DEFAULT_HEIGHT")) {
        config.default_size.height = parseInt("MEDIA_DEFAULT_HEIGHT", v);
    }
    if (const char* v = env("MEDIA_QUALITY")) {
        config.quality = parseInt("MEDIA_QUALITY", v);
    }
    if (const char* v = env("MEDIA_ALLOW_UPSCALE")) {
        config.allow_upscale = parseBool(v);
    }

    return config;
}

std::vector<Dimensions> MediaConfig::parseSizeList(const std::string& value) {
    std::vector<Dimensions> sizes;
    std::stringstream ss(value);
    std::string item;

    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        auto last = item.find_last_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        item = item.substr(first, last - first + 1);

        auto sep = item.find_first_of("xX");
        if (sep == std::string::npos || sep == 0 || sep == item.size() - 1) {
            throw exceptions::ConfigurationException(
                "Malformed size '" + item + "', expected WIDTHxHEIGHT");
        }

        int w = parseInt("MEDIA_ALLOWED_SIZES", item.substr(0, sep));
        int h = parseInt("MEDIA_ALLOWED_SIZES", item.substr(sep + 1));
        if (w <= 0 || h <= 0) {
            throw exceptions::ConfigurationException(
                "Allowed size '" + item + "' must be positive");
        }
        sizes.emplace_back(w, h);
    }

    return sizes;
}

void MediaConfig::validate() const {
    if (port <= 0 || port > 65535) {
        throw exceptions::ConfigurationException("Port must be within 1-65535");
    }
    if (storage_path.empty() || cache_path.empty()) {
        throw exceptions::ConfigurationException("Storage and cache paths must be set");
    }
    if (cache_ttl.count() <= 0) {
        throw exceptions::ConfigurationException("Cache TTL must be positive");
    }
    if (sweep_interval.count() <= 0) {
        throw exceptions::ConfigurationException("Sweep interval must be positive");
    }
    if (transform_timeout.count() <= 0) {
        throw exceptions::ConfigurationException("Transform timeout must be positive");
    }
    if (quality < 1 || quality > 100) {
        throw exceptions::ConfigurationException("Quality must be within 1-100");
    }
    if (strict_sizes && allowed_sizes.empty()) {
        throw exceptions::ConfigurationException("Strict size mode requires at least one allowed size");
    }
    if (min_width <= 0 || min_height <= 0) {
        throw exceptions::ConfigurationException("Minimum dimensions must be positive");
    }
    if (min_width > max_width || min_height > max_height) {
        throw exceptions::ConfigurationException("Minimum dimensions exceed maximum dimensions");
    }
    if (default_size.width <= 0 || default_size.height <= 0) {
        throw exceptions::ConfigurationException("Default dimensions must be positive");
    }
}

bool MediaConfig::isValid() const {
    try {
        validate();
        return true;
    } catch (const exceptions::ConfigurationException&) {
        return false;
    }
}

} // namespace lumen
