#include "size_policy.h"
#include "../exceptions/media_exceptions.h"
#include <algorithm>
#include <cctype>

namespace lumen {

SizePolicy::SizePolicy(Mode mode, std::vector<Dimensions> allowed, Bounds bounds,
                       Dimensions default_size)
    : mode_(mode), allowed_(std::move(allowed)), bounds_(bounds), default_size_(default_size) {
    std::sort(allowed_.begin(), allowed_.end());
    allowed_.erase(std::unique(allowed_.begin(), allowed_.end()), allowed_.end());

    if (default_size_.width <= 0 || default_size_.height <= 0 || !permits(default_size_)) {
        throw exceptions::ConfigurationException(
            "Default size " + default_size_.toString() + " is not permitted by the size policy");
    }
}

SizePolicy SizePolicy::strict(std::vector<Dimensions> allowed, Dimensions default_size) {
    if (allowed.empty()) {
        throw exceptions::ConfigurationException("Strict size policy requires allowed sizes");
    }
    return SizePolicy(Mode::STRICT, std::move(allowed), Bounds{0, 0, 0, 0}, default_size);
}

SizePolicy SizePolicy::bounded(Bounds bounds, Dimensions default_size) {
    if (bounds.min_width <= 0 || bounds.min_height <= 0 ||
        bounds.min_width > bounds.max_width || bounds.min_height > bounds.max_height) {
        throw exceptions::ConfigurationException("Invalid size bounds");
    }
    return SizePolicy(Mode::BOUNDED, {}, bounds, default_size);
}

SizePolicy SizePolicy::fromConfig(const MediaConfig& config) {
    if (config.strict_sizes) {
        return strict(config.allowed_sizes, config.default_size);
    }
    return bounded(Bounds{config.min_width, config.max_width,
                          config.min_height, config.max_height},
                   config.default_size);
}

std::optional<int> SizePolicy::parseDimension(const std::string& value) {
    if (value.empty() || value.size() > 9) {
        return std::nullopt;
    }
    if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    int parsed = std::stoi(value);
    if (parsed <= 0) {
        return std::nullopt;
    }
    return parsed;
}

Dimensions SizePolicy::normalize(const std::optional<std::string>& width,
                                 const std::optional<std::string>& height) const {
    if (!width && !height) {
        return default_size_;
    }
    if (!width || !height) {
        throw exceptions::InvalidDimensionsException(
            "Both width and height must be provided, or neither");
    }

    auto w = parseDimension(*width);
    auto h = parseDimension(*height);
    if (!w || !h) {
        throw exceptions::InvalidDimensionsException(
            "Invalid width or height values: width and height must be positive integers");
    }

    Dimensions size(*w, *h);
    enforce(size);
    return size;
}

Dimensions SizePolicy::normalize(std::optional<int> width, std::optional<int> height) const {
    if (!width && !height) {
        return default_size_;
    }
    if (!width || !height) {
        throw exceptions::InvalidDimensionsException(
            "Both width and height must be provided, or neither");
    }
    if (*width <= 0 || *height <= 0) {
        throw exceptions::InvalidDimensionsException(
            "Invalid width or height values: width and height must be positive integers");
    }

    Dimensions size(*width, *height);
    enforce(size);
    return size;
}

bool SizePolicy::permits(const Dimensions& size) const {
    if (mode_ == Mode::STRICT) {
        return std::binary_search(allowed_.begin(), allowed_.end(), size);
    }
    return size.width >= bounds_.min_width && size.width <= bounds_.max_width &&
           size.height >= bounds_.min_height && size.height <= bounds_.max_height;
}

void SizePolicy::enforce(const Dimensions& size) const {
    if (permits(size)) {
        return;
    }

    if (mode_ == Mode::STRICT) {
        throw exceptions::SizePolicyViolationException(
            "Invalid thumbnail size " + size.toString() + ": not in the list of allowed sizes");
    }
    throw exceptions::SizePolicyViolationException(
        "Invalid thumbnail size " + size.toString() + ": allowed range is " +
        std::to_string(bounds_.min_width) + "-" + std::to_string(bounds_.max_width) + " x " +
        std::to_string(bounds_.min_height) + "-" + std::to_string(bounds_.max_height));
}

nlohmann::json SizePolicy::listAllowed() const {
    nlohmann::json description;
    description["mode"] = mode_ == Mode::STRICT ? "strict" : "bounded";
    description["default"] = default_size_.toJson();

    if (mode_ == Mode::STRICT) {
        nlohmann::json sizes = nlohmann::json::array();
        for (const auto& size : allowed_) {
            sizes.push_back(size.toJson());
        }
        description["sizes"] = sizes;
    } else {
        description["bounds"] = {
            {"minWidth", bounds_.min_width},
            {"maxWidth", bounds_.max_width},
            {"minHeight", bounds_.min_height},
            {"maxHeight", bounds_.max_height}
        };
    }

    return description;
}

} // namespace lumen
