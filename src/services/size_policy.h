#ifndef LUMEN_SIZE_POLICY_H
#define LUMEN_SIZE_POLICY_H

#include "../models/thumbnail.h"
#include "../models/media_config.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lumen {

/**
 * @brief Validates and normalizes requested thumbnail dimensions
 *
 * Strict mode accepts only an explicit allow-list of (width, height) pairs.
 * Bounded mode accepts any pair inside [min, max] per axis. Out-of-range
 * requests are rejected in both modes, never clamped.
 *
 * Immutable after construction and safe to share between threads.
 */
class SizePolicy {
public:
    enum class Mode {
        STRICT,
        BOUNDED
    };

    struct Bounds {
        int min_width;
        int max_width;
        int min_height;
        int max_height;
    };

    // Throws ConfigurationException if the default pair violates the policy
    static SizePolicy strict(std::vector<Dimensions> allowed, Dimensions default_size);
    static SizePolicy bounded(Bounds bounds, Dimensions default_size);
    static SizePolicy fromConfig(const MediaConfig& config);

    /**
     * @brief Resolve raw query values into a permitted pair
     *
     * Both absent resolves to the default pair. Exactly one present, or any
     * value that is not a positive decimal integer, throws
     * InvalidDimensionsException. A well-formed pair the policy does not
     * permit throws SizePolicyViolationException.
     */
    Dimensions normalize(const std::optional<std::string>& width,
                         const std::optional<std::string>& height) const;

    Dimensions normalize(std::optional<int> width, std::optional<int> height) const;

    // True if a positive pair is permitted by the policy
    bool permits(const Dimensions& size) const;

    // Policy description for the /sizes endpoint
    nlohmann::json listAllowed() const;

    Mode mode() const { return mode_; }
    const Dimensions& defaultSize() const { return default_size_; }
    const std::vector<Dimensions>& allowedSizes() const { return allowed_; }
    const Bounds& bounds() const { return bounds_; }

    // Parse a query value; std::nullopt unless it is a positive decimal integer
    static std::optional<int> parseDimension(const std::string& value);

private:
    SizePolicy(Mode mode, std::vector<Dimensions> allowed, Bounds bounds, Dimensions default_size);

    void enforce(const Dimensions& size) const;

    Mode mode_;
    std::vector<Dimensions> allowed_;   // sorted, strict mode only
    Bounds bounds_;
    Dimensions default_size_;
};

} // namespace lumen

#endif // LUMEN_SIZE_POLICY_H
