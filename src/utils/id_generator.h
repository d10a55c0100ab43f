#ifndef LUMEN_UTILS_ID_GENERATOR_H
#define LUMEN_UTILS_ID_GENERATOR_H

#include <string>

namespace lumen {
namespace utils {

/**
 * @brief Utility class for generating unique identifiers
 */
class IdGenerator {
public:
    /**
     * @brief Generate a request correlation ID
     *
     * Format: {timestamp}_{uuid v4}. The timestamp prefix keeps IDs
     * roughly sortable in log searches.
     */
    static std::string generateRequestId();
};

} // namespace utils
} // namespace lumen

#endif // LUMEN_UTILS_ID_GENERATOR_H
