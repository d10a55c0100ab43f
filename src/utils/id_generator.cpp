#include "id_generator.h"
#include <random>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace lumen {
namespace utils {

std::string IdGenerator::generateRequestId() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream oss;
    oss << std::time(nullptr) << "_";

    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (dis(gen) & 0xFFFFFFFF) << "-";
    oss << std::setw(4) << (dis(gen) & 0xFFFF) << "-";
    oss << std::setw(4) << ((dis(gen) & 0x0FFF) | 0x4000) << "-";
    oss << std::setw(4) << ((dis(gen) & 0x3FFF) | 0x8000) << "-";
    oss << std::setw(12) << (dis(gen) & 0xFFFFFFFFFFFF);

    return oss.str();
}

} // namespace utils
} // namespace lumen
