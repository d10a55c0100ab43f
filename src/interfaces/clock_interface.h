#ifndef LUMEN_CLOCK_INTERFACE_H
#define LUMEN_CLOCK_INTERFACE_H

#include <chrono>

namespace lumen {

/**
 * @brief Source of wall-clock time for TTL bookkeeping
 *
 * Injected into the cache store and the sweeper so that expiry can be
 * exercised with a simulated clock.
 */
class ClockInterface {
public:
    virtual ~ClockInterface() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
};

/**
 * @brief Clock backed by std::chrono::system_clock
 */
class SystemClock : public ClockInterface {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace lumen

#endif // LUMEN_CLOCK_INTERFACE_H
