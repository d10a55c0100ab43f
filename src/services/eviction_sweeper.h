#ifndef LUMEN_EVICTION_SWEEPER_H
#define LUMEN_EVICTION_SWEEPER_H

#include "cache_store.h"
#include "../interfaces/clock_interface.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace lumen {

/**
 * @brief Removes expired cache entries, periodically and on demand
 *
 * Lifecycle: Stopped -> start() -> Running -> stop() -> Stopped. The periodic
 * worker is an explicit thread owned by the sweeper; the destructor stops it.
 * sweepOnce() may run concurrently with the worker and with cache traffic:
 * removal is idempotent and only successful removals are counted.
 */
class EvictionSweeper {
public:
    EvictionSweeper(std::shared_ptr<CacheStore> store,
                    std::shared_ptr<ClockInterface> clock,
                    std::chrono::milliseconds interval);
    ~EvictionSweeper();

    EvictionSweeper(const EvictionSweeper&) = delete;
    EvictionSweeper& operator=(const EvictionSweeper&) = delete;

    // Start the periodic worker; no-op if already running
    void start();

    // Stop and join the worker; no-op if not running
    void stop();

    // One synchronous pass; returns the number of entries removed
    size_t sweepOnce();

    bool isRunning() const { return running_.load(); }

    uint64_t totalRemoved() const { return total_removed_.load(); }

    uint64_t sweepCount() const { return sweeps_.load(); }

    // Clock time of the latest completed pass, empty before the first one
    std::optional<TimePoint> lastSweepAt() const;

    std::chrono::milliseconds getInterval() const { return interval_; }

private:
    std::shared_ptr<CacheStore> store_;
    std::shared_ptr<ClockInterface> clock_;
    std::chrono::milliseconds interval_;

    std::mutex lifecycle_mutex_;    // serializes start/stop
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    bool stop_requested_;
    std::thread worker_;
    std::atomic<bool> running_;

    std::atomic<uint64_t> total_removed_;
    std::atomic<uint64_t> sweeps_;

    mutable std::mutex last_sweep_mutex_;
    std::optional<TimePoint> last_sweep_at_;

    void workerLoop();
};

} // namespace lumen

#endif // LUMEN_EVICTION_SWEEPER_H
