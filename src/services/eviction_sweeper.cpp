#include "eviction_sweeper.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"

namespace lumen {

EvictionSweeper::EvictionSweeper(std::shared_ptr<CacheStore> store,
                                 std::shared_ptr<ClockInterface> clock,
                                 std::chrono::milliseconds interval)
    : store_(std::move(store)),
      clock_(std::move(clock)),
      interval_(interval),
      stop_requested_(false),
      running_(false),
      total_removed_(0),
      sweeps_(0) {
}

EvictionSweeper::~EvictionSweeper() {
    stop();
}

void EvictionSweeper::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = false;
    }

    running_.store(true);
    worker_ = std::thread(&EvictionSweeper::workerLoop, this);

    Logger::log_structured(spdlog::level::info, "Eviction sweeper started", {
        {"interval_ms", interval_.count()}
    });
}

void EvictionSweeper::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wait_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false);

    Logger::log_structured(spdlog::level::info, "Eviction sweeper stopped", {
        {"total_removed", total_removed_.load()},
        {"sweeps", sweeps_.load()}
    });
}

size_t EvictionSweeper::sweepOnce() {
    METRICS_TIMER("SweepDuration");

    TimePoint now = clock_->now();
    auto expired = store_->listExpired(now);

    size_t removed = 0;
    for (const auto& key : expired) {
        try {
            if (store_->remove(key)) {
                ++removed;
            }
        } catch (const std::exception& e) {
            Logger::log_error("Failed to remove expired cache entry", e, {{"cache_key", key}});
        }
    }

    total_removed_.fetch_add(removed);
    sweeps_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(last_sweep_mutex_);
        last_sweep_at_ = now;
    }

    if (removed > 0) {
        Logger::log_structured(spdlog::level::info, "Expired thumbnails removed", {
            {"removed", removed},
            {"candidates", expired.size()}
        });
    }
    METRICS_COUNT("EvictedEntries", static_cast<double>(removed), "Count");

    CacheStats stats = store_->stats();
    METRICS_GAUGE("CacheEntries", static_cast<double>(stats.entries), "Count");
    METRICS_GAUGE("CacheBytes", static_cast<double>(stats.total_bytes), "Bytes");

    return removed;
}

std::optional<TimePoint> EvictionSweeper::lastSweepAt() const {
    std::lock_guard<std::mutex> lock(last_sweep_mutex_);
    return last_sweep_at_;
}

void EvictionSweeper::workerLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, interval_, [this] { return stop_requested_; });
            if (stop_requested_) {
                break;
            }
        }

        try {
            sweepOnce();
        } catch (const std::exception& e) {
            Logger::log_error("Periodic sweep failed", e);
        }
    }
}

} // namespace lumen
