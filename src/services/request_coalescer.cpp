#include "request_coalescer.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"

namespace lumen {

RequestCoalescer::Shard& RequestCoalescer::shardFor(const std::string& key) {
    return shards_[std::hash<std::string>{}(key) % SHARD_COUNT];
}

RequestCoalescer::Outcome RequestCoalescer::run(const std::string& key,
                                                const std::function<TransformedImage()>& work) {
    Shard& shard = shardFor(key);

    std::promise<TransformedImage> promise;
    std::shared_future<TransformedImage> future;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.in_flight.find(key);
        if (it != shard.in_flight.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            shard.in_flight.emplace(key, future);
            leader = true;
        }
    }

    if (!leader) {
        coalesced_.fetch_add(1, std::memory_order_relaxed);
        METRICS_COUNT("CoalescedRequests", 1.0, "Count", {{"role", "follower"}});
        LOG_DEBUG("Joining in-flight transform for key {}", key);
        return Outcome{future.get(), false};
    }

    leaders_.fetch_add(1, std::memory_order_relaxed);

    try {
        promise.set_value(work());
    } catch (...) {
        // Followers get the same failure; no retry stampede
        promise.set_exception(std::current_exception());
    }

    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.in_flight.erase(key);
    }

    return Outcome{future.get(), true};
}

size_t RequestCoalescer::inFlight() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.in_flight.size();
    }
    return total;
}

} // namespace lumen
