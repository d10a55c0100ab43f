#ifndef LUMEN_REQUEST_COALESCER_H
#define LUMEN_REQUEST_COALESCER_H

#include "../models/thumbnail.h"
#include <array>
#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lumen {

/**
 * @brief Single-flight execution per cache key
 *
 * The first caller for a key becomes the leader and runs the work on its own
 * thread. Callers arriving while the leader is busy become followers: they
 * block on a shared future, start no work of their own, and receive the
 * leader's value or rethrown exception. The in-flight record is removed once
 * the outcome is published, so the next caller after that starts afresh.
 *
 * The in-flight map is sharded; unrelated keys never wait on each other.
 */
class RequestCoalescer {
public:
    struct Outcome {
        TransformedImage image;
        bool leader;            // true if this caller ran the work
    };

    RequestCoalescer() = default;

    RequestCoalescer(const RequestCoalescer&) = delete;
    RequestCoalescer& operator=(const RequestCoalescer&) = delete;

    // Throws whatever the leader's work threw
    Outcome run(const std::string& key, const std::function<TransformedImage()>& work);

    // Keys currently in flight
    size_t inFlight() const;

    // Callers that joined an in-flight computation instead of starting one
    uint64_t coalescedCount() const { return coalesced_.load(std::memory_order_relaxed); }

    // Computations started
    uint64_t leaderCount() const { return leaders_.load(std::memory_order_relaxed); }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_future<TransformedImage>> in_flight;
    };

    static constexpr size_t SHARD_COUNT = 32;

    std::array<Shard, SHARD_COUNT> shards_;
    std::atomic<uint64_t> coalesced_{0};
    std::atomic<uint64_t> leaders_{0};

    Shard& shardFor(const std::string& key);
};

} // namespace lumen

#endif // LUMEN_REQUEST_COALESCER_H
