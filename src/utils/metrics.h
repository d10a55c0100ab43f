#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <vector>
#include <chrono>
#include <memory>
#include <mutex>

namespace lumen {

/**
 * CloudWatch Embedded Metric Format (EMF) metrics publisher
 * Metrics are written as JSON lines on stdout and extracted by the log pipeline
 */
class Metrics {
public:
    using DimensionMap = std::map<std::string, std::string>;

    /**
     * Initialize metrics with service configuration
     * @param namespace_name Metric namespace (e.g., "LumenMedia")
     * @param service_name Service name for default dimension
     * @param environment Environment name (e.g., "production")
     * @param enabled Whether metrics are enabled
     */
    static void initialize(
        const std::string& namespace_name,
        const std::string& service_name,
        const std::string& environment = "production",
        bool enabled = true
    );

    /**
     * Get the shared metrics instance
     */
    static std::shared_ptr<Metrics> get();

    /**
     * Publish a counter metric
     * @param name Metric name (e.g., "CacheHits")
     * @param value Counter value (default 1)
     * @param unit Metric unit (None, Count, Bytes, ...)
     * @param dimensions Additional dimensions beyond default
     */
    void publish_count(
        const std::string& name,
        double value = 1.0,
        const std::string& unit = "Count",
        const DimensionMap& dimensions = {}
    );

    /**
     * Publish a duration metric in milliseconds
     */
    void publish_duration(
        const std::string& name,
        double duration_ms,
        const DimensionMap& dimensions = {}
    );

    /**
     * Publish a gauge metric (current value)
     */
    void publish_gauge(
        const std::string& name,
        double value,
        const std::string& unit = "None",
        const DimensionMap& dimensions = {}
    );

    /**
     * Scoped timer, publishes its duration when destroyed
     */
    class Timer {
    public:
        Timer(const std::string& metric_name, const DimensionMap& dimensions = {});
        ~Timer();

        Timer(const Timer&) = delete;
        Timer& operator=(const Timer&) = delete;

        double elapsed_ms() const;

    private:
        std::string metric_name_;
        DimensionMap dimensions_;
        std::chrono::steady_clock::time_point start_time_;
    };

    /**
     * Create a timer for automatic duration tracking
     * Usage:
     *   {
     *     auto timer = Metrics::get()->start_timer("TransformDuration");
     *     // ... do work ...
     *   }
     * Returns nullptr when metrics are disabled.
     */
    std::unique_ptr<Timer> start_timer(
        const std::string& metric_name,
        const DimensionMap& dimensions = {}
    );

    bool is_enabled() const { return enabled_; }

private:
    Metrics(
        const std::string& namespace_name,
        const std::string& service_name,
        const std::string& environment,
        bool enabled
    );

    void publish_metric(
        const std::string& name,
        double value,
        const std::string& unit,
        const DimensionMap& dimensions
    );

    nlohmann::json create_emf_log(
        const std::string& name,
        double value,
        const std::string& unit,
        const DimensionMap& dimensions
    );

    static std::shared_ptr<Metrics> instance_;
    static std::mutex instance_mutex_;

    std::string namespace_;
    std::string service_name_;
    std::string environment_;
    bool enabled_;
    std::mutex output_mutex_;
};

#define LUMEN_METRICS_CONCAT_INNER(a, b) a##b
#define LUMEN_METRICS_CONCAT(a, b) LUMEN_METRICS_CONCAT_INNER(a, b)

#define METRICS_COUNT(name, ...) \
    if (auto m = lumen::Metrics::get(); m && m->is_enabled()) { \
        m->publish_count(name, ##__VA_ARGS__); \
    }

#define METRICS_DURATION(name, duration_ms, ...) \
    if (auto m = lumen::Metrics::get(); m && m->is_enabled()) { \
        m->publish_duration(name, duration_ms, ##__VA_ARGS__); \
    }

#define METRICS_GAUGE(name, value, ...) \
    if (auto m = lumen::Metrics::get(); m && m->is_enabled()) { \
        m->publish_gauge(name, value, ##__VA_ARGS__); \
    }

#define METRICS_TIMER(name, ...) \
    auto LUMEN_METRICS_CONCAT(_metrics_timer_, __LINE__) = \
        lumen::Metrics::get()->start_timer(name, ##__VA_ARGS__)

} // namespace lumen
