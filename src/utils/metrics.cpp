#include "utils/metrics.h"
#include "utils/logger.h"
#include <iostream>

namespace lumen {

std::shared_ptr<Metrics> Metrics::instance_;
std::mutex Metrics::instance_mutex_;

void Metrics::initialize(
    const std::string& namespace_name,
    const std::string& service_name,
    const std::string& environment,
    bool enabled
) {
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        instance_ = std::shared_ptr<Metrics>(
            new Metrics(namespace_name, service_name, environment, enabled)
        );
    }

    if (enabled) {
        LOG_INFO("Metrics initialized: namespace={}, service={}, environment={}",
                 namespace_name, service_name, environment);
    } else {
        LOG_INFO("Metrics disabled");
    }
}

std::shared_ptr<Metrics> Metrics::get() {
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        if (instance_) {
            return instance_;
        }
    }
    initialize("LumenMedia", "lumen-media", "production", true);
    std::lock_guard<std::mutex> lock(instance_mutex_);
    return instance_;
}

Metrics::Metrics(
    const std::string& namespace_name,
    const std::string& service_name,
    const std::string& environment,
    bool enabled
)
    : namespace_(namespace_name)
    , service_name_(service_name)
    , environment_(environment)
    , enabled_(enabled)
{}

void Metrics::publish_count(
    const std::string& name,
    double value,
    const std::string& unit,
    const DimensionMap& dimensions
) {
    if (!enabled_) return;
    publish_metric(name, value, unit, dimensions);
}

void Metrics::publish_duration(
    const std::string& name,
    double duration_ms,
    const DimensionMap& dimensions
) {
    if (!enabled_) return;
    publish_metric(name, duration_ms, "Milliseconds", dimensions);
}

void Metrics::publish_gauge(
    const std::string& name,
    double value,
    const std::string& unit,
    const DimensionMap& dimensions
) {
    if (!enabled_) return;
    publish_metric(name, value, unit, dimensions);
}

void Metrics::publish_metric(
    const std::string& name,
    double value,
    const std::string& unit,
    const DimensionMap& dimensions
) {
    if (!enabled_) return;

    nlohmann::json emf_log = create_emf_log(name, value, unit, dimensions);

    // Worker threads publish concurrently; keep lines whole
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << emf_log.dump() << std::endl;
}

nlohmann::json Metrics::create_emf_log(
    const std::string& name,
    double value,
    const std::string& unit,
    const DimensionMap& dimensions
) {
    std::vector<std::vector<std::string>> dimension_sets;
    std::vector<std::string> dimension_names = {"ServiceName", "Environment"};

    for (const auto& [key, val] : dimensions) {
        dimension_names.push_back(key);
    }

    dimension_sets.push_back(dimension_names);

    nlohmann::json emf_log = {
        {"_aws", {
            {"Timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count()},
            {"CloudWatchMetrics", {
                {
                    {"Namespace", namespace_},
                    {"Dimensions", dimension_sets},
                    {"Metrics", {
                        {
                            {"Name", name},
                            {"Unit", unit}
                        }
                    }}
                }
            }}
        }},
        {"ServiceName", service_name_},
        {"Environment", environment_},
        {name, value}
    };

    for (const auto& [key, val] : dimensions) {
        emf_log[key] = val;
    }

    return emf_log;
}

std::unique_ptr<Metrics::Timer> Metrics::start_timer(
    const std::string& metric_name,
    const DimensionMap& dimensions
) {
    if (!enabled_) return nullptr;
    return std::unique_ptr<Timer>(new Timer(metric_name, dimensions));
}

Metrics::Timer::Timer(const std::string& metric_name, const DimensionMap& dimensions)
    : metric_name_(metric_name)
    , dimensions_(dimensions)
    , start_time_(std::chrono::steady_clock::now())
{}

Metrics::Timer::~Timer() {
    try {
        double duration = elapsed_ms();
        if (auto metrics = Metrics::get(); metrics && metrics->is_enabled()) {
            metrics->publish_duration(metric_name_, duration, dimensions_);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Failed to publish timer {}: {}", metric_name_, e.what());
    }
}

double Metrics::Timer::elapsed_ms() const {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        end_time - start_time_
    );
    return static_cast<double>(duration.count()) / 1000.0;
}

} // namespace lumen
