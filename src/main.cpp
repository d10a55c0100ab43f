#include <crow.h>
#include <cstdlib>
#include <memory>
#include <string>

#include "services/cache_store.h"
#include "services/eviction_sweeper.h"
#include "services/image_transformer.h"
#include "services/local_source_storage.h"
#include "services/media_service.h"
#include "services/size_policy.h"
#include "services/stats_tracker.h"
#include "controllers/thumbnail_controller.h"
#include "models/media_config.h"
#include "middleware/request_context_middleware.h"
#include "utils/logger.h"
#include "utils/metrics.h"

int main() {
    // Get logging configuration from environment
    const char* log_level_env = std::getenv("LOG_LEVEL");
    const char* log_format_env = std::getenv("LOG_FORMAT");
    const char* environment_env = std::getenv("ENVIRONMENT");

    std::string log_level = log_level_env ? log_level_env : "info";
    std::string log_format_str = log_format_env ? log_format_env : "json";
    std::string environment = environment_env ? environment_env : "production";

    // Initialize logging
    auto log_format = (log_format_str == "text")
        ? lumen::Logger::Format::TEXT
        : lumen::Logger::Format::JSON;

    lumen::Logger::initialize("lumen-media", log_level, log_format, environment);

    // Initialize metrics
    const char* metrics_enabled_env = std::getenv("METRICS_ENABLED");
    const char* metrics_namespace_env = std::getenv("METRICS_NAMESPACE");

    bool metrics_enabled = metrics_enabled_env
        ? (std::string(metrics_enabled_env) == "true")
        : true;
    std::string metrics_namespace = metrics_namespace_env ? metrics_namespace_env : "LumenMedia";

    lumen::Metrics::initialize(metrics_namespace, "lumen-media", environment, metrics_enabled);

    // Load and check configuration
    lumen::MediaConfig config;
    try {
        config = lumen::MediaConfig::fromEnvironment();
        config.validate();
    } catch (const std::exception& e) {
        LOG_CRITICAL("Invalid configuration: {}", e.what());
        return 1;
    }

    LOG_INFO("Starting Lumen Media Server");
    lumen::Logger::log_structured(spdlog::level::info, "Service configuration", {
        {"storage_path", config.storage_path},
        {"source_prefix", config.source_prefix},
        {"cache_path", config.cache_path},
        {"cache_ttl_ms", config.cache_ttl.count()},
        {"sweep_interval_ms", config.sweep_interval.count()},
        {"transform_timeout_ms", config.transform_timeout.count()},
        {"strict_sizes", config.strict_sizes},
        {"default_size", config.default_size.toString()},
        {"quality", config.quality}
    });

    // Initialize libvips
    if (!lumen::ImageTransformer::initialize()) {
        LOG_CRITICAL("Failed to initialize image transformer");
        return 1;
    }

    std::shared_ptr<lumen::CacheStore> cache_store;
    std::shared_ptr<lumen::LocalSourceStorage> source_storage;
    std::shared_ptr<lumen::EvictionSweeper> sweeper;
    std::shared_ptr<lumen::MediaService> media_service;

    try {
        auto clock = std::make_shared<lumen::SystemClock>();
        auto stats = std::make_shared<lumen::StatsTracker>();

        source_storage = std::make_shared<lumen::LocalSourceStorage>(config.storage_path);
        cache_store = std::make_shared<lumen::CacheStore>(config.cache_path, stats, clock);
        sweeper = std::make_shared<lumen::EvictionSweeper>(cache_store, clock, config.sweep_interval);

        auto transformer = std::make_shared<lumen::ImageTransformer>(config.quality, config.allow_upscale);

        media_service = std::make_shared<lumen::MediaService>(
            source_storage,
            transformer,
            cache_store,
            sweeper,
            lumen::SizePolicy::fromConfig(config),
            config.cache_ttl,
            config.transform_timeout);
    } catch (const std::exception& e) {
        LOG_CRITICAL("Failed to initialize media services: {}", e.what());
        lumen::ImageTransformer::shutdown();
        return 1;
    }

    sweeper->start();

    lumen::ThumbnailController thumbnail_controller(media_service, config.source_prefix, config.cache_ttl);

    // Startup App with middleware
    using App = crow::App<lumen::RequestContextMiddleware>;
    App app;

    CROW_ROUTE(app, "/")([](){
        return "Lumen Media Server - On-demand thumbnails with a persistent cache";
    });

    CROW_ROUTE(app, "/health")([cache_store, sweeper]() {
        nlohmann::json health_status = {
            {"status", "healthy"},
            {"timestamp", lumen::Logger::get_timestamp()},
            {"services", {
                {"cache", cache_store != nullptr ? "ok" : "unavailable"},
                {"sweeper", sweeper->isRunning() ? "running" : "stopped"}
            }},
            {"cache_entries", cache_store->size()}
        };

        crow::response resp(200, health_status.dump());
        resp.add_header("Content-Type", "application/json");
        return resp;
    });

    // Register thumbnail routes
    thumbnail_controller.registerRoutes(app);

    lumen::Logger::log_structured(spdlog::level::info, "Starting server", {
        {"port", config.port},
        {"log_level", log_level},
        {"log_format", log_format_str},
        {"metrics_enabled", metrics_enabled}
    });

    // Run app
    app
    .port(static_cast<uint16_t>(config.port))
    .loglevel(crow::LogLevel::Warning)
    .multithreaded().run();

    // Cleanup
    sweeper->stop();

    // libvips must not be shut down under a running transform
    if (media_service->waitForWorkers(config.transform_timeout)) {
        lumen::ImageTransformer::shutdown();
    } else {
        lumen::Logger::log_structured(spdlog::level::warn, "Skipping libvips shutdown, transforms still running", {
            {"running_workers", media_service->runningWorkers()}
        });
    }

    LOG_INFO("Lumen Media Server stopped");
    return 0;
}
