#include "utils/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/pattern_formatter.h>
#include <iomanip>
#include <sstream>

namespace lumen {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::string Logger::service_name_;
std::string Logger::environment_;
Logger::Format Logger::format_ = Logger::Format::JSON;
std::mutex Logger::init_mutex_;

void Logger::initialize(
    const std::string& service_name,
    const std::string& log_level,
    Format format,
    const std::string& environment
) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(init_mutex_);

        service_name_ = service_name;
        environment_ = environment;
        format_ = format;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>("lumen", console_sink);
        logger->set_level(parse_log_level(log_level));

        if (format == Format::TEXT) {
            // [2026-10-19 10:30:45.123] [info] Message
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        } else {
            // JSON lines are built in log_structured
            logger->set_pattern("%v");
        }

        logger->flush_on(spdlog::level::info);
        spdlog::set_default_logger(logger);
        logger_ = logger;
    }

    logger->info("Logger initialized: service={}, level={}, format={}, environment={}",
                 service_name, log_level,
                 (format == Format::JSON ? "json" : "text"),
                 environment);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    {
        std::lock_guard<std::mutex> lock(init_mutex_);
        if (logger_) {
            return logger_;
        }
    }
    initialize("lumen-media", "info", Format::JSON, "production");
    std::lock_guard<std::mutex> lock(init_mutex_);
    return logger_;
}

void Logger::log_structured(
    spdlog::level::level_enum level,
    const std::string& message,
    const nlohmann::json& fields
) {
    auto logger = get();

    if (format_ == Format::TEXT) {
        if (fields.empty()) {
            logger->log(level, message);
        } else {
            logger->log(level, "{} {}", message, fields.dump());
        }
        return;
    }

    nlohmann::json log_entry = {
        {"timestamp", get_timestamp()},
        {"level", spdlog::level::to_string_view(level).data()},
        {"service", service_name_},
        {"environment", environment_},
        {"message", message}
    };

    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    logger->log(level, log_entry.dump());
}

void Logger::log_with_request(
    spdlog::level::level_enum level,
    const std::string& message,
    const std::string& request_id,
    const std::string& endpoint,
    const nlohmann::json& fields
) {
    nlohmann::json context = fields;
    context["request_id"] = request_id;

    if (!endpoint.empty()) {
        context["endpoint"] = endpoint;
    }

    log_structured(level, message, context);
}

void Logger::log_error(
    const std::string& message,
    const std::exception& exception,
    const nlohmann::json& fields
) {
    nlohmann::json context = fields;
    context["error_type"] = "exception";
    context["error_message"] = exception.what();

    log_structured(spdlog::level::err, message, context);
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_utc{};
    gmtime_r(&now_time_t, &tm_utc);

    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << now_ms.count() << 'Z';

    return ss.str();
}

spdlog::level::level_enum Logger::parse_log_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;

    return spdlog::level::info;
}

} // namespace lumen
