#pragma once

#include <crow.h>
#include <chrono>
#include <string>
#include "utils/id_generator.h"
#include "utils/logger.h"
#include "utils/metrics.h"

namespace lumen {

/**
 * Request context middleware for correlation tracking
 * Tags each request with an ID (or reuses X-Request-ID) and logs its duration
 */
struct RequestContextMiddleware {
    struct context {
        std::string request_id;
        std::string endpoint;
        std::chrono::steady_clock::time_point start_time;
    };

    void before_handle(crow::request& req, crow::response& /*res*/, context& ctx) {
        auto header_id = req.get_header_value("X-Request-ID");
        if (!header_id.empty()) {
            ctx.request_id = header_id;
        } else {
            ctx.request_id = utils::IdGenerator::generateRequestId();
        }

        ctx.endpoint = req.url;
        ctx.start_time = std::chrono::steady_clock::now();
    }

    // Handlers replace the response wholesale, so the header is set afterwards
    void after_handle(crow::request& req, crow::response& res, context& ctx) {
        double duration_ms = get_elapsed_ms(ctx);

        res.set_header("X-Request-ID", ctx.request_id);

        Logger::log_with_request(spdlog::level::info, "Request completed",
            ctx.request_id, ctx.endpoint, {
                {"method", crow::method_name(req.method)},
                {"status", res.code},
                {"duration_ms", duration_ms}
            });
        METRICS_DURATION("RequestDuration", duration_ms, {{"status", std::to_string(res.code)}});
    }

    static std::string get_request_id(const context& ctx) {
        return ctx.request_id;
    }

    static double get_elapsed_ms(const context& ctx) {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::microseconds>(
            now - ctx.start_time
        ).count() / 1000.0;
    }
};

} // namespace lumen
