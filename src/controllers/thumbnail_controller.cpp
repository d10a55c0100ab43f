#include "thumbnail_controller.h"
#include "../exceptions/media_exceptions.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lumen {

ThumbnailController::ThumbnailController(std::shared_ptr<MediaServiceInterface> media_service,
                                         const std::string& source_prefix,
                                         std::chrono::milliseconds cache_ttl)
    : media_service_(media_service),
      source_prefix_(source_prefix),
      cache_ttl_(cache_ttl) {
}

std::string ThumbnailController::toSourcePath(const std::string& request_path) const {
    std::string path = request_path;
    while (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }
    if (source_prefix_.empty() || path.compare(0, source_prefix_.size(), source_prefix_) == 0) {
        return path;
    }
    return source_prefix_ + path;
}

std::string ThumbnailController::cacheControlHeader() const {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(cache_ttl_).count();
    return "public, max-age=" + std::to_string(seconds);
}

crow::response ThumbnailController::handleGetThumbnail(const crow::request& req,
                                                       const std::string& path) {
    std::string source_path = toSourcePath(path);

    try {
        Thumbnail thumbnail = media_service_->getThumbnail(
            source_path, queryParam(req, "w"), queryParam(req, "h"));

        crow::response resp(200, std::string(thumbnail.bytes.begin(), thumbnail.bytes.end()));
        resp.add_header("Content-Type", thumbnail.content_type);
        resp.add_header("Cache-Control", cacheControlHeader());
        resp.add_header("X-Cache", thumbnail.served_from_cache ? "HIT" : "MISS");

        METRICS_COUNT("APIRequests", 1.0, "Count", {{"endpoint", "/image"}, {"status", "success"}});
        return resp;

    } catch (const std::exception&) {
        return handleFailure("/image/:path", source_path);
    }
}

crow::response ThumbnailController::handleListSizes(const crow::request& req) {
    try {
        return createJsonSuccess("Allowed thumbnail sizes", media_service_->listAllowedSizes());
    } catch (const std::exception&) {
        return handleFailure("/image/sizes", "");
    }
}

crow::response ThumbnailController::handleCacheStats(const crow::request& req) {
    try {
        return createJsonSuccess("Cache statistics", media_service_->getCacheStats().toJson());
    } catch (const std::exception&) {
        return handleFailure("/image/cache/stats", "");
    }
}

crow::response ThumbnailController::handleClearExpired(const crow::request& req) {
    try {
        size_t cleared = media_service_->clearExpired();

        Logger::log_structured(spdlog::level::info, "Expired cache entries cleared", {
            {"endpoint", "/image/cache/clear"},
            {"cleared", cleared}
        });
        return createJsonSuccess("Cleared expired cache entries", {{"cleared", cleared}});
    } catch (const std::exception&) {
        return handleFailure("/image/cache/clear", "");
    }
}

crow::response ThumbnailController::handleFailure(const std::string& endpoint,
                                                  const std::string& path) {
    int status = 500;
    std::string message = "Internal server error";

    try {
        throw;
    } catch (const exceptions::InvalidRequestException& e) {
        status = 400;
        message = e.what();
    } catch (const exceptions::SizePolicyViolationException& e) {
        status = 400;
        message = e.what();
    } catch (const exceptions::NotFoundException&) {
        status = 404;
        message = "Image not found";
    } catch (const exceptions::StorageUnavailableException& e) {
        status = 503;
        message = "Storage unavailable";
        Logger::log_error("Source storage unavailable", e, {{"endpoint", endpoint}, {"source_path", path}});
    } catch (const exceptions::TransformException& e) {
        message = "Failed to process image";
        Logger::log_error("Thumbnail transformation failed", e, {{"endpoint", endpoint}, {"source_path", path}});
    } catch (const std::exception& e) {
        Logger::log_error("Unhandled request error", e, {{"endpoint", endpoint}, {"source_path", path}});
    }

    if (status < 500) {
        Logger::log_structured(spdlog::level::info, "Request rejected", {
            {"endpoint", endpoint},
            {"source_path", path},
            {"status", status},
            {"reason", message}
        });
    }

    METRICS_COUNT("APIRequests", 1.0, "Count", {{"endpoint", endpoint}, {"status", std::to_string(status)}});
    return createJsonError(status, message);
}

crow::response ThumbnailController::createJsonSuccess(const std::string& message, const json& data) {
    json body = {
        {"success", true},
        {"message", message},
        {"data", data}
    };
    crow::response resp(200, body.dump());
    resp.add_header("Content-Type", "application/json");
    return resp;
}

crow::response ThumbnailController::createJsonError(int status_code, const std::string& error_message) {
    json body = {
        {"success", false},
        {"message", error_message}
    };
    crow::response resp(status_code, body.dump());
    resp.add_header("Content-Type", "application/json");
    return resp;
}

std::optional<std::string> ThumbnailController::queryParam(const crow::request& req, const char* name) {
    const char* value = req.url_params.get(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace lumen
