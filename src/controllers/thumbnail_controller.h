#ifndef LUMEN_THUMBNAIL_CONTROLLER_H
#define LUMEN_THUMBNAIL_CONTROLLER_H

#include <crow.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "../interfaces/media_service_interface.h"

namespace lumen {

class ThumbnailController {
public:
    ThumbnailController(std::shared_ptr<MediaServiceInterface> media_service,
                        const std::string& source_prefix,
                        std::chrono::milliseconds cache_ttl);

    // Register routes with Crow app (templated to support middleware)
    template<typename App>
    void registerRoutes(App& app);

    // Prepend the source prefix unless the path already carries it
    std::string toSourcePath(const std::string& request_path) const;

    // Cache-Control header value for thumbnail responses
    std::string cacheControlHeader() const;

    /**
     * @brief Map the exception currently being handled to an error response
     *
     * Must be called from inside a catch block. Client errors give 400,
     * missing sources 404, storage outages 503 and everything else 500.
     */
    static crow::response handleFailure(const std::string& endpoint, const std::string& path);

private:
    std::shared_ptr<MediaServiceInterface> media_service_;
    std::string source_prefix_;
    std::chrono::milliseconds cache_ttl_;

    // Thumbnail endpoint handler
    crow::response handleGetThumbnail(const crow::request& req, const std::string& path);

    crow::response handleListSizes(const crow::request& req);

    crow::response handleCacheStats(const crow::request& req);

    crow::response handleClearExpired(const crow::request& req);

    // Helper: Create JSON success envelope
    static crow::response createJsonSuccess(const std::string& message, const nlohmann::json& data);

    // Helper: Create JSON error envelope
    static crow::response createJsonError(int status_code, const std::string& error_message);

    static std::optional<std::string> queryParam(const crow::request& req, const char* name);
};

// Template implementation must be in header
template<typename App>
void ThumbnailController::registerRoutes(App& app) {
    CROW_ROUTE(app, "/image/sizes").methods("GET"_method)
    ([this](const crow::request& req) {
        return handleListSizes(req);
    });

    CROW_ROUTE(app, "/image/cache/stats").methods("GET"_method)
    ([this](const crow::request& req) {
        return handleCacheStats(req);
    });

    CROW_ROUTE(app, "/image/cache/clear").methods("DELETE"_method)
    ([this](const crow::request& req) {
        return handleClearExpired(req);
    });

    // Thumbnail of any stored image (must come after the static routes)
    CROW_ROUTE(app, "/image/<path>").methods("GET"_method)
    ([this](const crow::request& req, const std::string& path) {
        return handleGetThumbnail(req, path);
    });
}

} // namespace lumen

#endif // LUMEN_THUMBNAIL_CONTROLLER_H
