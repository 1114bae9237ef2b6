#pragma once

/**
 * @file portal_api.hpp
 * @brief JSON/HTTP surface of the portal
 *
 * ROUTES (owner taken from the X-Owner-Id header):
 *   POST   /api/uploads                      initialize or resume
 *   PUT    /api/uploads/:id/chunks/:index    raw chunk bytes
 *   GET    /api/uploads/:id                  session status
 *   DELETE /api/uploads/:id                  abort
 *   GET    /api/files?limit=&offset=         list
 *   GET    /api/files/:id
 *   GET    /api/files/:id/download           bytes (local) or {url, expires_at} (remote)
 *   PATCH  /api/files/:id                    {"filename": ...}
 *   DELETE /api/files/:id                    soft delete
 *   GET    /api/health
 *
 * Errors answer {"error": code, "message": text, "retry": hint}. Backend
 * failures are logged in full and answered with a generic message.
 */

#include "fmp/config/config.hpp"
#include "fmp/events/components.hpp"
#include "fmp/files/file_service.hpp"
#include "fmp/network/http_router.hpp"
#include "fmp/upload/engine.hpp"

#include <nlohmann/json.hpp>

namespace fmp::server {

class PortalApi {
public:
    PortalApi(upload::UploadEngine& engine,
              files::FileService& files,
              const events::MetricsComponent& metrics,
              const config::PortalConfig& config);

    void register_routes(network::HttpRouter& router);

    /// Status, code and retry hint for an error; BackendIOError text is replaced
    static network::HttpResponse error_response(const Error& error, const char* retry_override = nullptr);

private:
    network::HttpResponse initialize_upload(const network::HttpContext& ctx);
    network::HttpResponse put_chunk(const network::HttpContext& ctx);
    network::HttpResponse upload_status(const network::HttpContext& ctx);
    network::HttpResponse abort_upload(const network::HttpContext& ctx);

    network::HttpResponse list_files(const network::HttpContext& ctx);
    network::HttpResponse get_file(const network::HttpContext& ctx);
    network::HttpResponse download_file(const network::HttpContext& ctx);
    network::HttpResponse rename_file(const network::HttpContext& ctx);
    network::HttpResponse delete_file(const network::HttpContext& ctx);

    network::HttpResponse health(const network::HttpContext& ctx);

    nlohmann::json session_json(const upload::SessionView& view) const;

    upload::UploadEngine& engine_;
    files::FileService& files_;
    const events::MetricsComponent& metrics_;
    const config::PortalConfig& config_;
};

} // namespace fmp::server
