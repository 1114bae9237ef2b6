#include "fmp/server/portal_api.hpp"

#include "fmp/core/filename.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <ctime>
#include <istream>
#include <iterator>

namespace fmp::server {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

constexpr const char* kOwnerHeader = "X-Owner-Id";

std::string to_iso8601(Timestamp tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

json optional_time(const std::optional<Timestamp>& tp) {
    return tp ? json(to_iso8601(*tp)) : json(nullptr);
}

bool parse_uint(const std::string& text, std::uint64_t& out) {
    if (text.empty()) {
        return false;
    }
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc() && ptr == end;
}

HttpResponse json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

std::string owner_of(const HttpContext& ctx) {
    return ctx.request.get_header(kOwnerHeader);
}

json file_json(const files::FileRecord& record) {
    return json{
        {"id", record.id},
        {"filename", record.filename},
        {"file_size", record.size},
        {"mime_type", record.content_type},
        {"file_hash", record.content_hash},
        {"storage_mode", storage::to_string(record.mode)},
        {"uploaded_at", to_iso8601(record.uploaded_at)},
        {"updated_at", to_iso8601(record.updated_at)},
        {"last_accessed_at", optional_time(record.last_accessed_at)},
        {"download_count", record.download_count},
    };
}

} // namespace

PortalApi::PortalApi(upload::UploadEngine& engine,
                     files::FileService& files,
                     const events::MetricsComponent& metrics,
                     const config::PortalConfig& config)
    : engine_(engine), files_(files), metrics_(metrics), config_(config) {}

HttpResponse PortalApi::error_response(const Error& error, const char* retry_override) {
    std::string message = error.message;
    if (error.code == ErrorCode::BackendIOError) {
        message = "Storage backend error";
    }
    HttpResponse response(static_cast<HttpStatus>(http_status_for(error.code)));
    response.set_header("Content-Type", "application/json");
    response.set_body(json{
        {"error", to_string(error.code)},
        {"message", message},
        {"retry", retry_override ? retry_override : retry_hint_for(error.code)},
    }.dump());
    return response;
}

void PortalApi::register_routes(network::HttpRouter& router) {
    // Every API route except health needs an owner
    router.use([](const HttpContext& ctx, HttpResponse& response) {
        if (ctx.request.path.rfind("/api/", 0) != 0 || ctx.request.path == "/api/health") {
            return true;
        }
        if (owner_of(ctx).empty()) {
            response = network::json_error(HttpStatus::UNAUTHORIZED, "unauthorized",
                                           std::string("Missing ") + kOwnerHeader + " header");
            return false;
        }
        return true;
    });

    router.post("/api/uploads", [this](const HttpContext& ctx) { return initialize_upload(ctx); });
    router.put("/api/uploads/:id/chunks/:index", [this](const HttpContext& ctx) { return put_chunk(ctx); });
    router.get("/api/uploads/:id", [this](const HttpContext& ctx) { return upload_status(ctx); });
    router.delete_("/api/uploads/:id", [this](const HttpContext& ctx) { return abort_upload(ctx); });

    router.get("/api/files", [this](const HttpContext& ctx) { return list_files(ctx); });
    router.get("/api/files/:id", [this](const HttpContext& ctx) { return get_file(ctx); });
    router.get("/api/files/:id/download", [this](const HttpContext& ctx) { return download_file(ctx); });
    router.patch("/api/files/:id", [this](const HttpContext& ctx) { return rename_file(ctx); });
    router.delete_("/api/files/:id", [this](const HttpContext& ctx) { return delete_file(ctx); });

    router.get("/api/health", [this](const HttpContext& ctx) { return health(ctx); });
}

json PortalApi::session_json(const upload::SessionView& view) const {
    json j{
        {"session_id", view.id},
        {"filename", view.filename},
        {"content_type", view.content_type},
        {"status", upload::to_string(view.status)},
        {"total_size", view.total_size},
        {"chunk_size", view.chunk_size},
        {"total_chunks", view.total_chunks},
        {"uploaded_chunks", view.uploaded_chunks},
        {"missing_chunks", view.missing_chunks},
        {"progress_percent", view.progress_percent},
        {"storage_mode", storage::to_string(view.mode)},
        {"declared_hash", view.declared_hash ? json(*view.declared_hash) : json(nullptr)},
        {"content_hash", view.content_hash ? json(*view.content_hash) : json(nullptr)},
        {"deduplicated", view.deduplicated},
        {"created_at", to_iso8601(view.created_at)},
        {"updated_at", to_iso8601(view.updated_at)},
        {"expires_at", to_iso8601(view.expires_at)},
        {"completed_at", optional_time(view.completed_at)},
    };
    if (!view.last_error.empty()) {
        j["last_error"] = view.last_error;
    }
    if (view.status == upload::SessionStatus::Completed) {
        if (auto record = files_.find_for_session(view.owner_id, view.id)) {
            j["file_id"] = record->id;
        }
    }
    return j;
}

// ════════════════════════════════════════════════════════════
// Uploads
// ════════════════════════════════════════════════════════════

HttpResponse PortalApi::initialize_upload(const HttpContext& ctx) {
    const auto body = json::parse(ctx.request.body_as_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return error_response(make_error(ErrorCode::InvalidRequest, "Body must be a JSON object"));
    }

    upload::UploadRequest request;
    request.owner_id = owner_of(ctx);

    const auto total = body.find("total_size");
    if (total == body.end() || !total->is_number_unsigned()) {
        return error_response(make_error(ErrorCode::InvalidRequest, "total_size must be a positive integer"));
    }
    request.total_size = total->get<std::uint64_t>();

    if (auto chunk = body.find("chunk_size"); chunk != body.end() && !chunk->is_null()) {
        if (!chunk->is_number_unsigned()) {
            return error_response(make_error(ErrorCode::InvalidRequest, "chunk_size must be a positive integer"));
        }
        request.chunk_size = chunk->get<std::uint64_t>();
    }

    const auto name = body.find("filename");
    if (name == body.end() || !name->is_string() || sanitize_filename(name->get<std::string>()).empty()) {
        return error_response(make_error(ErrorCode::InvalidRequest, "filename is required"));
    }
    request.filename = name->get<std::string>();
    if (!config::is_extension_allowed(config_, sanitize_filename(request.filename))) {
        return error_response(make_error(ErrorCode::InvalidRequest, "File type not allowed"));
    }

    if (auto type = body.find("content_type"); type != body.end() && type->is_string()) {
        request.content_type = type->get<std::string>();
    }
    if (auto hash = body.find("file_hash"); hash != body.end() && !hash->is_null()) {
        if (!hash->is_string()) {
            return error_response(make_error(ErrorCode::InvalidRequest, "file_hash must be a hex string"));
        }
        request.declared_hash = hash->get<std::string>();
    }

    auto result = engine_.initialize_upload(request);
    if (result.is_error()) {
        return error_response(result.error());
    }
    const auto& init = result.value();
    json reply = session_json(init.session);
    reply["resumed"] = init.resumed;
    return json_response(init.resumed ? HttpStatus::OK : HttpStatus::CREATED, reply);
}

HttpResponse PortalApi::put_chunk(const HttpContext& ctx) {
    const auto owner = owner_of(ctx);
    const auto session_id = ctx.get_param("id");

    std::uint64_t index = 0;
    if (!parse_uint(ctx.get_param("index"), index) || index > 0xFFFFFFFFull) {
        return error_response(make_error(ErrorCode::InvalidRequest, "Chunk index must be a non-negative integer"));
    }

    auto result = engine_.accept_chunk(owner, session_id, static_cast<std::uint32_t>(index), ctx.request.body);
    if (result.is_error()) {
        const auto& error = result.error();
        if (error.code == ErrorCode::BackendIOError) {
            spdlog::error("[API] session={} chunk={} backend failure: {}", session_id, index, error.message);
            // A failed merge leaves the session failed; resending the chunk cannot help
            auto status = engine_.get_session_status(owner, session_id);
            if (status.is_ok() && upload::is_terminal(status.value().status)) {
                return error_response(error, "restart");
            }
        }
        return error_response(error);
    }

    const auto& chunk = result.value();
    json reply{
        {"session_id", session_id},
        {"chunk_index", index},
        {"status", upload::to_string(chunk.status)},
        {"progress_percent", chunk.progress_percent},
        {"missing_chunks", chunk.missing_chunks},
        {"duplicate", chunk.duplicate},
    };
    if (chunk.status == upload::SessionStatus::Completed) {
        if (auto record = files_.find_for_session(owner, session_id)) {
            reply["file_id"] = record->id;
            reply["file"] = file_json(*record);
        }
    }
    return json_response(HttpStatus::OK, reply);
}

HttpResponse PortalApi::upload_status(const HttpContext& ctx) {
    auto result = engine_.get_session_status(owner_of(ctx), ctx.get_param("id"));
    if (result.is_error()) {
        return error_response(result.error());
    }
    return json_response(HttpStatus::OK, session_json(result.value()));
}

HttpResponse PortalApi::abort_upload(const HttpContext& ctx) {
    auto result = engine_.abort_upload(owner_of(ctx), ctx.get_param("id"));
    if (result.is_error()) {
        return error_response(result.error());
    }
    return json_response(HttpStatus::OK, session_json(result.value()));
}

// ════════════════════════════════════════════════════════════
// Files
// ════════════════════════════════════════════════════════════

HttpResponse PortalApi::list_files(const HttpContext& ctx) {
    std::uint64_t limit = 0;
    std::uint64_t offset = 0;
    const auto limit_text = ctx.request.get_query("limit");
    const auto offset_text = ctx.request.get_query("offset");
    if ((!limit_text.empty() && !parse_uint(limit_text, limit)) ||
        (!offset_text.empty() && !parse_uint(offset_text, offset))) {
        return error_response(make_error(ErrorCode::InvalidRequest, "limit and offset must be non-negative integers"));
    }

    const auto page = files_.list(owner_of(ctx), static_cast<std::size_t>(limit), static_cast<std::size_t>(offset));
    json items = json::array();
    for (const auto& record : page.items) {
        items.push_back(file_json(record));
    }
    const std::size_t effective_limit =
        limit == 0 ? config_.page_size : std::min<std::size_t>(limit, files::FileService::kMaxPageSize);

    return json_response(HttpStatus::OK, json{
        {"files", items},
        {"pagination", {{"limit", effective_limit}, {"offset", offset}, {"total", page.total}}},
    });
}

HttpResponse PortalApi::get_file(const HttpContext& ctx) {
    auto result = files_.get(owner_of(ctx), ctx.get_param("id"));
    if (result.is_error()) {
        return error_response(result.error());
    }
    return json_response(HttpStatus::OK, file_json(result.value()));
}

HttpResponse PortalApi::download_file(const HttpContext& ctx) {
    auto result = files_.open_download(owner_of(ctx), ctx.get_param("id"));
    if (result.is_error()) {
        return error_response(result.error());
    }
    auto& download = result.value();
    auto& handle = download.handle;

    if (handle.kind == storage::DownloadHandle::Kind::SignedUrl) {
        return json_response(HttpStatus::OK, json{
            {"url", handle.url},
            {"expires_at", to_iso8601(handle.expires_at)},
            {"filename", download.record.filename},
        });
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(static_cast<std::size_t>(handle.size));
    bytes.assign(std::istreambuf_iterator<char>(*handle.stream), std::istreambuf_iterator<char>());
    if (bytes.size() != handle.size) {
        spdlog::error("[API] file={} short read: {} of {} bytes", download.record.id, bytes.size(), handle.size);
        return error_response(make_error(ErrorCode::BackendIOError, "short read"), "none");
    }

    HttpResponse response(HttpStatus::OK);
    const auto& type = download.record.content_type;
    response.set_header("Content-Type", is_valid_media_type(type) ? type : "application/octet-stream");
    response.set_header("Content-Disposition", "attachment; filename=\"" + download.record.filename + "\"");
    response.set_body(std::move(bytes));
    return response;
}

HttpResponse PortalApi::rename_file(const HttpContext& ctx) {
    const auto body = json::parse(ctx.request.body_as_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("filename") || !body["filename"].is_string()) {
        return error_response(make_error(ErrorCode::InvalidRequest, "New filename is required"));
    }
    const auto requested = body["filename"].get<std::string>();
    if (!config::is_extension_allowed(config_, sanitize_filename(requested))) {
        return error_response(make_error(ErrorCode::InvalidRequest, "File type not allowed"));
    }

    auto result = files_.rename(owner_of(ctx), ctx.get_param("id"), requested);
    if (result.is_error()) {
        return error_response(result.error());
    }
    return json_response(HttpStatus::OK, file_json(result.value()));
}

HttpResponse PortalApi::delete_file(const HttpContext& ctx) {
    auto result = files_.remove(owner_of(ctx), ctx.get_param("id"));
    if (result.is_error()) {
        return error_response(result.error());
    }
    return json_response(HttpStatus::OK, json{
        {"id", result.value().id},
        {"deleted", true},
    });
}

HttpResponse PortalApi::health(const HttpContext&) {
    return json_response(HttpStatus::OK, json{
        {"status", "ok"},
        {"storage_mode", storage::to_string(engine_.mode())},
        {"sessions", engine_.session_count()},
        {"metrics", metrics_.to_json()},
    });
}

} // namespace fmp::server
