#include "fmp/upload/session_ledger.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace fmp::upload {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> read_optional_string(const json& document, const char* key) {
    if (!document.contains(key) || document.at(key).is_null()) {
        return std::nullopt;
    }
    return document.at(key).get<std::string>();
}

} // namespace

json session_to_json(const UploadSession& session) {
    const auto& d = session.data();

    json chunks = json::array();
    for (const auto& ref : session.tracker().ordered_receipts()) {
        chunks.push_back({
            {"index", ref.index},
            {"size", ref.size},
            {"digest", ref.digest},
            {"reference", ref.reference},
        });
    }

    json j;
    j["id"] = d.id;
    j["owner_id"] = d.owner_id;
    j["filename"] = d.filename;
    j["content_type"] = d.content_type;
    j["total_size"] = d.total_size;
    j["chunk_size"] = d.chunk_size;
    j["total_chunks"] = d.total_chunks;
    j["declared_hash"] = optional_string(d.declared_hash);
    j["content_hash"] = optional_string(d.content_hash);
    j["status"] = to_string(d.status);
    j["staging"] = {
        {"mode", storage::to_string(d.staging.mode)},
        {"location", d.staging.location},
        {"upload_id", d.staging.upload_id},
    };
    j["final_location"] = optional_string(d.final_location);
    j["last_error"] = d.last_error;
    j["deduplicated"] = d.deduplicated;
    j["created_at"] = to_unix_millis(d.created_at);
    j["updated_at"] = to_unix_millis(d.updated_at);
    j["expires_at"] = to_unix_millis(d.expires_at);
    j["completed_at"] = d.completed_at ? json(to_unix_millis(*d.completed_at)) : json(nullptr);
    j["chunks"] = std::move(chunks);
    return j;
}

Result<UploadSession> session_from_json(const json& document) {
    try {
        SessionData d;
        d.id = document.at("id").get<std::string>();
        d.owner_id = document.at("owner_id").get<std::string>();
        d.filename = document.value("filename", "");
        d.content_type = document.value("content_type", "");
        d.total_size = document.at("total_size").get<std::uint64_t>();
        d.chunk_size = document.at("chunk_size").get<std::uint64_t>();
        d.total_chunks = document.at("total_chunks").get<std::uint32_t>();
        d.declared_hash = read_optional_string(document, "declared_hash");
        d.content_hash = read_optional_string(document, "content_hash");

        auto status = parse_session_status(document.at("status").get<std::string>());
        if (!status) {
            return Fail<UploadSession>(ErrorCode::InvalidRequest, "Unknown session status in ledger");
        }
        d.status = *status;

        const auto& staging = document.at("staging");
        auto mode = storage::parse_storage_mode(staging.at("mode").get<std::string>());
        if (!mode) {
            return Fail<UploadSession>(ErrorCode::InvalidRequest, "Unknown storage mode in ledger");
        }
        d.staging.session_id = d.id;
        d.staging.mode = *mode;
        d.staging.location = staging.value("location", "");
        d.staging.upload_id = staging.value("upload_id", "");

        d.final_location = read_optional_string(document, "final_location");
        d.last_error = document.value("last_error", "");
        d.deduplicated = document.value("deduplicated", false);
        d.created_at = from_unix_millis(document.at("created_at").get<std::int64_t>());
        d.updated_at = from_unix_millis(document.at("updated_at").get<std::int64_t>());
        d.expires_at = from_unix_millis(document.at("expires_at").get<std::int64_t>());
        if (document.contains("completed_at") && !document.at("completed_at").is_null()) {
            d.completed_at = from_unix_millis(document.at("completed_at").get<std::int64_t>());
        }

        if (d.total_chunks != UploadSession::chunk_count(d.total_size, d.chunk_size)) {
            return Fail<UploadSession>(ErrorCode::InvalidRequest, "Inconsistent chunk geometry for session " + d.id);
        }

        ChunkTracker tracker(d.total_chunks);
        for (const auto& chunk : document.value("chunks", json::array())) {
            storage::ChunkRef ref;
            ref.index = chunk.at("index").get<std::uint32_t>();
            ref.size = chunk.at("size").get<std::uint64_t>();
            ref.digest = chunk.at("digest").get<std::string>();
            ref.reference = chunk.value("reference", "");
            if (ref.index >= d.total_chunks) {
                return Fail<UploadSession>(ErrorCode::InvalidRequest, "Chunk index out of range in ledger");
            }
            tracker.mark(ref);
        }

        return Ok(UploadSession(std::move(d), std::move(tracker)));
    } catch (const json::exception& e) {
        return Fail<UploadSession>(ErrorCode::InvalidRequest, std::string("Malformed session document: ") + e.what());
    }
}

// ════════════════════════════════════════════════════════
// JsonFileSessionLedger
// ════════════════════════════════════════════════════════

JsonFileSessionLedger::JsonFileSessionLedger(fs::path directory) : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        spdlog::error("[SessionLedger] cannot create {}: {}", directory_.string(), ec.message());
    }
}

fs::path JsonFileSessionLedger::path_for(const std::string& session_id) const {
    return directory_ / (session_id + ".json");
}

Result<void> JsonFileSessionLedger::save(const UploadSession& session) {
    const auto target = path_for(session.id());
    const fs::path temp = target.string() + ".tmp";

    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return Err<void>(make_error(ErrorCode::BackendIOError, "Cannot write ledger file " + temp.string()));
        }
        out << session_to_json(session).dump();
        out.flush();
        if (!out) {
            return Err<void>(make_error(ErrorCode::BackendIOError, "Short write to ledger file " + temp.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        return Err<void>(make_error(ErrorCode::BackendIOError, "Cannot replace ledger file: " + ec.message()));
    }
    return Ok();
}

Result<void> JsonFileSessionLedger::remove(const std::string& session_id) {
    std::error_code ec;
    fs::remove(path_for(session_id), ec);
    if (ec) {
        return Err<void>(make_error(ErrorCode::BackendIOError, "Cannot remove ledger file: " + ec.message()));
    }
    return Ok();
}

Result<std::vector<UploadSession>> JsonFileSessionLedger::load_all() {
    std::vector<UploadSession> sessions;
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return Fail<std::vector<UploadSession>>(ErrorCode::BackendIOError,
                                                "Cannot list ledger directory: " + ec.message());
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        std::ifstream input(entry.path());
        auto document = json::parse(input, nullptr, false);
        if (document.is_discarded()) {
            spdlog::error("[SessionLedger] skipping unreadable {}", entry.path().string());
            continue;
        }
        auto session = session_from_json(document);
        if (session.is_error()) {
            spdlog::error("[SessionLedger] skipping {}: {}", entry.path().string(), session.error().message);
            continue;
        }
        sessions.push_back(std::move(session.value()));
    }
    return Ok(std::move(sessions));
}

// ════════════════════════════════════════════════════════
// MemorySessionLedger
// ════════════════════════════════════════════════════════

Result<void> MemorySessionLedger::save(const UploadSession& session) {
    auto document = session_to_json(session);
    std::lock_guard lock(mutex_);
    documents_[session.id()] = std::move(document);
    ++saves_;
    return Ok();
}

Result<void> MemorySessionLedger::remove(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    documents_.erase(session_id);
    return Ok();
}

Result<std::vector<UploadSession>> MemorySessionLedger::load_all() {
    std::lock_guard lock(mutex_);
    std::vector<UploadSession> sessions;
    for (const auto& [id, document] : documents_) {
        auto session = session_from_json(document);
        if (session.is_error()) {
            return Err<std::vector<UploadSession>>(session.error());
        }
        sessions.push_back(std::move(session.value()));
    }
    return Ok(std::move(sessions));
}

std::size_t MemorySessionLedger::size() const {
    std::lock_guard lock(mutex_);
    return documents_.size();
}

std::size_t MemorySessionLedger::save_count() const {
    std::lock_guard lock(mutex_);
    return saves_;
}

bool MemorySessionLedger::contains(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    return documents_.count(session_id) > 0;
}

} // namespace fmp::upload
