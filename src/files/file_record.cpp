#include "fmp/files/file_record.hpp"

#include <nlohmann/json.hpp>

namespace fmp::files {

using json = nlohmann::json;

namespace {

json optional_millis(const std::optional<Timestamp>& tp) {
    return tp ? json(to_unix_millis(*tp)) : json(nullptr);
}

std::optional<Timestamp> read_optional_millis(const json& document, const char* key) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return std::nullopt;
    }
    return from_unix_millis(it->get<std::int64_t>());
}

} // namespace

json to_json(const FileRecord& record) {
    return json{
        {"id", record.id},
        {"owner_id", record.owner_id},
        {"session_id", record.session_id},
        {"filename", record.filename},
        {"content_type", record.content_type},
        {"size", record.size},
        {"content_hash", record.content_hash},
        {"storage_mode", storage::to_string(record.mode)},
        {"location", record.location},
        {"uploaded_at", to_unix_millis(record.uploaded_at)},
        {"updated_at", to_unix_millis(record.updated_at)},
        {"download_count", record.download_count},
        {"last_accessed_at", optional_millis(record.last_accessed_at)},
        {"deleted", record.deleted},
        {"deleted_at", optional_millis(record.deleted_at)},
    };
}

FileRecord record_from_json(const json& document) {
    FileRecord record;
    record.id = document.at("id").get<std::string>();
    record.owner_id = document.at("owner_id").get<std::string>();
    record.session_id = document.at("session_id").get<std::string>();
    record.filename = document.at("filename").get<std::string>();
    record.content_type = document.value("content_type", std::string("application/octet-stream"));
    record.size = document.at("size").get<std::uint64_t>();
    record.content_hash = document.value("content_hash", std::string());
    record.mode = storage::parse_storage_mode(document.at("storage_mode").get<std::string>())
                      .value_or(storage::StorageMode::Local);
    record.location = document.at("location").get<std::string>();
    record.uploaded_at = from_unix_millis(document.at("uploaded_at").get<std::int64_t>());
    record.updated_at = from_unix_millis(document.value("updated_at", to_unix_millis(record.uploaded_at)));
    record.download_count = document.value("download_count", std::uint64_t{0});
    record.last_accessed_at = read_optional_millis(document, "last_accessed_at");
    record.deleted = document.value("deleted", false);
    record.deleted_at = read_optional_millis(document, "deleted_at");
    return record;
}

} // namespace fmp::files
