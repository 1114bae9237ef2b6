#pragma once

#include "fmp/core/clock.hpp"
#include "fmp/storage/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace fmp::files {

/**
 * @brief A file an account owns, created once per completed upload
 *
 * Several records may point at the same location when uploads were
 * deduplicated; deleting a record never touches the stored object.
 */
struct FileRecord {
    std::string id;
    std::string owner_id;
    std::string session_id;   // unique across the catalog
    std::string filename;
    std::string content_type;
    std::uint64_t size = 0;
    std::string content_hash;
    storage::StorageMode mode = storage::StorageMode::Local;
    std::string location;

    Timestamp uploaded_at{};
    Timestamp updated_at{};
    std::uint64_t download_count = 0;
    std::optional<Timestamp> last_accessed_at;

    bool deleted = false;
    std::optional<Timestamp> deleted_at;
};

nlohmann::json to_json(const FileRecord& record);

/// Throws nlohmann::json::exception on missing or mistyped fields
FileRecord record_from_json(const nlohmann::json& document);

} // namespace fmp::files
