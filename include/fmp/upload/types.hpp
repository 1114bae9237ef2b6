#pragma once

#include "fmp/core/clock.hpp"
#include "fmp/storage/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fmp::upload {

enum class SessionStatus {
    Pending,     // Initialized, no chunk yet
    Uploading,   // At least one chunk, some missing
    Merging,     // All chunks present, finalize running
    Completed,
    Failed,
    Expired
};

const char* to_string(SessionStatus status);

std::optional<SessionStatus> parse_session_status(const std::string& text);

inline bool is_terminal(SessionStatus status) noexcept {
    return status == SessionStatus::Completed || status == SessionStatus::Failed ||
           status == SessionStatus::Expired;
}

/**
 * @brief Arguments of initialize_upload
 */
struct UploadRequest {
    std::string owner_id;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;   ///< 0 selects the configured default
    std::optional<std::string> declared_hash;
    std::string filename;
    std::string content_type;
};

/**
 * @brief Point-in-time copy of a session, safe to hand out of the lock
 */
struct SessionView {
    std::string id;
    std::string owner_id;
    std::string filename;
    std::string content_type;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::vector<std::uint32_t> uploaded_chunks;
    std::vector<std::uint32_t> missing_chunks;
    double progress_percent = 0.0;
    SessionStatus status = SessionStatus::Pending;
    storage::StorageMode mode = storage::StorageMode::Local;
    std::optional<std::string> declared_hash;
    std::optional<std::string> content_hash;
    std::optional<std::string> final_location;
    std::string last_error;
    bool deduplicated = false;
    Timestamp created_at{};
    Timestamp updated_at{};
    Timestamp expires_at{};
    std::optional<Timestamp> completed_at;
};

struct InitResult {
    SessionView session;
    bool resumed = false;   ///< an in-progress session was re-presented
};

/**
 * @brief Reply to accept_chunk
 */
struct ChunkResult {
    SessionStatus status = SessionStatus::Uploading;
    double progress_percent = 0.0;
    std::vector<std::uint32_t> missing_chunks;
    bool duplicate = false;
    std::optional<std::string> final_location;   ///< set when this chunk completed the upload
};

} // namespace fmp::upload
