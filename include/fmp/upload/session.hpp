#pragma once

#include "fmp/core/result.hpp"
#include "fmp/upload/chunk_tracker.hpp"
#include "fmp/upload/types.hpp"

#include <optional>
#include <string>

namespace fmp::upload {

/**
 * @brief Everything about a session that is persisted, except chunk receipts
 */
struct SessionData {
    std::string id;
    std::string owner_id;
    std::string filename;
    std::string content_type;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::optional<std::string> declared_hash;
    std::optional<std::string> content_hash;
    SessionStatus status = SessionStatus::Pending;
    storage::StagingHandle staging;
    std::optional<std::string> final_location;
    std::string last_error;
    bool deduplicated = false;
    Timestamp created_at{};
    Timestamp updated_at{};
    Timestamp expires_at{};
    std::optional<Timestamp> completed_at;
};

/**
 * @brief State machine for one upload
 *
 *   pending ──chunk──▶ uploading ──last chunk──▶ merging ──▶ completed
 *      │                   │                        │
 *      └───────────────────┴──── failed / expired ◀─┘
 *
 * completed, failed and expired are terminal. Not thread-safe; UploadEngine
 * holds the per-session lock around every call.
 */
class UploadSession {
public:
    UploadSession(SessionData data, ChunkTracker tracker);

    /// ceil(total_size / chunk_size); 0 when chunk_size is 0
    static std::uint64_t chunk_count(std::uint64_t total_size, std::uint64_t chunk_size) noexcept;

    [[nodiscard]] const std::string& id() const noexcept { return data_.id; }
    [[nodiscard]] const std::string& owner_id() const noexcept { return data_.owner_id; }
    [[nodiscard]] SessionStatus status() const noexcept { return data_.status; }
    [[nodiscard]] const SessionData& data() const noexcept { return data_; }
    [[nodiscard]] const ChunkTracker& tracker() const noexcept { return tracker_; }
    [[nodiscard]] ChunkTracker& tracker() noexcept { return tracker_; }

    /// Byte length chunk `index` must have; the last chunk carries the remainder
    [[nodiscard]] std::uint64_t expected_chunk_length(std::uint32_t index) const noexcept;

    [[nodiscard]] bool past_deadline(Timestamp now) const noexcept { return now > data_.expires_at; }

    Result<void> transition_to(SessionStatus next, Timestamp now);

    Result<void> mark_completed(std::string final_location,
                                std::string content_hash,
                                bool deduplicated,
                                Timestamp now);

    Result<void> mark_failed(std::string reason, Timestamp now);

    Result<void> mark_expired(Timestamp now);

    void touch(Timestamp now) noexcept { data_.updated_at = now; }

    [[nodiscard]] SessionView view() const;

private:
    [[nodiscard]] bool can_transition(SessionStatus target) const noexcept;

    SessionData data_;
    ChunkTracker tracker_;
};

} // namespace fmp::upload
