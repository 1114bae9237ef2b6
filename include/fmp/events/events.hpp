/**
 * @file events.hpp
 * @brief Event types emitted by the portal
 *
 * Events are past-tense facts. They carry plain values only, never
 * references into the emitter's state, so a subscriber may keep them.
 */

#pragma once

#include "fmp/storage/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace fmp::events {

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

struct UploadInitializedEvent {
    std::string owner_id;
    std::string session_id;
    std::string filename;
    std::uint64_t total_size = 0;
    std::uint32_t total_chunks = 0;
    storage::StorageMode mode = storage::StorageMode::Local;
    bool resumed = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ChunkAcceptedEvent {
    std::string session_id;
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t bytes = 0;
    bool duplicate = false;   // identical re-send, no state change
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A session reached `completed`
 *
 * WHO EMITS: UploadEngine, once per session, after the completed state is durable
 * WHO SUBSCRIBES: FileService (creates the FileRecord), Logger, Metrics
 */
struct UploadCompletedEvent {
    std::string owner_id;
    std::string session_id;
    std::string final_location;
    std::uint64_t size = 0;
    std::string content_hash;
    std::string declared_hash;
    std::string filename;
    std::string content_type;
    storage::StorageMode mode = storage::StorageMode::Local;
    bool deduplicated = false;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadFailedEvent {
    std::string owner_id;
    std::string session_id;
    std::string reason;
    bool aborted_by_owner = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadExpiredEvent {
    std::string owner_id;
    std::string session_id;
    std::uint32_t chunks_received = 0;
    std::uint32_t total_chunks = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// File Events
// ════════════════════════════════════════════════════════

struct FileRecordCreatedEvent {
    std::string owner_id;
    std::string file_id;
    std::string session_id;
    std::string filename;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileRenamedEvent {
    std::string owner_id;
    std::string file_id;
    std::string old_name;
    std::string new_name;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileDeletedEvent {
    std::string owner_id;
    std::string file_id;
    std::string filename;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileDownloadedEvent {
    std::string owner_id;
    std::string file_id;
    std::uint64_t size = 0;
    bool signed_url = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    std::uint16_t port = 0;
    storage::StorageMode mode = storage::StorageMode::Local;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ServerShuttingDownEvent {
    std::string reason = "normal";
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace fmp::events
