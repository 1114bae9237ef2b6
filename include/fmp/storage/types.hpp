#pragma once

#include "fmp/core/clock.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace fmp::storage {

enum class StorageMode {
    Local,   // Filesystem under the portal data directory
    Remote   // Object store with native multipart upload
};

const char* to_string(StorageMode mode);

std::optional<StorageMode> parse_storage_mode(const std::string& text);

/**
 * @brief Backend-specific staging identifier for one upload session
 *
 * Local:  location = staging directory (absolute), upload_id empty
 * Remote: location = destination object key, upload_id = multipart upload id
 */
struct StagingHandle {
    std::string session_id;
    StorageMode mode = StorageMode::Local;
    std::string location;
    std::string upload_id;
};

/**
 * @brief Receipt for one persisted chunk
 */
struct ChunkRef {
    std::uint32_t index = 0;
    std::uint64_t size = 0;
    std::string digest;      ///< SHA-256 hex of the chunk bytes
    std::string reference;   ///< Local chunk file name or remote part ETag
};

/**
 * @brief Result of assembling all chunks into one durable object
 */
struct MergeOutput {
    std::string location;
    std::string content_hash;
    bool full_content_hash = true;   ///< false when content_hash is derived from part digests
    std::uint64_t size = 0;
};

/**
 * @brief What a download resolves to
 *
 * Local objects are streamed by the portal. Remote objects are handed out as
 * a time-bounded signed URL so large downloads bypass the portal.
 */
struct DownloadHandle {
    enum class Kind {
        Stream,
        SignedUrl
    };

    Kind kind = Kind::Stream;
    std::unique_ptr<std::istream> stream;
    std::uint64_t size = 0;
    std::string url;
    Timestamp expires_at{};
};

/**
 * @brief Per-variant constraints checked when an upload is initialized
 */
struct BackendLimits {
    std::uint64_t min_chunk_size = 1;      ///< Applies to every chunk except the last
    std::uint32_t max_chunks = 0xFFFFFFFFu;
};

} // namespace fmp::storage
