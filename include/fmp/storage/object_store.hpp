#pragma once

/**
 * @file object_store.hpp
 * @brief Minimal multipart object store client surface
 *
 * Only the calls the remote backend needs. Part numbers are 1-based as in
 * the S3 API. Checksums are SHA-256 hex on the way in; implementations
 * convert to the wire encoding they need.
 */

#include "fmp/core/result.hpp"
#include "fmp/core/clock.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fmp::storage {

struct PartInfo {
    std::uint32_t part_number = 0;
    std::string etag;
    std::string checksum_sha256;   ///< hex, empty if the store did not report one
    std::uint64_t size = 0;
};

struct CompletedPart {
    std::uint32_t part_number = 0;
    std::string etag;
    std::string checksum_sha256;   ///< hex
};

struct PresignedUrl {
    std::string url;
    Timestamp expires_at{};
};

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual Result<std::string> create_multipart_upload(const std::string& key,
                                                        const std::string& content_type) = 0;

    /**
     * @brief Upload id of an open multipart upload for key, if any
     */
    virtual Result<std::optional<std::string>> find_multipart_upload(const std::string& key) = 0;

    /// @return ETag of the stored part
    virtual Result<std::string> upload_part(const std::string& key,
                                            const std::string& upload_id,
                                            std::uint32_t part_number,
                                            const std::vector<std::uint8_t>& bytes,
                                            const std::string& checksum_sha256) = 0;

    /// NotFound when the upload id is unknown (completed, aborted or never created)
    virtual Result<std::vector<PartInfo>> list_parts(const std::string& key,
                                                     const std::string& upload_id) = 0;

    virtual Result<void> complete_multipart_upload(const std::string& key,
                                                   const std::string& upload_id,
                                                   const std::vector<CompletedPart>& parts) = 0;

    /// Aborting an unknown upload id succeeds
    virtual Result<void> abort_multipart_upload(const std::string& key,
                                                const std::string& upload_id) = 0;

    virtual Result<bool> object_exists(const std::string& key) = 0;

    virtual Result<void> delete_object(const std::string& key) = 0;

    virtual Result<PresignedUrl> presign_get(const std::string& key, std::chrono::seconds ttl) = 0;
};

} // namespace fmp::storage
