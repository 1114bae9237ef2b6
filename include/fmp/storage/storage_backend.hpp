#pragma once

/**
 * @file storage_backend.hpp
 * @brief Uniform capability surface for durable byte storage
 *
 * The upload engine and the merge coordinator only ever talk to this
 * interface. Whether chunks land in a directory or in a multipart upload is
 * decided once, when the backend is constructed.
 *
 * CONTRACT (both variants):
 * - open_staging_area is idempotent per session id
 * - write_chunk accepts the same (index, bytes) any number of times;
 *   different bytes for a written index is ChunkConflict
 * - finalize assembles chunks strictly in the order given
 * - abort is idempotent and leaves staging_exists() == false
 */

#include "fmp/core/result.hpp"
#include "fmp/storage/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fmp::storage {

class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual StorageMode mode() const noexcept = 0;

    virtual BackendLimits limits() const noexcept { return BackendLimits{}; }

    virtual Result<StagingHandle> open_staging_area(const std::string& session_id,
                                                    const std::string& content_type) = 0;

    virtual Result<ChunkRef> write_chunk(const StagingHandle& handle,
                                         std::uint32_t index,
                                         const std::vector<std::uint8_t>& bytes,
                                         const std::string& digest) = 0;

    /**
     * @brief Content digest derivable before any merge work, if the variant has one
     *
     * Lets the merge coordinator consult the dedup index before paying for a
     * merge. Variants that only learn the hash while assembling return nullopt.
     */
    virtual std::optional<std::string> digest_before_merge(const std::vector<ChunkRef>& ordered) const = 0;

    virtual Result<MergeOutput> finalize(const StagingHandle& handle,
                                         const std::vector<ChunkRef>& ordered) = 0;

    virtual Result<void> abort(const StagingHandle& handle) = 0;

    virtual Result<bool> staging_exists(const StagingHandle& handle) const = 0;

    virtual Result<DownloadHandle> read_final(const std::string& location) = 0;

    /**
     * @brief Remove a merged object nobody references (lost dedup race, failed verification)
     */
    virtual Result<void> discard_final(const std::string& location) = 0;
};

} // namespace fmp::storage
