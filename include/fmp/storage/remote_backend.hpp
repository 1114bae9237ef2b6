#pragma once

#include "fmp/storage/object_store.hpp"
#include "fmp/storage/storage_backend.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace fmp::storage {

struct RemoteBackendOptions {
    std::string key_prefix = "uploads/";
    std::uint64_t min_part_size = 5ull * 1024 * 1024;
    std::chrono::seconds signed_url_ttl{3600};
};

/**
 * @brief Object-store variant built on native multipart upload
 *
 * One multipart upload per session, keyed "<prefix><session_id>". Chunk i
 * is part i + 1 and is sent with its SHA-256 as x-amz-checksum-sha256, so
 * the store rejects corrupted parts and the content digest of the whole
 * object can be derived from part digests before completing:
 *
 *   sha256-parts:<hex(sha256(d0 || d1 || ... || dn-1))>-<n>
 *
 * where di is the raw 32-byte digest of chunk i.
 */
class RemoteBackend final : public StorageBackend {
public:
    explicit RemoteBackend(std::shared_ptr<ObjectStore> store, RemoteBackendOptions options = {});

    StorageMode mode() const noexcept override { return StorageMode::Remote; }

    BackendLimits limits() const noexcept override;

    Result<StagingHandle> open_staging_area(const std::string& session_id,
                                            const std::string& content_type) override;

    Result<ChunkRef> write_chunk(const StagingHandle& handle,
                                 std::uint32_t index,
                                 const std::vector<std::uint8_t>& bytes,
                                 const std::string& digest) override;

    std::optional<std::string> digest_before_merge(const std::vector<ChunkRef>& ordered) const override;

    Result<MergeOutput> finalize(const StagingHandle& handle,
                                 const std::vector<ChunkRef>& ordered) override;

    Result<void> abort(const StagingHandle& handle) override;

    Result<bool> staging_exists(const StagingHandle& handle) const override;

    Result<DownloadHandle> read_final(const std::string& location) override;

    Result<void> discard_final(const std::string& location) override;

    static constexpr std::uint32_t kMaxParts = 10000;

private:
    using PartMap = std::map<std::uint32_t, PartInfo>;

    // Part already stored under this number; the upload's part list is loaded on first use
    Result<std::optional<PartInfo>> stored_part(const StagingHandle& handle, std::uint32_t part_number);

    void remember(const std::string& upload_id, const PartInfo& part);

    void forget(const std::string& upload_id);

    std::shared_ptr<ObjectStore> store_;
    RemoteBackendOptions options_;

    std::mutex parts_mutex_;
    std::map<std::string, PartMap> parts_;   // upload id -> parts
};

} // namespace fmp::storage
