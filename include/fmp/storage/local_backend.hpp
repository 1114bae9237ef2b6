#pragma once

#include "fmp/storage/storage_backend.hpp"

#include <filesystem>

namespace fmp::storage {

/**
 * @brief Filesystem variant
 *
 * Layout under root:
 *   staging/<session_id>/chunk-00000000   one file per chunk
 *   objects/<ab>/<session_id>             merged objects, sharded by id prefix
 *
 * Final locations are returned relative to root ("objects/ab/abcd...") so
 * the data directory can be relocated without rewriting records.
 */
class LocalBackend final : public StorageBackend {
public:
    explicit LocalBackend(std::filesystem::path root);

    StorageMode mode() const noexcept override { return StorageMode::Local; }

    Result<StagingHandle> open_staging_area(const std::string& session_id,
                                            const std::string& content_type) override;

    Result<ChunkRef> write_chunk(const StagingHandle& handle,
                                 std::uint32_t index,
                                 const std::vector<std::uint8_t>& bytes,
                                 const std::string& digest) override;

    std::optional<std::string> digest_before_merge(const std::vector<ChunkRef>&) const override {
        return std::nullopt;
    }

    Result<MergeOutput> finalize(const StagingHandle& handle,
                                 const std::vector<ChunkRef>& ordered) override;

    Result<void> abort(const StagingHandle& handle) override;

    Result<bool> staging_exists(const StagingHandle& handle) const override;

    Result<DownloadHandle> read_final(const std::string& location) override;

    Result<void> discard_final(const std::string& location) override;

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    static std::string chunk_file_name(std::uint32_t index);

    std::filesystem::path staging_dir(const std::string& session_id) const;

    Result<std::filesystem::path> resolve_final(const std::string& location) const;

    std::filesystem::path root_;
};

} // namespace fmp::storage
