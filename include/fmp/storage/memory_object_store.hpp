#pragma once

#include "fmp/storage/object_store.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace fmp::storage {

/**
 * @brief In-process object store with S3 multipart semantics
 *
 * Backs the remote backend in tests and in the `memory://` dev mode.
 * Enforces the same rules S3 does on complete: parts listed in ascending
 * order, ETags matching, every part but the last at least min_part_size.
 */
class MemoryObjectStore final : public ObjectStore {
public:
    explicit MemoryObjectStore(std::shared_ptr<const Clock> clock,
                               std::uint64_t min_part_size = 5ull * 1024 * 1024);

    Result<std::string> create_multipart_upload(const std::string& key,
                                                const std::string& content_type) override;

    Result<std::optional<std::string>> find_multipart_upload(const std::string& key) override;

    Result<std::string> upload_part(const std::string& key,
                                    const std::string& upload_id,
                                    std::uint32_t part_number,
                                    const std::vector<std::uint8_t>& bytes,
                                    const std::string& checksum_sha256) override;

    Result<std::vector<PartInfo>> list_parts(const std::string& key,
                                             const std::string& upload_id) override;

    Result<void> complete_multipart_upload(const std::string& key,
                                           const std::string& upload_id,
                                           const std::vector<CompletedPart>& parts) override;

    Result<void> abort_multipart_upload(const std::string& key,
                                        const std::string& upload_id) override;

    Result<bool> object_exists(const std::string& key) override;

    Result<void> delete_object(const std::string& key) override;

    Result<PresignedUrl> presign_get(const std::string& key, std::chrono::seconds ttl) override;

    // Inspection and fault injection for tests

    std::optional<std::vector<std::uint8_t>> object_data(const std::string& key) const;
    std::size_t object_count() const;
    std::size_t open_upload_count() const;
    std::size_t complete_calls() const;

    /// The next `count` upload_part calls fail with BackendIOError
    void fail_next_part_uploads(std::size_t count);

    /// The next complete_multipart_upload call fails with BackendIOError
    void fail_next_complete();

private:
    struct StoredPart {
        std::vector<std::uint8_t> data;
        std::string etag;
        std::string checksum_sha256;
    };

    struct OpenUpload {
        std::string key;
        std::string content_type;
        std::map<std::uint32_t, StoredPart> parts;
    };

    struct StoredObject {
        std::vector<std::uint8_t> data;
        std::string content_type;
    };

    std::shared_ptr<const Clock> clock_;
    std::uint64_t min_part_size_;

    mutable std::mutex mutex_;
    std::map<std::string, OpenUpload> uploads_;   // upload id -> upload
    std::map<std::string, StoredObject> objects_;
    std::size_t complete_calls_ = 0;
    std::size_t failing_part_uploads_ = 0;
    bool fail_next_complete_ = false;
};

} // namespace fmp::storage
