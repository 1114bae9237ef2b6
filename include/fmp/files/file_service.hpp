#pragma once

/**
 * @file file_service.hpp
 * @brief Owner-scoped file operations on top of FileCatalog
 *
 * WHY THIS FILE EXISTS:
 * The upload engine only knows sessions. Accounts see files: this service
 * turns each UploadCompletedEvent into a FileRecord and answers list, get,
 * rename, delete and download on behalf of the owner.
 *
 * Every call checks the caller owns the record (Forbidden otherwise).
 * Deleted records answer NotFound.
 */

#include "fmp/core/clock.hpp"
#include "fmp/core/result.hpp"
#include "fmp/events/components.hpp"
#include "fmp/events/event_bus.hpp"
#include "fmp/events/events.hpp"
#include "fmp/files/file_catalog.hpp"
#include "fmp/storage/storage_backend.hpp"

#include <memory>
#include <optional>
#include <string>

namespace fmp::files {

struct Download {
    FileRecord record;
    storage::DownloadHandle handle;
};

class FileService {
public:
    static constexpr std::size_t kMaxPageSize = 100;

    FileService(FileCatalog& catalog,
                storage::StorageBackend& backend,
                events::EventBus& bus,
                std::shared_ptr<const Clock> clock,
                std::size_t default_page_size = 20);

    FileService(const FileService&) = delete;
    FileService& operator=(const FileService&) = delete;

    /// limit 0 selects the default page size; larger limits are capped
    FilePage list(const std::string& owner_id, std::size_t limit, std::size_t offset) const;

    Result<FileRecord> get(const std::string& owner_id, const std::string& file_id) const;

    Result<FileRecord> rename(const std::string& owner_id, const std::string& file_id, const std::string& filename);

    /// Soft delete; the stored object stays, it may back other records
    Result<FileRecord> remove(const std::string& owner_id, const std::string& file_id);

    /// Record produced by an upload session, if any; owner-checked
    std::optional<FileRecord> find_for_session(const std::string& owner_id, const std::string& session_id) const;

    /// Resolves the object and counts the access
    Result<Download> open_download(const std::string& owner_id, const std::string& file_id);

    /**
     * @brief Create the record for a completed upload
     *
     * Idempotent per session: a second call returns the existing record.
     * Called from the UploadCompletedEvent subscription.
     */
    Result<FileRecord> record_completed_upload(const events::UploadCompletedEvent& event);

private:
    Result<FileRecord> owned(const std::string& owner_id, const std::string& file_id) const;

    FileCatalog& catalog_;
    storage::StorageBackend& backend_;
    events::EventBus& bus_;
    std::shared_ptr<const Clock> clock_;
    std::size_t default_page_size_;
    events::SubscriptionSet subscriptions_;
};

} // namespace fmp::files
