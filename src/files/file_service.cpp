#include "fmp/files/file_service.hpp"

#include "fmp/core/filename.hpp"
#include "fmp/core/id.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace fmp::files {

FileService::FileService(FileCatalog& catalog,
                         storage::StorageBackend& backend,
                         events::EventBus& bus,
                         std::shared_ptr<const Clock> clock,
                         std::size_t default_page_size)
    : catalog_(catalog),
      backend_(backend),
      bus_(bus),
      clock_(std::move(clock)),
      default_page_size_(default_page_size == 0 ? 20 : default_page_size),
      subscriptions_(bus) {
    subscriptions_.add<events::UploadCompletedEvent>([this](const events::UploadCompletedEvent& event) {
        auto res = record_completed_upload(event);
        if (res.is_error()) {
            spdlog::error("[FileService] no record for session={}: {}", event.session_id, res.error().message);
        }
    });
}

Result<FileRecord> FileService::owned(const std::string& owner_id, const std::string& file_id) const {
    auto found = catalog_.get(file_id);
    if (found.is_error()) {
        return found;
    }
    const auto& record = found.value();
    if (record.deleted) {
        return Fail<FileRecord>(ErrorCode::NotFound, "File not found: " + file_id);
    }
    if (record.owner_id != owner_id) {
        return Fail<FileRecord>(ErrorCode::Forbidden, "File belongs to another account");
    }
    return found;
}

FilePage FileService::list(const std::string& owner_id, std::size_t limit, std::size_t offset) const {
    const std::size_t effective = limit == 0 ? default_page_size_ : std::min(limit, kMaxPageSize);
    return catalog_.list(owner_id, effective, offset);
}

Result<FileRecord> FileService::get(const std::string& owner_id, const std::string& file_id) const {
    return owned(owner_id, file_id);
}

std::optional<FileRecord> FileService::find_for_session(const std::string& owner_id,
                                                       const std::string& session_id) const {
    auto record = catalog_.find_by_session(session_id);
    if (!record || record->owner_id != owner_id || record->deleted) {
        return std::nullopt;
    }
    return record;
}

Result<FileRecord> FileService::rename(const std::string& owner_id,
                                       const std::string& file_id,
                                       const std::string& filename) {
    const auto sanitized = sanitize_filename(filename);
    if (sanitized.empty()) {
        return Fail<FileRecord>(ErrorCode::InvalidRequest, "Filename is empty after sanitizing");
    }

    auto found = owned(owner_id, file_id);
    if (found.is_error()) {
        return found;
    }
    auto record = found.value();
    const std::string old_name = record.filename;
    record.filename = sanitized;
    record.updated_at = clock_->now();

    if (auto res = catalog_.update(record); res.is_error()) {
        return Err<FileRecord>(res.error());
    }
    bus_.emit(events::FileRenamedEvent{owner_id, file_id, old_name, sanitized});
    return Ok(std::move(record));
}

Result<FileRecord> FileService::remove(const std::string& owner_id, const std::string& file_id) {
    auto found = owned(owner_id, file_id);
    if (found.is_error()) {
        return found;
    }
    auto record = found.value();
    const auto now = clock_->now();
    record.deleted = true;
    record.deleted_at = now;
    record.updated_at = now;

    if (auto res = catalog_.update(record); res.is_error()) {
        return Err<FileRecord>(res.error());
    }
    bus_.emit(events::FileDeletedEvent{owner_id, file_id, record.filename});
    return Ok(std::move(record));
}

Result<Download> FileService::open_download(const std::string& owner_id, const std::string& file_id) {
    auto found = owned(owner_id, file_id);
    if (found.is_error()) {
        return Err<Download>(found.error());
    }
    auto record = found.value();

    if (record.mode != backend_.mode()) {
        spdlog::warn("[FileService] file={} stored in {} mode, portal runs {}", file_id,
                     storage::to_string(record.mode), storage::to_string(backend_.mode()));
        return Fail<Download>(ErrorCode::BackendIOError, "File is not reachable in the current storage mode");
    }

    auto handle = backend_.read_final(record.location);
    if (handle.is_error()) {
        spdlog::error("[FileService] file={} location={} unreadable: {}", file_id, record.location,
                      handle.error().message);
        return Err<Download>(handle.error());
    }

    const auto now = clock_->now();
    record.download_count += 1;
    record.last_accessed_at = now;
    if (auto res = catalog_.update(record); res.is_error()) {
        spdlog::warn("[FileService] file={} access not recorded: {}", file_id, res.error().message);
    }

    const bool signed_url = handle.value().kind == storage::DownloadHandle::Kind::SignedUrl;
    bus_.emit(events::FileDownloadedEvent{owner_id, file_id, record.size, signed_url});
    return Ok(Download{std::move(record), std::move(handle.value())});
}

Result<FileRecord> FileService::record_completed_upload(const events::UploadCompletedEvent& event) {
    const auto now = clock_->now();

    FileRecord record;
    record.id = generate_id();
    record.owner_id = event.owner_id;
    record.session_id = event.session_id;
    record.filename = event.filename;
    record.content_type = event.content_type;
    record.size = event.size;
    record.content_hash = event.content_hash;
    record.mode = event.mode;
    record.location = event.final_location;
    record.uploaded_at = now;
    record.updated_at = now;

    auto inserted = catalog_.insert_if_absent(record);
    if (inserted.is_error()) {
        return Err<FileRecord>(inserted.error());
    }
    auto [stored, created] = inserted.value();
    if (created) {
        bus_.emit(events::FileRecordCreatedEvent{stored.owner_id, stored.id, stored.session_id, stored.filename,
                                                 stored.size});
    }
    return Ok(std::move(stored));
}

} // namespace fmp::files
