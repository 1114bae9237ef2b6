#include "fmp/storage/memory_object_store.hpp"

#include "fmp/core/hash.hpp"
#include "fmp/core/id.hpp"

#include <spdlog/spdlog.h>

namespace fmp::storage {

MemoryObjectStore::MemoryObjectStore(std::shared_ptr<const Clock> clock, std::uint64_t min_part_size)
    : clock_(std::move(clock)), min_part_size_(min_part_size) {}

Result<std::string> MemoryObjectStore::create_multipart_upload(const std::string& key,
                                                               const std::string& content_type) {
    std::lock_guard lock(mutex_);
    const std::string upload_id = generate_id();
    uploads_[upload_id] = OpenUpload{key, content_type, {}};
    spdlog::debug("[MemoryObjectStore] multipart created key={} upload_id={}", key, upload_id);
    return Ok(upload_id);
}

Result<std::optional<std::string>> MemoryObjectStore::find_multipart_upload(const std::string& key) {
    std::lock_guard lock(mutex_);
    for (const auto& [id, upload] : uploads_) {
        if (upload.key == key) {
            return Ok(std::optional<std::string>(id));
        }
    }
    return Ok(std::optional<std::string>());
}

Result<std::string> MemoryObjectStore::upload_part(const std::string& key,
                                                   const std::string& upload_id,
                                                   std::uint32_t part_number,
                                                   const std::vector<std::uint8_t>& bytes,
                                                   const std::string& checksum_sha256) {
    std::lock_guard lock(mutex_);
    if (failing_part_uploads_ > 0) {
        --failing_part_uploads_;
        return Fail<std::string>(ErrorCode::BackendIOError, "Injected upload_part failure");
    }

    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.key != key) {
        return Fail<std::string>(ErrorCode::NotFound, "NoSuchUpload: " + upload_id);
    }
    if (part_number < 1 || part_number > 10000) {
        return Fail<std::string>(ErrorCode::InvalidRequest, "Part number out of range: " + std::to_string(part_number));
    }

    const std::string actual = crypto::sha256_hex(bytes);
    if (!checksum_sha256.empty() && actual != checksum_sha256) {
        return Fail<std::string>(ErrorCode::BackendIOError, "BadDigest for part " + std::to_string(part_number));
    }

    // Like S3, re-uploading a part number replaces it
    StoredPart part;
    part.data = bytes;
    part.checksum_sha256 = actual;
    part.etag = "\"" + actual.substr(0, 32) + "\"";
    std::string etag = part.etag;
    it->second.parts[part_number] = std::move(part);
    return Ok(etag);
}

Result<std::vector<PartInfo>> MemoryObjectStore::list_parts(const std::string& key,
                                                            const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.key != key) {
        return Fail<std::vector<PartInfo>>(ErrorCode::NotFound, "NoSuchUpload: " + upload_id);
    }

    std::vector<PartInfo> parts;
    parts.reserve(it->second.parts.size());
    for (const auto& [number, part] : it->second.parts) {
        parts.push_back(PartInfo{number, part.etag, part.checksum_sha256, part.data.size()});
    }
    return Ok(parts);
}

Result<void> MemoryObjectStore::complete_multipart_upload(const std::string& key,
                                                          const std::string& upload_id,
                                                          const std::vector<CompletedPart>& parts) {
    std::lock_guard lock(mutex_);
    ++complete_calls_;
    if (fail_next_complete_) {
        fail_next_complete_ = false;
        return Err<void>(make_error(ErrorCode::BackendIOError, "Injected complete failure"));
    }

    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.key != key) {
        return Err<void>(make_error(ErrorCode::NotFound, "NoSuchUpload: " + upload_id));
    }
    if (parts.empty()) {
        return Err<void>(make_error(ErrorCode::InvalidRequest, "MalformedXML: no parts"));
    }

    auto& upload = it->second;
    StoredObject object;
    object.content_type = upload.content_type;

    std::uint32_t previous = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto& requested = parts[i];
        if (requested.part_number <= previous) {
            return Err<void>(make_error(ErrorCode::InvalidRequest, "InvalidPartOrder"));
        }
        previous = requested.part_number;

        auto stored = upload.parts.find(requested.part_number);
        if (stored == upload.parts.end() || stored->second.etag != requested.etag) {
            return Err<void>(make_error(ErrorCode::InvalidRequest,
                                        "InvalidPart: " + std::to_string(requested.part_number)));
        }
        if (!requested.checksum_sha256.empty() && requested.checksum_sha256 != stored->second.checksum_sha256) {
            return Err<void>(make_error(ErrorCode::InvalidRequest,
                                        "BadDigest: " + std::to_string(requested.part_number)));
        }
        const bool last = i + 1 == parts.size();
        if (!last && stored->second.data.size() < min_part_size_) {
            return Err<void>(make_error(ErrorCode::InvalidRequest,
                                        "EntityTooSmall: part " + std::to_string(requested.part_number)));
        }
        object.data.insert(object.data.end(), stored->second.data.begin(), stored->second.data.end());
    }

    spdlog::debug("[MemoryObjectStore] multipart completed key={} bytes={}", key, object.data.size());
    objects_[key] = std::move(object);
    uploads_.erase(it);
    return Ok();
}

Result<void> MemoryObjectStore::abort_multipart_upload(const std::string& key,
                                                       const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it != uploads_.end() && it->second.key == key) {
        uploads_.erase(it);
    }
    return Ok();
}

Result<bool> MemoryObjectStore::object_exists(const std::string& key) {
    std::lock_guard lock(mutex_);
    return Ok(objects_.count(key) > 0);
}

Result<void> MemoryObjectStore::delete_object(const std::string& key) {
    std::lock_guard lock(mutex_);
    objects_.erase(key);
    return Ok();
}

Result<PresignedUrl> MemoryObjectStore::presign_get(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard lock(mutex_);
    if (objects_.count(key) == 0) {
        return Fail<PresignedUrl>(ErrorCode::NotFound, "NoSuchKey: " + key);
    }
    PresignedUrl presigned;
    presigned.expires_at = clock_->now() + ttl;
    presigned.url = "memory://objects/" + key + "?expires=" + std::to_string(to_unix_millis(presigned.expires_at) / 1000);
    return Ok(presigned);
}

std::optional<std::vector<std::uint8_t>> MemoryObjectStore::object_data(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second.data;
}

std::size_t MemoryObjectStore::object_count() const {
    std::lock_guard lock(mutex_);
    return objects_.size();
}

std::size_t MemoryObjectStore::open_upload_count() const {
    std::lock_guard lock(mutex_);
    return uploads_.size();
}

std::size_t MemoryObjectStore::complete_calls() const {
    std::lock_guard lock(mutex_);
    return complete_calls_;
}

void MemoryObjectStore::fail_next_part_uploads(std::size_t count) {
    std::lock_guard lock(mutex_);
    failing_part_uploads_ = count;
}

void MemoryObjectStore::fail_next_complete() {
    std::lock_guard lock(mutex_);
    fail_next_complete_ = true;
}

} // namespace fmp::storage
