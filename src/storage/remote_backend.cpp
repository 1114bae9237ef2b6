#include "fmp/storage/remote_backend.hpp"

#include "fmp/core/hash.hpp"

#include <spdlog/spdlog.h>

namespace fmp::storage {

namespace {

// Store-level rejections (EntityTooSmall, InvalidPart, ...) are storage failures to callers
Error as_backend_error(const Error& error, const std::string& context) {
    return make_error(ErrorCode::BackendIOError, context + ": " + error.message);
}

} // namespace

RemoteBackend::RemoteBackend(std::shared_ptr<ObjectStore> store, RemoteBackendOptions options)
    : store_(std::move(store)), options_(std::move(options)) {}

BackendLimits RemoteBackend::limits() const noexcept {
    BackendLimits limits;
    limits.min_chunk_size = options_.min_part_size;
    limits.max_chunks = kMaxParts;
    return limits;
}

Result<StagingHandle> RemoteBackend::open_staging_area(const std::string& session_id,
                                                       const std::string& content_type) {
    StagingHandle handle;
    handle.session_id = session_id;
    handle.mode = StorageMode::Remote;
    handle.location = options_.key_prefix + session_id;

    // Reuse an upload left open by an earlier attempt for the same session
    auto existing = store_->find_multipart_upload(handle.location);
    if (existing.is_error()) {
        return Err<StagingHandle>(as_backend_error(existing.error(), "find multipart upload"));
    }
    if (existing.value()) {
        handle.upload_id = *existing.value();
        spdlog::debug("[RemoteBackend] reusing multipart session={} upload_id={}", session_id, handle.upload_id);
        return Ok(handle);
    }

    auto created = store_->create_multipart_upload(handle.location, content_type);
    if (created.is_error()) {
        return Err<StagingHandle>(as_backend_error(created.error(), "create multipart upload"));
    }
    handle.upload_id = created.value();
    spdlog::debug("[RemoteBackend] multipart opened session={} key={} upload_id={}",
                  session_id, handle.location, handle.upload_id);
    return Ok(handle);
}

Result<std::optional<PartInfo>> RemoteBackend::stored_part(const StagingHandle& handle, std::uint32_t part_number) {
    {
        std::lock_guard lock(parts_mutex_);
        auto it = parts_.find(handle.upload_id);
        if (it != parts_.end()) {
            auto part = it->second.find(part_number);
            if (part == it->second.end()) {
                return Ok(std::optional<PartInfo>());
            }
            return Ok(std::optional<PartInfo>(part->second));
        }
    }

    auto listed = store_->list_parts(handle.location, handle.upload_id);
    if (listed.is_error()) {
        return Err<std::optional<PartInfo>>(as_backend_error(listed.error(), "list parts"));
    }

    std::lock_guard lock(parts_mutex_);
    auto& known = parts_[handle.upload_id];
    for (const auto& part : listed.value()) {
        known.emplace(part.part_number, part);
    }
    auto part = known.find(part_number);
    if (part == known.end()) {
        return Ok(std::optional<PartInfo>());
    }
    return Ok(std::optional<PartInfo>(part->second));
}

void RemoteBackend::remember(const std::string& upload_id, const PartInfo& part) {
    std::lock_guard lock(parts_mutex_);
    parts_[upload_id][part.part_number] = part;
}

void RemoteBackend::forget(const std::string& upload_id) {
    std::lock_guard lock(parts_mutex_);
    parts_.erase(upload_id);
}

Result<ChunkRef> RemoteBackend::write_chunk(const StagingHandle& handle,
                                            std::uint32_t index,
                                            const std::vector<std::uint8_t>& bytes,
                                            const std::string& digest) {
    if (index >= kMaxParts) {
        return Fail<ChunkRef>(ErrorCode::IndexOutOfRange, "Chunk index exceeds multipart part limit");
    }
    const std::uint32_t part_number = index + 1;

    ChunkRef ref;
    ref.index = index;
    ref.size = bytes.size();
    ref.digest = digest;

    auto existing = stored_part(handle, part_number);
    if (existing.is_error()) {
        return Err<ChunkRef>(existing.error());
    }
    if (existing.value()) {
        const auto& part = *existing.value();
        if (part.checksum_sha256 == digest && part.size == bytes.size()) {
            ref.reference = part.etag;
            return Ok(ref);
        }
        return Fail<ChunkRef>(ErrorCode::ChunkConflict,
                              "Chunk " + std::to_string(index) + " already stored with different content");
    }

    auto uploaded = store_->upload_part(handle.location, handle.upload_id, part_number, bytes, digest);
    if (uploaded.is_error()) {
        return Err<ChunkRef>(as_backend_error(uploaded.error(), "upload part " + std::to_string(part_number)));
    }
    ref.reference = uploaded.value();

    remember(handle.upload_id, PartInfo{part_number, ref.reference, digest, ref.size});
    spdlog::debug("[RemoteBackend] part stored session={} part={} bytes={}", handle.session_id, part_number, ref.size);
    return Ok(ref);
}

std::optional<std::string> RemoteBackend::digest_before_merge(const std::vector<ChunkRef>& ordered) const {
    crypto::Sha256 hasher;
    for (const auto& ref : ordered) {
        const auto raw = crypto::hex_decode(ref.digest);
        if (raw.size() != crypto::kSha256Size) {
            return std::nullopt;
        }
        hasher.update(raw);
    }
    return "sha256-parts:" + hasher.finish_hex() + "-" + std::to_string(ordered.size());
}

Result<MergeOutput> RemoteBackend::finalize(const StagingHandle& handle,
                                            const std::vector<ChunkRef>& ordered) {
    auto digest = digest_before_merge(ordered);
    if (!digest) {
        return Fail<MergeOutput>(ErrorCode::BackendIOError, "Chunk receipts carry malformed digests");
    }

    std::vector<CompletedPart> parts;
    parts.reserve(ordered.size());
    std::uint64_t total = 0;
    for (const auto& ref : ordered) {
        parts.push_back(CompletedPart{ref.index + 1, ref.reference, ref.digest});
        total += ref.size;
    }

    auto completed = store_->complete_multipart_upload(handle.location, handle.upload_id, parts);
    if (completed.is_error()) {
        return Err<MergeOutput>(as_backend_error(completed.error(), "complete multipart upload"));
    }
    forget(handle.upload_id);

    MergeOutput output;
    output.location = handle.location;
    output.content_hash = *digest;
    output.full_content_hash = false;
    output.size = total;

    spdlog::info("[RemoteBackend] multipart completed session={} parts={} bytes={} key={}",
                 handle.session_id, parts.size(), total, handle.location);
    return Ok(output);
}

Result<void> RemoteBackend::abort(const StagingHandle& handle) {
    forget(handle.upload_id);
    if (handle.upload_id.empty()) {
        return Ok();
    }
    auto aborted = store_->abort_multipart_upload(handle.location, handle.upload_id);
    if (aborted.is_error()) {
        return Err<void>(as_backend_error(aborted.error(), "abort multipart upload"));
    }
    spdlog::debug("[RemoteBackend] multipart aborted session={} upload_id={}", handle.session_id, handle.upload_id);
    return Ok();
}

Result<bool> RemoteBackend::staging_exists(const StagingHandle& handle) const {
    if (handle.upload_id.empty()) {
        return Ok(false);
    }
    auto listed = store_->list_parts(handle.location, handle.upload_id);
    if (listed.is_ok()) {
        return Ok(true);
    }
    if (listed.error().code == ErrorCode::NotFound) {
        return Ok(false);
    }
    return Err<bool>(as_backend_error(listed.error(), "list parts"));
}

Result<DownloadHandle> RemoteBackend::read_final(const std::string& location) {
    auto presigned = store_->presign_get(location, options_.signed_url_ttl);
    if (presigned.is_error()) {
        if (presigned.error().code == ErrorCode::NotFound) {
            return Err<DownloadHandle>(presigned.error());
        }
        return Err<DownloadHandle>(as_backend_error(presigned.error(), "presign"));
    }

    DownloadHandle handle;
    handle.kind = DownloadHandle::Kind::SignedUrl;
    handle.url = presigned.value().url;
    handle.expires_at = presigned.value().expires_at;
    return Ok(std::move(handle));
}

Result<void> RemoteBackend::discard_final(const std::string& location) {
    auto deleted = store_->delete_object(location);
    if (deleted.is_error()) {
        return Err<void>(as_backend_error(deleted.error(), "delete object"));
    }
    spdlog::debug("[RemoteBackend] discarded {}", location);
    return Ok();
}

} // namespace fmp::storage
