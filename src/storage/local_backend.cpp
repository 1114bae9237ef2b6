#include "fmp/storage/local_backend.hpp"

#include "fmp/core/hash.hpp"
#include "fmp/core/id.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <system_error>

namespace fmp::storage {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

bool is_safe_component(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

std::string hash_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return {};
    }
    crypto::Sha256 hasher;
    char buffer[kCopyBufferSize];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        hasher.update(buffer, static_cast<std::size_t>(input.gcount()));
    }
    return hasher.finish_hex();
}

Result<void> ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec && !fs::is_directory(dir)) {
        return Err<void>(make_error(ErrorCode::BackendIOError,
                                    "Failed to create directory: " + dir.string()));
    }
    return Ok();
}

} // namespace

LocalBackend::LocalBackend(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_ / "staging", ec);
    fs::create_directories(root_ / "objects", ec);
    if (ec) {
        spdlog::warn("[LocalBackend] could not prepare {}: {}", root_.string(), ec.message());
    }
}

std::string LocalBackend::chunk_file_name(std::uint32_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk-%08u", index);
    return name;
}

fs::path LocalBackend::staging_dir(const std::string& session_id) const {
    return root_ / "staging" / session_id;
}

Result<StagingHandle> LocalBackend::open_staging_area(const std::string& session_id,
                                                      const std::string&) {
    if (!is_safe_component(session_id)) {
        return Fail<StagingHandle>(ErrorCode::InvalidRequest, "Invalid session id for staging: " + session_id);
    }

    const auto dir = staging_dir(session_id);
    if (auto res = ensure_directory(dir); res.is_error()) {
        return Err<StagingHandle>(res.error());
    }

    StagingHandle handle;
    handle.session_id = session_id;
    handle.mode = StorageMode::Local;
    handle.location = dir.string();
    spdlog::debug("[LocalBackend] staging ready session={} dir={}", session_id, handle.location);
    return Ok(handle);
}

Result<ChunkRef> LocalBackend::write_chunk(const StagingHandle& handle,
                                           std::uint32_t index,
                                           const std::vector<std::uint8_t>& bytes,
                                           const std::string& digest) {
    const fs::path dir(handle.location);
    if (!fs::is_directory(dir)) {
        return Fail<ChunkRef>(ErrorCode::BackendIOError, "Staging area missing for session " + handle.session_id);
    }

    ChunkRef ref;
    ref.index = index;
    ref.size = bytes.size();
    ref.digest = digest;
    ref.reference = chunk_file_name(index);

    const fs::path target = dir / ref.reference;
    if (fs::exists(target)) {
        // Retried request: identical bytes are a no-op, anything else is a conflict
        if (hash_file(target) == digest) {
            return Ok(ref);
        }
        return Fail<ChunkRef>(ErrorCode::ChunkConflict,
                              "Chunk " + std::to_string(index) + " already stored with different content");
    }

    // Write beside the target and rename so a crash never leaves a torn chunk
    const fs::path temp = dir / (ref.reference + ".tmp-" + generate_id(4));
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Fail<ChunkRef>(ErrorCode::BackendIOError, "Failed to create chunk file: " + temp.string());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Fail<ChunkRef>(ErrorCode::BackendIOError, "Failed to write chunk file: " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Fail<ChunkRef>(ErrorCode::BackendIOError,
                              "Failed to commit chunk " + std::to_string(index) + ": " + ec.message());
    }

    spdlog::debug("[LocalBackend] stored chunk session={} index={} bytes={}", handle.session_id, index, bytes.size());
    return Ok(ref);
}

Result<MergeOutput> LocalBackend::finalize(const StagingHandle& handle,
                                           const std::vector<ChunkRef>& ordered) {
    const fs::path dir(handle.location);
    if (!fs::is_directory(dir)) {
        return Fail<MergeOutput>(ErrorCode::BackendIOError, "Staging area missing for session " + handle.session_id);
    }

    const std::string shard = handle.session_id.substr(0, std::min<std::size_t>(2, handle.session_id.size()));
    const std::string location = "objects/" + shard + "/" + handle.session_id;
    const fs::path final_path = root_ / location;
    const fs::path partial_path = final_path.string() + ".partial";

    if (auto res = ensure_directory(final_path.parent_path()); res.is_error()) {
        return Err<MergeOutput>(res.error());
    }

    auto fail = [&](const std::string& message) {
        std::error_code ignored;
        fs::remove(partial_path, ignored);
        return Fail<MergeOutput>(ErrorCode::BackendIOError, message);
    };

    std::ofstream out(partial_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail("Failed to create merge output: " + partial_path.string());
    }

    crypto::Sha256 hasher;
    std::uint64_t total = 0;
    char buffer[kCopyBufferSize];

    for (const auto& ref : ordered) {
        const fs::path chunk_path = dir / chunk_file_name(ref.index);
        std::ifstream input(chunk_path, std::ios::binary);
        if (!input) {
            return fail("Chunk file missing during merge: " + chunk_path.string());
        }

        std::uint64_t chunk_bytes = 0;
        while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
            const auto count = static_cast<std::size_t>(input.gcount());
            hasher.update(buffer, count);
            out.write(buffer, static_cast<std::streamsize>(count));
            chunk_bytes += count;
        }
        if (!out) {
            return fail("Failed writing merge output: " + partial_path.string());
        }
        if (chunk_bytes != ref.size) {
            return fail("Chunk " + std::to_string(ref.index) + " has " + std::to_string(chunk_bytes) +
                        " bytes on disk, expected " + std::to_string(ref.size));
        }
        total += chunk_bytes;
    }

    out.flush();
    out.close();
    if (!out) {
        return fail("Failed to flush merge output: " + partial_path.string());
    }

    std::error_code ec;
    fs::rename(partial_path, final_path, ec);
    if (ec) {
        return fail("Failed to publish merged object: " + ec.message());
    }

    fs::remove_all(dir, ec);
    if (ec) {
        // Object is durable; a leftover staging dir is only wasted space
        spdlog::warn("[LocalBackend] could not remove staging {}: {}", dir.string(), ec.message());
    }

    MergeOutput output;
    output.location = location;
    output.content_hash = hasher.finish_hex();
    output.full_content_hash = true;
    output.size = total;

    spdlog::info("[LocalBackend] merged session={} chunks={} bytes={} location={}",
                 handle.session_id, ordered.size(), total, location);
    return Ok(output);
}

Result<void> LocalBackend::abort(const StagingHandle& handle) {
    std::error_code ec;
    fs::remove_all(fs::path(handle.location), ec);
    if (ec) {
        return Err<void>(make_error(ErrorCode::BackendIOError,
                                    "Failed to remove staging " + handle.location + ": " + ec.message()));
    }
    spdlog::debug("[LocalBackend] staging removed session={}", handle.session_id);
    return Ok();
}

Result<bool> LocalBackend::staging_exists(const StagingHandle& handle) const {
    std::error_code ec;
    const bool exists = fs::exists(fs::path(handle.location), ec);
    if (ec) {
        return Fail<bool>(ErrorCode::BackendIOError, "Failed to stat staging: " + ec.message());
    }
    return Ok(exists);
}

Result<fs::path> LocalBackend::resolve_final(const std::string& location) const {
    const fs::path relative(location);
    if (relative.empty() || relative.is_absolute()) {
        return Fail<fs::path>(ErrorCode::InvalidRequest, "Invalid object location: " + location);
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return Fail<fs::path>(ErrorCode::InvalidRequest, "Invalid object location: " + location);
        }
    }
    return Ok(root_ / relative);
}

Result<DownloadHandle> LocalBackend::read_final(const std::string& location) {
    auto resolved = resolve_final(location);
    if (resolved.is_error()) {
        return Err<DownloadHandle>(resolved.error());
    }
    const auto& path = resolved.value();

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Fail<DownloadHandle>(ErrorCode::NotFound, "Object not found: " + location);
    }

    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*stream) {
        return Fail<DownloadHandle>(ErrorCode::BackendIOError, "Failed to open object: " + location);
    }

    DownloadHandle handle;
    handle.kind = DownloadHandle::Kind::Stream;
    handle.size = size;
    handle.stream = std::move(stream);
    return Ok(std::move(handle));
}

Result<void> LocalBackend::discard_final(const std::string& location) {
    auto resolved = resolve_final(location);
    if (resolved.is_error()) {
        return Err<void>(resolved.error());
    }
    std::error_code ec;
    fs::remove(resolved.value(), ec);
    if (ec) {
        return Err<void>(make_error(ErrorCode::BackendIOError,
                                    "Failed to discard " + location + ": " + ec.message()));
    }
    spdlog::debug("[LocalBackend] discarded {}", location);
    return Ok();
}

} // namespace fmp::storage
