#include "fmp/upload/engine.hpp"

#include "fmp/core/filename.hpp"
#include "fmp/core/hash.hpp"
#include "fmp/core/id.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace fmp::upload {

namespace {

constexpr const char* kDefaultContentType = "application/octet-stream";
constexpr const char* kDefaultFilename = "unnamed";

bool is_sha256_hex(const std::string& text) {
    return text.size() == 64 &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isxdigit(c); });
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

ChunkResult make_result(const UploadSession& session, bool duplicate) {
    ChunkResult result;
    result.status = session.status();
    result.progress_percent = session.tracker().progress_percent();
    result.missing_chunks = session.tracker().missing();
    result.duplicate = duplicate;
    result.final_location = session.data().final_location;
    return result;
}

events::UploadCompletedEvent completed_event(const SessionData& d) {
    events::UploadCompletedEvent event;
    event.owner_id = d.owner_id;
    event.session_id = d.id;
    event.final_location = d.final_location.value_or("");
    event.size = d.total_size;
    event.content_hash = d.content_hash.value_or("");
    event.declared_hash = d.declared_hash.value_or("");
    event.filename = d.filename;
    event.content_type = d.content_type;
    event.mode = d.staging.mode;
    event.deduplicated = d.deduplicated;
    return event;
}

void log_if_error(const Result<void>& res, const std::string& session_id, const char* what) {
    if (res.is_error()) {
        spdlog::error("[UploadEngine] session={} {}: {}", session_id, what, res.error().message);
    }
}

} // namespace

UploadEngine::UploadEngine(storage::StorageBackend& backend,
                           SessionLedger& ledger,
                           DedupIndex& dedup,
                           events::EventBus& bus,
                           std::shared_ptr<const Clock> clock,
                           EngineOptions options)
    : backend_(backend),
      ledger_(ledger),
      bus_(bus),
      clock_(std::move(clock)),
      options_(options),
      coordinator_(backend, dedup) {}

std::string UploadEngine::resume_key(const std::string& owner_id,
                                     const std::string& declared_hash,
                                     std::uint64_t total_size,
                                     std::uint64_t chunk_size) {
    return owner_id + '\x1f' + declared_hash + '\x1f' + std::to_string(total_size) + '\x1f' +
           std::to_string(chunk_size);
}

UploadEngine::SlotPtr UploadEngine::find_slot(const std::string& session_id) const {
    std::shared_lock lock(slots_mutex_);
    auto it = slots_.find(session_id);
    return it == slots_.end() ? nullptr : it->second;
}

std::vector<UploadEngine::SlotPtr> UploadEngine::all_slots() const {
    std::shared_lock lock(slots_mutex_);
    std::vector<SlotPtr> out;
    out.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
        out.push_back(slot);
    }
    return out;
}

std::vector<events::UploadCompletedEvent> UploadEngine::completed_uploads() const {
    std::vector<events::UploadCompletedEvent> out;
    for (const auto& slot : all_slots()) {
        std::lock_guard lock(slot->mutex);
        if (!slot->removed && slot->session.status() == SessionStatus::Completed) {
            out.push_back(completed_event(slot->session.data()));
        }
    }
    return out;
}

std::size_t UploadEngine::session_count() const {
    std::shared_lock lock(slots_mutex_);
    return slots_.size();
}

void UploadEngine::save_locked(const Slot& slot) {
    log_if_error(ledger_.save(slot.session), slot.session.id(), "ledger save failed");
}

void UploadEngine::forget_resume_locked(const UploadSession& session) {
    const auto& d = session.data();
    if (!d.declared_hash) {
        return;
    }
    const auto key = resume_key(d.owner_id, *d.declared_hash, d.total_size, d.chunk_size);
    std::lock_guard lock(resume_mutex_);
    auto it = resume_index_.find(key);
    if (it != resume_index_.end() && it->second == d.id) {
        resume_index_.erase(it);
    }
}

void UploadEngine::reclaim_staging_locked(const UploadSession& session) {
    log_if_error(backend_.abort(session.data().staging), session.id(), "staging abort failed");
}

events::UploadExpiredEvent UploadEngine::expire_locked(Slot& slot, Timestamp now) {
    auto& session = slot.session;
    events::UploadExpiredEvent event;
    event.owner_id = session.owner_id();
    event.session_id = session.id();
    event.chunks_received = session.tracker().received_count();
    event.total_chunks = session.tracker().total_chunks();

    log_if_error(session.mark_expired(now), session.id(), "expire");
    reclaim_staging_locked(session);
    forget_resume_locked(session);
    save_locked(slot);
    return event;
}

// ════════════════════════════════════════════════════════
// Startup
// ════════════════════════════════════════════════════════

Result<std::size_t> UploadEngine::recover() {
    auto loaded = ledger_.load_all();
    if (loaded.is_error()) {
        return Err<std::size_t>(loaded.error());
    }

    const auto now = clock_->now();
    std::size_t restored = 0;

    for (auto& session : loaded.value()) {
        bool changed = false;
        const auto status = session.status();

        if (!is_terminal(status) && session.data().staging.mode != backend_.mode()) {
            log_if_error(session.mark_failed("storage mode changed since the upload started", now),
                         session.id(), "recover");
            changed = true;
        } else if (status == SessionStatus::Merging) {
            spdlog::warn("[UploadEngine] session={} was merging at shutdown, failing it", session.id());
            log_if_error(session.mark_failed("interrupted by restart during merge", now), session.id(), "recover");
            reclaim_staging_locked(session);
            changed = true;
        } else if (status == SessionStatus::Pending || status == SessionStatus::Uploading) {
            auto exists = backend_.staging_exists(session.data().staging);
            if (exists.is_error()) {
                spdlog::warn("[UploadEngine] session={} staging check failed: {}", session.id(),
                             exists.error().message);
            } else if (!exists.value()) {
                log_if_error(session.mark_failed("staging area lost", now), session.id(), "recover");
                changed = true;
            }
        }

        const std::string id = session.id();
        auto slot = std::make_shared<Slot>(std::move(session));
        {
            std::lock_guard slot_lock(slot->mutex);
            if (changed) {
                save_locked(*slot);
            }
            const auto& d = slot->session.data();
            const bool resumable = d.status == SessionStatus::Pending || d.status == SessionStatus::Uploading;
            if (resumable && d.declared_hash) {
                std::lock_guard lock(resume_mutex_);
                resume_index_[resume_key(d.owner_id, *d.declared_hash, d.total_size, d.chunk_size)] = id;
            }
        }

        std::unique_lock lock(slots_mutex_);
        if (slots_.emplace(id, std::move(slot)).second) {
            ++restored;
        }
    }

    spdlog::info("[UploadEngine] restored {} sessions from ledger", restored);
    return Ok(restored);
}

// ════════════════════════════════════════════════════════
// Initialization
// ════════════════════════════════════════════════════════

Result<InitResult> UploadEngine::try_resume(const std::string& key, const std::string& owner_id) {
    std::string session_id;
    {
        std::lock_guard lock(resume_mutex_);
        auto it = resume_index_.find(key);
        if (it == resume_index_.end()) {
            return Fail<InitResult>(ErrorCode::SessionNotFound, "no resumable session");
        }
        session_id = it->second;
    }

    auto slot = find_slot(session_id);
    if (!slot) {
        return Fail<InitResult>(ErrorCode::SessionNotFound, "no resumable session");
    }

    InitResult result;
    events::UploadInitializedEvent event;
    {
        std::lock_guard lock(slot->mutex);
        const auto& session = slot->session;
        const auto status = session.status();
        if (slot->removed || session.owner_id() != owner_id ||
            (status != SessionStatus::Pending && status != SessionStatus::Uploading) ||
            session.past_deadline(clock_->now())) {
            return Fail<InitResult>(ErrorCode::SessionNotFound, "no resumable session");
        }
        result.session = session.view();
        result.resumed = true;

        event.owner_id = owner_id;
        event.session_id = session.id();
        event.filename = session.data().filename;
        event.total_size = session.data().total_size;
        event.total_chunks = session.data().total_chunks;
        event.mode = session.data().staging.mode;
        event.resumed = true;
    }
    bus_.emit(event);
    return Ok(std::move(result));
}

Result<InitResult> UploadEngine::initialize_upload(const UploadRequest& request) {
    if (request.owner_id.empty()) {
        return Fail<InitResult>(ErrorCode::InvalidRequest, "owner id is required");
    }
    if (request.total_size == 0) {
        return Fail<InitResult>(ErrorCode::InvalidRequest, "total size must be greater than zero");
    }
    if (request.total_size > options_.max_file_size) {
        return Fail<InitResult>(ErrorCode::InvalidRequest,
                                "total size exceeds the maximum of " + std::to_string(options_.max_file_size) +
                                    " bytes");
    }

    const std::uint64_t chunk_size = request.chunk_size != 0 ? request.chunk_size : options_.default_chunk_size;
    const std::uint64_t total_chunks = UploadSession::chunk_count(request.total_size, chunk_size);
    const auto limits = backend_.limits();
    const std::uint32_t max_chunks = std::min(limits.max_chunks, options_.max_chunks);
    if (total_chunks == 0 || total_chunks > max_chunks) {
        return Fail<InitResult>(ErrorCode::InvalidRequest,
                                "upload would need " + std::to_string(total_chunks) + " chunks, limit is " +
                                    std::to_string(max_chunks) + "; use a larger chunk size");
    }
    if (total_chunks > 1 && chunk_size < limits.min_chunk_size) {
        return Fail<InitResult>(ErrorCode::InvalidRequest,
                                "chunk size must be at least " + std::to_string(limits.min_chunk_size) + " bytes");
    }

    if (!request.content_type.empty() && !is_valid_media_type(request.content_type)) {
        return Fail<InitResult>(ErrorCode::InvalidRequest, "content type must look like type/subtype");
    }

    std::optional<std::string> declared_hash;
    if (request.declared_hash && !request.declared_hash->empty()) {
        declared_hash = lowercase(*request.declared_hash);
        if (!is_sha256_hex(*declared_hash)) {
            return Fail<InitResult>(ErrorCode::InvalidRequest, "declared hash must be 64 hex characters (SHA-256)");
        }
    }

    std::unique_lock init_lock(init_mutex_, std::defer_lock);
    std::string key;
    if (declared_hash) {
        init_lock.lock();
        key = resume_key(request.owner_id, *declared_hash, request.total_size, chunk_size);
        auto resumed = try_resume(key, request.owner_id);
        if (resumed.is_ok()) {
            return resumed;
        }
    }

    const auto now = clock_->now();
    SessionData data;
    data.id = generate_id();
    data.owner_id = request.owner_id;
    data.filename = sanitize_filename(request.filename);
    if (data.filename.empty()) {
        data.filename = kDefaultFilename;
    }
    data.content_type = request.content_type.empty() ? kDefaultContentType : request.content_type;
    data.total_size = request.total_size;
    data.chunk_size = chunk_size;
    data.total_chunks = static_cast<std::uint32_t>(total_chunks);
    data.declared_hash = declared_hash;
    data.status = SessionStatus::Pending;
    data.created_at = now;
    data.updated_at = now;
    data.expires_at = now + options_.session_ttl;

    auto staging = backend_.open_staging_area(data.id, data.content_type);
    if (staging.is_error()) {
        spdlog::error("[UploadEngine] staging open failed session={}: {}", data.id, staging.error().message);
        return Err<InitResult>(staging.error());
    }
    data.staging = staging.value();

    auto slot = std::make_shared<Slot>(UploadSession(std::move(data), ChunkTracker(static_cast<std::uint32_t>(total_chunks))));
    const auto& session = slot->session;

    if (auto saved = ledger_.save(session); saved.is_error()) {
        reclaim_staging_locked(session);
        return Err<InitResult>(saved.error());
    }

    InitResult result;
    result.session = session.view();

    events::UploadInitializedEvent event;
    event.owner_id = session.owner_id();
    event.session_id = session.id();
    event.filename = session.data().filename;
    event.total_size = session.data().total_size;
    event.total_chunks = session.data().total_chunks;
    event.mode = session.data().staging.mode;

    {
        std::unique_lock lock(slots_mutex_);
        slots_.emplace(session.id(), slot);
    }
    if (declared_hash) {
        std::lock_guard lock(resume_mutex_);
        resume_index_[key] = result.session.id;
    }
    if (init_lock.owns_lock()) {
        init_lock.unlock();
    }

    bus_.emit(event);
    return Ok(std::move(result));
}

// ════════════════════════════════════════════════════════
// Chunks
// ════════════════════════════════════════════════════════

Result<ChunkResult> UploadEngine::accept_chunk(const std::string& owner_id,
                                               const std::string& session_id,
                                               std::uint32_t index,
                                               const std::vector<std::uint8_t>& bytes) {
    auto slot = find_slot(session_id);
    if (!slot) {
        return Fail<ChunkResult>(ErrorCode::SessionNotFound, "Unknown upload session " + session_id);
    }

    const std::string digest = crypto::sha256_hex(bytes);
    std::unique_lock lock(slot->mutex);
    auto& session = slot->session;

    // Validate, waiting out any in-flight write of the same index
    while (true) {
        if (slot->removed) {
            return Fail<ChunkResult>(ErrorCode::SessionNotFound, "Unknown upload session " + session_id);
        }
        if (session.owner_id() != owner_id) {
            return Fail<ChunkResult>(ErrorCode::Forbidden, "Session belongs to another account");
        }
        const auto now = clock_->now();
        if (!is_terminal(session.status()) && session.past_deadline(now)) {
            auto event = expire_locked(*slot, now);
            lock.unlock();
            bus_.emit(event);
            return Fail<ChunkResult>(ErrorCode::Expired, "Upload session has expired");
        }
        if (session.status() == SessionStatus::Expired) {
            return Fail<ChunkResult>(ErrorCode::Expired, "Upload session has expired");
        }
        if (is_terminal(session.status())) {
            return Fail<ChunkResult>(ErrorCode::SessionClosed,
                                     std::string("Upload session is ") + to_string(session.status()));
        }
        if (index >= session.data().total_chunks) {
            return Fail<ChunkResult>(ErrorCode::IndexOutOfRange,
                                     "Chunk index " + std::to_string(index) + " out of range [0, " +
                                         std::to_string(session.data().total_chunks) + ")");
        }
        const auto expected = session.expected_chunk_length(index);
        if (bytes.size() != expected) {
            return Fail<ChunkResult>(ErrorCode::InvalidRequest,
                                     "Chunk " + std::to_string(index) + " must be " + std::to_string(expected) +
                                         " bytes, got " + std::to_string(bytes.size()));
        }
        if (!session.tracker().in_flight(index)) {
            break;
        }
        slot->chunk_done.wait(lock);
    }

    switch (session.tracker().check(index, digest)) {
        case ChunkTracker::MarkOutcome::Duplicate: {
            auto result = make_result(session, true);
            events::ChunkAcceptedEvent event{session.id(), index, session.data().total_chunks, bytes.size(), true};
            lock.unlock();
            bus_.emit(event);
            return Ok(std::move(result));
        }
        case ChunkTracker::MarkOutcome::Conflict:
            return Fail<ChunkResult>(ErrorCode::ChunkConflict,
                                     "Chunk " + std::to_string(index) + " was already received with different content");
        case ChunkTracker::MarkOutcome::Added:
            break;
    }

    session.tracker().reserve(index);
    const auto staging = session.data().staging;
    lock.unlock();

    auto written = backend_.write_chunk(staging, index, bytes, digest);

    lock.lock();
    session.tracker().release(index);
    slot->chunk_done.notify_all();

    if (written.is_error()) {
        spdlog::warn("[UploadEngine] session={} chunk={} write failed: {}", session_id, index, written.error().message);
        return Err<ChunkResult>(written.error());
    }
    if (slot->removed) {
        return Fail<ChunkResult>(ErrorCode::SessionNotFound, "Unknown upload session " + session_id);
    }
    if (session.status() == SessionStatus::Expired) {
        return Fail<ChunkResult>(ErrorCode::Expired, "Upload session expired while the chunk was written");
    }
    if (is_terminal(session.status())) {
        return Fail<ChunkResult>(ErrorCode::SessionClosed,
                                 std::string("Upload session is ") + to_string(session.status()));
    }

    const auto now = clock_->now();
    session.tracker().mark(written.value());
    session.touch(now);
    if (session.status() == SessionStatus::Pending) {
        log_if_error(session.transition_to(SessionStatus::Uploading, now), session_id, "transition");
    }

    // Exactly one caller observes the set becoming complete while uploading
    bool merge_owner = false;
    if (session.tracker().complete() && session.status() == SessionStatus::Uploading) {
        log_if_error(session.transition_to(SessionStatus::Merging, now), session_id, "transition");
        forget_resume_locked(session);
        merge_owner = true;
    }
    save_locked(*slot);

    auto result = make_result(session, false);
    events::ChunkAcceptedEvent event{session.id(), index, session.data().total_chunks, bytes.size(), false};
    lock.unlock();
    bus_.emit(event);

    if (merge_owner) {
        return run_merge(slot);
    }
    return Ok(std::move(result));
}

Result<ChunkResult> UploadEngine::fail_merge(std::unique_lock<std::mutex>& lock,
                                             Slot& slot,
                                             const Error& error,
                                             Timestamp now) {
    auto& session = slot.session;
    spdlog::error("[UploadEngine] session={} merge failed: {}", session.id(), error.message);
    log_if_error(session.mark_failed(error.message, now), session.id(), "fail");
    reclaim_staging_locked(session);
    save_locked(slot);

    events::UploadFailedEvent event{session.owner_id(), session.id(), error.message, false};
    lock.unlock();
    bus_.emit(event);
    return Err<ChunkResult>(error);
}

Result<ChunkResult> UploadEngine::run_merge(const SlotPtr& slot) {
    MergePlan plan;
    {
        std::lock_guard lock(slot->mutex);
        const auto& session = slot->session;
        plan.session_id = session.id();
        plan.staging = session.data().staging;
        plan.total_chunks = session.data().total_chunks;
        plan.ordered = session.tracker().ordered_receipts();
        plan.declared_hash = session.data().declared_hash;
    }

    const auto started = std::chrono::steady_clock::now();
    auto outcome = coordinator_.merge(plan);
    const auto duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    std::unique_lock lock(slot->mutex);
    auto& session = slot->session;
    const auto now = clock_->now();

    if (session.status() != SessionStatus::Merging) {
        // The reaper expired the session while finalize ran; a merged object stays for dedup
        spdlog::warn("[UploadEngine] session={} became {} during merge", plan.session_id, to_string(session.status()));
        return Fail<ChunkResult>(session.status() == SessionStatus::Expired ? ErrorCode::Expired
                                                                            : ErrorCode::SessionClosed,
                                 std::string("Upload session is ") + to_string(session.status()));
    }

    if (outcome.is_error()) {
        return fail_merge(lock, *slot, outcome.error(), now);
    }

    const auto& merged = outcome.value();
    auto completed = session.mark_completed(merged.location, merged.content_hash, merged.deduplicated, now);
    if (completed.is_error()) {
        return fail_merge(lock, *slot, completed.error(), now);
    }
    save_locked(*slot);

    auto event = completed_event(session.data());
    event.duration = duration;

    auto result = make_result(session, false);
    lock.unlock();
    bus_.emit(event);
    return Ok(std::move(result));
}

// ════════════════════════════════════════════════════════
// Queries and lifecycle
// ════════════════════════════════════════════════════════

Result<SessionView> UploadEngine::get_session_status(const std::string& owner_id,
                                                     const std::string& session_id) const {
    auto slot = find_slot(session_id);
    if (!slot) {
        return Fail<SessionView>(ErrorCode::SessionNotFound, "Unknown upload session " + session_id);
    }
    std::lock_guard lock(slot->mutex);
    if (slot->removed) {
        return Fail<SessionView>(ErrorCode::SessionNotFound, "Unknown upload session " + session_id);
    }
    if (slot->session.owner_id() != owner_id) {
        return Fail<SessionView>(ErrorCode::Forbidden, "Session belongs to another account");
    }
    return Ok(slot->session.view());
}

Result<SessionView> UploadEngine::abort_upload(const std::string& owner_id, const std::string& session_id) {
    auto slot = find_slot(session_id);
    if (!slot) {
        return Fail<SessionView>(ErrorCode::SessionNotFound, "Unknown upload session " + session_id);
    }

    std::unique_lock lock(slot->mutex);
    auto& session = slot->session;
    if (slot->removed) {
        return Fail<SessionView>(ErrorCode::SessionNotFound, "Unknown upload session " + session_id);
    }
    if (session.owner_id() != owner_id) {
        return Fail<SessionView>(ErrorCode::Forbidden, "Session belongs to another account");
    }
    if (session.status() == SessionStatus::Expired) {
        return Fail<SessionView>(ErrorCode::Expired, "Upload session has expired");
    }
    if (session.status() != SessionStatus::Pending && session.status() != SessionStatus::Uploading) {
        return Fail<SessionView>(ErrorCode::SessionClosed,
                                 std::string("Upload session is ") + to_string(session.status()));
    }

    auto failed = session.mark_failed("aborted by owner", clock_->now());
    if (failed.is_error()) {
        return Err<SessionView>(failed.error());
    }
    reclaim_staging_locked(session);
    forget_resume_locked(session);
    save_locked(*slot);

    auto view = session.view();
    events::UploadFailedEvent event{session.owner_id(), session.id(), "aborted by owner", true};
    lock.unlock();
    bus_.emit(event);
    return Ok(std::move(view));
}

std::size_t UploadEngine::expire_stale() {
    const auto now = clock_->now();
    std::vector<events::UploadExpiredEvent> expired;

    for (const auto& slot : all_slots()) {
        std::lock_guard lock(slot->mutex);
        if (slot->removed) {
            continue;
        }
        const auto& session = slot->session;
        if (is_terminal(session.status()) || !session.past_deadline(now)) {
            continue;
        }
        expired.push_back(expire_locked(*slot, now));
    }

    for (const auto& event : expired) {
        bus_.emit(event);
    }
    return expired.size();
}

std::size_t UploadEngine::purge_terminal() {
    const auto now = clock_->now();
    std::vector<std::string> purged;

    for (const auto& slot : all_slots()) {
        std::lock_guard lock(slot->mutex);
        const auto& session = slot->session;
        if (slot->removed || !is_terminal(session.status())) {
            continue;
        }
        if (now - session.data().updated_at < options_.terminal_retention) {
            continue;
        }
        if (auto res = ledger_.remove(session.id()); res.is_error()) {
            spdlog::warn("[UploadEngine] session={} ledger removal failed: {}", session.id(), res.error().message);
            continue;
        }
        slot->removed = true;
        purged.push_back(session.id());
    }

    if (!purged.empty()) {
        std::unique_lock lock(slots_mutex_);
        for (const auto& id : purged) {
            slots_.erase(id);
        }
        spdlog::debug("[UploadEngine] purged {} terminal sessions", purged.size());
    }
    return purged.size();
}

} // namespace fmp::upload
