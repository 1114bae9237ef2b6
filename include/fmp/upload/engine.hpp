#pragma once

/**
 * @file engine.hpp
 * @brief Resumable chunked-upload engine
 *
 * WHY THIS FILE EXISTS:
 * Browsers upload large files as many independent HTTP requests that may be
 * retried, reordered, duplicated, or interrupted by a restart. The engine is
 * the single place that turns that stream of chunk requests into exactly one
 * durable object per upload.
 *
 * CONCURRENCY:
 * - Each session has its own mutex; sessions never block each other
 * - Chunk bytes are written to the backend outside the session lock. The
 *   index is reserved as in-flight first, so a concurrent write of the same
 *   index waits for the outcome instead of racing
 * - The call that removes the last missing index (under the lock) is the
 *   only one that runs the merge, on its own thread, after unlocking
 * - Every state change is saved to the ledger while the lock is held
 *
 * EVENTS (emitted outside any lock):
 * UploadInitializedEvent, ChunkAcceptedEvent, UploadCompletedEvent,
 * UploadFailedEvent, UploadExpiredEvent
 */

#include "fmp/core/clock.hpp"
#include "fmp/core/result.hpp"
#include "fmp/events/event_bus.hpp"
#include "fmp/events/events.hpp"
#include "fmp/storage/storage_backend.hpp"
#include "fmp/upload/dedup_index.hpp"
#include "fmp/upload/merge_coordinator.hpp"
#include "fmp/upload/session.hpp"
#include "fmp/upload/session_ledger.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fmp::upload {

struct EngineOptions {
    std::chrono::seconds session_ttl{24 * 3600};
    std::chrono::seconds terminal_retention{3600};
    std::uint64_t max_file_size = 100ull * 1024 * 1024;
    std::uint64_t default_chunk_size = 5ull * 1024 * 1024;
    // Upper bound on chunks per session, on top of the backend's own limit
    std::uint32_t max_chunks = 10000;
};

class UploadEngine {
public:
    UploadEngine(storage::StorageBackend& backend,
                 SessionLedger& ledger,
                 DedupIndex& dedup,
                 events::EventBus& bus,
                 std::shared_ptr<const Clock> clock,
                 EngineOptions options = {});

    UploadEngine(const UploadEngine&) = delete;
    UploadEngine& operator=(const UploadEngine&) = delete;

    /**
     * @brief Reload the ledger; call once before serving requests
     *
     * Sessions caught in `merging` by a restart are failed and their staging
     * aborted. Live sessions whose staging area has vanished are failed.
     *
     * @return number of sessions restored
     */
    Result<std::size_t> recover();

    /**
     * @brief Create a session, or re-present a resumable one
     *
     * With a declared hash, a pending/uploading session of the same owner,
     * hash, total size and chunk size is returned instead (resumed = true).
     */
    Result<InitResult> initialize_upload(const UploadRequest& request);

    /**
     * @brief Persist one chunk
     *
     * Error order: SessionNotFound, Forbidden, Expired, SessionClosed,
     * IndexOutOfRange, InvalidRequest (wrong length), ChunkConflict,
     * BackendIOError. When this chunk completes the upload the merge runs
     * before returning; a merge failure is returned as its error
     * (BackendIOError, HashMismatch) with the session left `failed`.
     */
    Result<ChunkResult> accept_chunk(const std::string& owner_id,
                                     const std::string& session_id,
                                     std::uint32_t index,
                                     const std::vector<std::uint8_t>& bytes);

    Result<SessionView> get_session_status(const std::string& owner_id, const std::string& session_id) const;

    /// Owner cancel of a pending/uploading session; staging is reclaimed
    Result<SessionView> abort_upload(const std::string& owner_id, const std::string& session_id);

    /**
     * @brief Expire every live session past its deadline
     *
     * Status is re-checked under each session's lock right before mutating.
     * @return number of sessions expired
     */
    std::size_t expire_stale();

    /**
     * @brief Drop terminal sessions whose retention window has elapsed
     * @return number of sessions removed
     */
    std::size_t purge_terminal();

    /// Completion events for every completed session still held, for replay after a restart
    std::vector<events::UploadCompletedEvent> completed_uploads() const;

    std::size_t session_count() const;

    storage::StorageMode mode() const noexcept { return backend_.mode(); }

    const EngineOptions& options() const noexcept { return options_; }

private:
    struct Slot {
        explicit Slot(UploadSession s) : session(std::move(s)) {}

        std::mutex mutex;
        std::condition_variable chunk_done;   // an in-flight index was released
        UploadSession session;
        bool removed = false;
    };

    using SlotPtr = std::shared_ptr<Slot>;

    static std::string resume_key(const std::string& owner_id,
                                  const std::string& declared_hash,
                                  std::uint64_t total_size,
                                  std::uint64_t chunk_size);

    SlotPtr find_slot(const std::string& session_id) const;
    std::vector<SlotPtr> all_slots() const;

    Result<InitResult> try_resume(const std::string& key, const std::string& owner_id);

    // All *_locked helpers require slot.mutex held
    void save_locked(const Slot& slot);
    void forget_resume_locked(const UploadSession& session);
    events::UploadExpiredEvent expire_locked(Slot& slot, Timestamp now);
    void reclaim_staging_locked(const UploadSession& session);

    Result<ChunkResult> run_merge(const SlotPtr& slot);

    // Fails a merging session, reclaims its staging and releases `lock` before emitting
    Result<ChunkResult> fail_merge(std::unique_lock<std::mutex>& lock, Slot& slot, const Error& error, Timestamp now);

    storage::StorageBackend& backend_;
    SessionLedger& ledger_;
    events::EventBus& bus_;
    std::shared_ptr<const Clock> clock_;
    EngineOptions options_;
    MergeCoordinator coordinator_;

    mutable std::shared_mutex slots_mutex_;
    std::unordered_map<std::string, SlotPtr> slots_;

    // Serialises initialisations that carry a declared hash
    std::mutex init_mutex_;

    // Leaf lock; never held while acquiring another
    std::mutex resume_mutex_;
    std::unordered_map<std::string, std::string> resume_index_;   // resume key -> session id
};

} // namespace fmp::upload
