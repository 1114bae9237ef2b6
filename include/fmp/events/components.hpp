/**
 * @file components.hpp
 * @brief Observability components driven by the event bus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // every upload and file event is now logged and counted
 *
 * Both components unsubscribe on destruction, so they may be shorter-lived
 * than the bus.
 */

#pragma once

#include "fmp/events/event_bus.hpp"
#include "fmp/events/events.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace fmp::events {

/**
 * @brief Keeps (type, id) pairs so a component can drop its subscriptions
 */
class SubscriptionSet {
public:
    explicit SubscriptionSet(EventBus& bus) : bus_(bus) {}

    ~SubscriptionSet() {
        for (auto& release : releases_) {
            release();
        }
    }

    SubscriptionSet(const SubscriptionSet&) = delete;
    SubscriptionSet& operator=(const SubscriptionSet&) = delete;

    template<typename EventType>
    void add(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        EventBus* bus = &bus_;
        releases_.push_back([bus, id]() { bus->unsubscribe<EventType>(id); });
    }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> releases_;
};

class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<UploadInitializedEvent>([](const UploadInitializedEvent& e) {
            spdlog::info("[UploadInitialized] owner={} session={} file={} bytes={} chunks={} mode={}{}",
                         e.owner_id, e.session_id, e.filename, e.total_size, e.total_chunks,
                         storage::to_string(e.mode), e.resumed ? " (resumed)" : "");
        });

        subscriptions_.add<ChunkAcceptedEvent>([](const ChunkAcceptedEvent& e) {
            spdlog::debug("[ChunkAccepted] session={} chunk={}/{} bytes={}{}",
                          e.session_id, e.chunk_index + 1, e.total_chunks, e.bytes,
                          e.duplicate ? " duplicate" : "");
        });

        subscriptions_.add<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] owner={} session={} bytes={} hash={} location={} dedup={} duration={}ms",
                         e.owner_id, e.session_id, e.size, e.content_hash, e.final_location,
                         e.deduplicated, e.duration.count());
        });

        subscriptions_.add<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::warn("[UploadFailed] owner={} session={} reason={}{}",
                         e.owner_id, e.session_id, e.reason, e.aborted_by_owner ? " (aborted)" : "");
        });

        subscriptions_.add<UploadExpiredEvent>([](const UploadExpiredEvent& e) {
            spdlog::info("[UploadExpired] owner={} session={} received={}/{}",
                         e.owner_id, e.session_id, e.chunks_received, e.total_chunks);
        });

        subscriptions_.add<FileRecordCreatedEvent>([](const FileRecordCreatedEvent& e) {
            spdlog::info("[FileCreated] owner={} file={} name={} bytes={}", e.owner_id, e.file_id, e.filename, e.size);
        });

        subscriptions_.add<FileRenamedEvent>([](const FileRenamedEvent& e) {
            spdlog::info("[FileRenamed] owner={} file={} from={} to={}", e.owner_id, e.file_id, e.old_name, e.new_name);
        });

        subscriptions_.add<FileDeletedEvent>([](const FileDeletedEvent& e) {
            spdlog::info("[FileDeleted] owner={} file={} name={}", e.owner_id, e.file_id, e.filename);
        });

        subscriptions_.add<FileDownloadedEvent>([](const FileDownloadedEvent& e) {
            spdlog::info("[FileDownloaded] owner={} file={} bytes={} via={}",
                         e.owner_id, e.file_id, e.size, e.signed_url ? "signed-url" : "stream");
        });

        subscriptions_.add<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("File portal listening on port {} (storage: {})", e.port, storage::to_string(e.mode));
            spdlog::info("════════════════════════════════════════════");
        });

        subscriptions_.add<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("File portal shutting down: {}", e.reason);
        });
    }

private:
    SubscriptionSet subscriptions_;
};

/**
 * @brief Counters for the health endpoint
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> uploads_started{0};
        std::atomic<std::uint64_t> uploads_resumed{0};
        std::atomic<std::uint64_t> chunks_accepted{0};
        std::atomic<std::uint64_t> chunks_duplicate{0};
        std::atomic<std::uint64_t> bytes_received{0};
        std::atomic<std::uint64_t> uploads_completed{0};
        std::atomic<std::uint64_t> uploads_deduplicated{0};
        std::atomic<std::uint64_t> uploads_failed{0};
        std::atomic<std::uint64_t> uploads_expired{0};
        std::atomic<std::uint64_t> files_deleted{0};
        std::atomic<std::uint64_t> files_downloaded{0};
    };

    explicit MetricsComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<UploadInitializedEvent>([this](const UploadInitializedEvent& e) {
            if (e.resumed) {
                stats_.uploads_resumed++;
            } else {
                stats_.uploads_started++;
            }
        });

        subscriptions_.add<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            if (e.duplicate) {
                stats_.chunks_duplicate++;
                return;
            }
            stats_.chunks_accepted++;
            stats_.bytes_received += e.bytes;
        });

        subscriptions_.add<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads_completed++;
            if (e.deduplicated) {
                stats_.uploads_deduplicated++;
            }
        });

        subscriptions_.add<UploadFailedEvent>([this](const UploadFailedEvent&) { stats_.uploads_failed++; });
        subscriptions_.add<UploadExpiredEvent>([this](const UploadExpiredEvent&) { stats_.uploads_expired++; });
        subscriptions_.add<FileDeletedEvent>([this](const FileDeletedEvent&) { stats_.files_deleted++; });
        subscriptions_.add<FileDownloadedEvent>([this](const FileDownloadedEvent&) { stats_.files_downloaded++; });
    }

    const Stats& get_stats() const { return stats_; }

    nlohmann::json to_json() const {
        return {
            {"uploads_started", stats_.uploads_started.load()},
            {"uploads_resumed", stats_.uploads_resumed.load()},
            {"chunks_accepted", stats_.chunks_accepted.load()},
            {"chunks_duplicate", stats_.chunks_duplicate.load()},
            {"bytes_received", stats_.bytes_received.load()},
            {"uploads_completed", stats_.uploads_completed.load()},
            {"uploads_deduplicated", stats_.uploads_deduplicated.load()},
            {"uploads_failed", stats_.uploads_failed.load()},
            {"uploads_expired", stats_.uploads_expired.load()},
            {"files_deleted", stats_.files_deleted.load()},
            {"files_downloaded", stats_.files_downloaded.load()},
        };
    }

private:
    Stats stats_;
    SubscriptionSet subscriptions_;   // last, so handlers go before stats_
};

} // namespace fmp::events
