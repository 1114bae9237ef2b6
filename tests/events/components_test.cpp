#include "fmp/events/components.hpp"
#include "fmp/events/event_bus.hpp"
#include "fmp/events/events.hpp"

#include <gtest/gtest.h>

using namespace fmp::events;

TEST(MetricsComponentTest, CountsUploadLifecycle) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(UploadInitializedEvent{"alice", "s-1", "a.bin", 10, 1});
    UploadInitializedEvent resumed;
    resumed.resumed = true;
    bus.emit(resumed);

    bus.emit(ChunkAcceptedEvent{"s-1", 0, 2, 1024, false});
    bus.emit(ChunkAcceptedEvent{"s-1", 0, 2, 1024, true});

    UploadCompletedEvent completed;
    completed.deduplicated = true;
    bus.emit(completed);
    bus.emit(UploadFailedEvent{});
    bus.emit(UploadExpiredEvent{});
    bus.emit(FileDeletedEvent{});
    bus.emit(FileDownloadedEvent{});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.uploads_started.load(), 1u);
    EXPECT_EQ(stats.uploads_resumed.load(), 1u);
    EXPECT_EQ(stats.chunks_accepted.load(), 1u);
    EXPECT_EQ(stats.chunks_duplicate.load(), 1u);
    EXPECT_EQ(stats.bytes_received.load(), 1024u);
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.uploads_deduplicated.load(), 1u);
    EXPECT_EQ(stats.uploads_failed.load(), 1u);
    EXPECT_EQ(stats.uploads_expired.load(), 1u);
    EXPECT_EQ(stats.files_deleted.load(), 1u);
    EXPECT_EQ(stats.files_downloaded.load(), 1u);

    const auto json = metrics.to_json();
    EXPECT_EQ(json.at("bytes_received").get<std::uint64_t>(), 1024u);
}

TEST(MetricsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(UploadCompletedEvent{}));
}
