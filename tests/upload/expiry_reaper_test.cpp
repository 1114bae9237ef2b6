#include "fmp/upload/expiry_reaper.hpp"
#include "fmp/storage/local_backend.hpp"

#include "support/manual_clock.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace fmp;
using namespace fmp::upload;
using namespace std::chrono_literals;

class ExpiryReaperTest : public ::testing::Test {
protected:
    ExpiryReaperTest()
        : clock(std::make_shared<test::ManualClock>()),
          backend(dir.path()),
          engine(backend, ledger, dedup, bus, clock, options()) {}

    static EngineOptions options() {
        EngineOptions opts;
        opts.session_ttl = std::chrono::hours(1);
        opts.terminal_retention = std::chrono::hours(1);
        return opts;
    }

    std::string init() {
        UploadRequest request;
        request.owner_id = "42";
        request.total_size = 10;
        request.chunk_size = 5;
        return engine.initialize_upload(request).value().session.id;
    }

    test::TempDir dir;
    std::shared_ptr<test::ManualClock> clock;
    storage::LocalBackend backend;
    MemorySessionLedger ledger;
    DedupIndex dedup;
    events::EventBus bus;
    UploadEngine engine;
};

TEST_F(ExpiryReaperTest, SweepExpiresThenPurges) {
    const auto id = init();
    ExpiryReaper reaper(engine, 1h);

    auto first = reaper.sweep();
    EXPECT_EQ(first.expired, 0u);
    EXPECT_EQ(first.purged, 0u);

    clock->advance(std::chrono::minutes(61));
    auto second = reaper.sweep();
    EXPECT_EQ(second.expired, 1u);
    EXPECT_EQ(second.purged, 0u);
    EXPECT_EQ(engine.get_session_status("42", id).value().status, SessionStatus::Expired);

    clock->advance(std::chrono::minutes(61));
    auto third = reaper.sweep();
    EXPECT_EQ(third.purged, 1u);
    EXPECT_EQ(engine.session_count(), 0u);
    EXPECT_EQ(reaper.sweeps(), 3u);
}

TEST_F(ExpiryReaperTest, BackgroundThreadSweeps) {
    const auto id = init();
    clock->advance(std::chrono::hours(2));

    ExpiryReaper reaper(engine, 5ms);
    reaper.start();
    EXPECT_TRUE(reaper.running());

    for (int i = 0; i < 400 && reaper.sweeps() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    reaper.stop();

    EXPECT_FALSE(reaper.running());
    EXPECT_GE(reaper.sweeps(), 1u);
    EXPECT_EQ(engine.get_session_status("42", id).value().status, SessionStatus::Expired);
}

TEST_F(ExpiryReaperTest, StopIsIdempotentAndFast) {
    ExpiryReaper reaper(engine, std::chrono::hours(1));
    reaper.start();
    reaper.start();

    const auto begin = std::chrono::steady_clock::now();
    reaper.stop();
    reaper.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    EXPECT_EQ(reaper.sweeps(), 0u);
}
