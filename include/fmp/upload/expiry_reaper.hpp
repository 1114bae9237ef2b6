#pragma once

/**
 * @file expiry_reaper.hpp
 * @brief Background sweep that expires abandoned uploads
 *
 * WHY THIS FILE EXISTS:
 * A client that walks away never sends the request that would notice its
 * session is stale. Something has to reclaim the staging space on a timer.
 *
 * EXAMPLE:
 * ExpiryReaper reaper(engine, std::chrono::seconds(60));
 * reaper.start();
 * ...
 * reaper.stop();   // also done by the destructor
 */

#include "fmp/upload/engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace fmp::upload {

class ExpiryReaper {
public:
    struct SweepStats {
        std::size_t expired = 0;
        std::size_t purged = 0;
    };

    ExpiryReaper(UploadEngine& engine, std::chrono::milliseconds interval);
    ~ExpiryReaper();

    ExpiryReaper(const ExpiryReaper&) = delete;
    ExpiryReaper& operator=(const ExpiryReaper&) = delete;

    void start();

    /// Wakes the thread and joins it; safe to call twice
    void stop();

    /// One expire + purge pass on the calling thread
    SweepStats sweep();

    bool running() const noexcept { return running_.load(); }
    std::size_t sweeps() const noexcept { return sweeps_.load(); }

private:
    void run();

    UploadEngine& engine_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> sweeps_{0};
    std::thread thread_;
};

} // namespace fmp::upload
