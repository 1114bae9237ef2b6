#include "fmp/upload/expiry_reaper.hpp"

#include <spdlog/spdlog.h>

namespace fmp::upload {

ExpiryReaper::ExpiryReaper(UploadEngine& engine, std::chrono::milliseconds interval)
    : engine_(engine), interval_(interval) {}

ExpiryReaper::~ExpiryReaper() {
    stop();
}

void ExpiryReaper::start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        stopping_ = false;
    }
    thread_ = std::thread(&ExpiryReaper::run, this);
    spdlog::info("[Reaper] started, interval={}ms", interval_.count());
}

void ExpiryReaper::stop() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        spdlog::info("[Reaper] stopped after {} sweeps", sweeps_.load());
    }
    running_ = false;
}

ExpiryReaper::SweepStats ExpiryReaper::sweep() {
    SweepStats stats;
    stats.expired = engine_.expire_stale();
    stats.purged = engine_.purge_terminal();
    ++sweeps_;
    if (stats.expired > 0 || stats.purged > 0) {
        spdlog::info("[Reaper] expired={} purged={}", stats.expired, stats.purged);
    }
    return stats;
}

void ExpiryReaper::run() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        if (wake_.wait_for(lock, interval_, [this]() { return stopping_; })) {
            break;
        }
        lock.unlock();
        try {
            sweep();
        } catch (const std::exception& e) {
            spdlog::error("[Reaper] sweep failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace fmp::upload
