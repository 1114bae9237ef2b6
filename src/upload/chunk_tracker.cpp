#include "fmp/upload/chunk_tracker.hpp"

namespace fmp::upload {

ChunkTracker::ChunkTracker(std::uint32_t total_chunks) : total_chunks_(total_chunks) {}

bool ChunkTracker::contains(std::uint32_t index) const {
    return receipts_.count(index) > 0;
}

const storage::ChunkRef* ChunkTracker::receipt(std::uint32_t index) const {
    auto it = receipts_.find(index);
    return it == receipts_.end() ? nullptr : &it->second;
}

ChunkTracker::MarkOutcome ChunkTracker::check(std::uint32_t index, const std::string& digest) const {
    auto it = receipts_.find(index);
    if (it == receipts_.end()) {
        return MarkOutcome::Added;
    }
    return it->second.digest == digest ? MarkOutcome::Duplicate : MarkOutcome::Conflict;
}

ChunkTracker::MarkOutcome ChunkTracker::mark(const storage::ChunkRef& ref) {
    const auto outcome = check(ref.index, ref.digest);
    if (outcome == MarkOutcome::Added) {
        receipts_.emplace(ref.index, ref);
    }
    return outcome;
}

bool ChunkTracker::reserve(std::uint32_t index) {
    return in_flight_.insert(index).second;
}

void ChunkTracker::release(std::uint32_t index) {
    in_flight_.erase(index);
}

bool ChunkTracker::in_flight(std::uint32_t index) const {
    return in_flight_.count(index) > 0;
}

std::vector<std::uint32_t> ChunkTracker::uploaded() const {
    std::vector<std::uint32_t> out;
    out.reserve(receipts_.size());
    for (const auto& [index, ref] : receipts_) {
        out.push_back(index);
    }
    return out;
}

std::vector<std::uint32_t> ChunkTracker::missing() const {
    std::vector<std::uint32_t> out;
    out.reserve(total_chunks_ - receipts_.size());
    auto it = receipts_.begin();
    for (std::uint32_t i = 0; i < total_chunks_; ++i) {
        if (it != receipts_.end() && it->first == i) {
            ++it;
            continue;
        }
        out.push_back(i);
    }
    return out;
}

double ChunkTracker::progress_percent() const noexcept {
    if (total_chunks_ == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(receipts_.size()) / static_cast<double>(total_chunks_);
}

std::vector<storage::ChunkRef> ChunkTracker::ordered_receipts() const {
    std::vector<storage::ChunkRef> out;
    out.reserve(receipts_.size());
    for (const auto& [index, ref] : receipts_) {
        out.push_back(ref);
    }
    return out;
}

} // namespace fmp::upload
