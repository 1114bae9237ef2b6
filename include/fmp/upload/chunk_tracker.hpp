#pragma once

#include "fmp/storage/types.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <vector>

namespace fmp::upload {

/**
 * @brief Which chunk indices of one session are durable, plus a receipt each
 *
 * Not thread-safe; the owning session's lock guards it. An index can also be
 * reserved as in-flight while its bytes are being written outside the lock,
 * so a second writer for the same index waits instead of racing.
 */
class ChunkTracker {
public:
    enum class MarkOutcome {
        Added,
        Duplicate,   // present with the same digest
        Conflict     // present with a different digest
    };

    explicit ChunkTracker(std::uint32_t total_chunks);

    [[nodiscard]] std::uint32_t total_chunks() const noexcept { return total_chunks_; }
    [[nodiscard]] std::uint32_t received_count() const noexcept {
        return static_cast<std::uint32_t>(receipts_.size());
    }
    [[nodiscard]] bool complete() const noexcept { return receipts_.size() == total_chunks_; }

    [[nodiscard]] bool contains(std::uint32_t index) const;
    [[nodiscard]] const storage::ChunkRef* receipt(std::uint32_t index) const;

    /// Record a durable chunk; the index must be < total_chunks()
    MarkOutcome mark(const storage::ChunkRef& ref);

    /// Compare a digest against what is stored without changing anything
    MarkOutcome check(std::uint32_t index, const std::string& digest) const;

    bool reserve(std::uint32_t index);
    void release(std::uint32_t index);
    [[nodiscard]] bool in_flight(std::uint32_t index) const;
    [[nodiscard]] bool any_in_flight() const noexcept { return !in_flight_.empty(); }

    [[nodiscard]] std::vector<std::uint32_t> uploaded() const;
    [[nodiscard]] std::vector<std::uint32_t> missing() const;
    [[nodiscard]] double progress_percent() const noexcept;

    /// Receipts in index order, ready for finalize
    [[nodiscard]] std::vector<storage::ChunkRef> ordered_receipts() const;

private:
    std::uint32_t total_chunks_;
    std::map<std::uint32_t, storage::ChunkRef> receipts_;
    std::set<std::uint32_t> in_flight_;
};

} // namespace fmp::upload
