#pragma once

#include "fmp/core/result.hpp"
#include "fmp/storage/storage_backend.hpp"
#include "fmp/upload/dedup_index.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fmp::upload {

/**
 * @brief Inputs copied out of a session so the merge can run without its lock
 */
struct MergePlan {
    std::string session_id;
    storage::StagingHandle staging;
    std::uint32_t total_chunks = 0;
    std::vector<storage::ChunkRef> ordered;
    std::optional<std::string> declared_hash;
};

struct MergeOutcome {
    std::string location;
    std::string content_hash;
    std::uint64_t size = 0;
    bool deduplicated = false;   ///< location belongs to an earlier upload of the same content
};

/**
 * @brief Turns a complete set of staged chunks into one durable object
 *
 * 1. re-check every index 0..n-1 has a receipt
 * 2. if the backend knows the digest up front, a dedup hit skips the merge
 *    and the staging area is dropped
 * 3. otherwise finalize, verify a declared hash when the backend's digest
 *    covers the full content, then register; losing a registration race
 *    discards our copy in favour of the winner's
 *
 * Errors are returned, never retried. The caller fails the session and
 * aborts staging.
 */
class MergeCoordinator {
public:
    MergeCoordinator(storage::StorageBackend& backend, DedupIndex& dedup);

    Result<MergeOutcome> merge(const MergePlan& plan);

private:
    void drop_staging(const MergePlan& plan);
    void drop_output(const std::string& location);

    storage::StorageBackend& backend_;
    DedupIndex& dedup_;
};

} // namespace fmp::upload
