#include "fmp/upload/merge_coordinator.hpp"

#include <spdlog/spdlog.h>

namespace fmp::upload {

MergeCoordinator::MergeCoordinator(storage::StorageBackend& backend, DedupIndex& dedup)
    : backend_(backend), dedup_(dedup) {}

void MergeCoordinator::drop_staging(const MergePlan& plan) {
    if (auto res = backend_.abort(plan.staging); res.is_error()) {
        spdlog::warn("[Merge] session={} staging not reclaimed: {}", plan.session_id, res.error().message);
    }
}

void MergeCoordinator::drop_output(const std::string& location) {
    if (auto res = backend_.discard_final(location); res.is_error()) {
        spdlog::warn("[Merge] orphaned object {} not removed: {}", location, res.error().message);
    }
}

Result<MergeOutcome> MergeCoordinator::merge(const MergePlan& plan) {
    if (plan.ordered.size() != plan.total_chunks) {
        return Fail<MergeOutcome>(ErrorCode::InvalidRequest,
                                  "Merge requested with " + std::to_string(plan.ordered.size()) + " of " +
                                      std::to_string(plan.total_chunks) + " chunks");
    }
    std::uint64_t total_size = 0;
    for (std::uint32_t i = 0; i < plan.ordered.size(); ++i) {
        if (plan.ordered[i].index != i) {
            return Fail<MergeOutcome>(ErrorCode::InvalidRequest, "Chunk " + std::to_string(i) + " missing at merge");
        }
        total_size += plan.ordered[i].size;
    }

    const auto mode = backend_.mode();

    if (auto early = backend_.digest_before_merge(plan.ordered)) {
        if (auto existing = dedup_.lookup(*early, mode)) {
            spdlog::info("[Merge] session={} duplicate of {}, skipping merge", plan.session_id, *existing);
            drop_staging(plan);
            return Ok(MergeOutcome{*existing, *early, total_size, true});
        }
    }

    auto finalized = backend_.finalize(plan.staging, plan.ordered);
    if (finalized.is_error()) {
        return Err<MergeOutcome>(finalized.error());
    }
    const auto& output = finalized.value();

    if (plan.declared_hash && output.full_content_hash && *plan.declared_hash != output.content_hash) {
        drop_output(output.location);
        return Fail<MergeOutcome>(ErrorCode::HashMismatch,
                                  "Declared hash " + *plan.declared_hash + " but content hashes to " +
                                      output.content_hash);
    }

    MergeOutcome outcome{output.location, output.content_hash, output.size, false};

    auto registration = dedup_.register_if_absent(output.content_hash, mode, output.location);
    if (!registration.inserted && registration.location != output.location) {
        spdlog::info("[Merge] session={} lost dedup race, adopting {}", plan.session_id, registration.location);
        drop_output(output.location);
        outcome.location = registration.location;
        outcome.deduplicated = true;
    }
    return Ok(outcome);
}

} // namespace fmp::upload
