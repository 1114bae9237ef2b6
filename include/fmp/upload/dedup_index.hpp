#pragma once

#include "fmp/core/result.hpp"
#include "fmp/storage/types.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace fmp::upload {

/**
 * @brief (storage mode, content hash) -> location of an existing durable object
 *
 * Shared by every finalizing session. register_if_absent is atomic: of two
 * sessions finishing identical content at the same moment, exactly one
 * location is recorded and both callers learn which one.
 *
 * With a persistence file the index is written through on every insert
 * (temp file + rename) and reloaded by load().
 */
class DedupIndex {
public:
    struct Registration {
        std::string location;   ///< the location now on record
        bool inserted = false;  ///< true if the caller's location was the one recorded
    };

    DedupIndex() = default;
    explicit DedupIndex(std::filesystem::path persist_file);

    DedupIndex(const DedupIndex&) = delete;
    DedupIndex& operator=(const DedupIndex&) = delete;

    std::optional<std::string> lookup(const std::string& content_hash, storage::StorageMode mode) const;

    Registration register_if_absent(const std::string& content_hash,
                                    storage::StorageMode mode,
                                    const std::string& location);

    std::size_t size() const;

    /// Replace contents with the persistence file; a missing file is an empty index
    Result<void> load();

private:
    using Key = std::pair<storage::StorageMode, std::string>;

    Result<void> persist_locked() const;

    std::optional<std::filesystem::path> persist_file_;
    mutable std::mutex mutex_;
    std::map<Key, std::string> entries_;
};

} // namespace fmp::upload
