#pragma once

#include "fmp/config/config.hpp"
#include "fmp/core/clock.hpp"
#include "fmp/storage/storage_backend.hpp"

#include <memory>

namespace fmp::storage {

/**
 * @brief Build the backend selected by config.storage_mode
 *
 * local:  LocalBackend rooted at <data_dir>/storage
 * remote: RemoteBackend over S3ObjectStore, or over MemoryObjectStore when
 *         the endpoint is "memory://"
 */
Result<std::unique_ptr<StorageBackend>> make_backend(const config::PortalConfig& config,
                                                     std::shared_ptr<const Clock> clock);

} // namespace fmp::storage
