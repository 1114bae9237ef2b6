#include "fmp/storage/backend_factory.hpp"

#include "fmp/storage/local_backend.hpp"
#include "fmp/storage/memory_object_store.hpp"
#include "fmp/storage/remote_backend.hpp"
#include "fmp/storage/s3_object_store.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace fmp::storage {

namespace {

constexpr const char* kMemoryEndpoint = "memory://";

} // namespace

Result<std::unique_ptr<StorageBackend>> make_backend(const config::PortalConfig& config,
                                                     std::shared_ptr<const Clock> clock) {
    using BackendPtr = std::unique_ptr<StorageBackend>;

    if (config.storage_mode == StorageMode::Local) {
        const auto root = config.data_dir / "storage";
        std::error_code ec;
        std::filesystem::create_directories(root, ec);
        if (ec) {
            return Fail<BackendPtr>(ErrorCode::BackendIOError,
                                    "Cannot create storage root " + root.string() + ": " + ec.message());
        }
        spdlog::info("[Storage] local backend at {}", root.string());
        return Ok<BackendPtr>(std::make_unique<LocalBackend>(root));
    }

    const auto& s3 = config.s3;
    std::shared_ptr<ObjectStore> store;
    if (s3.endpoint.rfind(kMemoryEndpoint, 0) == 0) {
        spdlog::warn("[Storage] remote backend uses the in-process object store; objects are lost on exit");
        store = std::make_shared<MemoryObjectStore>(clock, s3.min_part_size);
    } else {
        if (s3.bucket.empty() || s3.endpoint.empty()) {
            return Fail<BackendPtr>(ErrorCode::InvalidRequest, "Remote storage needs an endpoint and a bucket");
        }
        S3Settings settings;
        settings.endpoint = s3.endpoint;
        settings.bucket = s3.bucket;
        settings.credentials.access_key = s3.access_key;
        settings.credentials.secret_key = s3.secret_key;
        settings.credentials.region = s3.region;
        store = std::make_shared<S3ObjectStore>(std::move(settings), clock);
    }

    RemoteBackendOptions options;
    options.key_prefix = s3.key_prefix;
    options.min_part_size = s3.min_part_size;
    options.signed_url_ttl = config.signed_url_ttl;
    return Ok<BackendPtr>(std::make_unique<RemoteBackend>(std::move(store), std::move(options)));
}

} // namespace fmp::storage
