#pragma once

/**
 * @file config.hpp
 * @brief Portal configuration
 *
 * Sources, lowest precedence first:
 *   1. built-in defaults below
 *   2. JSON file given with -c/--config
 *   3. FMP_* environment variables
 *   4. command line flags (-p, -d, -m)
 *
 * JSON layout mirrors the struct:
 *
 *   {
 *     "port": 8080,
 *     "storage_mode": "remote",
 *     "data_dir": "/var/lib/fmp",
 *     "session_ttl_seconds": 86400,
 *     "s3": { "endpoint": "https://s3.eu-west-1.amazonaws.com", "bucket": "portal", ... }
 *   }
 */

#include "fmp/core/result.hpp"
#include "fmp/storage/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace fmp::config {

struct S3Config {
    std::string endpoint;        ///< "memory://" selects the in-process store
    std::string bucket;
    std::string region = "us-east-1";
    std::string access_key;
    std::string secret_key;
    std::string key_prefix = "uploads/";
    std::uint64_t min_part_size = 5ull * 1024 * 1024;
};

struct PortalConfig {
    std::uint16_t port = 8080;
    std::size_t threads = 4;
    std::filesystem::path data_dir = "portal_data";
    storage::StorageMode storage_mode = storage::StorageMode::Local;

    std::chrono::seconds session_ttl{24 * 3600};
    std::chrono::seconds terminal_retention{3600};
    std::chrono::seconds reaper_interval{60};
    std::chrono::seconds signed_url_ttl{3600};

    std::uint64_t max_file_size = 100ull * 1024 * 1024;
    std::uint64_t default_chunk_size = 5ull * 1024 * 1024;
    std::uint32_t max_chunks = 10000;
    std::size_t page_size = 20;

    // Lowercase, without the dot; empty allows every extension
    std::vector<std::string> allowed_extensions;

    std::string log_level = "info";
    bool persist_dedup_index = true;

    S3Config s3;
};

/// Overlay the keys present in `document` onto `config`
Result<void> apply_json(PortalConfig& config, const nlohmann::json& document);

Result<void> load_config_file(PortalConfig& config, const std::filesystem::path& path);

using EnvLookup = std::function<const char*(const char*)>;

/// Overlay FMP_* variables; `lookup` defaults to std::getenv
Result<void> apply_environment(PortalConfig& config, const EnvLookup& lookup = {});

/**
 * @brief Defaults, then file, then environment, then flags
 *
 * -c/--config <file>, -p/--port <n>, -d/--data <dir>, -m/--mode <local|remote>
 */
Result<PortalConfig> load_config(int argc, const char* const argv[], const EnvLookup& lookup = {});

/// Remote mode needs a bucket plus credentials, unless the endpoint is memory://
bool remote_storage_configured(const PortalConfig& config);

bool is_extension_allowed(const PortalConfig& config, const std::string& filename);

nlohmann::json to_json(const PortalConfig& config);

} // namespace fmp::config
