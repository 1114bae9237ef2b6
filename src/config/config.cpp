#include "fmp/config/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fmp::config {

using json = nlohmann::json;

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> split_extensions(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(std::remove_if(item.begin(), item.end(), [](unsigned char c) { return std::isspace(c); }),
                   item.end());
        if (!item.empty() && item.front() == '.') {
            item.erase(0, 1);
        }
        if (!item.empty()) {
            out.push_back(lowercase(item));
        }
    }
    return out;
}

Result<std::uint64_t> parse_unsigned(const std::string& name, const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return Fail<std::uint64_t>(ErrorCode::InvalidRequest, name + " must be a non-negative integer, got '" + text + "'");
    }
    try {
        return Ok(static_cast<std::uint64_t>(std::stoull(text)));
    } catch (const std::out_of_range&) {
        return Fail<std::uint64_t>(ErrorCode::InvalidRequest, name + " is out of range");
    }
}

Result<void> set_mode(PortalConfig& config, const std::string& text) {
    auto mode = storage::parse_storage_mode(text);
    if (!mode) {
        return Err<void>(make_error(ErrorCode::InvalidRequest, "Unknown storage mode: " + text));
    }
    config.storage_mode = *mode;
    return Ok();
}

Result<void> set_port(PortalConfig& config, const std::string& text) {
    auto value = parse_unsigned("port", text);
    if (value.is_error()) {
        return Err<void>(value.error());
    }
    if (value.value() == 0 || value.value() > 65535) {
        return Err<void>(make_error(ErrorCode::InvalidRequest, "port out of range: " + text));
    }
    config.port = static_cast<std::uint16_t>(value.value());
    return Ok();
}

} // namespace

Result<void> apply_json(PortalConfig& config, const json& document) {
    if (!document.is_object()) {
        return Err<void>(make_error(ErrorCode::InvalidRequest, "Configuration root must be an object"));
    }

    try {
        if (document.contains("port")) {
            const auto port = document.at("port").get<std::uint32_t>();
            if (port == 0 || port > 65535) {
                return Err<void>(make_error(ErrorCode::InvalidRequest, "port out of range"));
            }
            config.port = static_cast<std::uint16_t>(port);
        }
        config.threads = document.value("threads", config.threads);
        if (document.contains("data_dir")) {
            config.data_dir = document.at("data_dir").get<std::string>();
        }
        if (document.contains("storage_mode")) {
            if (auto res = set_mode(config, document.at("storage_mode").get<std::string>()); res.is_error()) {
                return res;
            }
        }

        config.session_ttl = std::chrono::seconds(document.value("session_ttl_seconds", config.session_ttl.count()));
        config.terminal_retention =
            std::chrono::seconds(document.value("terminal_retention_seconds", config.terminal_retention.count()));
        config.reaper_interval =
            std::chrono::seconds(document.value("reaper_interval_seconds", config.reaper_interval.count()));
        config.signed_url_ttl =
            std::chrono::seconds(document.value("signed_url_ttl_seconds", config.signed_url_ttl.count()));

        config.max_file_size = document.value("max_file_size", config.max_file_size);
        config.default_chunk_size = document.value("default_chunk_size", config.default_chunk_size);
        config.max_chunks = document.value("max_chunks", config.max_chunks);
        config.page_size = document.value("page_size", config.page_size);
        config.log_level = document.value("log_level", config.log_level);
        config.persist_dedup_index = document.value("persist_dedup_index", config.persist_dedup_index);

        if (document.contains("allowed_extensions")) {
            const auto& exts = document.at("allowed_extensions");
            config.allowed_extensions.clear();
            if (exts.is_string()) {
                config.allowed_extensions = split_extensions(exts.get<std::string>());
            } else {
                for (const auto& ext : exts) {
                    auto parsed = split_extensions(ext.get<std::string>());
                    config.allowed_extensions.insert(config.allowed_extensions.end(), parsed.begin(), parsed.end());
                }
            }
        }

        if (document.contains("s3")) {
            const auto& s3 = document.at("s3");
            config.s3.endpoint = s3.value("endpoint", config.s3.endpoint);
            config.s3.bucket = s3.value("bucket", config.s3.bucket);
            config.s3.region = s3.value("region", config.s3.region);
            config.s3.access_key = s3.value("access_key", config.s3.access_key);
            config.s3.secret_key = s3.value("secret_key", config.s3.secret_key);
            config.s3.key_prefix = s3.value("key_prefix", config.s3.key_prefix);
            config.s3.min_part_size = s3.value("min_part_size", config.s3.min_part_size);
        }
    } catch (const json::exception& e) {
        return Err<void>(make_error(ErrorCode::InvalidRequest, std::string("Invalid configuration value: ") + e.what()));
    }

    if (config.threads == 0) {
        config.threads = 1;
    }
    return Ok();
}

Result<void> load_config_file(PortalConfig& config, const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<void>(make_error(ErrorCode::NotFound, "Cannot open config file: " + path.string()));
    }
    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<void>(make_error(ErrorCode::InvalidRequest, "Config file is not valid JSON: " + path.string()));
    }
    return apply_json(config, document);
}

Result<void> apply_environment(PortalConfig& config, const EnvLookup& lookup) {
    auto get = [&lookup](const char* name) -> const char* {
        return lookup ? lookup(name) : std::getenv(name);
    };

    if (const char* v = get("FMP_STORAGE_MODE")) {
        if (auto res = set_mode(config, v); res.is_error()) {
            return res;
        }
    }
    if (const char* v = get("FMP_DATA_DIR")) {
        config.data_dir = v;
    }
    if (const char* v = get("FMP_PORT")) {
        if (auto res = set_port(config, v); res.is_error()) {
            return res;
        }
    }
    if (const char* v = get("FMP_MAX_FILE_SIZE")) {
        auto value = parse_unsigned("FMP_MAX_FILE_SIZE", v);
        if (value.is_error()) {
            return Err<void>(value.error());
        }
        config.max_file_size = value.value();
    }
    if (const char* v = get("FMP_ALLOWED_EXTENSIONS")) {
        config.allowed_extensions = split_extensions(v);
    }
    if (const char* v = get("FMP_LOG_LEVEL")) {
        config.log_level = v;
    }
    if (const char* v = get("FMP_S3_ENDPOINT")) {
        config.s3.endpoint = v;
    }
    if (const char* v = get("FMP_S3_BUCKET")) {
        config.s3.bucket = v;
    }
    if (const char* v = get("FMP_S3_REGION")) {
        config.s3.region = v;
    }
    if (const char* v = get("FMP_S3_ACCESS_KEY")) {
        config.s3.access_key = v;
    }
    if (const char* v = get("FMP_S3_SECRET_KEY")) {
        config.s3.secret_key = v;
    }
    return Ok();
}

Result<PortalConfig> load_config(int argc, const char* const argv[], const EnvLookup& lookup) {
    PortalConfig config;

    // The file has to be applied before anything it could override
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            if (auto res = load_config_file(config, argv[i + 1]); res.is_error()) {
                return Err<PortalConfig>(res.error());
            }
        }
    }

    if (auto res = apply_environment(config, lookup); res.is_error()) {
        return Err<PortalConfig>(res.error());
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if ((arg == "-p" || arg == "--port") && has_value) {
            if (auto res = set_port(config, argv[++i]); res.is_error()) {
                return Err<PortalConfig>(res.error());
            }
        } else if ((arg == "-d" || arg == "--data") && has_value) {
            config.data_dir = argv[++i];
        } else if ((arg == "-m" || arg == "--mode") && has_value) {
            if (auto res = set_mode(config, argv[++i]); res.is_error()) {
                return Err<PortalConfig>(res.error());
            }
        } else if ((arg == "-c" || arg == "--config") && has_value) {
            ++i;
        } else {
            return Fail<PortalConfig>(ErrorCode::InvalidRequest, "Unknown or incomplete argument: " + arg);
        }
    }

    if (config.storage_mode == storage::StorageMode::Remote && !remote_storage_configured(config)) {
        spdlog::warn("[Config] remote storage requested without bucket/credentials, falling back to local");
        config.storage_mode = storage::StorageMode::Local;
    }
    return Ok(config);
}

bool remote_storage_configured(const PortalConfig& config) {
    if (config.s3.endpoint.rfind("memory://", 0) == 0) {
        return true;
    }
    return !config.s3.endpoint.empty() && !config.s3.bucket.empty() &&
           !config.s3.access_key.empty() && !config.s3.secret_key.empty();
}

bool is_extension_allowed(const PortalConfig& config, const std::string& filename) {
    if (config.allowed_extensions.empty()) {
        return true;
    }
    const auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 == filename.size()) {
        return false;
    }
    const auto ext = lowercase(filename.substr(dot + 1));
    return std::find(config.allowed_extensions.begin(), config.allowed_extensions.end(), ext) !=
           config.allowed_extensions.end();
}

json to_json(const PortalConfig& config) {
    json j;
    j["port"] = config.port;
    j["threads"] = config.threads;
    j["data_dir"] = config.data_dir.string();
    j["storage_mode"] = storage::to_string(config.storage_mode);
    j["session_ttl_seconds"] = config.session_ttl.count();
    j["terminal_retention_seconds"] = config.terminal_retention.count();
    j["reaper_interval_seconds"] = config.reaper_interval.count();
    j["signed_url_ttl_seconds"] = config.signed_url_ttl.count();
    j["max_file_size"] = config.max_file_size;
    j["default_chunk_size"] = config.default_chunk_size;
    j["max_chunks"] = config.max_chunks;
    j["page_size"] = config.page_size;
    j["allowed_extensions"] = config.allowed_extensions;
    j["log_level"] = config.log_level;
    j["persist_dedup_index"] = config.persist_dedup_index;
    // Credentials are never echoed
    j["s3"] = {
        {"endpoint", config.s3.endpoint},
        {"bucket", config.s3.bucket},
        {"region", config.s3.region},
        {"key_prefix", config.s3.key_prefix},
        {"min_part_size", config.s3.min_part_size},
    };
    return j;
}

} // namespace fmp::config
