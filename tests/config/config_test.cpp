#include "fmp/config/config.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <map>

using namespace fmp;
using namespace fmp::config;

namespace {

EnvLookup env_from(std::map<std::string, std::string> values) {
    auto shared = std::make_shared<std::map<std::string, std::string>>(std::move(values));
    return [shared](const char* name) -> const char* {
        auto it = shared->find(name);
        return it == shared->end() ? nullptr : it->second.c_str();
    };
}

const EnvLookup kNoEnv = [](const char*) -> const char* { return nullptr; };

} // namespace

TEST(ConfigTest, Defaults) {
    const char* argv[] = {"fmp_server"};
    auto loaded = load_config(1, argv, kNoEnv);
    ASSERT_TRUE(loaded.is_ok());

    const auto& config = loaded.value();
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.storage_mode, storage::StorageMode::Local);
    EXPECT_EQ(config.max_file_size, 100ull * 1024 * 1024);
    EXPECT_EQ(config.session_ttl, std::chrono::hours(24));
    EXPECT_EQ(config.terminal_retention, std::chrono::hours(1));
    EXPECT_EQ(config.page_size, 20u);
    EXPECT_TRUE(config.allowed_extensions.empty());
}

TEST(ConfigTest, FileThenEnvironmentThenFlags) {
    test::TempDir dir;
    const auto file = dir / "portal.json";
    {
        std::ofstream out(file);
        out << R"({"port": 9000, "data_dir": "/from/file", "max_file_size": 1000,
                   "allowed_extensions": ["PDF", ".txt"], "s3": {"bucket": "b"}})";
    }

    const std::string path = file.string();
    const char* argv[] = {"fmp_server", "-c", path.c_str(), "-p", "9100"};
    auto loaded = load_config(5, argv, env_from({{"FMP_DATA_DIR", "/from/env"}, {"FMP_MAX_FILE_SIZE", "2048"}}));
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;

    const auto& config = loaded.value();
    EXPECT_EQ(config.port, 9100);
    EXPECT_EQ(config.data_dir.string(), "/from/env");
    EXPECT_EQ(config.max_file_size, 2048u);
    EXPECT_EQ(config.s3.bucket, "b");
    EXPECT_EQ(config.allowed_extensions, (std::vector<std::string>{"pdf", "txt"}));
}

TEST(ConfigTest, RemoteWithoutCredentialsFallsBackToLocal) {
    const char* argv[] = {"fmp_server", "-m", "remote"};
    auto loaded = load_config(3, argv, kNoEnv);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().storage_mode, storage::StorageMode::Local);
}

TEST(ConfigTest, RemoteWithMemoryEndpointStaysRemote) {
    const char* argv[] = {"fmp_server"};
    auto loaded = load_config(1, argv, env_from({{"FMP_STORAGE_MODE", "remote"}, {"FMP_S3_ENDPOINT", "memory://"}}));
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().storage_mode, storage::StorageMode::Remote);
}

TEST(ConfigTest, RejectsBadValues) {
    const char* bad_port[] = {"fmp_server", "-p", "70000"};
    EXPECT_TRUE(load_config(3, bad_port, kNoEnv).is_error());

    const char* unknown[] = {"fmp_server", "--verbose"};
    EXPECT_TRUE(load_config(2, unknown, kNoEnv).is_error());

    const char* argv[] = {"fmp_server"};
    EXPECT_TRUE(load_config(1, argv, env_from({{"FMP_STORAGE_MODE", "ftp"}})).is_error());
    EXPECT_TRUE(load_config(1, argv, env_from({{"FMP_MAX_FILE_SIZE", "-5"}})).is_error());

    PortalConfig config;
    EXPECT_TRUE(apply_json(config, nlohmann::json::array()).is_error());
    EXPECT_TRUE(apply_json(config, nlohmann::json{{"port", "eighty"}}).is_error());
}

TEST(ConfigTest, ExtensionAllowList) {
    PortalConfig config;
    EXPECT_TRUE(is_extension_allowed(config, "anything.exe"));

    config.allowed_extensions = {"pdf", "png"};
    EXPECT_TRUE(is_extension_allowed(config, "report.PDF"));
    EXPECT_TRUE(is_extension_allowed(config, "a.b.png"));
    EXPECT_FALSE(is_extension_allowed(config, "script.sh"));
    EXPECT_FALSE(is_extension_allowed(config, "noext"));
}

TEST(ConfigTest, JsonDumpOmitsSecrets) {
    PortalConfig config;
    config.s3.secret_key = "very-secret";
    config.s3.access_key = "AKIA";
    const auto dumped = to_json(config).dump();
    EXPECT_EQ(dumped.find("very-secret"), std::string::npos);
    EXPECT_EQ(dumped.find("AKIA"), std::string::npos);
}
