#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "uploadguard/core/config.h"

namespace {

std::filesystem::path MakeTempConfigPath() {
    const auto name = "uploadguard_cfg_" + Poco::UUIDGenerator().createOne().toString() + ".json";
    return std::filesystem::temp_directory_path() / name;
}

void WriteConfig(const std::filesystem::path& path, const std::string& retention,
                 const std::string& upload = "{\"max_files_per_request\": 3}",
                 const std::string& tls = "{\"enabled\": false}") {
    std::ofstream out(path);
    out << "{\n"
        << "  \"server\": {\n"
        << "    \"host\": \"127.0.0.1\",\n"
        << "    \"port\": 9090,\n"
        << "    \"threads\": 2,\n"
        << "    \"tls\": " << tls << ",\n"
        << "    \"limits\": {\"max_body_bytes\": 1048576}\n"
        << "  },\n"
        << "  \"storage\": {\"uploads_root\": \"data/uploads\", \"staging_path\": \"data/tmp\"},\n"
        << "  \"upload\": " << upload << ",\n"
        << "  \"retention\": " << retention << ",\n"
        << "  \"observability\": {\"log_level\": \"warning\"}\n"
        << "}\n";
}

}  // namespace

TEST(Config, LoadsAllSections) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"enabled\": false, \"max_age_seconds\": 120, \"min_age_seconds\": 60, "
                      "\"sweep_interval_seconds\": 30}");

    const auto config = uploadguard::core::LoadConfig(path.string());
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.threads, 2);
    EXPECT_EQ(config.server.limits.max_body_bytes, 1048576u);
    EXPECT_EQ(config.storage.uploads_root, "data/uploads");
    EXPECT_EQ(config.storage.staging_path, "data/tmp");
    EXPECT_EQ(config.upload.max_files_per_request, 3);
    EXPECT_FALSE(config.retention.enabled);
    EXPECT_EQ(config.retention.max_age_seconds, 120);
    EXPECT_EQ(config.retention.min_age_seconds, 60);
    EXPECT_EQ(config.retention.sweep_interval_seconds, 30);
    EXPECT_EQ(config.observability.log_level, "warning");

    std::filesystem::remove(path);
}

TEST(Config, RetentionDefaultsToSevenDays) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{}");

    const auto config = uploadguard::core::LoadConfig(path.string());
    EXPECT_TRUE(config.retention.enabled);
    EXPECT_EQ(config.retention.max_age_seconds, 7 * 24 * 60 * 60);
    EXPECT_EQ(config.retention.min_age_seconds, 3600);
    EXPECT_EQ(config.retention.sweep_interval_seconds, 86400);

    std::filesystem::remove(path);
}

TEST(Config, RejectsNonPositiveMaxAge) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"max_age_seconds\": 0}");

    EXPECT_THROW({ (void)uploadguard::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsNegativeMinAge) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"min_age_seconds\": -1}");

    EXPECT_THROW({ (void)uploadguard::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsZeroFilesPerRequest) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{}", "{\"max_files_per_request\": 0}");

    EXPECT_THROW({ (void)uploadguard::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, TlsEnabledRequiresCertificateAndKey) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{}", "{\"max_files_per_request\": 3}",
                "{\"enabled\": true, \"certificate\": \"server.crt\", \"private_key\": \"\"}");

    EXPECT_THROW({ (void)uploadguard::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}
