#include "uploadguard/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace uploadguard::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 268435456));

    config.storage.uploads_root = cfg->getString("storage.uploads_root", "uploads");
    config.storage.staging_path = cfg->getString("storage.staging_path", "uploads/tmp");

    config.upload.max_files_per_request = cfg->getInt("upload.max_files_per_request", 10);

    config.retention.enabled = cfg->getBool("retention.enabled", true);
    config.retention.max_age_seconds = cfg->getInt64("retention.max_age_seconds", 604800);
    config.retention.min_age_seconds = cfg->getInt64("retention.min_age_seconds", 3600);
    config.retention.sweep_interval_seconds =
        cfg->getInt("retention.sweep_interval_seconds", 86400);

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    if (config.server.threads <= 0) {
        throw std::invalid_argument("server.threads must be positive");
    }
    if (config.server.tls.enabled &&
        (IsBlank(config.server.tls.certificate) || IsBlank(config.server.tls.private_key))) {
        throw std::invalid_argument(
            "server.tls.enabled=true requires server.tls.certificate and server.tls.private_key");
    }
    if (IsBlank(config.storage.uploads_root)) {
        throw std::invalid_argument("storage.uploads_root must not be empty");
    }
    if (IsBlank(config.storage.staging_path)) {
        throw std::invalid_argument("storage.staging_path must not be empty");
    }
    if (config.upload.max_files_per_request <= 0) {
        throw std::invalid_argument("upload.max_files_per_request must be positive");
    }
    if (config.retention.max_age_seconds <= 0) {
        throw std::invalid_argument("retention.max_age_seconds must be positive");
    }
    if (config.retention.min_age_seconds < 0) {
        throw std::invalid_argument("retention.min_age_seconds must not be negative");
    }
    if (config.retention.sweep_interval_seconds <= 0) {
        throw std::invalid_argument("retention.sweep_interval_seconds must be positive");
    }
    return config;
}

}  // namespace uploadguard::core
