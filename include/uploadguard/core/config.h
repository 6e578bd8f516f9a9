#pragma once

#include <cstdint>
#include <string>

namespace uploadguard::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{268435456};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Where accepted files live and where in-flight files are staged.
struct StorageConfig {
    std::string uploads_root{"uploads"};
    std::string staging_path{"uploads/tmp"};
};

/// @brief Per-request upload limits.
struct UploadConfig {
    int max_files_per_request{10};
};

/// @brief Background deletion of aged uploads.
struct RetentionConfig {
    bool enabled{true};
    std::int64_t max_age_seconds{604800};
    std::int64_t min_age_seconds{3600};
    int sweep_interval_seconds{86400};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for UploadGuard.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    UploadConfig upload;
    RetentionConfig retention;
    ObservabilityConfig observability;
};

/// @brief Load server configuration from a JSON file.
/// @throws std::invalid_argument when a value is out of range.
Config LoadConfig(const std::string& path);

}  // namespace uploadguard::core
