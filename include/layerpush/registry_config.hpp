#pragma once

#include "layerpush/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace layerpush {

/// Object store the registry writes to.
struct BackendConfig {
    std::string type;  // "s3"
    std::map<std::string, std::string> params;  // Passed to ObjectStoreFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for the registry daemon.
struct RegistryConfig {
    // HTTP listener
    std::string listen_address = constants::DEFAULT_LISTEN_ADDRESS;
    uint16_t port = constants::DEFAULT_REGISTRY_PORT;

    // Upload planning
    int64_t chunk_size = constants::DEFAULT_UPLOAD_CHUNK_SIZE;
    int64_t min_multipart_size = constants::DEFAULT_MIN_MULTIPART_SIZE;
    size_t presign_expiry_secs = constants::DEFAULT_PRESIGN_EXPIRY_SECONDS;

    BackendConfig backend;

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<RegistryConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults (region, S3 credentials from the environment).
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

/// Configuration for the push client.
struct PushClientConfig {
    std::string registry_url;
    std::string ref;
    std::filesystem::path manifest_path;
    std::filesystem::path blobs_dir;     // Layer sources are <blobs_dir>/<digest>
    std::filesystem::path state_file;    // Uploaded parts, kept across interrupted runs

    size_t upload_concurrency = constants::DEFAULT_UPLOAD_CONCURRENCY;
    int max_rounds = constants::DEFAULT_MAX_PUSH_ROUNDS;
    size_t timeout_secs = constants::DEFAULT_PUSH_TIMEOUT_SECONDS;
    bool verbose = false;

    static std::optional<PushClientConfig> from_args(int argc, char* argv[]);

    std::string validate() const;
};

}  // namespace layerpush
