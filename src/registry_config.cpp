#include "layerpush/registry_config.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace layerpush {

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "s3") {
        if (params.count("bucket") == 0 || params.at("bucket").empty())
            return "s3 backend requires 'bucket'";
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

namespace {

// Map a --s3-X flag onto the backend params. Returns false if the suffix is unknown.
bool parse_backend_flag(const std::string& suffix, const char* value, BackendConfig& backend) {
    if (suffix == "endpoint") {
        backend.params["endpoint"] = value;
    } else if (suffix == "bucket") {
        backend.params["bucket"] = value;
    } else if (suffix == "region") {
        backend.params["region"] = value;
    } else if (suffix == "access-key") {
        backend.params["access_key"] = value;
    } else if (suffix == "secret-key") {
        backend.params["secret_key"] = value;
    } else if (suffix == "session-token") {
        backend.params["session_token"] = value;
    } else if (suffix == "prefix") {
        backend.params["path_prefix"] = value;
    } else {
        return false;
    }
    return true;
}

void print_registry_usage() {
    std::cerr <<
        "Usage: layerpush-registry --s3-bucket <name> [options]\n"
        "\n"
        "Object store:\n"
        "  --s3-bucket <name>               Bucket name (required)\n"
        "  --s3-endpoint <url>              Endpoint URL (default: AWS for the region)\n"
        "  --s3-region <region>             Region (default: us-east-1)\n"
        "  --s3-access-key <key>            Access key (or AWS_ACCESS_KEY_ID env)\n"
        "  --s3-secret-key <key>            Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
        "  --s3-session-token <token>       Session token (or AWS_SESSION_TOKEN env)\n"
        "  --s3-prefix <prefix>             Key prefix inside the bucket\n"
        "  --s3-path-style                  Use path-style addressing\n"
        "  --s3-no-verify-ssl               Skip SSL verification\n"
        "\n"
        "Server:\n"
        "  --config <path>                  JSON config file\n"
        "  --listen <address>               Listen address (default: 0.0.0.0)\n"
        "  --port <N>                       Listen port (default: 9580)\n"
        "  --chunk-size <bytes>             Multipart part size (default: 64MB)\n"
        "  --min-multipart-size <bytes>     Smaller layers get one PUT (default: 5MB)\n"
        "  --presign-expiry <secs>          Presigned URL lifetime (default: 900)\n"
        "  --daemon                         Run as daemon\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

void print_push_usage() {
    std::cerr <<
        "Usage: layerpush-push --registry <url> --ref <ref> --manifest <path> --blobs <dir> [options]\n"
        "\n"
        "Required:\n"
        "  --registry <url>                 Registry base URL\n"
        "  --ref <ref>                      <registry>/<namespace>/<name>:<tag>+<build>\n"
        "  --manifest <path>                Manifest JSON file\n"
        "  --blobs <dir>                    Directory holding one file per layer digest\n"
        "\n"
        "Options:\n"
        "  --state-file <path>              Keep uploaded parts here to resume an interrupted push\n"
        "  --concurrency <N>                Parallel chunk uploads (default: 8)\n"
        "  --max-rounds <N>                 Push exchanges before giving up (default: 8)\n"
        "  --timeout <secs>                 Overall deadline (default: 3600)\n"
        "  --verbose                        Verbose output\n"
        "  --help                           Show this help\n";
}

}  // namespace

// --- RegistryConfig ---

std::optional<RegistryConfig> RegistryConfig::from_args(int argc, char* argv[]) {
    RegistryConfig config;
    config.backend.type = "s3";

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--s3-path-style") {
                config.backend.params["use_path_style"] = "true";
                continue;
            }
            if (arg == "--s3-no-verify-ssl") {
                config.backend.params["verify_ssl"] = "false";
                continue;
            }
            if (arg.compare(0, 5, "--s3-") == 0) {
                auto* v = next_arg(i, arg.c_str());
                if (!v) return std::nullopt;
                if (!parse_backend_flag(arg.substr(5), v, config.backend)) {
                    std::cerr << "Error: unknown option: " << arg << "\n";
                    return std::nullopt;
                }
                continue;
            }

            if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--listen") {
                auto* v = next_arg(i, "--listen");
                if (!v) return std::nullopt;
                config.listen_address = v;
            } else if (arg == "--port") {
                auto* v = next_arg(i, "--port");
                if (!v) return std::nullopt;
                unsigned long port = std::stoul(v);
                if (port > 65535) {
                    std::cerr << "Error: --port out of range: " << v << "\n";
                    return std::nullopt;
                }
                config.port = static_cast<uint16_t>(port);
            } else if (arg == "--chunk-size") {
                auto* v = next_arg(i, "--chunk-size");
                if (!v) return std::nullopt;
                config.chunk_size = std::stoll(v);
            } else if (arg == "--min-multipart-size") {
                auto* v = next_arg(i, "--min-multipart-size");
                if (!v) return std::nullopt;
                config.min_multipart_size = std::stoll(v);
            } else if (arg == "--presign-expiry") {
                auto* v = next_arg(i, "--presign-expiry");
                if (!v) return std::nullopt;
                config.presign_expiry_secs = std::stoull(v);
            } else if (arg == "--daemon") {
                config.daemonize = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--pid-file") {
                auto* v = next_arg(i, "--pid-file");
                if (!v) return std::nullopt;
                config.pid_file = v;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_registry_usage();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool RegistryConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("listen_address")) listen_address = j["listen_address"].get<std::string>();
        if (j.contains("port")) port = j["port"].get<uint16_t>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<int64_t>();
        if (j.contains("min_multipart_size")) min_multipart_size = j["min_multipart_size"].get<int64_t>();
        if (j.contains("presign_expiry")) presign_expiry_secs = j["presign_expiry"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("daemon")) daemonize = j["daemon"].get<bool>();
        if (j.contains("pid_file")) pid_file = j["pid_file"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("backend") && j["backend"].is_object()) {
            auto& jb = j["backend"];
            if (jb.contains("type")) backend.type = jb["type"].get<std::string>();
            for (auto& [key, val] : jb.items()) {
                if (key != "type") {
                    backend.params[key] = val.is_string() ? val.get<std::string>() : val.dump();
                }
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void RegistryConfig::apply_defaults() {
    if (backend.type == "s3") {
        auto from_env = [&](const char* param, const char* env) {
            if (backend.params.count(param) == 0 || backend.params[param].empty()) {
                if (const char* v = std::getenv(env)) {
                    backend.params[param] = v;
                }
            }
        };
        from_env("access_key", "AWS_ACCESS_KEY_ID");
        from_env("secret_key", "AWS_SECRET_ACCESS_KEY");
        from_env("session_token", "AWS_SESSION_TOKEN");

        if (backend.params.count("region") == 0 || backend.params["region"].empty()) {
            backend.params["region"] = "us-east-1";
        }
    }
}

std::string RegistryConfig::validate() const {
    if (backend.empty()) return "backend type is required";
    auto err = backend.validate();
    if (!err.empty()) return "backend: " + err;
    if (chunk_size < 0) return "chunk_size must be >= 0";
    if (min_multipart_size < 0) return "min_multipart_size must be >= 0";
    if (presign_expiry_secs == 0 || presign_expiry_secs > static_cast<size_t>(constants::MAX_PRESIGN_EXPIRY_SECONDS))
        return "presign_expiry must be between 1 and " + std::to_string(constants::MAX_PRESIGN_EXPIRY_SECONDS) + " seconds";
    if (!metrics_file.empty() && metrics_interval_secs == 0) return "metrics_interval must be > 0";
    return {};
}

// --- PushClientConfig ---

std::optional<PushClientConfig> PushClientConfig::from_args(int argc, char* argv[]) {
    PushClientConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--registry") {
                auto* v = next_arg(i, "--registry");
                if (!v) return std::nullopt;
                config.registry_url = v;
            } else if (arg == "--ref") {
                auto* v = next_arg(i, "--ref");
                if (!v) return std::nullopt;
                config.ref = v;
            } else if (arg == "--manifest") {
                auto* v = next_arg(i, "--manifest");
                if (!v) return std::nullopt;
                config.manifest_path = v;
            } else if (arg == "--blobs") {
                auto* v = next_arg(i, "--blobs");
                if (!v) return std::nullopt;
                config.blobs_dir = v;
            } else if (arg == "--state-file") {
                auto* v = next_arg(i, "--state-file");
                if (!v) return std::nullopt;
                config.state_file = v;
            } else if (arg == "--concurrency") {
                auto* v = next_arg(i, "--concurrency");
                if (!v) return std::nullopt;
                config.upload_concurrency = std::stoull(v);
            } else if (arg == "--max-rounds") {
                auto* v = next_arg(i, "--max-rounds");
                if (!v) return std::nullopt;
                config.max_rounds = std::stoi(v);
            } else if (arg == "--timeout") {
                auto* v = next_arg(i, "--timeout");
                if (!v) return std::nullopt;
                config.timeout_secs = std::stoull(v);
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                print_push_usage();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return std::nullopt;
    }

    return config;
}

std::string PushClientConfig::validate() const {
    if (registry_url.empty()) return "registry URL is required (--registry)";
    if (ref.empty()) return "ref is required (--ref)";
    if (manifest_path.empty()) return "manifest is required (--manifest)";
    if (blobs_dir.empty()) return "blobs directory is required (--blobs)";
    if (!std::filesystem::is_directory(blobs_dir)) return "blobs directory does not exist: " + blobs_dir.string();
    if (upload_concurrency == 0) return "concurrency must be > 0";
    if (max_rounds <= 0) return "max_rounds must be > 0";
    if (timeout_secs == 0) return "timeout must be > 0";
    return {};
}

}  // namespace layerpush
