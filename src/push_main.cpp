// layerpush-push: push a manifest and its layers to a layerpush registry.
//
// Usage: layerpush-push --registry <url> --ref <ref> --manifest <path> --blobs <dir> [options]
//
// Each layer's bytes are read from <blobs>/<digest>. With --state-file, the
// parts uploaded so far are saved after every round and loaded on start, so a
// push interrupted by a crash or Ctrl-C resumes without re-sending them.

#include "layerpush/core/context.hpp"
#include "layerpush/core/log.hpp"
#include "layerpush/io/reader_at.hpp"
#include "layerpush/registry/client.hpp"
#include "layerpush/registry/types.hpp"
#include "layerpush/registry_config.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int sig) {
    (void)sig;
    g_interrupted = 1;
}

bool read_file(const std::filesystem::path& path, std::string& out) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

// Write via temp file + rename
bool save_state(const std::filesystem::path& path, const std::vector<layerpush::CompletePart>& parts) {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) return false;
        ofs << layerpush::encode_complete_parts(parts) << "\n";
        if (!ofs) return false;
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    return !ec;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = layerpush::PushClientConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    layerpush::set_verbose_logging(config.verbose);

    std::string manifest_bytes;
    if (!read_file(config.manifest_path, manifest_bytes)) {
        layerpush::log_error("Cannot read manifest %s", config.manifest_path.c_str());
        return 1;
    }
    auto manifest = layerpush::parse_manifest(manifest_bytes);
    if (!manifest.success) {
        layerpush::log_error("Invalid manifest: %s", manifest.error_message.c_str());
        return 1;
    }

    layerpush::RegistryClient client(config.registry_url);

    layerpush::PusherConfig pusher_config;
    pusher_config.upload_concurrency = config.upload_concurrency;
    pusher_config.max_rounds = config.max_rounds;
    layerpush::Pusher pusher(client, pusher_config);

    for (const auto& layer : manifest.manifest.layers) {
        auto path = config.blobs_dir / layer.digest;
        try {
            auto source = std::make_shared<layerpush::FileReaderAt>(path);
            if (source->size() != static_cast<uint64_t>(layer.size)) {
                layerpush::log_error("Layer %s is %llu bytes on disk, manifest declares %lld",
                                     layer.digest.c_str(),
                                     static_cast<unsigned long long>(source->size().value_or(0)),
                                     static_cast<long long>(layer.size));
                return 1;
            }
            pusher.add_source(layer.digest, std::move(source));
        } catch (const std::exception& e) {
            layerpush::log_error("Cannot open layer %s: %s", layer.digest.c_str(), e.what());
            return 1;
        }
    }

    if (!config.state_file.empty() && std::filesystem::exists(config.state_file)) {
        std::string state;
        std::string parse_error;
        if (!read_file(config.state_file, state)) {
            layerpush::log_error("Cannot read state file %s", config.state_file.c_str());
            return 1;
        }
        auto parts = layerpush::decode_complete_parts(state, parse_error);
        if (!parts) {
            layerpush::log_error("Invalid state file %s: %s", config.state_file.c_str(), parse_error.c_str());
            return 1;
        }
        pusher.set_evidence(*parts);
        layerpush::log_info("Resuming with %zu uploaded part(s) from %s", parts->size(),
                            config.state_file.c_str());
    }

    if (!config.state_file.empty()) {
        pusher.on_round([&config](const std::vector<layerpush::CompletePart>& parts) {
            if (!save_state(config.state_file, parts)) {
                layerpush::log_error("Failed to save state file %s", config.state_file.c_str());
            }
        });
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    auto ctx = layerpush::Context::with_timeout(std::chrono::seconds(config.timeout_secs));

    // Signals only set a flag; the context is cancelled from a normal thread
    std::atomic<bool> finished{false};
    std::thread watcher([&]() {
        while (!finished.load()) {
            if (g_interrupted) {
                layerpush::log_info("Interrupted, cancelling push");
                ctx.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto result = pusher.run(ctx, config.ref, manifest_bytes);

    finished = true;
    watcher.join();

    if (!result.success) {
        layerpush::log_error("Push failed (%s): %s", layerpush::error_kind_to_string(result.error_kind),
                             result.error_message.c_str());
        return 1;
    }

    if (!config.state_file.empty()) {
        std::error_code ec;
        std::filesystem::remove(config.state_file, ec);
    }

    std::printf("%s\n", config.ref.c_str());
    return 0;
}
