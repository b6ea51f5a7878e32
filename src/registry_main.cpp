#include "layerpush/core/log.hpp"
#include "layerpush/metrics.hpp"
#include "layerpush/registry/coordinator.hpp"
#include "layerpush/registry/server.hpp"
#include "layerpush/registry_config.hpp"
#include "layerpush/storage/object_store.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);  // Parent exits

    if (setsid() < 0) return false;

    // Second fork to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    // stdout/stderr are redirected to the log file after this returns
    close(STDIN_FILENO);
    open("/dev/null", O_RDONLY);  // stdin = fd 0

    return true;
}

void write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (ofs) {
        ofs << getpid() << "\n";
    }
}

bool is_secret_param(const std::string& k) {
    return k.find("key") != std::string::npos || k.find("secret") != std::string::npos ||
           k.find("token") != std::string::npos || k.find("credential") != std::string::npos;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = layerpush::RegistryConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Daemonize if requested (before log redirect so we fork first)
    if (config.daemonize) {
        if (!daemonize()) {
            std::cerr << "Failed to daemonize" << std::endl;
            return 1;
        }
    }

    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }

    layerpush::set_verbose_logging(config.verbose);

    std::cout << "layerpush-registry starting..." << std::endl;
    std::cout << "  listen: " << config.listen_address << ":" << config.port << std::endl;
    std::cout << "  backend-type: " << config.backend.type << std::endl;
    for (auto& [k, v] : config.backend.params) {
        // Mask secrets in log output
        std::cout << "  backend-" << k << ": " << (is_secret_param(k) ? "****" : v) << std::endl;
    }
    std::cout << "  chunk-size: " << config.chunk_size << std::endl;
    std::cout << "  min-multipart-size: " << config.min_multipart_size << std::endl;
    std::cout << "  presign-expiry: " << config.presign_expiry_secs << "s" << std::endl;

    std::unique_ptr<layerpush::ObjectStore> store;
    try {
        store = layerpush::ObjectStoreFactory::create(config.backend.type, config.backend.params);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create object store: " << e.what() << std::endl;
        return 1;
    }

    if (!config.pid_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.pid_file.parent_path(), ec);
        write_pid_file(config.pid_file);
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    std::unique_ptr<layerpush::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<layerpush::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"bucket", config.backend.params["bucket"]}});
        metrics->start();
        std::cout << "  metrics-file: " << config.metrics_file << std::endl;
    }

    layerpush::CoordinatorConfig coordinator_config;
    coordinator_config.chunk_size = config.chunk_size;
    coordinator_config.min_multipart_size = config.min_multipart_size;
    coordinator_config.presign_expiry = std::chrono::seconds(config.presign_expiry_secs);
    layerpush::PushCoordinator coordinator(*store, coordinator_config, metrics.get());

    layerpush::net::HttpServerConfig server_config;
    server_config.listen_address = config.listen_address;
    server_config.port = config.port;
    server_config.max_body_size = layerpush::constants::DEFAULT_MAX_PUSH_REQUEST_BODY;
    layerpush::RegistryServer server(coordinator, server_config);

    err = server.start();
    if (!err.empty()) {
        std::cerr << "Failed to start server: " << err << std::endl;
        if (metrics) metrics->stop();
        return 1;
    }

    std::cout << "layerpush-registry running on port " << server.port() << " (PID " << getpid() << ")"
              << std::endl;

    // Wait until shutdown signal, then stop outside signal context.
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    server.stop();
    if (metrics) metrics->stop();

    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    std::cout << "layerpush-registry exited cleanly" << std::endl;
    return 0;
}
