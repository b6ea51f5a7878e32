#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace layerpush {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports registry metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Serialize the registry to the .prom file now. Returns false on I/O failure.
    bool write_file();

    // --- Counter accessors ---
    prometheus::Counter& pushes_complete() { return *pushes_complete_; }
    prometheus::Counter& pushes_pending() { return *pushes_pending_; }
    prometheus::Counter& pushes_error() { return *pushes_error_; }
    prometheus::Counter& requirements_issued() { return *requirements_issued_; }
    prometheus::Counter& layers_deduplicated() { return *layers_deduplicated_; }
    prometheus::Counter& multipart_created() { return *multipart_created_; }
    prometheus::Counter& multipart_completed() { return *multipart_completed_; }
    prometheus::Counter& manifests_committed() { return *manifests_committed_; }

    // --- Gauge accessors ---
    prometheus::Gauge& pushes_in_flight() { return *pushes_in_flight_; }

    // --- Histogram accessors ---
    prometheus::Histogram& push_duration() { return *push_duration_; }

private:
    void writer_loop();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* pushes_complete_;
    prometheus::Counter* pushes_pending_;
    prometheus::Counter* pushes_error_;
    prometheus::Counter* requirements_issued_;
    prometheus::Counter* layers_deduplicated_;
    prometheus::Counter* multipart_created_;
    prometheus::Counter* multipart_completed_;
    prometheus::Counter* manifests_committed_;

    // --- Gauges ---
    prometheus::Gauge* pushes_in_flight_;

    // --- Histograms ---
    prometheus::Histogram* push_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

} // namespace layerpush
