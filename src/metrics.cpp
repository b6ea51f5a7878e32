#include "layerpush/metrics.hpp"
#include "layerpush/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace layerpush {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& pushes_family = prometheus::BuildCounter()
        .Name("layerpush_push_requests_total")
        .Help("Push requests handled, by outcome")
        .Labels(labels)
        .Register(*registry_);
    pushes_complete_ = &pushes_family.Add({{"result", "complete"}});
    pushes_pending_ = &pushes_family.Add({{"result", "pending"}});
    pushes_error_ = &pushes_family.Add({{"result", "error"}});

    requirements_issued_ = &prometheus::BuildCounter()
        .Name("layerpush_requirements_issued_total")
        .Help("Upload requirements returned to clients")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    layers_deduplicated_ = &prometheus::BuildCounter()
        .Name("layerpush_layers_deduplicated_total")
        .Help("Layers found already present in the object store")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& multipart_family = prometheus::BuildCounter()
        .Name("layerpush_multipart_sessions_total")
        .Help("Multipart upload sessions, by event")
        .Labels(labels)
        .Register(*registry_);
    multipart_created_ = &multipart_family.Add({{"event", "created"}});
    multipart_completed_ = &multipart_family.Add({{"event", "completed"}});

    manifests_committed_ = &prometheus::BuildCounter()
        .Name("layerpush_manifests_committed_total")
        .Help("Manifests written to the object store")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    pushes_in_flight_ = &prometheus::BuildGauge()
        .Name("layerpush_push_requests_in_flight")
        .Help("Push requests currently being reconciled")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    push_duration_ = &prometheus::BuildHistogram()
        .Name("layerpush_push_duration_seconds")
        .Help("Push request reconciliation time in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        // Final snapshot
        write_file();
    }
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

bool MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("Cannot open metrics file %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) {
        log_error("Failed writing metrics file %s", tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_error("Cannot rename %s to %s: %s", tmp_path.c_str(), prom_file_path_.c_str(),
                  ec.message().c_str());
        return false;
    }
    return true;
}

} // namespace layerpush
