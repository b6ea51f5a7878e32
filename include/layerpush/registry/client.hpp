#pragma once

#include "layerpush/core/constants.hpp"
#include "layerpush/core/context.hpp"
#include "layerpush/io/reader_at.hpp"
#include "layerpush/net/http.hpp"
#include "layerpush/registry/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace layerpush {

/// One request/response exchange with a registry's push endpoint.
class RegistryClient {
public:
    explicit RegistryClient(std::string base_url, const net::HttpClientConfig& http_config = {});

    /// POST /v1/push. Error responses are mapped back to their ErrorKind;
    /// connection failures are Transient.
    PushResult push(const Context& ctx, const std::string& ref, const std::string& manifest_bytes,
                    const PushParams& params);

    const std::string& base_url() const { return base_url_; }
    net::HttpClient& http() { return http_; }

private:
    std::string base_url_;
    net::HttpClient http_;
};

struct PusherConfig {
    size_t upload_concurrency = constants::DEFAULT_UPLOAD_CONCURRENCY;
    int max_rounds = constants::DEFAULT_MAX_PUSH_ROUNDS;
    std::chrono::milliseconds max_backoff{constants::DEFAULT_MAX_BACKOFF_MS};
};

/// Drives push exchanges until the registry commits the manifest.
///
/// Each round sends every CompletePart gathered so far, uploads the returned
/// requirements, and records the resulting ETags. Evidence is keyed by the
/// upload target a URL addresses (object path, upload id, part number), so a
/// freshly signed URL for the same part replaces the older record.
class Pusher {
public:
    using RoundCallback = std::function<void(const std::vector<CompletePart>& evidence)>;

    Pusher(RegistryClient& client, PusherConfig config = {});

    /// Register the byte source for a layer digest.
    void add_source(const std::string& digest, std::shared_ptr<const ReaderAt> source);

    /// Seed evidence kept from an interrupted run.
    void set_evidence(const std::vector<CompletePart>& evidence);

    /// Called after every round that recorded new evidence.
    void on_round(RoundCallback callback) { on_round_ = std::move(callback); }

    PushResult run(const Context& ctx, const std::string& ref, const std::string& manifest_bytes);

    /// Evidence accumulated so far, in the order it was first recorded.
    std::vector<CompletePart> evidence() const;

    /// Number of push exchanges made by the last run().
    int rounds() const { return rounds_; }

private:
    PushResult exchange(const Context& ctx, const std::string& ref, const std::string& manifest_bytes);
    PushResult upload_all(const Context& ctx, const std::vector<Requirement>& requirements);
    void record(const CompletePart& part);

    RegistryClient& client_;
    PusherConfig config_;
    std::map<std::string, std::shared_ptr<const ReaderAt>> sources_;

    std::vector<std::string> evidence_order_;
    std::map<std::string, CompletePart> evidence_;

    RoundCallback on_round_;
    int rounds_ = 0;
};

/// Identity of the upload a presigned URL addresses, ignoring its signature.
std::string upload_target_key(const std::string& url);

} // namespace layerpush
