#include "layerpush/registry/client.hpp"
#include "layerpush/core/backoff.hpp"
#include "layerpush/core/log.hpp"
#include "layerpush/registry/push_layer.hpp"

#include <algorithm>
#include <future>

namespace layerpush {

std::string upload_target_key(const std::string& url) {
    auto parsed = net::ParsedUrl::parse(url);
    if (!parsed) {
        return url;
    }
    auto params = parsed->query_params();
    std::string key = parsed->host_header() + net::url_decode(parsed->path);
    auto upload_id = params.find("uploadId");
    auto part_number = params.find("partNumber");
    if (upload_id != params.end()) {
        key += "?uploadId=" + upload_id->second;
    }
    if (part_number != params.end()) {
        key += "&partNumber=" + part_number->second;
    }
    return key;
}

// ----------------------------------------------------------------------------
// RegistryClient
// ----------------------------------------------------------------------------

RegistryClient::RegistryClient(std::string base_url, const net::HttpClientConfig& http_config)
    : base_url_(std::move(base_url)), http_(http_config) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

PushResult RegistryClient::push(const Context& ctx, const std::string& ref,
                                const std::string& manifest_bytes, const PushParams& params) {
    auto manifest = parse_manifest(manifest_bytes);
    if (!manifest.success) {
        return PushResult::failure(ErrorKind::InvalidInput, manifest.error_message);
    }

    auto request = net::HttpRequest::post(base_url_ + "/v1/push",
                                          encode_push_request(ref, manifest.manifest, params));
    request.headers.set_content_type("application/json");
    request.context = &ctx;

    auto response = http_.execute(request);
    if (response.canceled) {
        return PushResult::failure(ErrorKind::Canceled, response.error);
    }
    if (response.status_code == 0) {
        return PushResult::failure(ErrorKind::Transient, "push " + ref + ": " + response.error);
    }

    if (response.status_code != 200) {
        if (auto err = decode_error(response.body_string())) {
            return PushResult::failure(err->kind, err->message);
        }
        ErrorKind kind = net::is_retryable_status(response.status_code) ? ErrorKind::Transient
                                                                         : ErrorKind::Storage;
        return PushResult::failure(kind, "push " + ref + ": unexpected status code " +
                                             std::to_string(response.status_code));
    }

    auto decoded = decode_push_response(response.body_string());
    if (!decoded.success) {
        return PushResult::failure(ErrorKind::Storage, "push " + ref + ": " + decoded.error_message);
    }

    PushResult result;
    result.success = true;
    result.requirements = std::move(decoded.requirements);
    return result;
}

// ----------------------------------------------------------------------------
// Pusher
// ----------------------------------------------------------------------------

Pusher::Pusher(RegistryClient& client, PusherConfig config)
    : client_(client), config_(config) {
    if (config_.upload_concurrency == 0) config_.upload_concurrency = 1;
}

void Pusher::add_source(const std::string& digest, std::shared_ptr<const ReaderAt> source) {
    sources_[digest] = std::move(source);
}

void Pusher::set_evidence(const std::vector<CompletePart>& evidence) {
    evidence_.clear();
    evidence_order_.clear();
    for (const auto& part : evidence) {
        record(part);
    }
}

void Pusher::record(const CompletePart& part) {
    std::string target = upload_target_key(part.url);
    auto [it, inserted] = evidence_.insert_or_assign(target, part);
    (void)it;
    if (inserted) {
        evidence_order_.push_back(target);
    }
}

std::vector<CompletePart> Pusher::evidence() const {
    std::vector<CompletePart> parts;
    parts.reserve(evidence_order_.size());
    for (const auto& target : evidence_order_) {
        parts.push_back(evidence_.at(target));
    }
    return parts;
}

PushResult Pusher::exchange(const Context& ctx, const std::string& ref, const std::string& manifest_bytes) {
    PushParams params;
    params.uploaded = evidence();

    PushResult last = PushResult::failure(ErrorKind::Canceled, "context canceled");
    for (const auto& err : backoff_upto(ctx, config_.max_backoff)) {
        if (!err.empty()) {
            if (last.error_kind == ErrorKind::Transient) {
                last.error_message += " (" + err + ")";
                return last;
            }
            return PushResult::failure(ErrorKind::Canceled, err);
        }
        last = client_.push(ctx, ref, manifest_bytes, params);
        if (last.success || !is_retryable(last.error_kind)) {
            return last;
        }
        log_debug("Push exchange for %s failed, retrying: %s", ref.c_str(), last.error_message.c_str());
    }
    return last;
}

PushResult Pusher::upload_all(const Context& ctx, const std::vector<Requirement>& requirements) {
    for (const auto& req : requirements) {
        if (sources_.count(req.digest) == 0) {
            return PushResult::failure(ErrorKind::InvalidInput, "no source for layer " + req.digest);
        }
    }

    auto upload_one = [this, &ctx](const Requirement& req) -> PushLayerResult {
        const ReaderAt& source = *sources_.at(req.digest);
        PushLayerResult last;
        last.error_kind = ErrorKind::Canceled;
        last.error_message = "context canceled";
        for (const auto& err : backoff_upto(ctx, config_.max_backoff)) {
            if (!err.empty()) {
                if (last.error_kind != ErrorKind::Transient) {
                    last.error_kind = ErrorKind::Canceled;
                    last.error_message = err;
                }
                return last;
            }
            last = push_layer(ctx, client_.http(), req.url, req.offset, req.size, source);
            if (last.success || !is_retryable(last.error_kind)) {
                return last;
            }
            log_debug("Upload of %s at offset %lld failed, retrying: %s", req.digest.c_str(),
                      static_cast<long long>(req.offset), last.error_message.c_str());
        }
        return last;
    };

    PushResult failure;
    bool failed = false;

    const size_t concurrency = config_.upload_concurrency;
    for (size_t batch_start = 0; batch_start < requirements.size(); batch_start += concurrency) {
        size_t batch_end = std::min(batch_start + concurrency, requirements.size());
        std::vector<std::future<PushLayerResult>> futures;

        for (size_t i = batch_start; i < batch_end; ++i) {
            futures.push_back(std::async(std::launch::async, upload_one, std::cref(requirements[i])));
        }

        // Every future is drained so completed parts are recorded even when a sibling fails
        for (size_t i = 0; i < futures.size(); ++i) {
            const auto& req = requirements[batch_start + i];
            auto uploaded = futures[i].get();
            if (uploaded.success) {
                record({req.url, uploaded.etag});
            } else if (!failed) {
                failed = true;
                failure = PushResult::failure(uploaded.error_kind,
                    "upload " + req.digest + " at offset " + std::to_string(req.offset) + ": " +
                    uploaded.error_message);
            }
        }

        if (failed) break;
    }

    if (failed) return failure;

    PushResult ok;
    ok.success = true;
    return ok;
}

PushResult Pusher::run(const Context& ctx, const std::string& ref, const std::string& manifest_bytes) {
    rounds_ = 0;

    while (true) {
        if (rounds_ >= config_.max_rounds) {
            return PushResult::failure(ErrorKind::Storage,
                "push " + ref + " made no progress after " + std::to_string(rounds_) + " rounds");
        }
        ++rounds_;

        auto result = exchange(ctx, ref, manifest_bytes);
        if (!result.success) {
            return result;
        }
        if (result.requirements.empty()) {
            log_info("Pushed %s in %d round(s)", ref.c_str(), rounds_);
            return result;
        }

        log_info("Round %d: uploading %zu chunk(s) for %s", rounds_, result.requirements.size(), ref.c_str());
        auto uploaded = upload_all(ctx, result.requirements);
        if (on_round_) {
            on_round_(evidence());
        }
        if (!uploaded.success) {
            return uploaded;
        }
    }
}

} // namespace layerpush
