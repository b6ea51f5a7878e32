#include "layerpush/registry/coordinator.hpp"
#include "layerpush/core/log.hpp"
#include "layerpush/metrics.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <vector>
#include <unordered_map>

namespace layerpush {

namespace {

// Multipart evidence for one layer: upload id -> part number -> etag
struct LayerEvidence {
    std::map<std::string, std::map<int, std::string>> sessions;
    bool whole_object = false;
};

using Session = std::pair<const std::string, std::map<int, std::string>>;

// Reported sessions, most reported parts first
std::vector<const Session*> sessions_by_progress(const LayerEvidence& ev) {
    std::vector<const Session*> sessions;
    for (const auto& entry : ev.sessions) {
        sessions.push_back(&entry);
    }
    std::stable_sort(sessions.begin(), sessions.end(), [](const Session* a, const Session* b) {
        return a->second.size() > b->second.size();
    });
    return sessions;
}

ErrorKind storage_kind(ErrorKind kind) {
    // Anything but transient/canceled from the backend is reported as a storage failure
    if (kind == ErrorKind::Transient || kind == ErrorKind::Canceled) return kind;
    return ErrorKind::Storage;
}

std::string size_mismatch(const std::string& key, int64_t have, int64_t want) {
    return "object " + key + " has " + std::to_string(have) + " bytes, manifest declares " +
           std::to_string(want);
}

} // namespace

PushCoordinator::PushCoordinator(ObjectStore& store, CoordinatorConfig config, MetricsExporter* metrics)
    : store_(store), config_(config), metrics_(metrics) {}

ChunkPlan PushCoordinator::plan_for(int64_t size) const {
    int64_t chunk = config_.chunk_size;
    if (chunk > 0 && chunk < size) {
        chunk = std::max(chunk, config_.min_part_size);
        int64_t min_chunk = size / constants::S3_MAX_PARTS + (size % constants::S3_MAX_PARTS != 0 ? 1 : 0);
        chunk = std::max(chunk, min_chunk);
    }
    return chunks(size, chunk);
}

MultipartListResult PushCoordinator::list_incomplete_uploads(const std::string& prefix) const {
    return store_.list_multipart_uploads(constants::BLOB_KEY_PREFIX + prefix);
}

PushResult PushCoordinator::push(const std::string& ref, const std::string& manifest_json,
                                 const PushParams& params) {
    if (!metrics_) {
        return reconcile(ref, manifest_json, params);
    }

    metrics_->pushes_in_flight().Increment();
    PushResult result;
    {
        ScopedTimer timer(metrics_->push_duration());
        result = reconcile(ref, manifest_json, params);
    }
    metrics_->pushes_in_flight().Decrement();

    if (!result.success) {
        metrics_->pushes_error().Increment();
    } else if (result.requirements.empty()) {
        metrics_->pushes_complete().Increment();
    } else {
        metrics_->pushes_pending().Increment();
        metrics_->requirements_issued().Increment(static_cast<double>(result.requirements.size()));
    }
    return result;
}

PushResult PushCoordinator::reconcile(const std::string& ref, const std::string& manifest_json,
                                      const PushParams& params) {
    auto parsed_ref = parse_ref(ref);
    if (!parsed_ref.success) {
        return PushResult::failure(ErrorKind::InvalidInput, parsed_ref.error_message);
    }

    auto parsed = parse_manifest(manifest_json);
    if (!parsed.success) {
        return PushResult::failure(ErrorKind::InvalidInput, parsed.error_message);
    }
    const Manifest& manifest = parsed.manifest;

    // Distinct layers in declared order
    std::vector<Layer> layers;
    std::unordered_map<std::string, int64_t> sizes;
    for (const auto& layer : manifest.layers) {
        auto [it, inserted] = sizes.emplace(layer.digest, layer.size);
        if (inserted) {
            layers.push_back(layer);
        } else if (it->second != layer.size) {
            return PushResult::failure(ErrorKind::InvalidInput,
                "layer " + layer.digest + " is listed with sizes " + std::to_string(it->second) +
                " and " + std::to_string(layer.size));
        }
    }

    // Group the client's evidence by layer and session
    std::unordered_map<std::string, LayerEvidence> evidence;
    for (const auto& part : params.uploaded) {
        auto decoded = store_.parse_upload_url(part.url);
        if (!decoded.success) {
            return PushResult::failure(ErrorKind::InvalidInput, "uploaded: " + decoded.error_message);
        }
        const auto& target = decoded.target;

        std::string digest;
        if (target.key.starts_with(constants::BLOB_KEY_PREFIX)) {
            digest = target.key.substr(std::string(constants::BLOB_KEY_PREFIX).size());
        }
        if (digest.empty() || sizes.count(digest) == 0) {
            return PushResult::failure(ErrorKind::InvalidInput,
                "uploaded URL does not address a layer of this manifest: " + part.url);
        }
        if (part.etag.empty()) {
            return PushResult::failure(ErrorKind::InvalidInput, "uploaded URL has no etag: " + part.url);
        }

        auto& ev = evidence[digest];
        if (target.is_part()) {
            ev.sessions[target.upload_id][target.part_number] = part.etag;
        } else {
            ev.whole_object = true;
        }
    }

    std::vector<Requirement> requirements;

    auto presign = [&](const Layer& layer, const std::string& upload_id, const Chunk& chunk,
                       std::string& error, ErrorKind& kind) -> bool {
        auto signed_url = store_.presign_put(blob_key(layer.digest), upload_id,
                                             upload_id.empty() ? 0 : chunk.part_number,
                                             config_.presign_expiry);
        if (!signed_url.success) {
            error = signed_url.error_message;
            kind = signed_url.error_kind == ErrorKind::None ? ErrorKind::Storage : signed_url.error_kind;
            return false;
        }
        requirements.push_back({layer.digest, signed_url.url, chunk.offset, chunk.size});
        return true;
    };

    for (const auto& layer : layers) {
        const std::string key = blob_key(layer.digest);

        // a. Already present?
        auto st = store_.stat(key);
        if (st.success) {
            if (st.metadata.size != layer.size) {
                return PushResult::failure(ErrorKind::Integrity, size_mismatch(key, st.metadata.size, layer.size));
            }
            if (metrics_) metrics_->layers_deduplicated().Increment();
            continue;
        }
        if (st.error_kind != ErrorKind::NotFound) {
            return PushResult::failure(storage_kind(st.error_kind), st.error_message);
        }

        // b. Empty blobs have no bytes for a client to send
        if (layer.size == 0) {
            auto put = store_.put(key, {}, constants::DEFAULT_LAYER_CONTENT_TYPE);
            if (!put.success) {
                return PushResult::failure(storage_kind(put.error_kind), put.error_message);
            }
            log_debug("Wrote empty layer %s", key.c_str());
            continue;
        }

        ChunkPlan plan = plan_for(layer.size);
        bool multipart = layer.size >= config_.min_multipart_size && !plan.single();

        std::string error;
        ErrorKind kind = ErrorKind::Storage;
        std::optional<std::string> resume_upload_id;
        std::set<int> resume_parts;  // parts still needed under resume_upload_id

        // c/d. Multipart evidence
        auto ev_it = evidence.find(layer.digest);
        std::vector<const Session*> sessions;
        if (ev_it != evidence.end()) sessions = sessions_by_progress(ev_it->second);

        for (const auto* session : sessions) {
            int highest = session->second.rbegin()->first;
            if (highest > plan.count()) {
                return PushResult::failure(ErrorKind::InvalidInput,
                    "part " + std::to_string(highest) + " of " + key +
                    " is beyond the " + std::to_string(plan.count()) + "-part plan");
            }
        }

        // Sessions reporting every part are completed first
        bool present = false;
        std::vector<const Session*> partial;
        for (const auto* session : sessions) {
            const std::string& upload_id = session->first;
            const auto& parts = session->second;
            if (static_cast<int>(parts.size()) != plan.count()) {
                partial.push_back(session);
                continue;
            }

            std::vector<CompletedPart> completed;
            completed.reserve(parts.size());
            for (const auto& [number, etag] : parts) {
                completed.push_back({number, etag});
            }

            auto done = store_.complete_multipart(key, upload_id, completed);
            if (done.success) {
                if (metrics_) metrics_->multipart_completed().Increment();
                auto after = store_.stat(key);
                if (!after.success) {
                    return PushResult::failure(storage_kind(after.error_kind),
                        "after completing " + key + ": " + after.error_message);
                }
                if (after.metadata.size != layer.size) {
                    return PushResult::failure(ErrorKind::Integrity,
                        size_mismatch(key, after.metadata.size, layer.size));
                }
                log_debug("Completed multipart upload %s (%zu parts)", key.c_str(), completed.size());
                present = true;
                break;
            }

            if (done.error_code == "NoSuchUpload") {
                // Another pusher may have completed the same session
                auto after = store_.stat(key);
                if (after.success) {
                    if (after.metadata.size != layer.size) {
                        return PushResult::failure(ErrorKind::Integrity,
                            size_mismatch(key, after.metadata.size, layer.size));
                    }
                    present = true;
                    break;
                }
                if (after.error_kind != ErrorKind::NotFound) {
                    return PushResult::failure(storage_kind(after.error_kind), after.error_message);
                }
                log_info("Multipart upload %s for %s is gone", upload_id.c_str(), key.c_str());
            } else if (done.error_code == "InvalidPart") {
                // Reported etags do not match what the store holds: upload every part again
                log_info("Multipart upload for %s rejected parts (%s); re-requesting them",
                         key.c_str(), done.error_message.c_str());
                resume_upload_id = upload_id;
                for (int n = 1; n <= plan.count(); ++n) resume_parts.insert(n);
                break;
            } else {
                return PushResult::failure(storage_kind(done.error_kind), done.error_message);
            }
        }
        if (present) continue;

        // Otherwise resume the live session with the most reported parts
        if (!resume_upload_id && !partial.empty()) {
            auto listed = store_.list_multipart_uploads(key);
            if (!listed.success) {
                return PushResult::failure(storage_kind(listed.error_kind), listed.error_message);
            }
            for (const auto* session : partial) {
                bool alive = std::any_of(listed.uploads.begin(), listed.uploads.end(),
                                         [&](const MultipartUpload& u) {
                                             return u.key == key && u.upload_id == session->first;
                                         });
                if (!alive) continue;
                resume_upload_id = session->first;
                for (const auto& chunk : plan) {
                    if (session->second.count(chunk.part_number) == 0) resume_parts.insert(chunk.part_number);
                }
                break;
            }
        }
        if (!sessions.empty() && !resume_upload_id) {
            log_info("No reported multipart upload for %s is still open; starting a new session", key.c_str());
        }

        if (resume_upload_id) {
            for (int n : resume_parts) {
                if (!presign(layer, *resume_upload_id, plan.at(n), error, kind)) {
                    return PushResult::failure(kind, error);
                }
            }
            continue;
        }

        // e. Fresh upload
        if (ev_it != evidence.end() && ev_it->second.whole_object) {
            log_info("Layer %s was reported uploaded but is not in the store; requesting it again",
                     key.c_str());
        }
        if (!multipart) {
            if (!presign(layer, "", Chunk{1, 0, layer.size}, error, kind)) {
                return PushResult::failure(kind, error);
            }
            continue;
        }

        auto created = store_.create_multipart(key);
        if (!created.success) {
            return PushResult::failure(storage_kind(created.error_kind), created.error_message);
        }
        if (metrics_) metrics_->multipart_created().Increment();
        log_debug("Created multipart upload for %s (%d parts)", key.c_str(), plan.count());

        for (const auto& chunk : plan) {
            if (!presign(layer, created.upload_id, chunk, error, kind)) {
                return PushResult::failure(kind, error);
            }
        }
    }

    PushResult result;
    result.success = true;

    if (!requirements.empty()) {
        log_debug("Push %s: %zu requirements outstanding", ref.c_str(), requirements.size());
        result.requirements = std::move(requirements);
        return result;
    }

    std::string manifest_key = parsed_ref.ref.manifest_key();
    std::vector<uint8_t> body(manifest.json.begin(), manifest.json.end());
    auto put = store_.put(manifest_key, body, "application/json");
    if (!put.success) {
        return PushResult::failure(storage_kind(put.error_kind), put.error_message);
    }
    if (metrics_) metrics_->manifests_committed().Increment();
    log_info("Committed manifest %s (%zu layers)", manifest_key.c_str(), manifest.layers.size());
    return result;
}

} // namespace layerpush
