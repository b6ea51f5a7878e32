#pragma once

#include "layerpush/core/constants.hpp"
#include "layerpush/registry/types.hpp"
#include "layerpush/storage/object_store.hpp"
#include "layerpush/upload/chunks.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace layerpush {

class MetricsExporter;

struct CoordinatorConfig {
    // Requested part size for multipart sessions (capped so a plan has at most 10000 parts)
    int64_t chunk_size = constants::DEFAULT_UPLOAD_CHUNK_SIZE;

    // Smallest non-final part the store accepts; smaller chunk sizes are raised to it
    int64_t min_part_size = constants::S3_MIN_PART_SIZE;

    // Layers smaller than this get a single presigned PUT
    int64_t min_multipart_size = constants::DEFAULT_MIN_MULTIPART_SIZE;

    std::chrono::seconds presign_expiry{constants::DEFAULT_PRESIGN_EXPIRY_SECONDS};
};

/// Reconciles a manifest against the object store.
///
/// Every call recomputes what is missing from the store and the evidence the
/// client sends; nothing is remembered between calls, so concurrent pushes of
/// the same or overlapping manifests need no locking. The manifest is written
/// only once every layer is present with its declared size.
class PushCoordinator {
public:
    PushCoordinator(ObjectStore& store, CoordinatorConfig config = {}, MetricsExporter* metrics = nullptr);

    /// Returns the outstanding requirements, or an empty list once the
    /// manifest has been committed under the ref's manifest key.
    PushResult push(const std::string& ref, const std::string& manifest_json, const PushParams& params);

    /// Incomplete multipart sessions under blobs/<prefix>. Read-only.
    MultipartListResult list_incomplete_uploads(const std::string& prefix = "") const;

    /// Chunk plan used for a layer of the given size.
    ChunkPlan plan_for(int64_t size) const;

    const CoordinatorConfig& config() const { return config_; }

private:
    PushResult reconcile(const std::string& ref, const std::string& manifest_json, const PushParams& params);

    ObjectStore& store_;
    CoordinatorConfig config_;
    MetricsExporter* metrics_;
};

} // namespace layerpush
