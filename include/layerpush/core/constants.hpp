#pragma once

#include <cstddef>
#include <cstdint>

namespace layerpush::constants {

// Server defaults
constexpr uint16_t DEFAULT_REGISTRY_PORT = 9580;
constexpr const char* DEFAULT_LISTEN_ADDRESS = "0.0.0.0";
constexpr int DEFAULT_LISTEN_BACKLOG = 128;
constexpr int DEFAULT_CONNECTION_READ_TIMEOUT_SECONDS = 30;
constexpr size_t DEFAULT_MAX_REQUEST_BODY = 1024ULL * 1024 * 1024;     // 1GB (fake S3 parts)
constexpr size_t DEFAULT_MAX_PUSH_REQUEST_BODY = 16 * 1024 * 1024;     // 16MB

// Storage key layout
constexpr const char* BLOB_KEY_PREFIX = "blobs/";
constexpr const char* MANIFEST_KEY_PREFIX = "manifests/";

// Upload planning
constexpr int64_t S3_MIN_PART_SIZE = 5 * 1024 * 1024;                  // 5MB (S3 minimum part size)
constexpr int64_t DEFAULT_UPLOAD_CHUNK_SIZE = 64 * 1024 * 1024;        // 64MB
constexpr int64_t DEFAULT_MIN_MULTIPART_SIZE = S3_MIN_PART_SIZE;
constexpr int S3_MAX_PARTS = 10000;
constexpr int DEFAULT_PRESIGN_EXPIRY_SECONDS = 15 * 60;
constexpr int MAX_PRESIGN_EXPIRY_SECONDS = 7 * 24 * 3600;              // SigV4 limit

// Manifest limits
constexpr size_t MAX_DIGEST_LENGTH = 256;
constexpr size_t MAX_MANIFEST_LAYERS = 4096;

// Client defaults
constexpr size_t DEFAULT_UPLOAD_CONCURRENCY = 8;
constexpr int DEFAULT_MAX_PUSH_ROUNDS = 8;
constexpr int DEFAULT_PUSH_TIMEOUT_SECONDS = 3600;
constexpr int DEFAULT_MAX_BACKOFF_MS = 2000;
constexpr const char* DEFAULT_LAYER_CONTENT_TYPE = "text/plain";

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace layerpush::constants
