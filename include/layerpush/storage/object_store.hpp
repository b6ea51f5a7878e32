#pragma once

#include "layerpush/core/errors.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace layerpush {

// Metadata about a stored object
struct ObjectMetadata {
    int64_t size = 0;
    std::string etag;
    std::string content_type;
};

// Result of a stat (HEAD). A missing key is success == false with ErrorKind::NotFound.
struct StatResult {
    bool success = false;
    ObjectMetadata metadata;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

// Result of a put or multipart completion
struct PutResult {
    bool success = false;
    std::string etag;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_code;  // Backend error code when one was returned (e.g. "NoSuchUpload")
    std::string error_message;
};

// Result of a get operation
struct GetResult {
    bool success = false;
    std::vector<uint8_t> data;
    ObjectMetadata metadata;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

// Entry in a listing operation
struct ListEntry {
    std::string key;
    int64_t size = 0;
    std::string etag;
};

struct ListOptions {
    std::string prefix;
    uint32_t max_keys = 1000;
    std::string continuation_token;
};

struct ListResult {
    bool success = false;
    std::vector<ListEntry> entries;
    bool truncated = false;
    std::string continuation_token;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

// An open multipart upload session
struct MultipartUpload {
    std::string key;
    std::string upload_id;
    std::string initiated;  // ISO 8601 timestamp as reported by the backend
};

struct MultipartResult {
    bool success = false;
    std::string upload_id;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

struct MultipartListResult {
    bool success = false;
    std::vector<MultipartUpload> uploads;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

struct CompletedPart {
    int part_number = 0;
    std::string etag;
};

struct PresignResult {
    bool success = false;
    std::string url;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

// What a presigned upload URL writes to: a whole object, or one part of a
// multipart session when upload_id is set.
struct UploadTarget {
    std::string key;
    std::string upload_id;
    int part_number = 0;

    bool is_part() const { return !upload_id.empty(); }
};

struct UploadTargetResult {
    bool success = false;
    UploadTarget target;
    std::string error_message;
};

// Abstract object store: the single source of truth for blobs, manifests and
// multipart sessions. Keys are logical ("blobs/<digest>"); any configured key
// prefix is applied by the implementation. All methods are thread-safe.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual std::string type_name() const = 0;

    virtual StatResult stat(const std::string& key) const = 0;

    virtual GetResult get(const std::string& key) const = 0;

    virtual PutResult put(const std::string& key,
                          std::span<const uint8_t> data,
                          const std::string& content_type = "application/octet-stream") = 0;

    virtual ListResult list(const ListOptions& options = {}) const = 0;

    // Multipart lifecycle
    virtual MultipartResult create_multipart(const std::string& key) = 0;

    // Parts must be in ascending part number order
    virtual PutResult complete_multipart(const std::string& key,
                                         const std::string& upload_id,
                                         const std::vector<CompletedPart>& parts) = 0;

    virtual PutResult abort_multipart(const std::string& key, const std::string& upload_id) = 0;

    // Incomplete sessions whose key starts with prefix
    virtual MultipartListResult list_multipart_uploads(const std::string& prefix) const = 0;

    // Presigned PUT URL for a whole object (empty upload_id) or one part
    virtual PresignResult presign_put(const std::string& key,
                                      const std::string& upload_id,
                                      int part_number,
                                      std::chrono::seconds expires) const = 0;

    // Inverse of presign_put(): recover the target a presigned URL writes to
    virtual UploadTargetResult parse_upload_url(const std::string& url) const = 0;
};

// Factory for creating object stores from configuration
class ObjectStoreFactory {
public:
    // Throws std::runtime_error for an unknown type or missing required params
    static std::unique_ptr<ObjectStore> create(
        const std::string& type,
        const std::map<std::string, std::string>& params);
};

} // namespace layerpush
