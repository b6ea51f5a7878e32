#pragma once

#include "layerpush/core/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace layerpush {

// A content-addressed blob referenced by a manifest
struct Layer {
    std::string digest;
    int64_t size = 0;
};

// Ordered layer list plus the exact JSON document committed for it
struct Manifest {
    std::vector<Layer> layers;
    std::string json;  // Re-serialized document; unknown fields preserved
};

struct ManifestParseResult {
    bool success = false;
    Manifest manifest;
    std::string error_message;
};

// Parse {"layers":[{"digest":"...","size":N},...]}. Other top-level fields are kept.
ManifestParseResult parse_manifest(const std::string& bytes);

// Empty if the digest is usable as a storage key component, otherwise the reason
std::string validate_digest(const std::string& digest);

// <registry>/<namespace...>/<name>:<tag>+<build>
struct Ref {
    std::string registry;
    std::vector<std::string> namespaces;
    std::string name;
    std::string tag;
    std::string build;

    std::string to_string() const;

    // manifests/<registry>/<namespace...>/<name>/<tag>/<build>
    std::string manifest_key() const;
};

struct RefParseResult {
    bool success = false;
    Ref ref;
    std::string error_message;
};

/// Parses <registry>/<namespace...>/<name>:<tag>+<build>. The ref may hold
/// exactly one ':', so a registry with a port (localhost:5000/...) is rejected.
RefParseResult parse_ref(const std::string& ref);

// blobs/<digest>
std::string blob_key(const std::string& digest);

// A byte range the client must PUT to a presigned URL
struct Requirement {
    std::string digest;
    std::string url;
    int64_t offset = 0;
    int64_t size = 0;
};

// Evidence that one URL was written successfully
struct CompletePart {
    std::string url;
    std::string etag;
};

struct PushParams {
    std::vector<CompletePart> uploaded;
};

// Outcome of one push exchange; requirements empty on success means committed
struct PushResult {
    bool success = false;
    std::vector<Requirement> requirements;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;

    bool committed() const { return success && requirements.empty(); }

    static PushResult failure(ErrorKind kind, std::string message) {
        PushResult r;
        r.error_kind = kind;
        r.error_message = std::move(message);
        return r;
    }
};

// ----------------------------------------------------------------------------
// Wire encoding for the push endpoint (POST /v1/push)
// ----------------------------------------------------------------------------

struct PushRequestDecodeResult {
    bool success = false;
    std::string ref;
    std::string manifest_json;
    PushParams params;
    std::string error_message;
};

// {"ref":"...","manifest":{...},"uploaded":[{"url":"...","etag":"..."}]}
std::string encode_push_request(const std::string& ref, const Manifest& manifest, const PushParams& params);
PushRequestDecodeResult decode_push_request(const std::string& body);

struct PushResponseDecodeResult {
    bool success = false;
    std::vector<Requirement> requirements;
    std::string error_message;
};

// {"requirements":[{"digest":"...","url":"...","offset":N,"size":N}]}
std::string encode_push_response(const std::vector<Requirement>& requirements);
PushResponseDecodeResult decode_push_response(const std::string& body);

struct WireError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

// {"error":{"code":"<kind>","message":"..."}}
std::string encode_error(ErrorKind kind, const std::string& message);
std::optional<WireError> decode_error(const std::string& body);

// HTTP status an error kind is reported with
int error_kind_http_status(ErrorKind kind);

// CompletePart lists as a JSON array (client state file)
std::string encode_complete_parts(const std::vector<CompletePart>& parts);
std::optional<std::vector<CompletePart>> decode_complete_parts(const std::string& json, std::string& error);

} // namespace layerpush
