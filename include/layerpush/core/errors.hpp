#pragma once

#include <string>

namespace layerpush {

// Classification carried by every result struct alongside success/error_message
enum class ErrorKind {
    None,
    InvalidInput,   // Malformed manifest, ref, URL or argument; never retried
    Transient,      // Network failure, throttling, backend not ready; retry with backoff
    Storage,        // Backend rejected the request (non-2xx), not retryable
    Integrity,      // Stored object disagrees with what the manifest declares
    NotFound,       // Key does not exist
    Canceled        // Caller's context was cancelled or its deadline passed
};

const char* error_kind_to_string(ErrorKind kind);

/// Parse the wire name produced by error_kind_to_string(). Unknown names map to Storage.
ErrorKind error_kind_from_string(const std::string& name);

inline bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::Transient;
}

} // namespace layerpush
