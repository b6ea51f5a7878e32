#pragma once

#include "layerpush/core/constants.hpp"
#include "layerpush/core/context.hpp"
#include "layerpush/core/errors.hpp"
#include "layerpush/io/reader_at.hpp"
#include "layerpush/net/http.hpp"

#include <cstdint>
#include <string>

namespace layerpush {

struct PushLayerResult {
    bool success = false;
    std::string etag;          // Without surrounding quotes
    int status_code = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_code;    // S3 error code when the body carried one
    std::string error_message;
};

/// PUT bytes [offset, offset + size) of `source` to a presigned URL.
///
/// The body is streamed from the source, never buffered whole. Only a 200
/// response counts as success, and it must carry an ETag.
PushLayerResult push_layer(const Context& ctx,
                           net::HttpClient& client,
                           const std::string& url,
                           int64_t offset,
                           int64_t size,
                           const ReaderAt& source,
                           const std::string& content_type = constants::DEFAULT_LAYER_CONTENT_TYPE);

} // namespace layerpush
