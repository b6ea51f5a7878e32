#include "layerpush/registry/push_layer.hpp"
#include "layerpush/storage/s3_xml.hpp"

namespace layerpush {

namespace {

std::string strip_quotes(std::string etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        return etag.substr(1, etag.size() - 2);
    }
    return etag;
}

} // namespace

PushLayerResult push_layer(const Context& ctx,
                           net::HttpClient& client,
                           const std::string& url,
                           int64_t offset,
                           int64_t size,
                           const ReaderAt& source,
                           const std::string& content_type) {
    PushLayerResult result;

    if (offset < 0 || size < 0) {
        result.error_kind = ErrorKind::InvalidInput;
        result.error_message = "invalid range: offset " + std::to_string(offset) + ", size " +
                               std::to_string(size);
        return result;
    }

    SectionReader section(source, static_cast<uint64_t>(offset), static_cast<uint64_t>(size));

    net::HttpRequest request;
    request.method = net::HttpMethod::PUT;
    request.url = url;
    request.context = &ctx;
    request.body_stream = [&section](uint8_t* buf, size_t max) { return section.read(buf, max); };
    request.body_stream_size = static_cast<uint64_t>(size);
    request.headers.set_content_type(content_type.empty() ? constants::DEFAULT_LAYER_CONTENT_TYPE
                                                          : content_type);
    request.headers.set_content_length(static_cast<size_t>(size));
    if (size > 0) {
        request.headers.set("x-amz-copy-source-range",
                            "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + size - 1));
    }

    auto response = client.execute(request);
    result.status_code = response.status_code;

    if (response.canceled) {
        result.error_kind = ErrorKind::Canceled;
        result.error_message = "upload at offset " + std::to_string(offset) + ": " + response.error;
        return result;
    }
    if (response.is_network_error) {
        result.error_kind = ErrorKind::Transient;
        result.error_message = "upload at offset " + std::to_string(offset) + ": " + response.error;
        return result;
    }
    if (!response.error.empty() && response.status_code == 0) {
        // The source could not supply the declared bytes
        result.error_kind = ErrorKind::InvalidInput;
        result.error_message = "upload at offset " + std::to_string(offset) + ": " + response.error;
        return result;
    }

    if (response.status_code != 200) {
        result.error_kind = net::is_retryable_status(response.status_code) ? ErrorKind::Transient
                                                                            : ErrorKind::Storage;
        if (auto err = xml::parse_s3_error(response.body_string())) {
            result.error_code = err->code;
            result.error_message = err->code + ": " + err->message;
        } else {
            result.error_message = "unexpected status code " + std::to_string(response.status_code);
        }
        return result;
    }

    auto etag = response.headers.get("ETag");
    if (!etag || etag->empty()) {
        result.error_kind = ErrorKind::Storage;
        result.error_message = "upload at offset " + std::to_string(offset) + ": response has no ETag";
        return result;
    }

    result.success = true;
    result.etag = strip_quotes(*etag);
    return result;
}

} // namespace layerpush
