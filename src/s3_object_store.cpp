#include "layerpush/storage/object_store.hpp"
#include "layerpush/storage/s3_xml.hpp"
#include "layerpush/core/constants.hpp"
#include "layerpush/core/log.hpp"
#include "layerpush/net/http.hpp"

#include <cstring>
#include <sstream>
#include <stdexcept>

namespace layerpush {

namespace {

// ============================================================================
// SecureString - zeros its buffer on destruction so credentials do not
// linger in freed memory
// ============================================================================

class SecureString {
public:
    SecureString() = default;
    SecureString(const std::string& s) : data_(s) {}
    SecureString(const SecureString& other) : data_(other.data_) {}
    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            secure_clear();
            data_ = other.data_;
        }
        return *this;
    }
    ~SecureString() { secure_clear(); }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    void secure_clear() {
        if (!data_.empty()) {
            explicit_bzero(data_.data(), data_.size());
            data_.clear();
        }
    }

    std::string data_;
};

// S3 error codes that mean "try again later" even when the status does not say so
bool is_transient_s3_code(const std::string& code) {
    return code == "InternalError" || code == "SlowDown" || code == "ServiceUnavailable" ||
           code == "RequestTimeout";
}

ErrorKind classify(const net::HttpResponse& response, const std::string& s3_code = "") {
    if (response.canceled) return ErrorKind::Canceled;
    if (response.is_network_error) return ErrorKind::Transient;
    if (net::is_retryable_status(response.status_code) || is_transient_s3_code(s3_code)) {
        return ErrorKind::Transient;
    }
    if (response.status_code == 404) return ErrorKind::NotFound;
    return ErrorKind::Storage;
}

// Fills kind/code/message from a failed response, naming the operation and key
template <typename Result>
void fail(Result& result, const char* op, const std::string& key, const net::HttpResponse& response,
          std::string* error_code = nullptr) {
    result.success = false;
    std::string message = std::string(op) + " " + key + ": ";
    std::string code;
    if (!response.error.empty()) {
        message += response.error;
    } else if (auto err = xml::parse_s3_error(response.body_string())) {
        code = err->code;
        message += err->code + ": " + err->message + " (HTTP " + std::to_string(response.status_code) + ")";
    } else {
        message += "HTTP " + std::to_string(response.status_code);
    }
    result.error_kind = classify(response, code);
    result.error_message = message;
    if (error_code) *error_code = code;
}

// Ensure ETag has surrounding quotes (required for S3 CompleteMultipartUpload)
std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1";
}

uint32_t parse_uint(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        unsigned long v = std::stoul(value, &used);
        if (used == value.size()) return static_cast<uint32_t>(v);
    } catch (const std::exception&) {
    }
    throw std::runtime_error("S3 config '" + name + "' must be a non-negative integer, got '" + value + "'");
}

} // namespace

// ============================================================================
// S3ObjectStore - S3-compatible object store
// ============================================================================

class S3ObjectStore : public ObjectStore {
public:
    struct Config {
        std::string bucket;
        std::string region = "us-east-1";
        std::string endpoint;     // Empty for AWS, custom for MinIO/etc
        std::string path_prefix;  // Key prefix for shared buckets (e.g., "registry/")
        SecureString access_key;
        SecureString secret_key;
        std::string session_token;  // STS/temporary credentials
        bool use_path_style = false;
        bool verify_ssl = true;
        uint32_t connect_timeout_secs = 10;
        uint32_t request_timeout_secs = 300;
    };

    explicit S3ObjectStore(const Config& config)
        : config_(config)
        , signer_(config.access_key.str(), config.secret_key.str(), config.region, "s3") {
        if (!config_.path_prefix.empty() && config_.path_prefix.back() != '/') {
            config_.path_prefix += '/';
        }
        while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
            config_.endpoint.pop_back();
        }

        net::HttpClientConfig http_config;
        http_config.user_agent = "layerpush-s3/1.0";
        http_config.verify_ssl = config_.verify_ssl;
        http_client_ = std::make_unique<net::HttpClient>(http_config);

        auto base = net::ParsedUrl::parse(build_url(""));
        base_path_ = (base ? base->path : std::string()) + "/";
    }

    std::string type_name() const override { return "s3"; }

    StatResult stat(const std::string& key) const override {
        StatResult result;

        net::HttpRequest request = net::HttpRequest::head(build_url(key));
        prepare(request);
        auto response = http_client_->execute(request);

        if (!response.ok()) {
            fail(result, "stat", key, response);
            return result;
        }

        result.success = true;
        result.metadata.size = static_cast<int64_t>(response.headers.content_length().value_or(0));
        result.metadata.etag = response.headers.get("ETag").value_or("");
        result.metadata.content_type = response.headers.content_type().value_or("application/octet-stream");
        return result;
    }

    GetResult get(const std::string& key) const override {
        GetResult result;

        net::HttpRequest request = net::HttpRequest::get(build_url(key));
        prepare(request);
        auto response = http_client_->execute(request);

        if (!response.ok()) {
            fail(result, "get", key, response);
            return result;
        }

        result.success = true;
        result.data = std::move(response.body);
        result.metadata.size = static_cast<int64_t>(result.data.size());
        result.metadata.etag = response.headers.get("ETag").value_or("");
        result.metadata.content_type = response.headers.content_type().value_or("application/octet-stream");
        return result;
    }

    PutResult put(const std::string& key,
                  std::span<const uint8_t> data,
                  const std::string& content_type) override {
        PutResult result;

        net::HttpRequest request = net::HttpRequest::put(build_url(key),
            std::vector<uint8_t>(data.begin(), data.end()));
        request.headers.set_content_type(content_type.empty() ? "application/octet-stream" : content_type);
        prepare(request);
        auto response = http_client_->execute(request);

        if (!response.ok()) {
            fail(result, "put", key, response, &result.error_code);
            return result;
        }

        result.success = true;
        result.etag = response.headers.get("ETag").value_or("");
        return result;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;

        std::string url = build_url("") + "/?list-type=2";
        url += "&prefix=" + net::url_encode(config_.path_prefix + options.prefix);
        url += "&max-keys=" + std::to_string(options.max_keys);
        if (!options.continuation_token.empty()) {
            url += "&continuation-token=" + net::url_encode(options.continuation_token);
        }

        net::HttpRequest request = net::HttpRequest::get(url);
        prepare(request);
        auto response = http_client_->execute(request);

        if (!response.ok()) {
            fail(result, "list", options.prefix, response);
            return result;
        }

        std::string body = response.body_string();
        result.success = true;
        result.truncated = xml::get_element(body, "IsTruncated") == "true";
        result.continuation_token = xml::decode_entities(xml::get_element(body, "NextContinuationToken"));

        for (const auto& range : xml::find_elements(body, "Contents")) {
            std::string content = xml::element_content(body, range);

            ListEntry entry;
            entry.key = strip_prefix(xml::decode_entities(xml::get_element(content, "Key")));
            std::string size_str = xml::get_element(content, "Size");
            if (!size_str.empty()) {
                try {
                    entry.size = std::stoll(size_str);
                } catch (const std::exception&) {
                    result.success = false;
                    result.error_kind = ErrorKind::Storage;
                    result.error_message = "list " + options.prefix + ": invalid Size '" + size_str + "'";
                    return result;
                }
            }
            entry.etag = xml::decode_entities(xml::get_element(content, "ETag"));
            result.entries.push_back(std::move(entry));
        }

        return result;
    }

    MultipartResult create_multipart(const std::string& key) override {
        MultipartResult result;

        net::HttpRequest request = net::HttpRequest::post(build_url(key) + "?uploads", std::vector<uint8_t>{});
        prepare(request);
        auto response = http_client_->execute(request);

        if (!response.ok()) {
            fail(result, "create multipart upload", key, response);
            return result;
        }

        std::string upload_id = xml::decode_entities(xml::get_element(response.body_string(), "UploadId"));
        if (upload_id.empty()) {
            result.error_kind = ErrorKind::Storage;
            result.error_message = "create multipart upload " + key + ": response carries no UploadId";
            return result;
        }

        result.success = true;
        result.upload_id = upload_id;
        return result;
    }

    PutResult complete_multipart(const std::string& key,
                                 const std::string& upload_id,
                                 const std::vector<CompletedPart>& parts) override {
        PutResult result;

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        for (const auto& part : parts) {
            body << "  <Part>\n";
            body << "    <PartNumber>" << part.part_number << "</PartNumber>\n";
            body << "    <ETag>" << xml::escape(ensure_etag_quotes(part.etag)) << "</ETag>\n";
            body << "  </Part>\n";
        }
        body << "</CompleteMultipartUpload>";

        std::string url = build_url(key) + "?uploadId=" + net::url_encode(upload_id);
        net::HttpRequest request = net::HttpRequest::post(url, body.str());
        request.headers.set_content_type("application/xml");
        prepare(request);
        auto response = http_client_->execute(request);

        if (!response.ok()) {
            fail(result, "complete multipart upload", key, response, &result.error_code);
            return result;
        }

        // S3 can report a failed completion inside a 200 response
        std::string response_body = response.body_string();
        if (auto err = xml::parse_s3_error(response_body)) {
            result.error_code = err->code;
            result.error_kind = is_transient_s3_code(err->code) ? ErrorKind::Transient : ErrorKind::Storage;
            result.error_message = "complete multipart upload " + key + ": " + err->code + ": " + err->message;
            return result;
        }

        result.success = true;
        result.etag = xml::decode_entities(xml::get_element(response_body, "ETag"));
        return result;
    }

    PutResult abort_multipart(const std::string& key, const std::string& upload_id) override {
        PutResult result;

        std::string url = build_url(key) + "?uploadId=" + net::url_encode(upload_id);
        net::HttpRequest request = net::HttpRequest::del(url);
        prepare(request);
        auto response = http_client_->execute(request);

        if (!response.ok()) {
            fail(result, "abort multipart upload", key, response, &result.error_code);
            return result;
        }

        result.success = true;
        return result;
    }

    MultipartListResult list_multipart_uploads(const std::string& prefix) const override {
        MultipartListResult result;
        std::string key_marker;
        std::string upload_id_marker;

        while (true) {
            std::string url = build_url("") + "/?uploads";
            url += "&prefix=" + net::url_encode(config_.path_prefix + prefix);
            if (!key_marker.empty()) {
                url += "&key-marker=" + net::url_encode(key_marker);
                url += "&upload-id-marker=" + net::url_encode(upload_id_marker);
            }

            net::HttpRequest request = net::HttpRequest::get(url);
            prepare(request);
            auto response = http_client_->execute(request);

            if (!response.ok()) {
                fail(result, "list multipart uploads", prefix, response);
                result.uploads.clear();
                return result;
            }

            std::string body = response.body_string();
            for (const auto& range : xml::find_elements(body, "Upload")) {
                std::string content = xml::element_content(body, range);

                MultipartUpload upload;
                upload.key = strip_prefix(xml::decode_entities(xml::get_element(content, "Key")));
                upload.upload_id = xml::decode_entities(xml::get_element(content, "UploadId"));
                upload.initiated = xml::get_element(content, "Initiated");
                result.uploads.push_back(std::move(upload));
            }

            if (xml::get_element(body, "IsTruncated") != "true") break;

            std::string next_key = xml::decode_entities(xml::get_element(body, "NextKeyMarker"));
            std::string next_id = xml::decode_entities(xml::get_element(body, "NextUploadIdMarker"));
            if (next_key.empty() || (next_key == key_marker && next_id == upload_id_marker)) {
                result.error_kind = ErrorKind::Storage;
                result.error_message = "list multipart uploads " + prefix +
                                       ": truncated listing without a usable next marker";
                result.uploads.clear();
                return result;
            }
            key_marker = next_key;
            upload_id_marker = next_id;
        }

        result.success = true;
        return result;
    }

    PresignResult presign_put(const std::string& key,
                              const std::string& upload_id,
                              int part_number,
                              std::chrono::seconds expires) const override {
        PresignResult result;

        if (expires.count() <= 0 || expires.count() > constants::MAX_PRESIGN_EXPIRY_SECONDS) {
            result.error_kind = ErrorKind::InvalidInput;
            result.error_message = "presign " + key + ": expiry must be in (0, " +
                                   std::to_string(constants::MAX_PRESIGN_EXPIRY_SECONDS) + "] seconds";
            return result;
        }

        std::string url = build_url(key);
        if (!upload_id.empty()) {
            url += "?partNumber=" + std::to_string(part_number) + "&uploadId=" + net::url_encode(upload_id);
        }

        result.url = signer_.presign(net::HttpMethod::PUT, url, expires,
                                     std::chrono::system_clock::now(), config_.session_token);
        if (result.url.empty()) {
            result.error_kind = ErrorKind::Storage;
            result.error_message = "presign " + key + ": cannot parse endpoint URL " + url;
            return result;
        }

        result.success = true;
        return result;
    }

    UploadTargetResult parse_upload_url(const std::string& url) const override {
        UploadTargetResult result;

        auto parsed = net::ParsedUrl::parse(url);
        if (!parsed) {
            result.error_message = "not a URL: " + url;
            return result;
        }

        std::string path = net::url_decode(parsed->path);
        std::string expected = base_path_ + config_.path_prefix;
        if (!path.starts_with(expected) || path.size() == expected.size()) {
            result.error_message = "URL does not address an object in this store: " + url;
            return result;
        }
        result.target.key = path.substr(expected.size());

        auto params = parsed->query_params();
        auto upload_it = params.find("uploadId");
        auto part_it = params.find("partNumber");

        if (upload_it == params.end()) {
            if (part_it != params.end()) {
                result.error_message = "partNumber without uploadId in " + url;
                return result;
            }
            result.success = true;
            return result;
        }

        if (upload_it->second.empty()) {
            result.error_message = "empty uploadId in " + url;
            return result;
        }
        if (part_it == params.end()) {
            result.error_message = "multipart URL without partNumber: " + url;
            return result;
        }

        int part_number = 0;
        try {
            size_t used = 0;
            part_number = std::stoi(part_it->second, &used);
            if (used != part_it->second.size()) part_number = 0;
        } catch (const std::exception&) {
            part_number = 0;
        }
        if (part_number < 1 || part_number > constants::S3_MAX_PARTS) {
            result.error_message = "invalid partNumber '" + part_it->second + "' in " + url;
            return result;
        }

        result.target.upload_id = upload_it->second;
        result.target.part_number = part_number;
        result.success = true;
        return result;
    }

private:
    // Timeouts and signature
    void prepare(net::HttpRequest& request) const {
        request.connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
        request.total_timeout = std::chrono::seconds(config_.request_timeout_secs);
        if (!config_.session_token.empty()) {
            signer_.sign_with_token(request, config_.session_token);
        } else {
            signer_.sign(request);
        }
    }

    std::string build_url(const std::string& key) const {
        std::string url;
        if (!config_.endpoint.empty()) {
            url = config_.endpoint;
            if (config_.use_path_style && !config_.bucket.empty()) {
                url += "/" + config_.bucket;
            }
        } else {
            if (config_.use_path_style) {
                url = "https://s3." + config_.region + ".amazonaws.com/" + config_.bucket;
            } else {
                url = "https://" + config_.bucket + ".s3." + config_.region + ".amazonaws.com";
            }
        }
        if (!key.empty()) {
            url += "/" + net::url_encode_path(config_.path_prefix + key);
        }
        return url;
    }

    std::string strip_prefix(const std::string& key) const {
        if (!config_.path_prefix.empty() && key.starts_with(config_.path_prefix)) {
            return key.substr(config_.path_prefix.size());
        }
        return key;
    }

    Config config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;
    std::string base_path_;  // URL path of the bucket root, with trailing '/'
};

// ============================================================================
// ObjectStoreFactory
// ============================================================================

std::unique_ptr<ObjectStore> ObjectStoreFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& params) {

    if (type == "s3") {
        S3ObjectStore::Config s3_config;

        auto it = params.find("bucket");
        if (it == params.end() || it->second.empty()) {
            throw std::runtime_error("S3 backend requires 'bucket' config");
        }
        s3_config.bucket = it->second;

        if ((it = params.find("region")) != params.end() && !it->second.empty()) {
            s3_config.region = it->second;
        }
        if ((it = params.find("endpoint")) != params.end()) {
            s3_config.endpoint = it->second;
        }
        if ((it = params.find("path_prefix")) != params.end()) {
            s3_config.path_prefix = it->second;
        }
        if ((it = params.find("access_key")) != params.end()) {
            s3_config.access_key = it->second;
        }
        if ((it = params.find("secret_key")) != params.end()) {
            s3_config.secret_key = it->second;
        }
        if ((it = params.find("session_token")) != params.end()) {
            s3_config.session_token = it->second;
        }
        if ((it = params.find("use_path_style")) != params.end()) {
            s3_config.use_path_style = parse_bool(it->second);
        }
        if ((it = params.find("verify_ssl")) != params.end()) {
            s3_config.verify_ssl = parse_bool(it->second);
        }
        if ((it = params.find("connect_timeout")) != params.end()) {
            s3_config.connect_timeout_secs = parse_uint("connect_timeout", it->second);
        }
        if ((it = params.find("request_timeout")) != params.end()) {
            s3_config.request_timeout_secs = parse_uint("request_timeout", it->second);
        }

        log_debug("S3 object store: bucket=%s endpoint=%s prefix=%s",
                  s3_config.bucket.c_str(),
                  s3_config.endpoint.empty() ? "(aws)" : s3_config.endpoint.c_str(),
                  s3_config.path_prefix.c_str());
        return std::make_unique<S3ObjectStore>(s3_config);
    }

    throw std::runtime_error("Unknown storage backend type: " + type);
}

} // namespace layerpush
