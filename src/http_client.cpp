#include "layerpush/net/http.hpp"
#include "layerpush/core/context.hpp"
#include <curl/curl.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <unordered_set>

namespace layerpush::net {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

std::optional<HttpMethod> http_method_from_string(const std::string& method) {
    if (method == "GET") return HttpMethod::GET;
    if (method == "POST") return HttpMethod::POST;
    if (method == "PUT") return HttpMethod::PUT;
    if (method == "DELETE") return HttpMethod::DELETE;
    if (method == "HEAD") return HttpMethod::HEAD;
    return std::nullopt;
}

const char* http_status_reason(int status) {
    switch (status) {
        case 100: return "Continue";
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
    }
    return "Unknown";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    return status == 408 || status == 429 || status == 500 ||
           status == 502 || status == 503 || status == 504;
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode_path(const std::string& path) {
    std::string result;
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            result += url_encode(path.substr(start));
            break;
        }
        result += url_encode(path.substr(start, slash - start));
        result += '/';
        start = slash + 1;
    }
    return result;
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string url_decode(const std::string& str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int h1 = hex_digit(str[i + 1]);
            int h2 = hex_digit(str[i + 2]);
            if (h1 >= 0 && h2 >= 0) {
                int value = (h1 << 4) | h2;
                // Reject embedded null bytes (%00) to prevent truncation
                if (value == 0) {
                    i += 2;
                    continue;
                }
                decoded += static_cast<char>(value);
                i += 2;
                continue;
            }
        } else if (str[i] == '+') {
            decoded += ' ';
            continue;
        }
        decoded += str[i];
    }

    return decoded;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        if (!param.empty()) {
            size_t eq = param.find('=');
            if (eq != std::string::npos) {
                params[url_decode(param.substr(0, eq))] = url_decode(param.substr(eq + 1));
            } else {
                params[url_decode(param)] = "";
            }
        }
        pos = amp + 1;
    }
    return params;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_content_length(size_t length) {
    set("Content-Length", std::to_string(length));
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<size_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
    }
    return std::nullopt;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::head(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::HEAD;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::vector<uint8_t>& body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body = body;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    return post(url, std::vector<uint8_t>(body.begin(), body.end()));
}

HttpRequest HttpRequest::put(const std::string& url, const std::vector<uint8_t>& body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body = body;
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::DELETE;
    req.url = url;
    return req;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

HttpResponse HttpResponse::text(int status, const std::string& body, const std::string& content_type) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body.assign(body.begin(), body.end());
    resp.headers.set_content_type(content_type);
    return resp;
}

HttpResponse HttpResponse::json(int status, const std::string& body) {
    return text(status, body, "application/json");
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    size_t pos = scheme_end + 3;

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }

    if (host_port.front() == '[') {
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) {
            return std::nullopt;
        }
        result.host = host_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else if (size_t colon_pos = host_port.rfind(':'); colon_pos != std::string::npos) {
        result.host = host_port.substr(0, colon_pos);
        try {
            result.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }
    if (result.host.empty() || result.port < 0 || result.port > 65535) {
        return std::nullopt;
    }

    pos = host_end;

    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
        pos = query_end;
    }

    if (pos < url.size() && url[pos] == '#') {
        result.fragment = url.substr(pos + 1);
    }

    return result;
}

std::string ParsedUrl::to_string() const {
    std::ostringstream oss;
    oss << scheme << "://";

    if (host.find(':') != std::string::npos) {
        oss << "[" << host << "]";
    } else {
        oss << host;
    }

    if (port != 0) {
        oss << ":" << port;
    }

    oss << path;

    if (!query.empty()) {
        oss << "?" << query;
    }

    if (!fragment.empty()) {
        oss << "#" << fragment;
    }

    return oss.str();
}

std::string ParsedUrl::host_header() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = port == 0 ||
                        (scheme == "http" && port == 80) ||
                        (scheme == "https" && port == 443);
    if (!default_port) {
        h += ":" + std::to_string(port);
    }
    return h;
}

std::map<std::string, std::string> ParsedUrl::query_params() const {
    return parse_query(query);
}

// ============================================================================
// CURL callback functions
// ============================================================================

// Context for bounded response accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a new header block (e.g. after 100 Continue)
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders();
        return bytes;
    }
    if (line.empty()) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = start != std::string::npos ? value.substr(start) : "";

        headers->add(name, value);
    }

    return bytes;
}

// Request body source: either an in-memory buffer or a caller-supplied stream
struct ReadCallbackContext {
    const uint8_t* data = nullptr;
    size_t size = 0;
    size_t pos = 0;
    const HttpBodyStream* stream = nullptr;
    std::string error;
};

static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadCallbackContext*>(userdata);
    size_t max_bytes = size * nitems;

    if (rd->stream) {
        // Exceptions must not unwind through libcurl
        try {
            return (*rd->stream)(reinterpret_cast<uint8_t*>(buffer), max_bytes);
        } catch (const std::exception& e) {
            rd->error = e.what();
            return CURL_READFUNC_ABORT;
        }
    }

    size_t to_copy = std::min(max_bytes, rd->size - rd->pos);
    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }
    return to_copy;
}

static int xferinfo_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<const Context*>(clientp);
    return ctx->done() ? 1 : 0;  // Non-zero aborts the transfer
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

private:
    // Acquire a handle from the pool or create a new one
    CURL* acquire_handle() {
        std::lock_guard lock(pool_mutex_);

        if (!idle_handles_.empty()) {
            CURL* handle = idle_handles_.back();
            idle_handles_.pop_back();
            return handle;
        }

        return curl_easy_init();
    }

    // Return a handle to the pool; keeps its connection cache warm for reuse
    void release_handle(CURL* handle) {
        if (!handle) return;

        std::lock_guard lock(pool_mutex_);
        curl_easy_reset(handle);
        if (idle_handles_.size() < config_.max_idle_connections) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    void record(bool failed) {
        std::lock_guard lock(pool_mutex_);
        stats_.total_requests++;
        if (failed) stats_.failed_requests++;
    }

public:
    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        if (request.context && request.context->done()) {
            response.error = request.context->err();
            response.canceled = true;
            return response;
        }

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create curl handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            // libcurl computes Content-Length itself from the sizes set below
            if (name == "content-length") continue;
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // Send bodies immediately instead of waiting on 100-continue
        headers_list = curl_slist_append(headers_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        ReadCallbackContext read_data;
        read_data.data = request.body.data();
        read_data.size = request.body.size();

        if (request.method == HttpMethod::PUT) {
            curl_off_t length = static_cast<curl_off_t>(request.body.size());
            if (request.body_stream) {
                read_data.stream = &request.body_stream;
                length = static_cast<curl_off_t>(request.body_stream_size);
            }
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &read_data);
            // Always explicit, so empty PUTs carry Content-Length: 0
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, length);
        } else if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        if (request.context) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, request.context);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        // Never wait past the context deadline
        auto total_timeout = request.total_timeout;
        if (request.context) {
            if (auto left = request.context->remaining()) {
                total_timeout = std::min(total_timeout, std::max(*left, std::chrono::milliseconds(1)));
            }
        }
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(total_timeout.count()));

        if (config_.verify_ssl) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }

        CURLcode res = curl_easy_perform(curl);

        if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
            record(false);
        } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
            record(true);
        } else if (request.context && request.context->done()) {
            response.error = request.context->err();
            response.canceled = true;
            record(true);
        } else if (res == CURLE_ABORTED_BY_CALLBACK && !read_data.error.empty()) {
            // The body source failed; not a network problem
            response.error = "reading request body: " + read_data.error;
            record(true);
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
            record(true);
        }

        curl_slist_free_all(headers_list);
        release_handle(curl);

        return response;
    }

    PoolStats pool_stats() const {
        std::lock_guard lock(pool_mutex_);
        return stats_;
    }

private:
    HttpClientConfig config_;
    mutable std::mutex pool_mutex_;
    PoolStats stats_;
    std::vector<CURL*> idle_handles_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpClient::PoolStats HttpClient::pool_stats() const {
    return impl_->pool_stats();
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

static std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

static std::string sha256_hex(const uint8_t* data, size_t len) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, len, hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

static std::string sha256_hex(const std::string& data) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key,
                                        const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.c_str()), data.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

static std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

static std::string format_utc(std::chrono::system_clock::time_point tp, const char* fmt) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

// Query params are already URL-encoded in the URL, so they only need sorting,
// with valueless params written as "key="
static std::string build_canonical_query_string(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        if (!param.empty()) {
            size_t eq = param.find('=');
            if (eq != std::string::npos) {
                params[param.substr(0, eq)] = param.substr(eq + 1);
            } else {
                params[param] = "";
            }
        }
        pos = amp + 1;
    }

    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out += "&";
        out += key + "=" + value;
    }
    return out;
}

std::string AwsSigV4Signer::get_canonical_request(const std::string& method,
                                                   const std::string& path,
                                                   const std::string& canonical_query,
                                                   const std::string& canonical_headers,
                                                   const std::string& signed_headers,
                                                   const std::string& payload_hash) const {
    std::ostringstream oss;
    oss << method << "\n";
    oss << (path.empty() ? "/" : path) << "\n";
    oss << canonical_query << "\n";
    oss << canonical_headers << "\n";
    oss << signed_headers << "\n";
    oss << payload_hash;
    return oss.str();
}

std::string AwsSigV4Signer::get_string_to_sign(const std::string& datetime,
                                                const std::string& date,
                                                const std::string& canonical_request) const {
    std::ostringstream oss;
    oss << "AWS4-HMAC-SHA256\n";
    oss << datetime << "\n";
    oss << date << "/" << region_ << "/" << service_ << "/aws4_request\n";
    oss << sha256_hex(canonical_request);
    return oss.str();
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                 const std::string& string_to_sign) const {
    auto k_date = hmac_sha256("AWS4" + secret_access_key_, date);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");

    auto sig = hmac_sha256(k_signing, string_to_sign);
    return to_hex(sig.data(), sig.size());
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    auto now = std::chrono::system_clock::now();
    std::string datetime = format_utc(now, "%Y%m%dT%H%M%SZ");
    std::string date = format_utc(now, "%Y%m%d");

    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    request.headers.set("Host", url->host_header());
    request.headers.set("X-Amz-Date", datetime);

    // Reuse a pre-set payload hash (e.g. UNSIGNED-PAYLOAD) or compute it
    std::string payload_hash;
    if (auto existing = request.headers.get("X-Amz-Content-Sha256"); existing && !existing->empty()) {
        payload_hash = *existing;
    } else {
        payload_hash = sha256_hex(request.body.data(), request.body.size());
    }
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    // Content-Length is managed by libcurl and left unsigned
    std::map<std::string, std::string> sorted_headers;
    for (const auto& [name, value] : request.headers.all()) {
        if (name == "content-length") continue;
        sorted_headers[name] = value;
    }

    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : sorted_headers) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    std::string canonical_request = get_canonical_request(
        http_method_to_string(request.method), url->path,
        build_canonical_query_string(url->query),
        canonical_headers, signed_headers, payload_hash);

    std::string string_to_sign = get_string_to_sign(datetime, date, canonical_request);
    std::string signature = calculate_signature(date, string_to_sign);

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 ";
    auth << "Credential=" << access_key_id_ << "/" << date << "/" << region_ << "/"
         << service_ << "/aws4_request, ";
    auth << "SignedHeaders=" << signed_headers << ", ";
    auth << "Signature=" << signature;

    request.headers.set("Authorization", auth.str());
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                      const std::string& session_token) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request);
}

std::string AwsSigV4Signer::presign(HttpMethod method,
                                    const std::string& url,
                                    std::chrono::seconds expires,
                                    std::chrono::system_clock::time_point now,
                                    const std::string& session_token) const {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) return "";

    std::string datetime = format_utc(now, "%Y%m%dT%H%M%SZ");
    std::string date = format_utc(now, "%Y%m%d");
    std::string scope = date + "/" + region_ + "/" + service_ + "/aws4_request";

    // Existing params are re-encoded so every value is encoded exactly once
    std::map<std::string, std::string> params;
    for (const auto& [key, value] : parsed->query_params()) {
        params[url_encode(key)] = url_encode(value);
    }
    params["X-Amz-Algorithm"] = "AWS4-HMAC-SHA256";
    params["X-Amz-Credential"] = url_encode(access_key_id_ + "/" + scope);
    params["X-Amz-Date"] = datetime;
    params["X-Amz-Expires"] = std::to_string(expires.count());
    params["X-Amz-SignedHeaders"] = "host";
    if (!session_token.empty()) {
        params["X-Amz-Security-Token"] = url_encode(session_token);
    }

    std::string canonical_query;
    for (const auto& [key, value] : params) {
        if (!canonical_query.empty()) canonical_query += "&";
        canonical_query += key + "=" + value;
    }

    std::string canonical_request = get_canonical_request(
        http_method_to_string(method), parsed->path, canonical_query,
        "host:" + parsed->host_header() + "\n", "host", "UNSIGNED-PAYLOAD");

    std::string string_to_sign = get_string_to_sign(datetime, date, canonical_request);
    std::string signature = calculate_signature(date, string_to_sign);

    ParsedUrl signed_url = *parsed;
    signed_url.query = canonical_query + "&X-Amz-Signature=" + signature;
    signed_url.fragment.clear();
    return signed_url.to_string();
}

} // namespace layerpush::net
