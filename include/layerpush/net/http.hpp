#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace layerpush {
class Context;
}

namespace layerpush::net {

// HTTP methods
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);
std::optional<HttpMethod> http_method_from_string(const std::string& method);

const char* http_status_reason(int status);

bool is_success_status(int status);

// Statuses worth retrying: timeouts, throttling and gateway/availability errors
bool is_retryable_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    void set_content_length(size_t length);

    std::optional<std::string> content_type() const;
    std::optional<size_t> content_length() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// Pulls the next bytes of a streamed request body into buf; returns 0 at the
// end. May throw; the client turns the exception into a failed response.
using HttpBodyStream = std::function<size_t(uint8_t* buf, size_t max)>;

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Streamed body (PUT only); takes precedence over `body` when set
    HttpBodyStream body_stream;
    uint64_t body_stream_size = 0;

    // Timeouts
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{300000};  // 5 minutes default

    // Aborts the transfer once done; not owned, may be null
    const Context* context = nullptr;

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest del(const std::string& url);
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
    bool canceled = false;          // True if the request context finished mid-transfer

    static HttpResponse text(int status, const std::string& body,
                             const std::string& content_type = "text/plain");
    static HttpResponse json(int status, const std::string& body);
};

// HTTP client configuration
struct HttpClientConfig {
    // Connection pooling
    size_t max_idle_connections = 32;

    // Response size limits (0 = unlimited)
    size_t max_response_size = 100 * 1024 * 1024;  // 100MB default

    bool verify_ssl = true;

    std::string user_agent = "layerpush/1.0";
};

// HTTP client with a pool of reusable curl handles
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    // Synchronous request; safe to call from several threads at once
    HttpResponse execute(const HttpRequest& request);

    struct PoolStats {
        size_t total_requests = 0;
        size_t failed_requests = 0;
    };
    PoolStats pool_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS SigV4 signing helper (used for S3)
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service);

    // Sign a request with an Authorization header
    void sign(HttpRequest& request) const;

    // Sign with session token (for STS credentials)
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

    // Query-string authentication: returns `url` with the X-Amz-* parameters
    // and signature appended. `url` may already carry query parameters
    // (e.g. partNumber/uploadId); they are covered by the signature.
    std::string presign(HttpMethod method,
                        const std::string& url,
                        std::chrono::seconds expires,
                        std::chrono::system_clock::time_point now = std::chrono::system_clock::now(),
                        const std::string& session_token = "") const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;

    std::string get_canonical_request(const std::string& method,
                                      const std::string& path,
                                      const std::string& canonical_query,
                                      const std::string& canonical_headers,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;
    std::string fragment;

    std::string to_string() const;

    // host, or host:port when the port is not the scheme default (the Host header value)
    std::string host_header() const;

    // Decoded query parameters; a parameter without '=' maps to ""
    std::map<std::string, std::string> query_params() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// URL encoding/decoding (RFC 3986 unreserved characters pass through)
std::string url_encode(const std::string& str);
std::string url_decode(const std::string& str);

// Encode each path segment, keeping '/' separators
std::string url_encode_path(const std::string& path);

// Parse "a=1&b=2" into decoded key/value pairs
std::map<std::string, std::string> parse_query(const std::string& query);

} // namespace layerpush::net
