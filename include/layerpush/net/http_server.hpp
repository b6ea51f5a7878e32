#pragma once

#include "layerpush/net/http.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace layerpush::net {

// A parsed inbound request
struct ServerRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target;   // raw request target, e.g. "/bucket/key?uploadId=x"
    std::string path;     // decoded path
    std::string query;    // raw query string (without '?')
    std::map<std::string, std::string> params;  // decoded query parameters
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::string body_string() const { return std::string(body.begin(), body.end()); }
    bool has_param(const std::string& name) const { return params.count(name) != 0; }
};

// Returns the response for one request. Exceptions become a 500 response.
using HttpHandler = std::function<HttpResponse(const ServerRequest&)>;

struct HttpServerConfig {
    std::string listen_address = "127.0.0.1";
    uint16_t port = 0;  // 0 = pick an ephemeral port
    int backlog = 128;
    int read_timeout_seconds = 30;
    size_t max_body_size = 16 * 1024 * 1024;
};

/// Minimal blocking HTTP/1.1 server: one accept thread, one worker thread per
/// connection, one request per connection ("Connection: close").
///
/// Request bodies must carry Content-Length; "Expect: 100-continue" is
/// answered before the body is read. If the handler leaves Content-Length
/// unset it is filled in from the response body; HEAD responses never carry
/// a body.
class HttpServer {
public:
    HttpServer(HttpServerConfig config, HttpHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind, listen and start accepting. Returns an error message or empty on success.
    std::string start();

    // Stop accepting and wait for in-flight connections to finish.
    void stop();

    bool running() const { return running_.load(); }

    // Bound port (resolves port 0 after start())
    uint16_t port() const { return bound_port_; }

    // "http://<address>:<port>"
    std::string base_url() const;

private:
    void accept_loop();
    void handle_connection(int client_fd);

    HttpServerConfig config_;
    HttpHandler handler_;

    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    size_t active_connections_ = 0;
};

} // namespace layerpush::net
