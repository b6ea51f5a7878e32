#include "layerpush/net/http_server.hpp"
#include "layerpush/core/log.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <algorithm>
#include <cstring>
#include <netinet/in.h>
#include <strings.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace layerpush::net {

namespace {

constexpr size_t MAX_HEADER_BYTES = 64 * 1024;

bool send_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

void send_response(int fd, HttpMethod method, HttpResponse& resp) {
    if (!resp.headers.has("Content-Length")) {
        resp.headers.set_content_length(resp.body.size());
    }
    resp.headers.set("Connection", "close");

    std::string head = "HTTP/1.1 " + std::to_string(resp.status_code) + " " +
                       http_status_reason(resp.status_code) + "\r\n";
    for (const auto& [name, value] : resp.headers.all()) {
        head += name + ": " + value + "\r\n";
    }
    head += "\r\n";

    if (!send_all(fd, head.data(), head.size())) return;
    if (method != HttpMethod::HEAD && !resp.body.empty()) {
        send_all(fd, reinterpret_cast<const char*>(resp.body.data()), resp.body.size());
    }
}

void send_error(int fd, int status, const std::string& message) {
    auto resp = HttpResponse::text(status, message + "\n");
    send_response(fd, HttpMethod::GET, resp);
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

} // namespace

HttpServer::HttpServer(HttpServerConfig config, HttpHandler handler)
    : config_(std::move(config)), handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
    stop();
}

std::string HttpServer::start() {
    if (running_.load()) return "server already running";

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        return std::string("socket: ") + strerror(errno);
    }

    int one = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.listen_address.c_str(), &addr.sin_addr) != 1) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        return "invalid listen address: " + config_.listen_address;
    }

    if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = "bind " + config_.listen_address + ":" + std::to_string(config_.port) +
                          ": " + strerror(errno);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return err;
    }

    if (::listen(listen_fd_, config_.backlog) < 0) {
        std::string err = std::string("listen: ") + strerror(errno);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return err;
    }

    struct sockaddr_in bound;
    socklen_t bound_len = sizeof(bound);
    if (getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    running_ = true;
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);
    log_debug("HTTP server listening on %s:%u", config_.listen_address.c_str(),
              static_cast<unsigned>(bound_port_));
    return {};
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;

    // Closing the listening socket unblocks accept()
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (accept_thread_.joinable()) accept_thread_.join();

    std::unique_lock lock(conn_mutex_);
    conn_cv_.wait(lock, [this] { return active_connections_ == 0; });
}

std::string HttpServer::base_url() const {
    std::string host = config_.listen_address == "0.0.0.0" ? "127.0.0.1" : config_.listen_address;
    return "http://" + host + ":" + std::to_string(bound_port_);
}

void HttpServer::accept_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client_fd = ::accept4(listen_fd_, reinterpret_cast<struct sockaddr*>(&client_addr),
                                  &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            if (!running_.load()) break;
            log_error("accept failed: %s", strerror(errno));
            continue;
        }

        struct timeval tv;
        tv.tv_sec = config_.read_timeout_seconds;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        {
            std::lock_guard lock(conn_mutex_);
            active_connections_++;
        }
        std::thread([this, client_fd]() {
            handle_connection(client_fd);
            ::close(client_fd);
            std::lock_guard lock(conn_mutex_);
            active_connections_--;
            conn_cv_.notify_all();
        }).detach();
    }
}

void HttpServer::handle_connection(int client_fd) {
    // Read the header block
    std::string buf;
    size_t header_end = std::string::npos;
    char chunk[8192];
    while (header_end == std::string::npos) {
        ssize_t n = ::recv(client_fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        buf.append(chunk, static_cast<size_t>(n));
        header_end = buf.find("\r\n\r\n");
        if (header_end == std::string::npos && buf.size() > MAX_HEADER_BYTES) {
            send_error(client_fd, 431, "request headers too large");
            return;
        }
    }

    ServerRequest req;
    std::string head = buf.substr(0, header_end);
    std::string rest = buf.substr(header_end + 4);

    size_t line_end = head.find("\r\n");
    std::string request_line = head.substr(0, line_end);
    size_t sp1 = request_line.find(' ');
    size_t sp2 = sp1 == std::string::npos ? std::string::npos : request_line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos) {
        send_error(client_fd, 400, "malformed request line");
        return;
    }

    auto method = http_method_from_string(request_line.substr(0, sp1));
    if (!method) {
        send_error(client_fd, 405, "method not allowed");
        return;
    }
    req.method = *method;
    req.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);

    size_t qpos = req.target.find('?');
    req.path = url_decode(req.target.substr(0, qpos));
    if (qpos != std::string::npos) {
        req.query = req.target.substr(qpos + 1);
        req.params = parse_query(req.query);
    }

    size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        size_t eol = head.find("\r\n", pos);
        if (eol == std::string::npos) eol = head.size();
        std::string line = head.substr(pos, eol - pos);
        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            req.headers.add(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        }
        pos = eol + 2;
    }

    if (auto te = req.headers.get("Transfer-Encoding"); te && *te != "identity") {
        send_error(client_fd, 411, "chunked request bodies are not supported");
        return;
    }

    size_t content_length = 0;
    if (req.headers.has("Content-Length")) {
        auto len = req.headers.content_length();
        if (!len) {
            send_error(client_fd, 400, "invalid Content-Length");
            return;
        }
        content_length = *len;
    }
    if (content_length > config_.max_body_size) {
        send_error(client_fd, 413, "request body exceeds " + std::to_string(config_.max_body_size) + " bytes");
        return;
    }

    if (content_length > 0 && rest.empty()) {
        auto expect = req.headers.get("Expect");
        if (expect && expect->size() >= 12 && strncasecmp(expect->c_str(), "100-continue", 12) == 0) {
            static const char continue_line[] = "HTTP/1.1 100 Continue\r\n\r\n";
            if (!send_all(client_fd, continue_line, sizeof(continue_line) - 1)) return;
        }
    }

    req.body.assign(rest.begin(), rest.end());
    if (req.body.size() > content_length) {
        req.body.resize(content_length);
    }
    req.body.reserve(content_length);
    while (req.body.size() < content_length) {
        size_t want = std::min(sizeof(chunk), content_length - req.body.size());
        ssize_t n = ::recv(client_fd, chunk, want, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            log_debug("connection closed with %zu of %zu body bytes read",
                      req.body.size(), content_length);
            return;
        }
        req.body.insert(req.body.end(), chunk, chunk + n);
    }

    HttpResponse resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        log_error("handler for %s %s failed: %s", http_method_to_string(req.method),
                  req.path.c_str(), e.what());
        resp = HttpResponse::text(500, std::string("internal error: ") + e.what() + "\n");
    }

    send_response(client_fd, req.method, resp);
}

} // namespace layerpush::net
