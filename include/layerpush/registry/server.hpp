#pragma once

#include "layerpush/net/http_server.hpp"
#include "layerpush/registry/coordinator.hpp"

#include <string>

namespace layerpush {

/// HTTP front end of the push coordinator.
///
///   POST /v1/push     reconcile a manifest, returns {"requirements":[...]}
///   GET  /v1/uploads  incomplete multipart sessions (optional ?prefix=)
///   GET  /healthz     liveness
class RegistryServer {
public:
    RegistryServer(PushCoordinator& coordinator, net::HttpServerConfig config);

    std::string start() { return server_.start(); }
    void stop() { server_.stop(); }

    uint16_t port() const { return server_.port(); }
    std::string base_url() const { return server_.base_url(); }

    /// Route one request (exposed for in-process use and tests).
    net::HttpResponse handle(const net::ServerRequest& request);

private:
    net::HttpResponse handle_push(const net::ServerRequest& request);
    net::HttpResponse handle_uploads(const net::ServerRequest& request);

    PushCoordinator& coordinator_;
    net::HttpServer server_;
};

} // namespace layerpush
