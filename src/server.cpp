#include "layerpush/registry/server.hpp"
#include "layerpush/core/log.hpp"

#include <nlohmann/json.hpp>

namespace layerpush {

namespace {

net::HttpResponse error_response(ErrorKind kind, const std::string& message) {
    return net::HttpResponse::json(error_kind_http_status(kind), encode_error(kind, message));
}

} // namespace

RegistryServer::RegistryServer(PushCoordinator& coordinator, net::HttpServerConfig config)
    : coordinator_(coordinator)
    , server_(std::move(config), [this](const net::ServerRequest& req) { return handle(req); }) {}

net::HttpResponse RegistryServer::handle(const net::ServerRequest& request) {
    if (request.path == "/v1/push") {
        if (request.method != net::HttpMethod::POST) {
            return net::HttpResponse::json(405, encode_error(ErrorKind::InvalidInput, "use POST"));
        }
        return handle_push(request);
    }
    if (request.path == "/v1/uploads") {
        if (request.method != net::HttpMethod::GET) {
            return net::HttpResponse::json(405, encode_error(ErrorKind::InvalidInput, "use GET"));
        }
        return handle_uploads(request);
    }
    if (request.path == "/healthz") {
        return net::HttpResponse::text(200, "ok\n");
    }
    return error_response(ErrorKind::NotFound, "no route for " + request.path);
}

net::HttpResponse RegistryServer::handle_push(const net::ServerRequest& request) {
    auto decoded = decode_push_request(request.body_string());
    if (!decoded.success) {
        log_debug("Rejected push request: %s", decoded.error_message.c_str());
        return error_response(ErrorKind::InvalidInput, decoded.error_message);
    }

    auto result = coordinator_.push(decoded.ref, decoded.manifest_json, decoded.params);
    if (!result.success) {
        if (result.error_kind == ErrorKind::InvalidInput) {
            log_debug("Push %s rejected: %s", decoded.ref.c_str(), result.error_message.c_str());
        } else {
            log_error("Push %s failed (%s): %s", decoded.ref.c_str(),
                      error_kind_to_string(result.error_kind), result.error_message.c_str());
        }
        return error_response(result.error_kind, result.error_message);
    }

    return net::HttpResponse::json(200, encode_push_response(result.requirements));
}

net::HttpResponse RegistryServer::handle_uploads(const net::ServerRequest& request) {
    auto it = request.params.find("prefix");
    auto listed = coordinator_.list_incomplete_uploads(it != request.params.end() ? it->second : "");
    if (!listed.success) {
        log_error("Listing incomplete uploads failed: %s", listed.error_message.c_str());
        return error_response(listed.error_kind == ErrorKind::Transient ? ErrorKind::Transient : ErrorKind::Storage,
                              listed.error_message);
    }

    nlohmann::json uploads = nlohmann::json::array();
    for (const auto& u : listed.uploads) {
        uploads.push_back({{"key", u.key}, {"upload_id", u.upload_id}, {"initiated", u.initiated}});
    }
    return net::HttpResponse::json(200, nlohmann::json{{"uploads", uploads}}.dump());
}

} // namespace layerpush
