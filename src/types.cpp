#include "layerpush/registry/types.hpp"
#include "layerpush/core/constants.hpp"

#include <limits>
#include <nlohmann/json.hpp>

namespace layerpush {

using json = nlohmann::json;

namespace {

bool is_digest_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '.' || c == ':' || c == '-';
}

// Characters allowed in ref path segments, tag and build
bool is_ref_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '.' || c == '-';
}

std::string validate_ref_part(const std::string& part, const char* what) {
    if (part.empty()) return std::string("empty ") + what;
    if (part == "." || part == "..") return std::string(what) + " may not be '" + part + "'";
    for (char c : part) {
        if (!is_ref_char(c)) {
            return std::string("invalid character '") + c + "' in " + what + " '" + part + "'";
        }
    }
    return {};
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

// Reads an int64 field, rejecting floats, negatives and overflow
bool read_int64(const json& j, const char* field, int64_t& out, std::string& error) {
    auto it = j.find(field);
    if (it == j.end()) {
        error = std::string("missing \"") + field + "\"";
        return false;
    }
    if (it->is_number_unsigned()) {
        auto v = it->get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            error = std::string("\"") + field + "\" out of range";
            return false;
        }
        out = static_cast<int64_t>(v);
        return true;
    }
    if (it->is_number_integer()) {
        out = it->get<int64_t>();
        return true;
    }
    error = std::string("\"") + field + "\" must be an integer";
    return false;
}

bool read_string(const json& j, const char* field, std::string& out, std::string& error) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_string()) {
        error = std::string("\"") + field + "\" must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool parse_complete_parts(const json& arr, std::vector<CompletePart>& out, std::string& error) {
    if (!arr.is_array()) {
        error = "\"uploaded\" must be an array";
        return false;
    }
    for (size_t i = 0; i < arr.size(); ++i) {
        const auto& item = arr[i];
        if (!item.is_object()) {
            error = "uploaded[" + std::to_string(i) + "] must be an object";
            return false;
        }
        CompletePart part;
        std::string field_error;
        if (!read_string(item, "url", part.url, field_error)) {
            error = "uploaded[" + std::to_string(i) + "]: " + field_error;
            return false;
        }
        // A missing ETag is reported by the coordinator with the URL it belongs to
        if (auto it = item.find("etag"); it != item.end()) {
            if (!it->is_string()) {
                error = "uploaded[" + std::to_string(i) + "]: \"etag\" must be a string";
                return false;
            }
            part.etag = it->get<std::string>();
        }
        out.push_back(std::move(part));
    }
    return true;
}

json complete_parts_to_json(const std::vector<CompletePart>& parts) {
    json arr = json::array();
    for (const auto& p : parts) {
        arr.push_back({{"url", p.url}, {"etag", p.etag}});
    }
    return arr;
}

// Manifest validation shared by parse_manifest() and decode_push_request()
bool manifest_from_json(const json& j, Manifest& manifest, std::string& error) {
    if (!j.is_object()) {
        error = "manifest must be a JSON object";
        return false;
    }
    auto layers = j.find("layers");
    if (layers == j.end() || !layers->is_array()) {
        error = "manifest \"layers\" must be an array";
        return false;
    }
    if (layers->size() > constants::MAX_MANIFEST_LAYERS) {
        error = "manifest has " + std::to_string(layers->size()) + " layers (limit " +
                std::to_string(constants::MAX_MANIFEST_LAYERS) + ")";
        return false;
    }

    manifest.layers.clear();
    for (size_t i = 0; i < layers->size(); ++i) {
        const auto& jl = (*layers)[i];
        std::string where = "layers[" + std::to_string(i) + "]";
        if (!jl.is_object()) {
            error = where + " must be an object";
            return false;
        }

        Layer layer;
        std::string field_error;
        if (!read_string(jl, "digest", layer.digest, field_error) ||
            !read_int64(jl, "size", layer.size, field_error)) {
            error = where + ": " + field_error;
            return false;
        }
        if (auto err = validate_digest(layer.digest); !err.empty()) {
            error = where + ": " + err;
            return false;
        }
        if (layer.size < 0) {
            error = where + ": negative size " + std::to_string(layer.size);
            return false;
        }
        manifest.layers.push_back(std::move(layer));
    }

    manifest.json = j.dump();
    return true;
}

} // namespace

std::string validate_digest(const std::string& digest) {
    if (digest.empty()) return "empty digest";
    if (digest.size() > constants::MAX_DIGEST_LENGTH) {
        return "digest longer than " + std::to_string(constants::MAX_DIGEST_LENGTH) + " characters";
    }
    if (digest == "." || digest == "..") return "invalid digest '" + digest + "'";
    for (char c : digest) {
        if (!is_digest_char(c)) {
            return std::string("invalid character '") + c + "' in digest '" + digest + "'";
        }
    }
    return {};
}

ManifestParseResult parse_manifest(const std::string& bytes) {
    ManifestParseResult result;
    try {
        auto j = json::parse(bytes);
        result.success = manifest_from_json(j, result.manifest, result.error_message);
    } catch (const json::exception& e) {
        result.error_message = std::string("invalid manifest JSON: ") + e.what();
    }
    return result;
}

std::string Ref::to_string() const {
    std::string out = registry;
    for (const auto& ns : namespaces) out += "/" + ns;
    out += "/" + name + ":" + tag + "+" + build;
    return out;
}

std::string Ref::manifest_key() const {
    std::string out = constants::MANIFEST_KEY_PREFIX + registry;
    for (const auto& ns : namespaces) out += "/" + ns;
    out += "/" + name + "/" + tag + "/" + build;
    return out;
}

RefParseResult parse_ref(const std::string& ref) {
    RefParseResult result;
    auto fail = [&](const std::string& why) {
        result.error_message = "invalid ref '" + ref + "': " + why;
        return result;
    };

    size_t plus = ref.find('+');
    if (plus == std::string::npos) return fail("missing '+<build>'");
    if (ref.find('+', plus + 1) != std::string::npos) return fail("more than one '+'");

    std::string before = ref.substr(0, plus);
    std::string build = ref.substr(plus + 1);

    size_t colon = before.find(':');
    if (colon == std::string::npos) return fail("missing ':<tag>'");
    if (before.find(':', colon + 1) != std::string::npos) return fail("more than one ':'");

    std::string path = before.substr(0, colon);
    std::string tag = before.substr(colon + 1);

    auto segments = split(path, '/');
    if (segments.size() < 3) return fail("expected <registry>/<namespace>/<name>");

    for (const auto& seg : segments) {
        if (auto err = validate_ref_part(seg, "path segment"); !err.empty()) return fail(err);
    }
    if (auto err = validate_ref_part(tag, "tag"); !err.empty()) return fail(err);
    if (auto err = validate_ref_part(build, "build"); !err.empty()) return fail(err);

    result.ref.registry = segments.front();
    result.ref.name = segments.back();
    result.ref.namespaces.assign(segments.begin() + 1, segments.end() - 1);
    result.ref.tag = tag;
    result.ref.build = build;
    result.success = true;
    return result;
}

std::string blob_key(const std::string& digest) {
    return constants::BLOB_KEY_PREFIX + digest;
}

// ----------------------------------------------------------------------------
// Push endpoint wire format
// ----------------------------------------------------------------------------

std::string encode_push_request(const std::string& ref, const Manifest& manifest, const PushParams& params) {
    json j;
    j["ref"] = ref;
    j["manifest"] = json::parse(manifest.json);
    j["uploaded"] = complete_parts_to_json(params.uploaded);
    return j.dump();
}

PushRequestDecodeResult decode_push_request(const std::string& body) {
    PushRequestDecodeResult result;
    try {
        auto j = json::parse(body);
        if (!j.is_object()) {
            result.error_message = "push request must be a JSON object";
            return result;
        }
        if (!read_string(j, "ref", result.ref, result.error_message)) return result;

        auto m = j.find("manifest");
        if (m == j.end()) {
            result.error_message = "missing \"manifest\"";
            return result;
        }
        // Validated by the coordinator; only carried here
        result.manifest_json = m->dump();

        if (auto up = j.find("uploaded"); up != j.end() && !up->is_null()) {
            if (!parse_complete_parts(*up, result.params.uploaded, result.error_message)) return result;
        }
        result.success = true;
    } catch (const json::exception& e) {
        result.error_message = std::string("invalid push request JSON: ") + e.what();
    }
    return result;
}

std::string encode_push_response(const std::vector<Requirement>& requirements) {
    json arr = json::array();
    for (const auto& r : requirements) {
        arr.push_back({{"digest", r.digest}, {"url", r.url}, {"offset", r.offset}, {"size", r.size}});
    }
    return json{{"requirements", arr}}.dump();
}

PushResponseDecodeResult decode_push_response(const std::string& body) {
    PushResponseDecodeResult result;
    try {
        auto j = json::parse(body);
        auto reqs = j.is_object() ? j.find("requirements") : j.end();
        if (!j.is_object() || reqs == j.end() || !(reqs->is_array() || reqs->is_null())) {
            result.error_message = "push response has no \"requirements\" array";
            return result;
        }
        if (reqs->is_null()) {
            result.success = true;
            return result;
        }
        for (size_t i = 0; i < reqs->size(); ++i) {
            const auto& jr = (*reqs)[i];
            Requirement r;
            std::string err;
            if (!jr.is_object() ||
                !read_string(jr, "url", r.url, err) ||
                !read_int64(jr, "offset", r.offset, err) ||
                !read_int64(jr, "size", r.size, err)) {
                result.error_message = "requirements[" + std::to_string(i) + "]: " +
                                       (err.empty() ? "must be an object" : err);
                return result;
            }
            if (auto d = jr.find("digest"); d != jr.end() && d->is_string()) {
                r.digest = d->get<std::string>();
            }
            result.requirements.push_back(std::move(r));
        }
        result.success = true;
    } catch (const json::exception& e) {
        result.error_message = std::string("invalid push response JSON: ") + e.what();
    }
    return result;
}

std::string encode_error(ErrorKind kind, const std::string& message) {
    return json{{"error", {{"code", error_kind_to_string(kind)}, {"message", message}}}}.dump();
}

std::optional<WireError> decode_error(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object()) return std::nullopt;
        auto e = j.find("error");
        if (e == j.end() || !e->is_object()) return std::nullopt;

        WireError err;
        err.kind = error_kind_from_string(e->value("code", std::string()));
        err.message = e->value("message", std::string());
        return err;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

int error_kind_http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return 200;
        case ErrorKind::InvalidInput: return 400;
        case ErrorKind::NotFound: return 404;
        case ErrorKind::Integrity: return 409;
        case ErrorKind::Canceled: return 499;
        case ErrorKind::Transient: return 503;
        case ErrorKind::Storage: return 502;
    }
    return 500;
}

std::string encode_complete_parts(const std::vector<CompletePart>& parts) {
    return complete_parts_to_json(parts).dump(2);
}

std::optional<std::vector<CompletePart>> decode_complete_parts(const std::string& text, std::string& error) {
    try {
        std::vector<CompletePart> parts;
        if (!parse_complete_parts(json::parse(text), parts, error)) return std::nullopt;
        return parts;
    } catch (const json::exception& e) {
        error = e.what();
        return std::nullopt;
    }
}

} // namespace layerpush
