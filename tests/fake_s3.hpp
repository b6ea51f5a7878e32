// In-process S3 stand-in for tests.
//
// Serves the path-style subset of the S3 API the object store uses: object
// PUT/GET/HEAD, ListObjectsV2, and the multipart calls (initiate, upload part,
// complete, abort, list uploads). Signatures are not checked. ETags are MD5
// hex digests as on real S3. Faults can be injected per method.

#pragma once

#include "layerpush/core/constants.hpp"
#include "layerpush/net/http_server.hpp"
#include "layerpush/storage/s3_xml.hpp"

#include <openssl/evp.h>

#include <cstdint>
#include <cstdio>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace layerpush::testing {

class FakeS3 {
public:
    explicit FakeS3(std::string bucket = "test-bucket")
        : bucket_(std::move(bucket)),
          server_(make_config(), [this](const net::ServerRequest& req) { return handle(req); }) {}

    std::string start() { return server_.start(); }
    void stop() { server_.stop(); }

    std::string endpoint() const { return server_.base_url(); }
    const std::string& bucket() const { return bucket_; }

    /// Params for ObjectStoreFactory::create("s3", ...)
    std::map<std::string, std::string> store_params(const std::string& path_prefix = "") const {
        return {
            {"bucket", bucket_},
            {"endpoint", endpoint()},
            {"use_path_style", "true"},
            {"access_key", "AKIDTEST"},
            {"secret_key", "secret"},
            {"path_prefix", path_prefix},
        };
    }

    /// Fail the next `count` requests with this method using an S3 error body.
    void fail_next(net::HttpMethod method, int status, int count = 1,
                   const std::string& code = "SlowDown") {
        std::lock_guard lock(mutex_);
        for (int i = 0; i < count; ++i) {
            faults_.push_back({method, status, code});
        }
    }

    /// Forget every in-progress multipart session (as a lifecycle rule would).
    void drop_uploads() {
        std::lock_guard lock(mutex_);
        uploads_.clear();
    }

    /// Reject completions whose non-final parts are shorter than `bytes` (0 disables).
    void set_min_part_size(int64_t bytes) {
        std::lock_guard lock(mutex_);
        min_part_size_ = bytes;
    }

    void set_object(const std::string& key, const std::string& data) {
        std::lock_guard lock(mutex_);
        objects_[key] = {data, md5_hex(data), "application/octet-stream"};
    }

    std::optional<std::string> object(const std::string& key) const {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(key);
        if (it == objects_.end()) return std::nullopt;
        return it->second.data;
    }

    std::optional<std::string> content_type(const std::string& key) const {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(key);
        if (it == objects_.end()) return std::nullopt;
        return it->second.content_type;
    }

    size_t object_count() const {
        std::lock_guard lock(mutex_);
        return objects_.size();
    }

    size_t upload_count() const {
        std::lock_guard lock(mutex_);
        return uploads_.size();
    }

    // Successful object and part PUTs
    size_t put_count() const {
        std::lock_guard lock(mutex_);
        return put_count_;
    }

    size_t part_put_count() const {
        std::lock_guard lock(mutex_);
        return part_put_count_;
    }

    size_t request_count() const {
        std::lock_guard lock(mutex_);
        return request_count_;
    }

    static std::string md5_hex(const std::string& data) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        EVP_Digest(data.data(), data.size(), digest, &len, EVP_md5(), nullptr);
        std::string hex;
        char buf[3];
        for (unsigned int i = 0; i < len; ++i) {
            std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
            hex += buf;
        }
        return hex;
    }

private:
    struct Object {
        std::string data;
        std::string etag;  // unquoted
        std::string content_type;
    };

    struct Part {
        std::string data;
        std::string etag;
    };

    struct Upload {
        std::string key;
        std::string initiated;
        std::map<int, Part> parts;
    };

    struct Fault {
        net::HttpMethod method;
        int status;
        std::string code;
    };

    static net::HttpServerConfig make_config() {
        net::HttpServerConfig config;
        config.listen_address = "127.0.0.1";
        config.port = 0;
        config.max_body_size = constants::DEFAULT_MAX_REQUEST_BODY;
        return config;
    }

    static net::HttpResponse xml_response(int status, const std::string& body) {
        return net::HttpResponse::text(status, body, "application/xml");
    }

    static net::HttpResponse error(int status, const std::string& code, const std::string& message,
                                   const std::string& resource = "") {
        return xml_response(status, xml::format_s3_error(code, message, resource));
    }

    net::HttpResponse handle(const net::ServerRequest& req) {
        std::lock_guard lock(mutex_);
        ++request_count_;

        for (auto it = faults_.begin(); it != faults_.end(); ++it) {
            if (it->method == req.method) {
                Fault fault = *it;
                faults_.erase(it);
                return error(fault.status, fault.code, "injected fault");
            }
        }

        std::string root = "/" + bucket_;
        if (req.path != root && !req.path.starts_with(root + "/")) {
            return error(404, "NoSuchBucket", "The specified bucket does not exist", req.path);
        }
        std::string key = req.path.size() > root.size() + 1 ? req.path.substr(root.size() + 1) : "";

        if (key.empty()) {
            if (req.method != net::HttpMethod::GET) {
                return error(405, "MethodNotAllowed", "bucket operation not supported");
            }
            if (req.has_param("uploads")) return list_uploads(req);
            if (req.has_param("list-type")) return list_objects(req);
            return error(400, "InvalidRequest", "unsupported bucket request");
        }

        switch (req.method) {
            case net::HttpMethod::HEAD:
            case net::HttpMethod::GET:
                return get_object(req, key);
            case net::HttpMethod::PUT:
                if (req.has_param("uploadId")) return upload_part(req, key);
                return put_object(req, key);
            case net::HttpMethod::POST:
                if (req.has_param("uploads")) return create_upload(key);
                if (req.has_param("uploadId")) return complete_upload(req, key);
                return error(400, "InvalidRequest", "unsupported POST");
            case net::HttpMethod::DELETE:
                if (req.has_param("uploadId")) return abort_upload(req, key);
                objects_.erase(key);
                return net::HttpResponse::text(204, "");
        }
        return error(400, "InvalidRequest", "unsupported method");
    }

    net::HttpResponse get_object(const net::ServerRequest& req, const std::string& key) {
        auto it = objects_.find(key);
        if (it == objects_.end()) {
            return error(404, "NoSuchKey", "The specified key does not exist.", key);
        }
        auto resp = net::HttpResponse::text(200, it->second.data, it->second.content_type);
        resp.headers.set("ETag", "\"" + it->second.etag + "\"");
        if (req.method == net::HttpMethod::HEAD) {
            resp.headers.set_content_length(it->second.data.size());
            resp.body.clear();
        }
        return resp;
    }

    net::HttpResponse put_object(const net::ServerRequest& req, const std::string& key) {
        std::string data = req.body_string();
        std::string etag = md5_hex(data);
        objects_[key] = {data, etag, req.headers.content_type().value_or("binary/octet-stream")};
        ++put_count_;

        auto resp = net::HttpResponse::text(200, "");
        resp.headers.set("ETag", "\"" + etag + "\"");
        return resp;
    }

    net::HttpResponse create_upload(const std::string& key) {
        std::string upload_id = md5_hex(key + "#" + std::to_string(++upload_seq_));
        uploads_[upload_id] = {key, "2024-01-01T00:00:00.000Z", {}};

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
             << "<InitiateMultipartUploadResult>"
             << "<Bucket>" << xml::escape(bucket_) << "</Bucket>"
             << "<Key>" << xml::escape(key) << "</Key>"
             << "<UploadId>" << upload_id << "</UploadId>"
             << "</InitiateMultipartUploadResult>";
        return xml_response(200, body.str());
    }

    net::HttpResponse upload_part(const net::ServerRequest& req, const std::string& key) {
        auto it = uploads_.find(req.params.at("uploadId"));
        if (it == uploads_.end() || it->second.key != key) {
            return error(404, "NoSuchUpload", "The specified upload does not exist.", key);
        }
        int part_number = 0;
        auto pn = req.params.find("partNumber");
        if (pn != req.params.end()) part_number = std::atoi(pn->second.c_str());
        if (part_number < 1 || part_number > constants::S3_MAX_PARTS) {
            return error(400, "InvalidArgument", "Part number must be an integer between 1 and 10000");
        }

        std::string data = req.body_string();
        std::string etag = md5_hex(data);
        it->second.parts[part_number] = {data, etag};
        ++put_count_;
        ++part_put_count_;

        auto resp = net::HttpResponse::text(200, "");
        resp.headers.set("ETag", "\"" + etag + "\"");
        return resp;
    }

    net::HttpResponse complete_upload(const net::ServerRequest& req, const std::string& key) {
        auto it = uploads_.find(req.params.at("uploadId"));
        if (it == uploads_.end() || it->second.key != key) {
            return error(404, "NoSuchUpload", "The specified upload does not exist.", key);
        }
        Upload& upload = it->second;

        std::string body = req.body_string();
        std::string data;
        std::string etags;
        int last = 0;
        int count = 0;
        size_t short_parts = 0;
        size_t last_size = 0;
        for (const auto& range : xml::find_elements(body, "Part")) {
            std::string part = xml::element_content(body, range);
            int number = std::atoi(xml::get_element(part, "PartNumber").c_str());
            std::string etag = xml::decode_entities(xml::get_element(part, "ETag"));
            if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
                etag = etag.substr(1, etag.size() - 2);
            }
            if (number <= last) {
                return error(400, "InvalidPartOrder", "The list of parts was not in ascending order.");
            }
            auto p = upload.parts.find(number);
            if (p == upload.parts.end() || p->second.etag != etag) {
                return error(400, "InvalidPart", "One or more of the specified parts could not be found.");
            }
            if (count > 0 && static_cast<int64_t>(last_size) < min_part_size_) ++short_parts;
            last_size = p->second.data.size();
            data += p->second.data;
            etags += p->second.etag;
            last = number;
            ++count;
        }
        if (count == 0) {
            return error(400, "MalformedXML", "The XML you provided was not well-formed.");
        }
        if (short_parts > 0) {
            return error(400, "EntityTooSmall",
                         "Your proposed upload is smaller than the minimum allowed object size.");
        }

        std::string etag = md5_hex(etags) + "-" + std::to_string(count);
        objects_[key] = {data, etag, "binary/octet-stream"};
        uploads_.erase(it);

        std::ostringstream out;
        out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            << "<CompleteMultipartUploadResult>"
            << "<Bucket>" << xml::escape(bucket_) << "</Bucket>"
            << "<Key>" << xml::escape(key) << "</Key>"
            << "<ETag>&quot;" << etag << "&quot;</ETag>"
            << "</CompleteMultipartUploadResult>";
        return xml_response(200, out.str());
    }

    net::HttpResponse abort_upload(const net::ServerRequest& req, const std::string& key) {
        auto it = uploads_.find(req.params.at("uploadId"));
        if (it == uploads_.end() || it->second.key != key) {
            return error(404, "NoSuchUpload", "The specified upload does not exist.", key);
        }
        uploads_.erase(it);
        return net::HttpResponse::text(204, "");
    }

    net::HttpResponse list_objects(const net::ServerRequest& req) {
        std::string prefix = req.params.count("prefix") ? req.params.at("prefix") : "";

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<ListBucketResult>"
             << "<Name>" << xml::escape(bucket_) << "</Name>"
             << "<IsTruncated>false</IsTruncated>";
        for (const auto& [key, obj] : objects_) {
            if (!key.starts_with(prefix)) continue;
            body << "<Contents><Key>" << xml::escape(key) << "</Key>"
                 << "<Size>" << obj.data.size() << "</Size>"
                 << "<ETag>&quot;" << obj.etag << "&quot;</ETag></Contents>";
        }
        body << "</ListBucketResult>";
        return xml_response(200, body.str());
    }

    net::HttpResponse list_uploads(const net::ServerRequest& req) {
        std::string prefix = req.params.count("prefix") ? req.params.at("prefix") : "";

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<ListMultipartUploadsResult>"
             << "<Bucket>" << xml::escape(bucket_) << "</Bucket>"
             << "<IsTruncated>false</IsTruncated>";
        for (const auto& [id, upload] : uploads_) {
            if (!upload.key.starts_with(prefix)) continue;
            body << "<Upload><Key>" << xml::escape(upload.key) << "</Key>"
                 << "<UploadId>" << id << "</UploadId>"
                 << "<Initiated>" << upload.initiated << "</Initiated></Upload>";
        }
        body << "</ListMultipartUploadsResult>";
        return xml_response(200, body.str());
    }

    std::string bucket_;

    mutable std::mutex mutex_;
    std::map<std::string, Object> objects_;
    std::map<std::string, Upload> uploads_;
    std::deque<Fault> faults_;
    int64_t min_part_size_ = 0;
    size_t upload_seq_ = 0;
    size_t put_count_ = 0;
    size_t part_put_count_ = 0;
    size_t request_count_ = 0;

    net::HttpServer server_;  // Last: stopped before the state above is destroyed
};

} // namespace layerpush::testing
