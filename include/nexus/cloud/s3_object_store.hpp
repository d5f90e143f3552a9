/**
 * @file s3_object_store.hpp
 * @brief ObjectStore over the S3 REST API (AWS, Cloudflare R2, MinIO)
 *
 * Path-style addressing (<endpoint>/<bucket>/<key>), Signature Version 4,
 * one synchronous Beast connection per request over http or https.
 */

#pragma once

#include "nexus/cloud/object_store.hpp"
#include "nexus/core/config.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace nexus::cloud {

struct S3Endpoint {
    bool tls = true;
    std::string host;
    std::string port;

    // "https://host[:port]" or "http://host[:port]"
    static Result<S3Endpoint, Error> parse(const std::string& url);

    // Value of the Host header (port included only when non-default).
    std::string host_header() const;
};

class S3ObjectStore : public ObjectStore {
public:
    static Result<std::unique_ptr<S3ObjectStore>, Error> create(const core::CloudConfig& config);

    Result<std::string, Error> create_multipart(const std::string& key, const std::string& content_type) override;
    Result<std::string, Error> upload_part(const std::string& key,
                                           const std::string& upload_id,
                                           int part_number,
                                           const std::string& data) override;
    Result<void, Error> complete_multipart(const std::string& key,
                                           const std::string& upload_id,
                                           const CompletedParts& parts) override;
    Result<void, Error> abort_multipart(const std::string& key, const std::string& upload_id) override;
    Result<void, Error> download(const std::string& key, const std::filesystem::path& destination) override;
    Result<void, Error> remove(const std::string& key) override;

    struct Response {
        unsigned status = 0;
        std::string etag;
        std::string body;
    };

    /**
     * @brief Authorization and x-amz-* headers for one request
     *
     * `canonical_query` must already be sorted and encoded.
     */
    std::map<std::string, std::string> sign(const std::string& method,
                                            const std::string& canonical_uri,
                                            const std::string& canonical_query,
                                            const std::string& payload_sha256,
                                            std::chrono::system_clock::time_point when) const;

private:
    S3ObjectStore(core::CloudConfig config, S3Endpoint endpoint);

    std::string object_uri(const std::string& key) const;

    Result<Response, Error> send(const std::string& method,
                                 const std::string& key,
                                 const std::string& canonical_query,
                                 const std::string& body,
                                 const std::string& content_type);

    core::CloudConfig config_;
    S3Endpoint endpoint_;
};

// Percent-encode per RFC 3986; '/' is kept when encode_slash is false.
std::string s3_uri_encode(const std::string& value, bool encode_slash = true);

std::optional<std::string> extract_xml_element(const std::string& xml, const std::string& tag);

std::string build_complete_multipart_xml(const CompletedParts& parts);

} // namespace nexus::cloud
