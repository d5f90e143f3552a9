#include "nexus/cloud/s3_object_store.hpp"

#include "nexus/core/digest.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace nexus::cloud {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kTimeout = std::chrono::seconds(60);
constexpr std::uint64_t kMaxResponseBody = 16ULL * 1024 * 1024;

std::string format_utc(std::chrono::system_clock::time_point when, const char* format) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), format, &tm);
    return buf;
}

std::vector<std::uint8_t> bytes_of(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

/**
 * Connect a plain or TLS stream to the endpoint and hand it to `exchange`,
 * which writes one request and reads one response.
 */
template<typename Exchange>
Result<void, Error> with_stream(const S3Endpoint& endpoint, Exchange&& exchange) {
    try {
        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        const auto results = resolver.resolve(endpoint.host, endpoint.port);

        if (!endpoint.tls) {
            beast::tcp_stream stream(ioc);
            stream.expires_after(kTimeout);
            stream.connect(results);
            exchange(stream);
            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return Done();
        }

        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
            return Fail<void>(ErrorCode::StorageFailure, "cannot set TLS server name " + endpoint.host);
        }
        stream.set_verify_callback(ssl::host_name_verification(endpoint.host));

        beast::get_lowest_layer(stream).expires_after(kTimeout);
        beast::get_lowest_layer(stream).connect(results);
        stream.handshake(ssl::stream_base::client);
        exchange(stream);

        // Object stores routinely close without close_notify; the response is already complete.
        beast::error_code ec;
        stream.shutdown(ec);
        return Done();
    } catch (const boost::system::system_error& e) {
        return Fail<void>(ErrorCode::StorageFailure, std::string("s3 transport: ") + e.what());
    }
}

Error s3_error(const std::string& operation, unsigned status, const std::string& body) {
    const auto message = extract_xml_element(body, "Message");
    return Error{ErrorCode::StorageFailure,
                 operation + " failed with HTTP " + std::to_string(status) + ": " +
                 message.value_or(body.empty() ? "no body" : body.substr(0, 200))};
}

} // namespace

// ════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════

std::string s3_uri_encode(const std::string& value, bool encode_slash) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(uc);
        }
    }
    return escaped.str();
}

std::optional<std::string> extract_xml_element(const std::string& xml, const std::string& tag) {
    const std::string open_tag = "<" + tag + ">";
    const std::string close_tag = "</" + tag + ">";

    auto start = xml.find(open_tag);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    start += open_tag.size();

    const auto end = xml.find(close_tag, start);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    return xml.substr(start, end - start);
}

std::string build_complete_multipart_xml(const CompletedParts& parts) {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    xml << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
    for (const auto& [number, etag] : parts) {
        xml << "  <Part><PartNumber>" << number << "</PartNumber><ETag>" << etag << "</ETag></Part>\n";
    }
    xml << "</CompleteMultipartUpload>";
    return xml.str();
}

Result<S3Endpoint, Error> S3Endpoint::parse(const std::string& url) {
    S3Endpoint endpoint;
    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        endpoint.tls = true;
        endpoint.port = "443";
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        endpoint.tls = false;
        endpoint.port = "80";
        rest = url.substr(7);
    } else {
        return Fail<S3Endpoint>(ErrorCode::Validation, "cloud endpoint must start with http:// or https://");
    }

    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest.erase(slash);
    }
    const auto colon = rest.find(':');
    if (colon != std::string::npos) {
        endpoint.port = rest.substr(colon + 1);
        rest.erase(colon);
    }
    if (rest.empty() || endpoint.port.empty()) {
        return Fail<S3Endpoint>(ErrorCode::Validation, "cloud endpoint has no host: " + url);
    }
    endpoint.host = rest;
    return Ok<S3Endpoint, Error>(endpoint);
}

std::string S3Endpoint::host_header() const {
    const bool default_port = (tls && port == "443") || (!tls && port == "80");
    return default_port ? host : host + ":" + port;
}

// ════════════════════════════════════════════════════════
// S3ObjectStore
// ════════════════════════════════════════════════════════

Result<std::unique_ptr<S3ObjectStore>, Error> S3ObjectStore::create(const core::CloudConfig& config) {
    using Store = std::unique_ptr<S3ObjectStore>;
    if (!config.configured()) {
        return Fail<Store>(ErrorCode::Validation, "cloud backend is not fully configured");
    }
    auto endpoint = S3Endpoint::parse(config.endpoint);
    if (endpoint.is_error()) {
        return Err<Store, Error>(endpoint.error());
    }
    return Ok<Store, Error>(Store(new S3ObjectStore(config, endpoint.value())));
}

S3ObjectStore::S3ObjectStore(core::CloudConfig config, S3Endpoint endpoint)
    : config_(std::move(config)), endpoint_(std::move(endpoint)) {}

std::string S3ObjectStore::object_uri(const std::string& key) const {
    return "/" + s3_uri_encode(config_.bucket) + "/" + s3_uri_encode(key, false);
}

std::map<std::string, std::string> S3ObjectStore::sign(const std::string& method,
                                                       const std::string& canonical_uri,
                                                       const std::string& canonical_query,
                                                       const std::string& payload_sha256,
                                                       std::chrono::system_clock::time_point when) const {
    const std::string amz_date = format_utc(when, "%Y%m%dT%H%M%SZ");
    const std::string date_stamp = format_utc(when, "%Y%m%d");

    // Lowercase names, already in sorted order.
    std::map<std::string, std::string> headers;
    headers["host"] = endpoint_.host_header();
    headers["x-amz-content-sha256"] = payload_sha256;
    headers["x-amz-date"] = amz_date;

    std::ostringstream canonical_headers;
    std::ostringstream signed_headers;
    bool first = true;
    for (const auto& [name, value] : headers) {
        canonical_headers << name << ":" << value << "\n";
        if (!first) {
            signed_headers << ";";
        }
        signed_headers << name;
        first = false;
    }

    std::ostringstream canonical_request;
    canonical_request << method << "\n"
                      << canonical_uri << "\n"
                      << canonical_query << "\n"
                      << canonical_headers.str() << "\n"
                      << signed_headers.str() << "\n"
                      << payload_sha256;

    const std::string scope = date_stamp + "/" + config_.region + "/s3/aws4_request";

    std::ostringstream string_to_sign;
    string_to_sign << "AWS4-HMAC-SHA256\n"
                   << amz_date << "\n"
                   << scope << "\n"
                   << core::sha256_hex(canonical_request.str());

    const auto k_date = core::hmac_sha256(bytes_of("AWS4" + config_.secret_access_key), date_stamp);
    const auto k_region = core::hmac_sha256(k_date, config_.region);
    const auto k_service = core::hmac_sha256(k_region, "s3");
    const auto k_signing = core::hmac_sha256(k_service, "aws4_request");
    const auto signature = core::to_hex(core::hmac_sha256(k_signing, string_to_sign.str()));

    headers["authorization"] = "AWS4-HMAC-SHA256 Credential=" + config_.access_key_id + "/" + scope +
                               ", SignedHeaders=" + signed_headers.str() +
                               ", Signature=" + signature;
    return headers;
}

Result<S3ObjectStore::Response, Error> S3ObjectStore::send(const std::string& method,
                                                           const std::string& key,
                                                           const std::string& canonical_query,
                                                           const std::string& body,
                                                           const std::string& content_type) {
    const std::string uri = object_uri(key);
    const auto headers = sign(method, uri, canonical_query, core::sha256_hex(body),
                              std::chrono::system_clock::now());

    http::request<http::string_body> req{
        http::string_to_verb(method), canonical_query.empty() ? uri : uri + "?" + canonical_query, 11};
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    if (!content_type.empty()) {
        req.set(http::field::content_type, content_type);
    }
    req.body() = body;
    req.prepare_payload();

    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseBody);

    auto exchanged = with_stream(endpoint_, [&](auto& stream) {
        http::write(stream, req);
        beast::flat_buffer buffer;
        http::read(stream, buffer, parser);
    });
    if (exchanged.is_error()) {
        return Err<Response, Error>(exchanged.error());
    }

    const auto& res = parser.get();
    Response response;
    response.status = res.result_int();
    response.body = res.body();
    if (auto it = res.find(http::field::etag); it != res.end()) {
        response.etag = std::string(it->value());
    }
    return Ok<Response, Error>(std::move(response));
}

Result<std::string, Error> S3ObjectStore::create_multipart(const std::string& key, const std::string& content_type) {
    auto res = send("POST", key, "uploads=", "", content_type);
    if (res.is_error()) {
        return Err<std::string, Error>(res.error());
    }
    if (res.value().status != 200) {
        return Err<std::string, Error>(s3_error("CreateMultipartUpload", res.value().status, res.value().body));
    }
    auto upload_id = extract_xml_element(res.value().body, "UploadId");
    if (!upload_id) {
        return Fail<std::string>(ErrorCode::StorageFailure, "CreateMultipartUpload response has no UploadId");
    }
    return Ok<std::string, Error>(*upload_id);
}

Result<std::string, Error> S3ObjectStore::upload_part(const std::string& key,
                                                      const std::string& upload_id,
                                                      int part_number,
                                                      const std::string& data) {
    const std::string query = "partNumber=" + std::to_string(part_number) + "&uploadId=" + s3_uri_encode(upload_id);
    auto res = send("PUT", key, query, data, "");
    if (res.is_error()) {
        return Err<std::string, Error>(res.error());
    }
    if (res.value().status != 200) {
        return Err<std::string, Error>(s3_error("UploadPart", res.value().status, res.value().body));
    }
    if (res.value().etag.empty()) {
        return Fail<std::string>(ErrorCode::StorageFailure, "UploadPart response has no ETag");
    }
    return Ok<std::string, Error>(res.value().etag);
}

Result<void, Error> S3ObjectStore::complete_multipart(const std::string& key,
                                                      const std::string& upload_id,
                                                      const CompletedParts& parts) {
    const std::string query = "uploadId=" + s3_uri_encode(upload_id);
    auto res = send("POST", key, query, build_complete_multipart_xml(parts), "application/xml");
    if (res.is_error()) {
        return Err<void, Error>(res.error());
    }
    // S3 may report a failed completion inside a 200 response.
    if (res.value().status != 200 || res.value().body.find("<Error>") != std::string::npos) {
        return Err<void, Error>(s3_error("CompleteMultipartUpload", res.value().status, res.value().body));
    }
    return Done();
}

Result<void, Error> S3ObjectStore::abort_multipart(const std::string& key, const std::string& upload_id) {
    auto res = send("DELETE", key, "uploadId=" + s3_uri_encode(upload_id), "", "");
    if (res.is_error()) {
        return Err<void, Error>(res.error());
    }
    const auto status = res.value().status;
    if (status != 204 && status != 200 && status != 404) {
        return Err<void, Error>(s3_error("AbortMultipartUpload", status, res.value().body));
    }
    return Done();
}

Result<void, Error> S3ObjectStore::download(const std::string& key, const std::filesystem::path& destination) {
    const std::string uri = object_uri(key);
    const auto headers = sign("GET", uri, "", core::sha256_hex(""), std::chrono::system_clock::now());

    http::request<http::empty_body> req{http::verb::get, uri, 11};
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }

    Result<void, Error> exchanged = Done();
    unsigned status = 0;
    {
        // The parser owns the open file; leaving the scope closes it.
        http::response_parser<http::file_body> parser;
        parser.body_limit(std::numeric_limits<std::uint64_t>::max());
        beast::error_code ec;
        parser.get().body().open(destination.c_str(), beast::file_mode::write, ec);
        if (ec) {
            return Fail<void>(ErrorCode::StorageFailure, "open " + destination.string() + ": " + ec.message());
        }

        exchanged = with_stream(endpoint_, [&](auto& stream) {
            http::write(stream, req);
            beast::flat_buffer buffer;
            http::read(stream, buffer, parser);
        });
        if (parser.is_header_done()) {
            status = parser.get().result_int();
        }
    }

    std::error_code cleanup;
    if (exchanged.is_error()) {
        std::filesystem::remove(destination, cleanup);
        return exchanged;
    }
    if (status != 200) {
        std::filesystem::remove(destination, cleanup);
        return Fail<void>(ErrorCode::StorageFailure, "GetObject failed with HTTP " + std::to_string(status));
    }
    return Done();
}

Result<void, Error> S3ObjectStore::remove(const std::string& key) {
    auto res = send("DELETE", key, "", "", "");
    if (res.is_error()) {
        return Err<void, Error>(res.error());
    }
    const auto status = res.value().status;
    if (status != 204 && status != 200 && status != 404) {
        return Err<void, Error>(s3_error("DeleteObject", status, res.value().body));
    }
    return Done();
}

} // namespace nexus::cloud
