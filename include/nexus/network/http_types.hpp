#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace nexus {
namespace network {

/**
 * @brief HTTP request methods
 *
 * PATCH carries TUS chunk data; OPTIONS advertises protocol capabilities.
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DELETE_METHOD,  // Renamed to avoid the DELETE macro on some platforms
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief HTTP status codes used by the upload protocol
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,
    PRECONDITION_FAILED = 412,
    PAYLOAD_TOO_LARGE = 413,
    UNSUPPORTED_MEDIA_TYPE = 415,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503
};

/**
 * @brief Represents an HTTP request
 *
 * Body is a byte vector because PATCH bodies are raw file data.
 *
 * `truncated` is set by the connection when the peer closed the socket
 * before Content-Length bytes arrived; `body` then holds only the bytes
 * that were actually received.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    bool truncated = false;

    /**
     * @brief Get a header value (case-insensitive lookup)
     *
     * @return Header value if found, empty string otherwise
     */
    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        for (const auto& entry : headers) {
            if (strcasecmp(entry.first.c_str(), name.c_str()) == 0) {
                return true;
            }
        }
        return false;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    // Path component of the URL (query string removed)
    std::string path() const {
        auto pos = url.find('?');
        return pos == std::string::npos ? url : url.substr(0, pos);
    }
};

/**
 * @brief Represents an HTTP response
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    /**
     * @brief Set response body from a string
     *
     * Automatically sets Content-Length header.
     */
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(const std::vector<uint8_t>& data) {
        body = data;
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : "";
    }

    /**
     * @brief Serialize the response to bytes for transmission
     *
     * Content-Length is written for every status that may carry a body.
     */
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;

        oss << version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";

        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        if (status_code != 204 && headers.find("Content-Length") == headers.end()) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }

        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::UNAUTHORIZED: return "Unauthorized";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::CONFLICT: return "Conflict";
            case HttpStatus::PRECONDITION_FAILED: return "Precondition Failed";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::UNSUPPORTED_MEDIA_TYPE: return "Unsupported Media Type";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        }
        return "Unknown";
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            case HttpVersion::HTTP_1_1: return "HTTP/1.1";
            default: return "HTTP/1.1";
        }
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "PATCH") return HttpMethod::PATCH;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::PATCH: return "PATCH";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

} // namespace network
} // namespace nexus
