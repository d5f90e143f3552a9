#pragma once

#include "nexus/core/result.hpp"
#include "nexus/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <string>

namespace nexus {
namespace network {

/**
 * @brief State machine states for HTTP request parsing
 *
 * HTTP Request Format:
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Optional body
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * The request line and headers are parsed character by character; the
 * body is copied in bulk since PATCH bodies are megabytes of file data.
 *
 * Usage example:
 * ```cpp
 * HttpParser parser(64 * 1024 * 1024);
 * auto result = parser.parse(buffer, n);
 * if (result.is_error()) { ... }
 * if (result.value()) { HttpRequest request = parser.take_request(); }
 * ```
 *
 * When the peer disconnects in the middle of the body, in_body() is true
 * and take_partial_request() hands out what arrived so far.
 */
class HttpParser {
public:
    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

    explicit HttpParser(std::size_t max_body_bytes = std::numeric_limits<std::size_t>::max())
        : max_body_bytes_(max_body_bytes) {
        reset();
    }

    /**
     * @brief Parse incoming data
     *
     * @return true once the request is complete, false if more data is needed,
     *         or an error for malformed input
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::BODY) {
                const size_t remaining = expected_body_ - request_.body.size();
                const size_t take = std::min(remaining, len - i);
                request_.body.insert(request_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + i),
                                     reinterpret_cast<const uint8_t*>(data + i + take));
                i += take;
                if (request_.body.size() == expected_body_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool, std::string>(error_);
            }

            char c = data[i++];
            if (++header_bytes_ > kMaxHeaderBytes) {
                return fail("Request headers too large");
            }
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD: ok = parse_method(c); break;
                case ParseState::URL: ok = parse_url(c); break;
                case ParseState::VERSION: ok = parse_version(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                default: break;
            }
            if (!ok) {
                return fail(error_.empty() ? "Malformed request at line " + std::to_string(line_) : error_);
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    /**
     * @brief Move the parsed request out of the parser
     *
     * Only call this after parse() returns true.
     */
    HttpRequest take_request() {
        return std::move(request_);
    }

    /**
     * @brief Hand out a request whose body ended early
     *
     * Only meaningful while in_body() is true; the request is flagged
     * as truncated.
     */
    HttpRequest take_partial_request() {
        request_.truncated = true;
        return std::move(request_);
    }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }
    bool in_body() const { return state_ == ParseState::BODY; }

    // Set when the failure was an oversized body (maps to 413).
    bool body_too_large() const { return body_too_large_; }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        expected_body_ = 0;
        header_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        body_too_large_ = false;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    size_t max_body_bytes_;
    size_t expected_body_;
    size_t header_bytes_;
    size_t line_;
    bool last_char_was_cr_;
    bool body_too_large_;

    Result<bool> fail(std::string message) {
        error_ = std::move(message);
        state_ = ParseState::PARSE_ERROR;
        return Err<bool, std::string>(error_);
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                error_ = "Unsupported method " + buffer_;
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            // Empty line: headers complete
            last_char_was_cr_ = false;
            return begin_body();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool begin_body() {
        if (!request_.get_header("Transfer-Encoding").empty()) {
            error_ = "Transfer-Encoding is not supported, send Content-Length";
            return false;
        }

        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        char* end = nullptr;
        const unsigned long long length = std::strtoull(content_length.c_str(), &end, 10);
        if (end == content_length.c_str() || *end != '\0' || content_length[0] == '-') {
            error_ = "Invalid Content-Length";
            return false;
        }
        if (length > max_body_bytes_) {
            body_too_large_ = true;
            error_ = "Request body exceeds " + std::to_string(max_body_bytes_) + " bytes";
            return false;
        }

        expected_body_ = static_cast<size_t>(length);
        if (expected_body_ == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        request_.body.reserve(expected_body_);
        state_ = ParseState::BODY;
        return true;
    }
};

} // namespace network
} // namespace nexus
