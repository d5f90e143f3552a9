#include "nexus/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

namespace nexus {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_bytes)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_bytes) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);

                if (parse_result.is_error()) {
                    handle_error(parser_.body_too_large() ? HttpStatus::PAYLOAD_TOO_LARGE
                                                          : HttpStatus::BAD_REQUEST,
                                 parse_result.error());
                    return;
                }

                if (parse_result.value()) {
                    dispatch(parser_.take_request());
                } else {
                    do_read();
                }
                return;
            }

            if (ec == asio::error::eof || ec == asio::error::connection_reset) {
                if (parser_.in_body()) {
                    // Peer went away mid-body: hand over the bytes that arrived
                    HttpRequest partial = parser_.take_partial_request();
                    spdlog::info("{} {} disconnected after {} body bytes",
                                 HttpMethodUtils::to_string(partial.method), partial.url, partial.body.size());
                    dispatch(std::move(partial));
                }
                return;
            }

            if (ec != asio::error::operation_aborted) {
                spdlog::debug("Read error: {}", ec.message());
            }
        }
    );
}

void HttpConnection::dispatch(HttpRequest request) {
    spdlog::debug("{} {} HTTP/{}",
                  HttpMethodUtils::to_string(request.method),
                  request.url,
                  request.version == HttpVersion::HTTP_1_1 ? "1.1" : "1.0");

    HttpResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("Handler threw exception: {}", e.what());
        response = HttpResponse(HttpStatus::INTERNAL_SERVER_ERROR);
        response.set_body("Internal server error");
        response.set_header("Content-Type", "text/plain");
    }

    if (request.truncated) {
        // Nobody is listening for the response any more
        return;
    }
    do_write(response);
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    HttpResponse outgoing = response;
    outgoing.set_header("Connection", "close");
    auto data_ptr = std::make_shared<std::vector<uint8_t>>(outgoing.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::trace("Sent {} bytes", bytes_transferred);
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
        }
    );
}

void HttpConnection::handle_error(HttpStatus status, const std::string& message) {
    spdlog::warn("Connection error: {}", message);

    HttpResponse error_response(status);
    error_response.set_body(message);
    error_response.set_header("Content-Type", "text/plain");
    do_write(error_response);
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context, uint16_t port, std::size_t max_body_bytes)
    : acceptor_(io_context, tcp::endpoint(tcp::v4(), port))
    , max_body_bytes_(max_body_bytes)
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server listening on port {}", port_);
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_, max_body_bytes_)->start();
            } else if (ec == asio::error::operation_aborted) {
                return;
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            do_accept();
        }
    );
}

} // namespace network
} // namespace nexus
