#pragma once

#include "nexus/network/http_parser.hpp"
#include "nexus/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>

namespace nexus {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection gets its own HttpConnection that reads one
 * request, hands it to the handler, writes the response and closes.
 * enable_shared_from_this keeps it alive while async operations are
 * pending.
 *
 * If the peer disconnects while the body is still arriving, the request
 * is delivered to the handler with `truncated` set so an upload can keep
 * the bytes that did make it.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_bytes);

    void start();

private:
    void do_read();
    void dispatch(HttpRequest request);
    void do_write(const HttpResponse& response);
    void handle_error(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Thread safety:
 * - io_context.run() may be called from several threads
 * - The handler is called from io_context thread(s) and must be thread-safe
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 5168, 64 << 20);
 * server.set_handler([&](const HttpRequest& req) { return router.handle_request(req); });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    HttpServerAsio(asio::io_context& io_context, uint16_t port, std::size_t max_body_bytes);

    void set_handler(HttpRequestHandler handler);

    uint16_t get_port() const { return port_; }

    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::size_t max_body_bytes_;
    uint16_t port_;
};

} // namespace network
} // namespace nexus
