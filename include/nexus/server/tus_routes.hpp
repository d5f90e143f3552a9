/**
 * @file tus_routes.hpp
 * @brief TUS 1.0.0 wire protocol on top of UploadService
 *
 * ROUTES (base = /api/upload/tus by default):
 *   OPTIONS base, base/:id   capabilities
 *   POST    base             create (creation, concatenation)
 *   HEAD    base/:id         current offset
 *   PATCH   base/:id         append a chunk
 *   DELETE  base/:id         terminate
 *
 * Every response carries Tus-Resumable. Requests other than OPTIONS
 * without a supported Tus-Resumable get 412.
 */

#pragma once

#include "nexus/core/error.hpp"
#include "nexus/network/http_router.hpp"
#include "nexus/upload/service.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace nexus::server {

class TusRoutes {
public:
    TusRoutes(upload::UploadService& service, std::string base_path);

    void register_routes(network::HttpRouter& router);

    network::HttpResponse handle_options(const network::HttpContext& ctx);
    network::HttpResponse handle_create(const network::HttpContext& ctx);
    network::HttpResponse handle_head(const network::HttpContext& ctx);
    network::HttpResponse handle_patch(const network::HttpContext& ctx);
    network::HttpResponse handle_delete(const network::HttpContext& ctx);

    const std::string& base_path() const { return base_path_; }

private:
    bool check_version(const network::HttpContext& ctx, network::HttpResponse& response) const;
    std::string location_for(const network::HttpRequest& request, const std::string& upload_id) const;

    upload::UploadService& service_;
    std::string base_path_;
};

network::HttpStatus status_for(ErrorCode code) noexcept;

// JSON body {"error": "...", "message": "..."}; body omitted for HEAD.
network::HttpResponse error_response(const Error& error, bool with_body = true);

// Non-negative decimal integer, nothing else.
std::optional<std::uint64_t> parse_uint64(const std::string& text);

} // namespace nexus::server
