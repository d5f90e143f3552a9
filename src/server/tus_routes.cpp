#include "nexus/server/tus_routes.hpp"

#include "nexus/core/digest.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>

namespace nexus::server {

using network::HttpContext;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;

namespace {

constexpr const char* kTusResumable = "Tus-Resumable";

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += items[i];
    }
    return out;
}

std::string encode_upload_metadata(const std::map<std::string, std::string>& metadata) {
    std::vector<std::string> pairs;
    for (const auto& [key, value] : metadata) {
        pairs.push_back(value.empty() ? key : key + " " + core::base64_encode(value));
    }
    return join(pairs, ",");
}

HttpResponse tus_response(HttpStatus status) {
    HttpResponse response(status);
    response.set_header(kTusResumable, upload::kTusVersion);
    return response;
}

} // namespace

HttpStatus status_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Authentication: return HttpStatus::UNAUTHORIZED;
        case ErrorCode::Validation: return HttpStatus::BAD_REQUEST;
        case ErrorCode::PayloadTooLarge: return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorCode::OffsetConflict: return HttpStatus::CONFLICT;
        case ErrorCode::NotFound: return HttpStatus::NOT_FOUND;
        case ErrorCode::UnsupportedMediaType: return HttpStatus::UNSUPPORTED_MEDIA_TYPE;
        case ErrorCode::StorageFailure: return HttpStatus::INTERNAL_SERVER_ERROR;
        case ErrorCode::Internal: return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

HttpResponse error_response(const Error& error, bool with_body) {
    HttpResponse response = tus_response(status_for(error.code));
    if (with_body) {
        nlohmann::json body{{"error", to_string(error.code)}, {"message", error.message}};
        response.set_header("Content-Type", "application/json");
        response.set_body(body.dump());
    }
    return response;
}

std::optional<std::uint64_t> parse_uint64(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

TusRoutes::TusRoutes(upload::UploadService& service, std::string base_path)
    : service_(service), base_path_(std::move(base_path)) {}

void TusRoutes::register_routes(network::HttpRouter& router) {
    router.use([this](const HttpContext& ctx, HttpResponse& response) {
        return check_version(ctx, response);
    });

    const std::string item = base_path_ + "/:id";
    router.options(base_path_, [this](const HttpContext& ctx) { return handle_options(ctx); });
    router.options(item, [this](const HttpContext& ctx) { return handle_options(ctx); });
    router.post(base_path_, [this](const HttpContext& ctx) { return handle_create(ctx); });
    router.head(item, [this](const HttpContext& ctx) { return handle_head(ctx); });
    router.patch(item, [this](const HttpContext& ctx) { return handle_patch(ctx); });
    router.delete_(item, [this](const HttpContext& ctx) { return handle_delete(ctx); });
}

bool TusRoutes::check_version(const HttpContext& ctx, HttpResponse& response) const {
    const auto& request = ctx.request;
    if (request.method == HttpMethod::OPTIONS || request.path().rfind(base_path_, 0) != 0) {
        return true;
    }
    const auto version = request.get_header(kTusResumable);
    if (version == upload::kTusVersion) {
        return true;
    }

    response = tus_response(HttpStatus::PRECONDITION_FAILED);
    response.set_header("Tus-Version", join(service_.advertise().supported_versions, ","));
    if (request.method != HttpMethod::HEAD) {
        response.set_body("Unsupported Tus-Resumable version: '" + version + "'");
    }
    return false;
}

std::string TusRoutes::location_for(const HttpRequest& request, const std::string& upload_id) const {
    const std::string path = base_path_ + "/" + upload_id;
    const auto host = request.get_header("Host");
    if (host.empty()) {
        return path;
    }
    auto scheme = request.get_header("X-Forwarded-Proto");
    if (scheme != "https") {
        scheme = "http";
    }
    return scheme + "://" + host + path;
}

HttpResponse TusRoutes::handle_options(const HttpContext&) {
    const auto caps = service_.advertise();
    HttpResponse response = tus_response(HttpStatus::NO_CONTENT);
    response.set_header("Tus-Version", join(caps.supported_versions, ","));
    response.set_header("Tus-Extension", join(caps.extensions, ","));
    if (caps.max_size > 0) {
        response.set_header("Tus-Max-Size", std::to_string(caps.max_size));
    }
    return response;
}

HttpResponse TusRoutes::handle_create(const HttpContext& ctx) {
    const auto& request = ctx.request;
    upload::CreateRequest create;

    if (request.has_header("Upload-Concat")) {
        auto directive = upload::parse_concat_header(request.get_header("Upload-Concat"));
        if (directive.is_error()) {
            return error_response(directive.error());
        }
        create.concat = directive.value();
    }

    if (!create.concat.is_final()) {
        if (request.has_header("Upload-Defer-Length")) {
            return error_response(Error{ErrorCode::Validation, "Upload-Defer-Length is not supported"});
        }
        if (request.has_header("Upload-Length")) {
            create.length = parse_uint64(request.get_header("Upload-Length"));
            if (!create.length) {
                return error_response(Error{ErrorCode::Validation, "Upload-Length must be a non-negative integer"});
            }
        }
    }

    create.metadata = upload::parse_upload_metadata(request.get_header("Upload-Metadata"));

    auto result = service_.create(create);
    if (result.is_error()) {
        spdlog::debug("Create rejected: {}", result.error().message);
        return error_response(result.error());
    }

    const auto& session = result.value().session;
    HttpResponse response = tus_response(result.value().created ? HttpStatus::CREATED : HttpStatus::OK);
    response.set_header("Location", location_for(request, session.id));
    response.set_header("Upload-Offset", std::to_string(session.offset));
    return response;
}

HttpResponse TusRoutes::handle_head(const HttpContext& ctx) {
    auto info = service_.inspect(ctx.get_param("id"));
    if (info.is_error()) {
        return error_response(info.error(), false);
    }

    HttpResponse response = tus_response(HttpStatus::OK);
    response.set_header("Upload-Offset", std::to_string(info.value().offset));
    response.set_header("Upload-Length", std::to_string(info.value().size));
    response.set_header("Cache-Control", "no-store");
    if (!info.value().metadata.empty()) {
        response.set_header("Upload-Metadata", encode_upload_metadata(info.value().metadata));
    }
    if (info.value().partial) {
        response.set_header("Upload-Concat", "partial");
    } else if (!info.value().concat_parts.empty()) {
        std::vector<std::string> locations;
        for (const auto& id : info.value().concat_parts) {
            locations.push_back(base_path_ + "/" + id);
        }
        response.set_header("Upload-Concat", "final;" + join(locations, " "));
    }
    return response;
}

HttpResponse TusRoutes::handle_patch(const HttpContext& ctx) {
    const auto& request = ctx.request;

    const auto offset = parse_uint64(request.get_header("Upload-Offset"));
    if (!offset) {
        return error_response(Error{ErrorCode::Validation, "Upload-Offset must be a non-negative integer"});
    }

    const char* data = request.body.empty() ? nullptr : reinterpret_cast<const char*>(request.body.data());
    auto result = service_.append(ctx.get_param("id"), *offset, request.get_header("Content-Type"),
                                  data, request.body.size(), request.truncated);
    if (result.is_error()) {
        return error_response(result.error());
    }

    HttpResponse response = tus_response(HttpStatus::NO_CONTENT);
    response.set_header("Upload-Offset", std::to_string(result.value().offset));
    return response;
}

HttpResponse TusRoutes::handle_delete(const HttpContext& ctx) {
    auto result = service_.cancel(ctx.get_param("id"));
    if (result.is_error()) {
        return error_response(result.error());
    }
    return tus_response(HttpStatus::NO_CONTENT);
}

} // namespace nexus::server
