#include "nexus/core/error.hpp"

namespace nexus {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Authentication: return "authentication_error";
        case ErrorCode::Validation: return "validation_error";
        case ErrorCode::PayloadTooLarge: return "payload_too_large";
        case ErrorCode::OffsetConflict: return "offset_conflict";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::UnsupportedMediaType: return "unsupported_media_type";
        case ErrorCode::StorageFailure: return "storage_failure";
        case ErrorCode::Internal: return "internal_error";
    }
    return "internal_error";
}

} // namespace nexus
