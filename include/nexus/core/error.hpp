#pragma once

#include "nexus/core/result.hpp"

#include <string>

namespace nexus {

enum class ErrorCode {
    Authentication,       // bad or missing owner credential
    Validation,           // malformed input, write past declared size
    PayloadTooLarge,      // declared length above the configured maximum
    OffsetConflict,       // Upload-Offset does not match the stored offset
    NotFound,             // unknown upload id
    UnsupportedMediaType, // PATCH without application/offset+octet-stream
    StorageFailure,       // disk or database I/O error
    Internal
};

struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;
};

const char* to_string(ErrorCode code) noexcept;

template<typename T>
Result<T, Error> Fail(ErrorCode code, std::string message) {
    return Err<T, Error>(Error{code, std::move(message)});
}

inline Result<void, Error> Done() { return Ok<Error>(); }

} // namespace nexus
