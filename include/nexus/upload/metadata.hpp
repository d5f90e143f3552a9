/**
 * @file metadata.hpp
 * @brief Upload-Metadata and Upload-Concat header handling, fingerprints
 *
 * Upload-Metadata is a comma-separated list of `key base64(value)` pairs:
 *   filename YS50eHQ=,filetype dGV4dC9wbGFpbg==,password c2VjcmV0
 */

#pragma once

#include "nexus/core/error.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nexus::upload {

namespace metadata_keys {
inline constexpr const char* kCredential = "password";
inline constexpr const char* kFilename = "filename";
inline constexpr const char* kFiletype = "filetype";
inline constexpr const char* kLastModified = "lastModified";
}

// Pairs with an undecodable value are dropped with a warning; a bare
// key maps to an empty value.
std::map<std::string, std::string> parse_upload_metadata(const std::string& header);

// Last path component of a client-supplied name, or fallback when nothing is left.
std::string sanitize_filename(const std::string& name, const std::string& fallback);

std::string make_fingerprint(const std::string& filename,
                             std::uint64_t size,
                             const std::optional<std::string>& last_modified);

std::string make_final_fingerprint(const std::string& filename,
                                   std::uint64_t size,
                                   const std::vector<std::string>& part_ids);

struct ConcatDirective {
    bool partial = false;
    std::vector<std::string> final_parts;   // upload ids, in order

    bool is_final() const { return !final_parts.empty(); }
};

/**
 * @brief Parse an Upload-Concat header value
 *
 * "partial" or "final;<url> <url> ...". Each URL contributes its last
 * path segment, so bare ids are accepted too.
 */
Result<ConcatDirective, Error> parse_concat_header(const std::string& value);

} // namespace nexus::upload
