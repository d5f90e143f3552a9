/**
 * @file session.hpp
 * @brief Upload session record and its lifecycle rules
 *
 * LIFECYCLE:
 *   active ──(offset == size)──> completed ──(finalize)──> imported
 *     │                             ▲    │
 *     └──(cancel)──> aborted        └────┘ (finalize failed, retry later)
 *
 * INVARIANTS:
 * - 0 <= offset <= size, offset never decreases
 * - at most one active session per (fingerprint, owner)
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nexus::upload {

enum class UploadStatus {
    Active,
    Completed,
    Imported,
    Aborted
};

const char* to_string(UploadStatus status) noexcept;
std::optional<UploadStatus> parse_status(const std::string& text);

// Whether the lifecycle above allows moving from one status to another.
bool can_transition(UploadStatus from, UploadStatus to) noexcept;

struct CloudPart {
    int number = 0;
    std::string etag;
    std::uint64_t size = 0;
};

/**
 * @brief Multipart state of a cloud-backed session
 *
 * `uploaded_bytes` is the prefix of the local backing file already sent
 * as parts. An inactive state means the session is written locally.
 */
struct CloudState {
    bool active = false;
    std::string object_key;
    std::string multipart_id;
    std::uint64_t uploaded_bytes = 0;
    std::vector<CloudPart> parts;
};

struct UploadSession {
    std::string id;
    std::string fingerprint;
    std::string owner;
    std::uint64_t size = 0;
    std::uint64_t offset = 0;
    std::string filename;
    std::string content_type = "application/octet-stream";
    std::map<std::string, std::string> metadata;

    bool partial = false;
    std::vector<std::string> concat_parts;   // ids, only for final uploads

    UploadStatus status = UploadStatus::Active;
    CloudState cloud;

    std::int64_t created_at = 0;   // unix seconds
    std::int64_t updated_at = 0;

    bool bytes_complete() const { return offset == size; }
};

std::string encode_metadata(const std::map<std::string, std::string>& metadata);
std::map<std::string, std::string> decode_metadata(const std::string& json_text);

std::string encode_parts(const std::vector<std::string>& parts);
std::vector<std::string> decode_parts(const std::string& json_text);

std::string encode_cloud_state(const CloudState& state);
CloudState decode_cloud_state(const std::string& json_text);

std::int64_t unix_now();

} // namespace nexus::upload
