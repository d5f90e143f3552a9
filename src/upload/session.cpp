#include "nexus/upload/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>

namespace nexus::upload {

using json = nlohmann::json;

void to_json(json& j, const CloudPart& part) {
    j = json{{"number", part.number}, {"etag", part.etag}, {"size", part.size}};
}

void from_json(const json& j, CloudPart& part) {
    j.at("number").get_to(part.number);
    j.at("etag").get_to(part.etag);
    part.size = j.value("size", std::uint64_t{0});
}

const char* to_string(UploadStatus status) noexcept {
    switch (status) {
        case UploadStatus::Active: return "active";
        case UploadStatus::Completed: return "completed";
        case UploadStatus::Imported: return "imported";
        case UploadStatus::Aborted: return "aborted";
    }
    return "unknown";
}

std::optional<UploadStatus> parse_status(const std::string& text) {
    if (text == "active") return UploadStatus::Active;
    if (text == "completed") return UploadStatus::Completed;
    if (text == "imported") return UploadStatus::Imported;
    if (text == "aborted") return UploadStatus::Aborted;
    return std::nullopt;
}

bool can_transition(UploadStatus from, UploadStatus to) noexcept {
    switch (from) {
        case UploadStatus::Active:
            return to == UploadStatus::Completed || to == UploadStatus::Aborted;
        case UploadStatus::Completed:
            return to == UploadStatus::Imported || to == UploadStatus::Aborted;
        case UploadStatus::Imported:
            return to == UploadStatus::Completed;
        case UploadStatus::Aborted:
            return false;
    }
    return false;
}

std::string encode_metadata(const std::map<std::string, std::string>& metadata) {
    return json(metadata).dump();
}

std::map<std::string, std::string> decode_metadata(const std::string& json_text) {
    if (json_text.empty()) {
        return {};
    }
    try {
        return json::parse(json_text).get<std::map<std::string, std::string>>();
    } catch (const json::exception& e) {
        spdlog::warn("Discarding unreadable session metadata: {}", e.what());
        return {};
    }
}

std::string encode_parts(const std::vector<std::string>& parts) {
    return json(parts).dump();
}

std::vector<std::string> decode_parts(const std::string& json_text) {
    if (json_text.empty()) {
        return {};
    }
    try {
        return json::parse(json_text).get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        spdlog::warn("Discarding unreadable concat part list: {}", e.what());
        return {};
    }
}

std::string encode_cloud_state(const CloudState& state) {
    if (!state.active) {
        return "{}";
    }
    return json{
        {"object_key", state.object_key},
        {"multipart_id", state.multipart_id},
        {"uploaded_bytes", state.uploaded_bytes},
        {"parts", state.parts}
    }.dump();
}

CloudState decode_cloud_state(const std::string& json_text) {
    CloudState state;
    if (json_text.empty()) {
        return state;
    }
    try {
        const auto j = json::parse(json_text);
        if (!j.contains("multipart_id")) {
            return state;
        }
        state.active = true;
        state.object_key = j.value("object_key", "");
        state.multipart_id = j.value("multipart_id", "");
        state.uploaded_bytes = j.value("uploaded_bytes", std::uint64_t{0});
        state.parts = j.value("parts", std::vector<CloudPart>{});
    } catch (const json::exception& e) {
        spdlog::warn("Discarding unreadable cloud state: {}", e.what());
        return CloudState{};
    }
    return state;
}

std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace nexus::upload
