#include "nexus/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace nexus::core {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void read_cloud(const json& j, CloudConfig& cloud) {
    cloud.enabled = j.value("enabled", cloud.enabled);
    cloud.endpoint = j.value("endpoint", cloud.endpoint);
    cloud.region = j.value("region", cloud.region);
    cloud.bucket = j.value("bucket", cloud.bucket);
    cloud.access_key_id = j.value("access_key_id", cloud.access_key_id);
    cloud.secret_access_key = j.value("secret_access_key", cloud.secret_access_key);
    cloud.threshold_bytes = j.value("threshold_bytes", cloud.threshold_bytes);
    cloud.part_size_bytes = j.value("part_size_bytes", cloud.part_size_bytes);
    cloud.max_concurrent_uploads = j.value("max_concurrent_uploads", cloud.max_concurrent_uploads);
    cloud.monthly_limit_class_a = j.value("monthly_limit_class_a", cloud.monthly_limit_class_a);
    cloud.monthly_limit_class_b = j.value("monthly_limit_class_b", cloud.monthly_limit_class_b);
    cloud.monthly_limit_bytes = j.value("monthly_limit_bytes", cloud.monthly_limit_bytes);
    cloud.usage_flush_interval = std::chrono::seconds(
        j.value("usage_flush_seconds", static_cast<std::int64_t>(cloud.usage_flush_interval.count())));
}

fs::path optional_path(const json& j, const char* key) {
    return fs::path(j.value(key, std::string{}));
}

std::chrono::seconds seconds_value(const json& j, const char* key, std::chrono::seconds fallback) {
    return std::chrono::seconds(j.value(key, static_cast<std::int64_t>(fallback.count())));
}

} // namespace

void ServerConfig::resolve_paths() {
    if (upload_root.empty()) upload_root = data_root / "uploads";
    if (temp_root.empty()) temp_root = data_root / "tus_temp";
    if (database_path.empty()) database_path = data_root / "nexus.db";
    if (owners_file.empty()) owners_file = data_root / "owners.json";
    if (usage_file.empty()) usage_file = data_root / "cloud_usage.json";
}

Result<ServerConfig, Error> parse_config(const std::string& json_text) {
    auto j = json::parse(json_text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Fail<ServerConfig>(ErrorCode::Validation, "configuration is not a JSON object");
    }

    ServerConfig config;
    try {
        config.port = j.value("port", config.port);
        config.io_threads = j.value("io_threads", config.io_threads);
        config.worker_threads = j.value("worker_threads", config.worker_threads);
        config.data_root = j.value("data_root", config.data_root.string());
        config.upload_root = optional_path(j, "upload_root");
        config.temp_root = optional_path(j, "temp_root");
        config.database_path = optional_path(j, "database_path");
        config.owners_file = optional_path(j, "owners_file");
        config.usage_file = optional_path(j, "usage_file");
        config.base_path = j.value("base_path", config.base_path);
        config.max_upload_bytes = j.value("max_upload_bytes", config.max_upload_bytes);
        config.max_chunk_bytes = j.value("max_chunk_bytes", config.max_chunk_bytes);
        config.janitor_interval = seconds_value(j, "janitor_interval_seconds", config.janitor_interval);
        config.stale_upload_retention =
            seconds_value(j, "stale_upload_retention_seconds", config.stale_upload_retention);
        config.reconcile_interval = seconds_value(j, "reconcile_interval_seconds", config.reconcile_interval);
        config.log_level = j.value("log_level", config.log_level);
        config.log_file = j.value("log_file", config.log_file);
        if (j.contains("cloud") && j["cloud"].is_object()) {
            read_cloud(j["cloud"], config.cloud);
        }
    } catch (const json::exception& e) {
        return Fail<ServerConfig>(ErrorCode::Validation, std::string("invalid configuration value: ") + e.what());
    }

    if (!config.base_path.empty() && config.base_path.back() == '/') {
        config.base_path.pop_back();
    }
    if (config.cloud.part_size_bytes == 0) {
        return Fail<ServerConfig>(ErrorCode::Validation, "cloud.part_size_bytes must be > 0");
    }

    return Ok<ServerConfig, Error>(std::move(config));
}

Result<ServerConfig, Error> load_config(const fs::path& path) {
    if (path.empty() || !fs::exists(path)) {
        spdlog::warn("Config file '{}' not found, using defaults", path.string());
        return Ok<ServerConfig, Error>(ServerConfig{});
    }

    std::ifstream input(path);
    if (!input) {
        return Fail<ServerConfig>(ErrorCode::StorageFailure, "cannot read " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

} // namespace nexus::core
