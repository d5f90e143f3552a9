#pragma once

#include "nexus/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace nexus::core {

struct CloudConfig {
    bool enabled = false;
    std::string endpoint;            // e.g. https://<account>.r2.cloudflarestorage.com
    std::string region = "auto";
    std::string bucket;
    std::string access_key_id;
    std::string secret_access_key;
    std::uint64_t threshold_bytes = 100ULL * 1024 * 1024;
    std::uint64_t part_size_bytes = 5ULL * 1024 * 1024;
    std::size_t max_concurrent_uploads = 2;
    std::uint64_t monthly_limit_class_a = 1'000'000;
    std::uint64_t monthly_limit_class_b = 10'000'000;
    std::uint64_t monthly_limit_bytes = 10ULL * 1024 * 1024 * 1024;
    std::chrono::seconds usage_flush_interval{60};

    // A backend is usable only when every connection field is present.
    bool configured() const {
        return enabled && !endpoint.empty() && !bucket.empty() &&
               !access_key_id.empty() && !secret_access_key.empty();
    }
};

struct ServerConfig {
    std::uint16_t port = 5168;
    std::size_t io_threads = 4;
    std::size_t worker_threads = 2;

    std::filesystem::path data_root = "data";
    std::filesystem::path upload_root;
    std::filesystem::path temp_root;
    std::filesystem::path database_path;
    std::filesystem::path owners_file;
    std::filesystem::path usage_file;

    std::string base_path = "/api/upload/tus";
    std::uint64_t max_upload_bytes = 0;                  // 0 = unlimited
    std::uint64_t max_chunk_bytes = 64ULL * 1024 * 1024; // HTTP body cap

    std::chrono::seconds janitor_interval{3600};
    std::chrono::seconds stale_upload_retention{86400};
    std::chrono::seconds reconcile_interval{0};          // 0 = startup and on demand only

    std::string log_level = "info";
    std::string log_file;

    CloudConfig cloud;

    // Fill the derived paths that were left empty from data_root.
    // Call after command-line overrides have been applied.
    void resolve_paths();
};

/**
 * Load configuration from a JSON file. A missing file yields defaults;
 * a file that exists but cannot be parsed is an error.
 */
Result<ServerConfig, Error> load_config(const std::filesystem::path& path);

Result<ServerConfig, Error> parse_config(const std::string& json_text);

} // namespace nexus::core
