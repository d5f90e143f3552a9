#pragma once

#include "nexus/core/error.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace nexus::cloud {

// (part number, ETag) in upload order
using CompletedParts = std::vector<std::pair<int, std::string>>;

/**
 * @brief Multipart object storage used by cloud-backed uploads
 *
 * Implementations do not count usage; callers record operations on
 * UsageCounters as they make them.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Returns the multipart upload id.
    virtual Result<std::string, Error> create_multipart(const std::string& key, const std::string& content_type) = 0;

    // Returns the part's ETag.
    virtual Result<std::string, Error> upload_part(const std::string& key,
                                                   const std::string& upload_id,
                                                   int part_number,
                                                   const std::string& data) = 0;

    virtual Result<void, Error> complete_multipart(const std::string& key,
                                                   const std::string& upload_id,
                                                   const CompletedParts& parts) = 0;

    virtual Result<void, Error> abort_multipart(const std::string& key, const std::string& upload_id) = 0;

    virtual Result<void, Error> download(const std::string& key, const std::filesystem::path& destination) = 0;

    virtual Result<void, Error> remove(const std::string& key) = 0;
};

} // namespace nexus::cloud
