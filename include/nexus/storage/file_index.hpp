/**
 * @file file_index.hpp
 * @brief Queryable index of the files each owner has in storage
 *
 * The index is a derived cache of what is on disk. Finalizer adds
 * entries as uploads are imported; the Reconciler rebuilds it from the
 * owner directories. Nothing treats it as the source of truth.
 *
 * `filename` is the path relative to the owner's storage root, using
 * '/' separators, and is unique per owner.
 */

#pragma once

#include "nexus/core/error.hpp"
#include "nexus/storage/database.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nexus::storage {

struct FileIndexEntry {
    std::string owner;
    std::string filename;
    std::optional<std::int64_t> folder_id;
    std::uint64_t size_bytes = 0;
    std::string created_at;   // ISO-8601, UTC
    bool locked = false;
};

class FileIndex {
public:
    explicit FileIndex(Database& db);

    // Insert, or refresh size/created_at of an existing (owner, filename).
    Result<void, Error> upsert(const FileIndexEntry& entry);

    Result<void, Error> remove(const std::string& owner, const std::string& filename);

    Result<std::optional<FileIndexEntry>, Error> find(const std::string& owner, const std::string& filename);

    // ListFiles(owner), ordered by filename.
    Result<std::vector<FileIndexEntry>, Error> list_files(const std::string& owner);

    Result<std::vector<std::string>, Error> list_owners();

    Result<std::uint64_t, Error> usage_bytes(const std::string& owner);

    /**
     * @brief Apply one owner's reconcile diff in a single transaction
     *
     * Either every insert and delete lands or none does.
     */
    Result<void, Error> apply_diff(const std::string& owner,
                                   const std::vector<FileIndexEntry>& inserts,
                                   const std::vector<std::string>& deletes);

private:
    void initialize_schema();

    Database& db_;
};

// Current UTC time formatted as 2024-05-01T12:00:00Z.
std::string iso_timestamp_now();
std::string iso_timestamp(std::int64_t unix_seconds);

// Last write time of a file in unix seconds; now when it cannot be read.
std::int64_t file_mtime_unix(const std::filesystem::path& path);

} // namespace nexus::storage
