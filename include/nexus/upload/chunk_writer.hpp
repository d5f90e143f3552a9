/**
 * @file chunk_writer.hpp
 * @brief Append-only writer for upload backing files
 *
 * Each session has one backing file, <temp_root>/<id>. Bytes are written
 * with pwrite at the session's confirmed offset and flushed with
 * fdatasync before append() returns.
 *
 * CRASH RECOVERY:
 * Before every append the physical length is compared against the
 * confirmed offset. Extra bytes (written but never committed) are cut
 * off; a file shorter than the offset cannot be repaired and is reported
 * as StorageFailure.
 */

#pragma once

#include "nexus/core/error.hpp"
#include "nexus/upload/session.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace nexus::upload {

class ChunkWriter {
public:
    explicit ChunkWriter(std::filesystem::path temp_root);

    std::filesystem::path path_for(const std::string& id) const;

    // Create (or empty) the backing file for a new session.
    Result<void, Error> create(const std::string& id);

    /**
     * @brief Write len bytes at session.offset
     * @return the new offset, session.offset + len
     *
     * Rejects writes past the declared size with Validation. On an I/O
     * error the file is cut back to session.offset.
     */
    Result<std::uint64_t, Error> append(const UploadSession& session, const char* data, std::size_t len);

    // Truncate the backing file to the confirmed offset if it grew past it.
    Result<void, Error> reconcile_length(const UploadSession& session);

    Result<std::uint64_t, Error> physical_size(const std::string& id) const;

    // Missing files are not an error.
    Result<void, Error> remove(const std::string& id);

    const std::filesystem::path& temp_root() const { return temp_root_; }

private:
    std::filesystem::path temp_root_;
};

} // namespace nexus::upload
