/**
 * @file dedup.hpp
 * @brief Content-hash deduplication through hardlinks
 *
 * WHAT IT DOES:
 * Hashes a file (SHA-256), looks the hash up in the dedup index and
 * - on a miss, registers the file as the canonical copy
 * - on a hit whose canonical copy still exists, replaces the file with a
 *   hardlink to the canonical copy, so both names share one inode
 * - on a hit whose canonical copy is gone (or no longer matches), points
 *   the index at this file instead
 *
 * THREAD SAFETY:
 * The read-modify-write for a hash runs under a lock striped by hash, so
 * two files with equal content cannot race each other into the index.
 * Hashing itself runs outside the lock.
 */

#pragma once

#include "nexus/core/error.hpp"
#include "nexus/events/event_bus.hpp"
#include "nexus/storage/database.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace nexus::storage {

struct DedupOutcome {
    enum class Kind {
        Registered,      // first file with this content
        Linked,          // replaced by a hardlink to the canonical copy
        AlreadyShared,   // already the canonical path or the same inode
        Repaired         // stale canonical path replaced by this file
    };

    Kind kind = Kind::Registered;
    std::string hash;
    std::filesystem::path canonical_path;
    std::uint64_t bytes_saved = 0;
};

struct DedupScanStats {
    std::size_t scanned = 0;
    std::size_t deduplicated = 0;
    std::uint64_t bytes_saved = 0;
    std::size_t failed = 0;
};

class Deduplicator {
public:
    Deduplicator(Database& db, events::EventBus& bus);

    Result<DedupOutcome, Error> process(const std::filesystem::path& file,
                                        const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Pass every regular file below root through process()
     *
     * Hidden files and directories are skipped. Cancellation is checked
     * between files.
     */
    DedupScanStats scan_tree(const std::filesystem::path& root, const std::atomic<bool>* cancel = nullptr);

    Result<std::optional<std::filesystem::path>, Error> canonical_for(const std::string& hash);

private:
    static constexpr std::size_t kStripes = 64;

    std::mutex& stripe_for(const std::string& hash);
    void store_canonical(const std::string& hash, const std::filesystem::path& path);
    Result<void, Error> link_to_canonical(const std::filesystem::path& canonical, const std::filesystem::path& file);

    Database& db_;
    events::EventBus& bus_;
    std::array<std::mutex, kStripes> stripes_;
};

} // namespace nexus::storage
