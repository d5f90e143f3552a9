/**
 * @file reconciler.hpp
 * @brief Rebuilds the file index from what is actually on disk
 *
 * For each owner: walk the owner's storage root, diff the set of
 * relative paths against the indexed filenames, insert what is missing
 * and delete what is gone. Each owner's diff is applied atomically.
 * A clean run over an unchanged tree makes no changes.
 */

#pragma once

#include "nexus/auth/owner_directory.hpp"
#include "nexus/events/event_bus.hpp"
#include "nexus/storage/file_index.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace nexus::storage {

struct ReconcileStats {
    std::size_t owners_scanned = 0;
    std::size_t inserted = 0;
    std::size_t deleted = 0;
    std::size_t failed_owners = 0;
};

class Reconciler {
public:
    Reconciler(FileIndex& index,
               const auth::OwnerDirectory& owners,
               const auth::StorageLayout& layout,
               events::EventBus& bus);

    // Cancellation is checked between owners.
    ReconcileStats run(const std::atomic<bool>* cancel = nullptr);

    Result<ReconcileStats, Error> reconcile_owner(const auth::Owner& owner);

private:
    FileIndex& index_;
    const auth::OwnerDirectory& owners_;
    const auth::StorageLayout& layout_;
    events::EventBus& bus_;
};

// Relative '/'-separated paths of regular files below root, hidden entries skipped.
std::vector<FileIndexEntry> scan_owner_tree(const std::string& owner, const std::filesystem::path& root);

} // namespace nexus::storage
