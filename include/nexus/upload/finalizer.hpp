/**
 * @file finalizer.hpp
 * @brief Moves completed uploads into owner storage
 *
 * FLOW:
 * 1. Claim the session: completed -> imported (a lost race means another
 *    trigger already owns it, so this one is a no-op)
 * 2. Rename the backing file to <owner root>/<filename>, adding _1, _2 ...
 *    before the extension when the name is taken
 * 3. Record it in the FileIndex, then run the Deduplicator on it
 * 4. Delete the session record and notify the owner
 *
 * If step 2 fails the session goes back to completed so a later trigger
 * can retry without a new upload.
 */

#pragma once

#include "nexus/auth/owner_directory.hpp"
#include "nexus/core/error.hpp"
#include "nexus/events/event_bus.hpp"
#include "nexus/storage/dedup.hpp"
#include "nexus/storage/file_index.hpp"
#include "nexus/upload/chunk_writer.hpp"
#include "nexus/upload/session_store.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace nexus::upload {

struct FinalizeOutcome {
    bool imported = false;   // false: nothing to do (already imported, partial, unknown)
    std::filesystem::path path;
    std::string filename;    // relative to the owner root
};

class Finalizer {
public:
    Finalizer(SessionStore& sessions,
              ChunkWriter& writer,
              storage::FileIndex& index,
              storage::Deduplicator& dedup,
              const auth::OwnerDirectory& owners,
              const auth::StorageLayout& layout,
              auth::OwnerNotifier& notifier,
              events::EventBus& bus);

    Result<FinalizeOutcome, Error> finalize(const std::string& upload_id);

    // Sessions left in `imported` by a crash go back to `completed`.
    std::size_t release_interrupted();

private:
    Result<FinalizeOutcome, Error> import_claimed(const UploadSession& session);

    SessionStore& sessions_;
    ChunkWriter& writer_;
    storage::FileIndex& index_;
    storage::Deduplicator& dedup_;
    const auth::OwnerDirectory& owners_;
    const auth::StorageLayout& layout_;
    auth::OwnerNotifier& notifier_;
    events::EventBus& bus_;
    std::mutex placement_mutex_;
};

// First free path among name.ext, name_1.ext, name_2.ext ...
std::filesystem::path unique_destination(const std::filesystem::path& dir, const std::string& filename);

} // namespace nexus::upload
