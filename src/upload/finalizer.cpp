#include "nexus/upload/finalizer.hpp"

#include "nexus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <system_error>

namespace nexus::upload {
namespace fs = std::filesystem;

fs::path unique_destination(const fs::path& dir, const std::string& filename) {
    fs::path candidate = dir / filename;
    std::error_code ec;
    if (!fs::exists(candidate, ec)) {
        return candidate;
    }

    const fs::path name(filename);
    const std::string stem = name.stem().string();
    const std::string ext = name.extension().string();
    for (int i = 1;; ++i) {
        candidate = dir / (stem + "_" + std::to_string(i) + ext);
        if (!fs::exists(candidate, ec)) {
            return candidate;
        }
    }
}

namespace {

// rename(2), falling back to copy + remove across filesystems.
std::error_code move_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec != std::errc::cross_device_link) {
        return ec;
    }
    ec.clear();
    fs::copy_file(from, to, fs::copy_options::none, ec);
    if (ec) {
        return ec;
    }
    fs::remove(from, ec);
    return ec;
}

} // namespace

Finalizer::Finalizer(SessionStore& sessions,
                     ChunkWriter& writer,
                     storage::FileIndex& index,
                     storage::Deduplicator& dedup,
                     const auth::OwnerDirectory& owners,
                     const auth::StorageLayout& layout,
                     auth::OwnerNotifier& notifier,
                     events::EventBus& bus)
    : sessions_(sessions), writer_(writer), index_(index), dedup_(dedup),
      owners_(owners), layout_(layout), notifier_(notifier), bus_(bus) {}

Result<FinalizeOutcome, Error> Finalizer::finalize(const std::string& upload_id) {
    auto found = sessions_.find(upload_id);
    if (found.is_error()) {
        return Err<FinalizeOutcome, Error>(found.error());
    }
    if (!found.value()) {
        spdlog::debug("Finalize {}: no such session, already imported", upload_id);
        return Ok<FinalizeOutcome, Error>(FinalizeOutcome{});
    }

    const UploadSession session = *found.value();
    if (session.partial || session.status != UploadStatus::Completed) {
        return Ok<FinalizeOutcome, Error>(FinalizeOutcome{});
    }

    auto claimed = sessions_.transition(upload_id, UploadStatus::Completed, UploadStatus::Imported);
    if (claimed.is_error()) {
        return Err<FinalizeOutcome, Error>(claimed.error());
    }
    if (!claimed.value()) {
        spdlog::debug("Finalize {}: claimed by another trigger", upload_id);
        return Ok<FinalizeOutcome, Error>(FinalizeOutcome{});
    }

    auto imported = import_claimed(session);
    if (imported.is_error()) {
        spdlog::error("Finalize {} failed: {}", upload_id, imported.error().message);
        auto reverted = sessions_.transition(upload_id, UploadStatus::Imported, UploadStatus::Completed);
        if (reverted.is_error()) {
            spdlog::error("Finalize {}: could not release claim: {}", upload_id, reverted.error().message);
        }

        events::FinalizeFailedEvent event;
        event.upload_id = upload_id;
        event.error_message = imported.error().message;
        bus_.emit(event);
    }
    return imported;
}

Result<FinalizeOutcome, Error> Finalizer::import_claimed(const UploadSession& session) {
    const auto start = std::chrono::steady_clock::now();

    const auto owner = owners_.find(session.owner);
    if (!owner) {
        return Fail<FinalizeOutcome>(ErrorCode::NotFound, "unknown owner " + session.owner);
    }

    const fs::path root = layout_.resolve_owner_root(*owner);
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return Fail<FinalizeOutcome>(ErrorCode::StorageFailure, "create " + root.string() + ": " + ec.message());
    }

    FinalizeOutcome outcome;
    if (!fs::exists(writer_.path_for(session.id), ec)) {
        // Moved by an import that crashed before clearing the record.
        spdlog::warn("Finalize {}: backing file already gone, dropping session", session.id);
        if (auto removed = sessions_.remove(session.id); removed.is_error()) {
            return Err<FinalizeOutcome, Error>(removed.error());
        }
        return Ok<FinalizeOutcome, Error>(outcome);
    }
    {
        std::lock_guard lock(placement_mutex_);
        outcome.path = unique_destination(root, session.filename);
        ec = move_file(writer_.path_for(session.id), outcome.path);
    }
    if (ec) {
        return Fail<FinalizeOutcome>(ErrorCode::StorageFailure,
                                     "move into " + outcome.path.string() + ": " + ec.message());
    }
    outcome.imported = true;
    outcome.filename = outcome.path.lexically_relative(root).generic_string();

    // From here on the file is in place; the Reconciler repairs a missed index write.
    storage::FileIndexEntry entry;
    entry.owner = session.owner;
    entry.filename = outcome.filename;
    entry.size_bytes = fs::file_size(outcome.path, ec);
    if (ec) {
        entry.size_bytes = session.size;
    }
    entry.created_at = storage::iso_timestamp(storage::file_mtime_unix(outcome.path));
    if (auto indexed = index_.upsert(entry); indexed.is_error()) {
        spdlog::error("Finalize {}: index update failed: {}", session.id, indexed.error().message);
    }

    auto deduplicated = dedup_.process(outcome.path);
    if (deduplicated.is_error()) {
        spdlog::warn("Finalize {}: dedup skipped: {}", session.id, deduplicated.error().message);
    }

    if (auto removed = sessions_.remove(session.id); removed.is_error()) {
        spdlog::warn("Finalize {}: session record not removed: {}", session.id, removed.error().message);
    }

    notifier_.owner_changed(session.owner);

    events::FileImportedEvent event;
    event.upload_id = session.id;
    event.owner = session.owner;
    event.filename = outcome.filename;
    event.size = session.size;
    event.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    bus_.emit(event);

    return Ok<FinalizeOutcome, Error>(outcome);
}

std::size_t Finalizer::release_interrupted() {
    auto stuck = sessions_.list_by_status(UploadStatus::Imported);
    if (stuck.is_error()) {
        spdlog::error("Finalize recovery: {}", stuck.error().message);
        return 0;
    }

    std::size_t released = 0;
    for (const auto& session : stuck.value()) {
        auto reverted = sessions_.transition(session.id, UploadStatus::Imported, UploadStatus::Completed);
        if (reverted.is_ok() && reverted.value()) {
            ++released;
        }
    }
    if (released > 0) {
        spdlog::warn("Released {} interrupted imports for retry", released);
    }
    return released;
}

} // namespace nexus::upload
