#include "nexus/storage/reconciler.hpp"

#include "nexus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <map>
#include <system_error>

namespace nexus::storage {
namespace fs = std::filesystem;

namespace {

bool hidden_name(const fs::path& p) {
    const auto name = p.filename().string();
    return !name.empty() && name[0] == '.';
}

} // namespace

std::vector<FileIndexEntry> scan_owner_tree(const std::string& owner, const fs::path& root) {
    std::vector<FileIndexEntry> found;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return found;
    }

    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Scan of {} interrupted: {}", root.string(), ec.message());
            break;
        }
        if (hidden_name(it->path())) {
            if (it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        FileIndexEntry entry;
        entry.owner = owner;
        entry.filename = it->path().lexically_relative(root).generic_string();
        entry.size_bytes = it->file_size(ec);
        entry.created_at = iso_timestamp(file_mtime_unix(it->path()));
        found.push_back(std::move(entry));
    }
    return found;
}

Reconciler::Reconciler(FileIndex& index,
                       const auth::OwnerDirectory& owners,
                       const auth::StorageLayout& layout,
                       events::EventBus& bus)
    : index_(index), owners_(owners), layout_(layout), bus_(bus) {}

Result<ReconcileStats, Error> Reconciler::reconcile_owner(const auth::Owner& owner) {
    ReconcileStats stats;
    stats.owners_scanned = 1;

    auto indexed = index_.list_files(owner.name);
    if (indexed.is_error()) {
        return Err<ReconcileStats, Error>(indexed.error());
    }

    std::map<std::string, FileIndexEntry> on_disk;
    for (auto& entry : scan_owner_tree(owner.name, layout_.resolve_owner_root(owner))) {
        auto key = entry.filename;
        on_disk.emplace(std::move(key), std::move(entry));
    }

    std::vector<std::string> deletes;
    for (const auto& entry : indexed.value()) {
        if (on_disk.erase(entry.filename) == 0) {
            deletes.push_back(entry.filename);
        }
    }

    // What is left on disk is not yet indexed.
    std::vector<FileIndexEntry> inserts;
    inserts.reserve(on_disk.size());
    for (auto& [name, entry] : on_disk) {
        inserts.push_back(std::move(entry));
    }

    if (inserts.empty() && deletes.empty()) {
        return Ok<ReconcileStats, Error>(stats);
    }

    auto applied = index_.apply_diff(owner.name, inserts, deletes);
    if (applied.is_error()) {
        return Err<ReconcileStats, Error>(applied.error());
    }

    stats.inserted = inserts.size();
    stats.deleted = deletes.size();
    spdlog::info("Reconciled owner {}: +{} -{}", owner.name, stats.inserted, stats.deleted);
    return Ok<ReconcileStats, Error>(stats);
}

ReconcileStats Reconciler::run(const std::atomic<bool>* cancel) {
    const auto start = std::chrono::steady_clock::now();
    ReconcileStats total;

    for (const auto& owner : owners_.list_owners()) {
        if (cancel && cancel->load()) {
            spdlog::info("Reconcile cancelled after {} owners", total.owners_scanned);
            break;
        }
        auto result = reconcile_owner(owner);
        if (result.is_error()) {
            ++total.failed_owners;
            spdlog::error("Reconcile failed for owner {}: {}", owner.name, result.error().message);
            continue;
        }
        total.owners_scanned += result.value().owners_scanned;
        total.inserted += result.value().inserted;
        total.deleted += result.value().deleted;
    }

    events::ReconcileCompletedEvent event;
    event.owners_scanned = total.owners_scanned;
    event.inserted = total.inserted;
    event.deleted = total.deleted;
    event.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    bus_.emit(event);
    return total;
}

} // namespace nexus::storage
