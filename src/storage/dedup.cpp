#include "nexus/storage/dedup.hpp"

#include "nexus/core/digest.hpp"
#include "nexus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <system_error>

namespace nexus::storage {
namespace fs = std::filesystem;

namespace {

bool is_hidden(const fs::path& relative) {
    for (const auto& part : relative) {
        const auto name = part.string();
        if (!name.empty() && name[0] == '.' && name != "." && name != "..") {
            return true;
        }
    }
    return false;
}

} // namespace

Deduplicator::Deduplicator(Database& db, events::EventBus& bus) : db_(db), bus_(bus) {
    auto lock = db_.lock();
    db_.exec(R"SQL(
        CREATE TABLE IF NOT EXISTS dedup_index (
            hash TEXT PRIMARY KEY,
            canonical_path TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )SQL");
}

std::mutex& Deduplicator::stripe_for(const std::string& hash) {
    return stripes_[std::hash<std::string>{}(hash) % kStripes];
}

Result<std::optional<fs::path>, Error> Deduplicator::canonical_for(const std::string& hash) {
    try {
        auto lock = db_.lock();
        Statement stmt(db_, "SELECT canonical_path FROM dedup_index WHERE hash=?");
        stmt.bind(1, hash);
        std::optional<fs::path> path;
        if (stmt.step()) {
            path = fs::path(stmt.column_text(0));
        }
        return Ok<std::optional<fs::path>, Error>(std::move(path));
    } catch (const std::exception& e) {
        return Fail<std::optional<fs::path>>(ErrorCode::StorageFailure, e.what());
    }
}

void Deduplicator::store_canonical(const std::string& hash, const fs::path& path) {
    auto lock = db_.lock();
    Statement stmt(db_, R"SQL(
        INSERT INTO dedup_index(hash, canonical_path, updated_at)
        VALUES(?, ?, strftime('%s','now'))
        ON CONFLICT(hash) DO UPDATE SET canonical_path=excluded.canonical_path,
                                        updated_at=excluded.updated_at
    )SQL");
    stmt.bind(1, hash).bind(2, path.string());
    stmt.step();
}

Result<void, Error> Deduplicator::link_to_canonical(const fs::path& canonical, const fs::path& file) {
    // Link under a temporary name, then rename over the file, so the
    // logical name never disappears.
    const fs::path staging = file.parent_path() / ("." + file.filename().string() + ".dedup-" + core::random_hex_id(4));
    std::error_code ec;
    fs::create_hard_link(canonical, staging, ec);
    if (ec) {
        return Fail<void>(ErrorCode::StorageFailure, "hardlink " + canonical.string() + ": " + ec.message());
    }
    fs::rename(staging, file, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(staging, cleanup);
        return Fail<void>(ErrorCode::StorageFailure, "replace " + file.string() + ": " + ec.message());
    }
    return Done();
}

Result<DedupOutcome, Error> Deduplicator::process(const fs::path& file, const std::atomic<bool>* cancel) {
    std::error_code ec;
    const fs::path target = fs::absolute(file, ec).lexically_normal();
    if (ec || !fs::is_regular_file(target, ec)) {
        return Fail<DedupOutcome>(ErrorCode::NotFound, "not a regular file: " + file.string());
    }

    auto hash_result = core::sha256_file(target, cancel);
    if (hash_result.is_error()) {
        return Err<DedupOutcome, Error>(hash_result.error());
    }

    DedupOutcome outcome;
    outcome.hash = hash_result.value();
    outcome.canonical_path = target;

    std::lock_guard stripe_lock(stripe_for(outcome.hash));
    try {
        auto existing = canonical_for(outcome.hash);
        if (existing.is_error()) {
            return Err<DedupOutcome, Error>(existing.error());
        }

        if (!existing.value()) {
            store_canonical(outcome.hash, target);
            outcome.kind = DedupOutcome::Kind::Registered;
            return Ok<DedupOutcome, Error>(outcome);
        }

        const fs::path canonical = *existing.value();
        outcome.canonical_path = canonical;

        if (canonical == target) {
            outcome.kind = DedupOutcome::Kind::AlreadyShared;
            return Ok<DedupOutcome, Error>(outcome);
        }

        const bool canonical_present = fs::is_regular_file(canonical, ec);
        if (!canonical_present || fs::file_size(canonical, ec) != fs::file_size(target, ec)) {
            spdlog::info("Dedup canonical {} is gone or changed, re-pointing to {}", canonical.string(), target.string());
            store_canonical(outcome.hash, target);
            outcome.kind = DedupOutcome::Kind::Repaired;
            outcome.canonical_path = target;
            return Ok<DedupOutcome, Error>(outcome);
        }

        if (fs::equivalent(canonical, target, ec)) {
            outcome.kind = DedupOutcome::Kind::AlreadyShared;
            return Ok<DedupOutcome, Error>(outcome);
        }

        const auto size = fs::file_size(target, ec);
        if (auto linked = link_to_canonical(canonical, target); linked.is_error()) {
            return Err<DedupOutcome, Error>(linked.error());
        }

        outcome.kind = DedupOutcome::Kind::Linked;
        outcome.bytes_saved = ec ? 0 : size;
    } catch (const std::exception& e) {
        return Fail<DedupOutcome>(ErrorCode::StorageFailure, e.what());
    }

    events::FileDeduplicatedEvent event;
    event.path = target.string();
    event.canonical_path = outcome.canonical_path.string();
    event.hash = outcome.hash;
    event.bytes_saved = outcome.bytes_saved;
    bus_.emit(event);

    return Ok<DedupOutcome, Error>(outcome);
}

DedupScanStats Deduplicator::scan_tree(const fs::path& root, const std::atomic<bool>* cancel) {
    DedupScanStats stats;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return stats;
    }

    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Dedup scan stopped early in {}: {}", root.string(), ec.message());
            break;
        }
        if (cancel && cancel->load()) {
            spdlog::info("Dedup scan cancelled after {} files", stats.scanned);
            break;
        }

        const auto relative = it->path().lexically_relative(root);
        if (is_hidden(relative)) {
            if (it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        ++stats.scanned;
        auto outcome = process(it->path(), cancel);
        if (outcome.is_error()) {
            ++stats.failed;
            spdlog::warn("Dedup failed for {}: {}", it->path().string(), outcome.error().message);
            continue;
        }
        if (outcome.value().kind == DedupOutcome::Kind::Linked) {
            ++stats.deduplicated;
            stats.bytes_saved += outcome.value().bytes_saved;
        }
    }

    spdlog::info("Dedup scan of {}: scanned={} deduplicated={} saved={} failed={}",
                 root.string(), stats.scanned, stats.deduplicated, stats.bytes_saved, stats.failed);
    return stats;
}

} // namespace nexus::storage
