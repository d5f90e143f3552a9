#include "nexus/storage/file_index.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace nexus::storage {

namespace {

FileIndexEntry read_entry(const Statement& stmt) {
    FileIndexEntry entry;
    entry.owner = stmt.column_text(0);
    entry.filename = stmt.column_text(1);
    if (!stmt.column_is_null(2)) {
        entry.folder_id = stmt.column_int64(2);
    }
    entry.size_bytes = static_cast<std::uint64_t>(stmt.column_int64(3));
    entry.created_at = stmt.column_text(4);
    entry.locked = stmt.column_int64(5) != 0;
    return entry;
}

void bind_entry(Statement& stmt, const FileIndexEntry& entry) {
    stmt.bind(1, entry.owner).bind(2, entry.filename);
    if (entry.folder_id) {
        stmt.bind(3, *entry.folder_id);
    } else {
        stmt.bind_null(3);
    }
    stmt.bind(4, static_cast<std::int64_t>(entry.size_bytes))
        .bind(5, entry.created_at.empty() ? iso_timestamp_now() : entry.created_at)
        .bind(6, static_cast<std::int64_t>(entry.locked ? 1 : 0));
}

constexpr const char* kUpsertSql = R"SQL(
    INSERT INTO files(owner, filename, folder_id, size_bytes, created_at, is_locked)
    VALUES(?,?,?,?,?,?)
    ON CONFLICT(owner, filename)
    DO UPDATE SET size_bytes=excluded.size_bytes,
                  created_at=excluded.created_at
)SQL";

} // namespace

std::string iso_timestamp(std::int64_t unix_seconds) {
    const std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string iso_timestamp_now() {
    return iso_timestamp(static_cast<std::int64_t>(std::time(nullptr)));
}

std::int64_t file_mtime_unix(const std::filesystem::path& path) {
    std::error_code ec;
    const auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return static_cast<std::int64_t>(std::time(nullptr));
    }
    // file_clock and system_clock share an epoch offset that is fixed for
    // the process, so translating through now() is accurate to the second.
    const auto sys = std::chrono::system_clock::now() +
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            ftime - std::filesystem::file_time_type::clock::now());
    return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

FileIndex::FileIndex(Database& db) : db_(db) {
    initialize_schema();
}

void FileIndex::initialize_schema() {
    auto lock = db_.lock();
    db_.exec(R"SQL(
        CREATE TABLE IF NOT EXISTS files (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            owner TEXT NOT NULL,
            filename TEXT NOT NULL,
            folder_id INTEGER,
            size_bytes INTEGER NOT NULL DEFAULT 0,
            created_at TEXT NOT NULL,
            is_locked INTEGER NOT NULL DEFAULT 0,
            UNIQUE(owner, filename)
        );
        CREATE INDEX IF NOT EXISTS idx_files_owner ON files(owner);
    )SQL");
}

Result<void, Error> FileIndex::upsert(const FileIndexEntry& entry) {
    try {
        auto lock = db_.lock();
        Statement stmt(db_, kUpsertSql);
        bind_entry(stmt, entry);
        stmt.step();
    } catch (const std::exception& e) {
        return Fail<void>(ErrorCode::StorageFailure, e.what());
    }
    return Done();
}

Result<void, Error> FileIndex::remove(const std::string& owner, const std::string& filename) {
    try {
        auto lock = db_.lock();
        Statement stmt(db_, "DELETE FROM files WHERE owner=? AND filename=?");
        stmt.bind(1, owner).bind(2, filename);
        stmt.step();
    } catch (const std::exception& e) {
        return Fail<void>(ErrorCode::StorageFailure, e.what());
    }
    return Done();
}

Result<std::optional<FileIndexEntry>, Error> FileIndex::find(const std::string& owner, const std::string& filename) {
    try {
        auto lock = db_.lock();
        Statement stmt(db_, R"SQL(
            SELECT owner, filename, folder_id, size_bytes, created_at, is_locked
            FROM files WHERE owner=? AND filename=?
        )SQL");
        stmt.bind(1, owner).bind(2, filename);
        std::optional<FileIndexEntry> entry;
        if (stmt.step()) {
            entry = read_entry(stmt);
        }
        return Ok<std::optional<FileIndexEntry>, Error>(std::move(entry));
    } catch (const std::exception& e) {
        return Fail<std::optional<FileIndexEntry>>(ErrorCode::StorageFailure, e.what());
    }
}

Result<std::vector<FileIndexEntry>, Error> FileIndex::list_files(const std::string& owner) {
    try {
        auto lock = db_.lock();
        Statement stmt(db_, R"SQL(
            SELECT owner, filename, folder_id, size_bytes, created_at, is_locked
            FROM files WHERE owner=? ORDER BY filename
        )SQL");
        stmt.bind(1, owner);
        std::vector<FileIndexEntry> entries;
        while (stmt.step()) {
            entries.push_back(read_entry(stmt));
        }
        return Ok<std::vector<FileIndexEntry>, Error>(std::move(entries));
    } catch (const std::exception& e) {
        return Fail<std::vector<FileIndexEntry>>(ErrorCode::StorageFailure, e.what());
    }
}

Result<std::vector<std::string>, Error> FileIndex::list_owners() {
    try {
        auto lock = db_.lock();
        Statement stmt(db_, "SELECT DISTINCT owner FROM files ORDER BY owner");
        std::vector<std::string> owners;
        while (stmt.step()) {
            owners.push_back(stmt.column_text(0));
        }
        return Ok<std::vector<std::string>, Error>(std::move(owners));
    } catch (const std::exception& e) {
        return Fail<std::vector<std::string>>(ErrorCode::StorageFailure, e.what());
    }
}

Result<std::uint64_t, Error> FileIndex::usage_bytes(const std::string& owner) {
    try {
        auto lock = db_.lock();
        Statement stmt(db_, "SELECT COALESCE(SUM(size_bytes), 0) FROM files WHERE owner=?");
        stmt.bind(1, owner);
        stmt.step();
        return Ok<std::uint64_t, Error>(static_cast<std::uint64_t>(stmt.column_int64(0)));
    } catch (const std::exception& e) {
        return Fail<std::uint64_t>(ErrorCode::StorageFailure, e.what());
    }
}

Result<void, Error> FileIndex::apply_diff(const std::string& owner,
                                          const std::vector<FileIndexEntry>& inserts,
                                          const std::vector<std::string>& deletes) {
    if (inserts.empty() && deletes.empty()) {
        return Done();
    }

    try {
        auto lock = db_.lock();
        Transaction tx(db_);
        for (const auto& entry : inserts) {
            Statement stmt(db_, kUpsertSql);
            bind_entry(stmt, entry);
            stmt.step();
        }
        for (const auto& filename : deletes) {
            Statement stmt(db_, "DELETE FROM files WHERE owner=? AND filename=?");
            stmt.bind(1, owner).bind(2, filename);
            stmt.step();
        }
        tx.commit();
    } catch (const std::exception& e) {
        spdlog::error("Index diff for '{}' rolled back: {}", owner, e.what());
        return Fail<void>(ErrorCode::StorageFailure, e.what());
    }
    return Done();
}

} // namespace nexus::storage
