#include "nexus/upload/session_store.hpp"

#include <spdlog/spdlog.h>

namespace nexus::upload {

using storage::Statement;

namespace {

constexpr const char* kColumns =
    "id, fingerprint, owner, size, upload_offset, filename, content_type, metadata, "
    "concat_parts, is_partial, status, cloud_state, created_at, updated_at";

std::string select_sql(const std::string& where) {
    return std::string("SELECT ") + kColumns + " FROM upload_sessions " + where;
}

UploadSession read_row(const Statement& stmt) {
    UploadSession s;
    s.id = stmt.column_text(0);
    s.fingerprint = stmt.column_text(1);
    s.owner = stmt.column_text(2);
    s.size = static_cast<std::uint64_t>(stmt.column_int64(3));
    s.offset = static_cast<std::uint64_t>(stmt.column_int64(4));
    s.filename = stmt.column_text(5);
    s.content_type = stmt.column_text(6);
    s.metadata = decode_metadata(stmt.column_text(7));
    s.concat_parts = decode_parts(stmt.column_text(8));
    s.partial = stmt.column_int64(9) != 0;
    s.status = parse_status(stmt.column_text(10)).value_or(UploadStatus::Aborted);
    s.cloud = decode_cloud_state(stmt.column_text(11));
    s.created_at = stmt.column_int64(12);
    s.updated_at = stmt.column_int64(13);
    return s;
}

template<typename T>
Result<T, Error> storage_error(const std::exception& e) {
    spdlog::error("Session store: {}", e.what());
    return Fail<T>(ErrorCode::StorageFailure, e.what());
}

} // namespace

SessionStore::SessionStore(storage::Database& db) : db_(db) {
    initialize_schema();
}

void SessionStore::initialize_schema() {
    auto lock = db_.lock();
    db_.exec(R"SQL(
        CREATE TABLE IF NOT EXISTS upload_sessions (
            id TEXT PRIMARY KEY,
            fingerprint TEXT NOT NULL,
            owner TEXT NOT NULL,
            size INTEGER NOT NULL,
            upload_offset INTEGER NOT NULL DEFAULT 0,
            filename TEXT NOT NULL,
            content_type TEXT NOT NULL,
            metadata TEXT NOT NULL DEFAULT '{}',
            concat_parts TEXT NOT NULL DEFAULT '[]',
            is_partial INTEGER NOT NULL DEFAULT 0,
            status TEXT NOT NULL,
            cloud_state TEXT NOT NULL DEFAULT '{}',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            CHECK (upload_offset >= 0 AND upload_offset <= size)
        );
        CREATE UNIQUE INDEX IF NOT EXISTS idx_upload_sessions_active
            ON upload_sessions(fingerprint, owner) WHERE status = 'active';
        CREATE INDEX IF NOT EXISTS idx_upload_sessions_created
            ON upload_sessions(created_at);
    )SQL");
}

void SessionStore::insert_locked(const UploadSession& s) {
    Statement stmt(db_, R"SQL(
        INSERT INTO upload_sessions(id, fingerprint, owner, size, upload_offset, filename, content_type,
                                    metadata, concat_parts, is_partial, status, cloud_state,
                                    created_at, updated_at)
        VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )SQL");
    stmt.bind(1, s.id)
        .bind(2, s.fingerprint)
        .bind(3, s.owner)
        .bind(4, static_cast<std::int64_t>(s.size))
        .bind(5, static_cast<std::int64_t>(s.offset))
        .bind(6, s.filename)
        .bind(7, s.content_type)
        .bind(8, encode_metadata(s.metadata))
        .bind(9, encode_parts(s.concat_parts))
        .bind(10, static_cast<std::int64_t>(s.partial ? 1 : 0))
        .bind(11, std::string(to_string(s.status)))
        .bind(12, encode_cloud_state(s.cloud))
        .bind(13, s.created_at)
        .bind(14, s.updated_at);
    stmt.step();
}

std::optional<UploadSession> SessionStore::find_active_locked(const std::string& fingerprint,
                                                              const std::string& owner) {
    Statement stmt(db_, select_sql("WHERE fingerprint=? AND owner=? AND status='active'").c_str());
    stmt.bind(1, fingerprint).bind(2, owner);
    if (stmt.step()) {
        return read_row(stmt);
    }
    return std::nullopt;
}

Result<std::pair<UploadSession, bool>, Error> SessionStore::create_or_resume(const UploadSession& session) {
    using Created = std::pair<UploadSession, bool>;
    try {
        auto lock = db_.lock();
        if (auto existing = find_active_locked(session.fingerprint, session.owner)) {
            return Ok<Created, Error>(Created{std::move(*existing), false});
        }
        insert_locked(session);
        return Ok<Created, Error>(Created{session, true});
    } catch (const std::exception& e) {
        return storage_error<Created>(e);
    }
}

Result<void, Error> SessionStore::insert(const UploadSession& session) {
    try {
        auto lock = db_.lock();
        insert_locked(session);
        return Done();
    } catch (const std::exception& e) {
        return storage_error<void>(e);
    }
}

Result<std::optional<UploadSession>, Error> SessionStore::find(const std::string& id) {
    using Found = std::optional<UploadSession>;
    try {
        auto lock = db_.lock();
        Statement stmt(db_, select_sql("WHERE id=?").c_str());
        stmt.bind(1, id);
        Found found;
        if (stmt.step()) {
            found = read_row(stmt);
        }
        return Ok<Found, Error>(std::move(found));
    } catch (const std::exception& e) {
        return storage_error<Found>(e);
    }
}

Result<std::optional<UploadSession>, Error> SessionStore::find_active(const std::string& fingerprint,
                                                                      const std::string& owner) {
    using Found = std::optional<UploadSession>;
    try {
        auto lock = db_.lock();
        return Ok<Found, Error>(find_active_locked(fingerprint, owner));
    } catch (const std::exception& e) {
        return storage_error<Found>(e);
    }
}

std::optional<UploadSession> SessionStore::find_live_locked(const std::string& fingerprint,
                                                            const std::string& owner) {
    Statement stmt(db_, select_sql(
        "WHERE fingerprint=? AND owner=? AND status!='aborted' ORDER BY created_at DESC LIMIT 1").c_str());
    stmt.bind(1, fingerprint).bind(2, owner);
    if (stmt.step()) {
        return read_row(stmt);
    }
    return std::nullopt;
}

Result<std::optional<UploadSession>, Error> SessionStore::find_by_fingerprint(const std::string& fingerprint,
                                                                              const std::string& owner) {
    using Found = std::optional<UploadSession>;
    try {
        auto lock = db_.lock();
        return Ok<Found, Error>(find_live_locked(fingerprint, owner));
    } catch (const std::exception& e) {
        return storage_error<Found>(e);
    }
}

Result<std::pair<UploadSession, bool>, Error> SessionStore::insert_unless_live(const UploadSession& session) {
    using Created = std::pair<UploadSession, bool>;
    try {
        auto lock = db_.lock();
        if (auto existing = find_live_locked(session.fingerprint, session.owner)) {
            return Ok<Created, Error>(Created{std::move(*existing), false});
        }
        insert_locked(session);
        return Ok<Created, Error>(Created{session, true});
    } catch (const std::exception& e) {
        return storage_error<Created>(e);
    }
}

Result<bool, Error> SessionStore::commit_append(const std::string& id,
                                                std::uint64_t expected_offset,
                                                std::uint64_t new_offset,
                                                const CloudState& cloud) {
    if (new_offset < expected_offset) {
        return Fail<bool>(ErrorCode::Internal, "offset may not decrease");
    }
    try {
        auto lock = db_.lock();
        Statement stmt(db_, R"SQL(
            UPDATE upload_sessions SET upload_offset=?, cloud_state=?, updated_at=?
            WHERE id=? AND upload_offset=? AND status='active' AND ? <= size
        )SQL");
        stmt.bind(1, static_cast<std::int64_t>(new_offset))
            .bind(2, encode_cloud_state(cloud))
            .bind(3, unix_now())
            .bind(4, id)
            .bind(5, static_cast<std::int64_t>(expected_offset))
            .bind(6, static_cast<std::int64_t>(new_offset));
        stmt.step();
        return Ok<bool, Error>(db_.changes() == 1);
    } catch (const std::exception& e) {
        return storage_error<bool>(e);
    }
}

Result<bool, Error> SessionStore::transition(const std::string& id, UploadStatus from, UploadStatus to) {
    if (!can_transition(from, to)) {
        return Fail<bool>(ErrorCode::Internal,
                          std::string("illegal status transition ") + to_string(from) + " -> " + to_string(to));
    }
    try {
        auto lock = db_.lock();
        Statement stmt(db_, "UPDATE upload_sessions SET status=?, updated_at=? WHERE id=? AND status=?");
        stmt.bind(1, std::string(to_string(to)))
            .bind(2, unix_now())
            .bind(3, id)
            .bind(4, std::string(to_string(from)));
        stmt.step();
        return Ok<bool, Error>(db_.changes() == 1);
    } catch (const std::exception& e) {
        return storage_error<bool>(e);
    }
}

Result<void, Error> SessionStore::update_cloud(const std::string& id, const CloudState& cloud) {
    try {
        auto lock = db_.lock();
        Statement stmt(db_, "UPDATE upload_sessions SET cloud_state=?, updated_at=? WHERE id=?");
        stmt.bind(1, encode_cloud_state(cloud)).bind(2, unix_now()).bind(3, id);
        stmt.step();
        return Done();
    } catch (const std::exception& e) {
        return storage_error<void>(e);
    }
}

Result<void, Error> SessionStore::remove(const std::string& id) {
    try {
        auto lock = db_.lock();
        Statement stmt(db_, "DELETE FROM upload_sessions WHERE id=?");
        stmt.bind(1, id);
        stmt.step();
        return Done();
    } catch (const std::exception& e) {
        return storage_error<void>(e);
    }
}

Result<std::vector<UploadSession>, Error> SessionStore::list_created_before(std::int64_t cutoff) {
    using Sessions = std::vector<UploadSession>;
    try {
        auto lock = db_.lock();
        Statement stmt(db_, select_sql("WHERE created_at < ? AND status != 'imported' ORDER BY created_at").c_str());
        stmt.bind(1, cutoff);
        Sessions sessions;
        while (stmt.step()) {
            sessions.push_back(read_row(stmt));
        }
        return Ok<Sessions, Error>(std::move(sessions));
    } catch (const std::exception& e) {
        return storage_error<Sessions>(e);
    }
}

Result<std::vector<UploadSession>, Error> SessionStore::list_by_status(UploadStatus status) {
    using Sessions = std::vector<UploadSession>;
    try {
        auto lock = db_.lock();
        Statement stmt(db_, select_sql("WHERE status=? ORDER BY created_at").c_str());
        stmt.bind(1, std::string(to_string(status)));
        Sessions sessions;
        while (stmt.step()) {
            sessions.push_back(read_row(stmt));
        }
        return Ok<Sessions, Error>(std::move(sessions));
    } catch (const std::exception& e) {
        return storage_error<Sessions>(e);
    }
}

} // namespace nexus::upload
