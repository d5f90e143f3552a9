/**
 * @file session_store.hpp
 * @brief Durable upload session records (SQLite table `upload_sessions`)
 *
 * Offsets and statuses only move through compare-and-swap updates:
 * commit_append() succeeds only if the stored offset is still the one the
 * caller read, transition() only if the stored status is still `from`.
 * A false result means another writer got there first; nothing changed.
 */

#pragma once

#include "nexus/core/error.hpp"
#include "nexus/storage/database.hpp"
#include "nexus/upload/session.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nexus::upload {

class SessionStore {
public:
    explicit SessionStore(storage::Database& db);

    /**
     * @brief Insert a new active session, unless one is already active
     *        for the same (fingerprint, owner)
     *
     * @return the stored session and whether it was created by this call
     */
    Result<std::pair<UploadSession, bool>, Error> create_or_resume(const UploadSession& session);

    // Insert unconditionally.
    Result<void, Error> insert(const UploadSession& session);

    /**
     * @brief Insert unless a session that was not aborted already carries
     *        the same (fingerprint, owner), in any status
     *
     * Final concatenations use this: they are created completed, so the
     * active-only rule of create_or_resume() does not cover them.
     * @return the stored session and whether it was created by this call
     */
    Result<std::pair<UploadSession, bool>, Error> insert_unless_live(const UploadSession& session);

    Result<std::optional<UploadSession>, Error> find(const std::string& id);

    Result<std::optional<UploadSession>, Error> find_active(const std::string& fingerprint, const std::string& owner);

    // Most recent session that was not aborted, any status.
    Result<std::optional<UploadSession>, Error> find_by_fingerprint(const std::string& fingerprint,
                                                                    const std::string& owner);

    Result<bool, Error> commit_append(const std::string& id,
                                      std::uint64_t expected_offset,
                                      std::uint64_t new_offset,
                                      const CloudState& cloud);

    Result<bool, Error> transition(const std::string& id, UploadStatus from, UploadStatus to);

    Result<void, Error> update_cloud(const std::string& id, const CloudState& cloud);

    Result<void, Error> remove(const std::string& id);

    // Sessions created before cutoff that never reached `imported`.
    Result<std::vector<UploadSession>, Error> list_created_before(std::int64_t cutoff);

    Result<std::vector<UploadSession>, Error> list_by_status(UploadStatus status);

private:
    void initialize_schema();
    void insert_locked(const UploadSession& session);
    std::optional<UploadSession> find_active_locked(const std::string& fingerprint, const std::string& owner);
    std::optional<UploadSession> find_live_locked(const std::string& fingerprint, const std::string& owner);

    storage::Database& db_;
};

} // namespace nexus::upload
