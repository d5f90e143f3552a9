/**
 * @file service.hpp
 * @brief Resumable upload operations: create, inspect, append, cancel
 *
 * UploadService is transport-agnostic; TusRoutes maps HTTP onto it.
 *
 * APPEND IS A COMPARE-AND-SWAP:
 * A chunk is accepted only when the declared offset equals the stored
 * offset. A retried request that already landed sees a conflict and the
 * client re-syncs through inspect(). Appends to one session are also
 * serialised by a per-session mutex; different sessions never contend.
 *
 * COMPLETION:
 * When the offset reaches the declared size the session becomes
 * completed and a job is handed to the executor: materialise the bytes
 * locally (cloud uploads) and, unless the upload is a partial, finalize.
 * The executor is the worker pool in the server and an inline call in
 * tests. A failed import leaves the session completed; an empty append
 * at the final offset or retry_completed() triggers it again.
 */

#pragma once

#include "nexus/auth/owner_directory.hpp"
#include "nexus/core/error.hpp"
#include "nexus/events/event_bus.hpp"
#include "nexus/upload/finalizer.hpp"
#include "nexus/upload/metadata.hpp"
#include "nexus/upload/session_store.hpp"
#include "nexus/upload/storage_strategy.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nexus::upload {

inline constexpr const char* kTusVersion = "1.0.0";
inline constexpr const char* kOffsetContentType = "application/offset+octet-stream";

struct CreateRequest {
    std::optional<std::uint64_t> length;
    std::map<std::string, std::string> metadata;
    ConcatDirective concat;
};

struct CreateResult {
    UploadSession session;
    bool created = false;   // false: an existing session was returned
};

struct OffsetInfo {
    std::uint64_t offset = 0;
    std::uint64_t size = 0;
    UploadStatus status = UploadStatus::Active;
    bool partial = false;
    std::vector<std::string> concat_parts;
    std::map<std::string, std::string> metadata;
};

struct AppendResult {
    std::uint64_t offset = 0;
    bool completed = false;
};

struct Capabilities {
    std::string version = kTusVersion;
    std::vector<std::string> supported_versions{kTusVersion};
    std::vector<std::string> extensions{"creation", "termination", "concatenation"};
    std::uint64_t max_size = 0;   // 0 = no limit advertised
};

class UploadService {
public:
    using Executor = std::function<void(std::function<void()>)>;

    UploadService(SessionStore& sessions,
                  StorageBackends& backends,
                  Finalizer& finalizer,
                  const auth::OwnerDirectory& owners,
                  events::EventBus& bus,
                  Executor executor,
                  std::uint64_t max_upload_bytes = 0);

    Result<CreateResult, Error> create(const CreateRequest& request);

    Result<OffsetInfo, Error> inspect(const std::string& upload_id);

    /**
     * @brief Append a chunk at declared_offset
     *
     * `truncated` marks a body that ended early (client disconnect); the
     * bytes that did arrive are kept and the client resumes from the
     * returned offset.
     */
    Result<AppendResult, Error> append(const std::string& upload_id,
                                       std::uint64_t declared_offset,
                                       const std::string& content_type,
                                       const char* data,
                                       std::size_t len,
                                       bool truncated = false);

    Result<void, Error> cancel(const std::string& upload_id);

    Capabilities advertise() const;

    /**
     * @brief Resume work a restart interrupted
     *
     * Releases interrupted imports, re-adopts cloud slots and schedules
     * completion for every completed non-partial session.
     * @return number of sessions scheduled
     */
    std::size_t recover_pending();

    /**
     * @brief Import completed uploads whose earlier import failed
     *
     * Runs the imports on the calling thread. Cloud sessions still being
     * materialized are left to their pending job.
     * @return number of uploads imported
     */
    std::size_t retry_completed();

    // Per-upload locks currently held or waited on.
    std::size_t tracked_locks() const;

private:
    Result<CreateResult, Error> create_final(const auth::Owner& owner, const CreateRequest& request);
    Result<void, Error> mark_completed(UploadSession& session);
    void schedule_completion(UploadSession session);
    bool complete(UploadSession& session);
    std::shared_ptr<std::mutex> session_mutex(const std::string& upload_id);
    void release_session_mutex(const std::string& upload_id);

    SessionStore& sessions_;
    StorageBackends& backends_;
    Finalizer& finalizer_;
    const auth::OwnerDirectory& owners_;
    events::EventBus& bus_;
    Executor executor_;
    std::uint64_t max_upload_bytes_;

    // An entry lives as long as someone holds its lock.
    mutable std::mutex locks_mutex_;
    std::unordered_map<std::string, std::weak_ptr<std::mutex>> session_locks_;
};

} // namespace nexus::upload
