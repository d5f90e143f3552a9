#include "nexus/upload/service.hpp"

#include "nexus/core/digest.hpp"
#include "nexus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

namespace nexus::upload {

namespace {

constexpr std::size_t kConcatBufferSize = 64 * 1024;

std::string lowercase_media_type(const std::string& content_type) {
    std::string media = content_type.substr(0, content_type.find(';'));
    media.erase(media.find_last_not_of(" \t") + 1);
    media.erase(0, media.find_first_not_of(" \t"));
    std::transform(media.begin(), media.end(), media.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return media;
}

std::optional<std::string> metadata_value(const std::map<std::string, std::string>& metadata, const char* key) {
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

UploadService::UploadService(SessionStore& sessions,
                             StorageBackends& backends,
                             Finalizer& finalizer,
                             const auth::OwnerDirectory& owners,
                             events::EventBus& bus,
                             Executor executor,
                             std::uint64_t max_upload_bytes)
    : sessions_(sessions), backends_(backends), finalizer_(finalizer), owners_(owners), bus_(bus),
      executor_(std::move(executor)), max_upload_bytes_(max_upload_bytes) {
    if (!executor_) {
        executor_ = [](std::function<void()> job) { job(); };
    }
}

std::shared_ptr<std::mutex> UploadService::session_mutex(const std::string& upload_id) {
    std::lock_guard lock(locks_mutex_);
    auto& slot = session_locks_[upload_id];
    if (auto held = slot.lock()) {
        return held;
    }
    std::shared_ptr<std::mutex> created(new std::mutex, [this, upload_id](std::mutex* mutex) {
        release_session_mutex(upload_id);
        delete mutex;
    });
    slot = created;
    return created;
}

void UploadService::release_session_mutex(const std::string& upload_id) {
    std::lock_guard lock(locks_mutex_);
    auto it = session_locks_.find(upload_id);
    // A newer holder may have replaced the entry already.
    if (it != session_locks_.end() && it->second.expired()) {
        session_locks_.erase(it);
    }
}

std::size_t UploadService::tracked_locks() const {
    std::lock_guard lock(locks_mutex_);
    return session_locks_.size();
}

Capabilities UploadService::advertise() const {
    Capabilities caps;
    caps.max_size = max_upload_bytes_;
    return caps;
}

// ════════════════════════════════════════════════════════
// Create
// ════════════════════════════════════════════════════════

Result<CreateResult, Error> UploadService::create(const CreateRequest& request) {
    const auto credential = metadata_value(request.metadata, metadata_keys::kCredential);
    if (!credential || credential->empty()) {
        return Fail<CreateResult>(ErrorCode::Authentication, "missing owner credential");
    }
    const auto owner = owners_.authenticate(*credential);
    if (!owner) {
        return Fail<CreateResult>(ErrorCode::Authentication, "invalid owner credential");
    }

    if (request.concat.is_final()) {
        return create_final(*owner, request);
    }

    if (!request.length) {
        return Fail<CreateResult>(ErrorCode::Validation, "Upload-Length is required");
    }
    const std::uint64_t size = *request.length;
    if (max_upload_bytes_ > 0 && size > max_upload_bytes_) {
        return Fail<CreateResult>(ErrorCode::PayloadTooLarge,
                                  "upload of " + std::to_string(size) + " bytes exceeds the limit of " +
                                  std::to_string(max_upload_bytes_));
    }

    const auto raw_filename = metadata_value(request.metadata, metadata_keys::kFilename);
    if (!raw_filename) {
        return Fail<CreateResult>(ErrorCode::Validation, "metadata must include a filename");
    }

    UploadSession session;
    session.id = core::random_hex_id();
    session.owner = owner->name;
    session.size = size;
    session.filename = sanitize_filename(*raw_filename, session.id);
    session.content_type = metadata_value(request.metadata, metadata_keys::kFiletype)
                               .value_or("application/octet-stream");
    if (session.content_type.empty()) {
        session.content_type = "application/octet-stream";
    }
    session.metadata = request.metadata;
    session.metadata.erase(metadata_keys::kCredential);
    session.partial = request.concat.partial;
    session.created_at = session.updated_at = unix_now();

    session.fingerprint = make_fingerprint(session.filename, size,
                                           metadata_value(request.metadata, metadata_keys::kLastModified));
    if (session.partial) {
        // Parts of one file share metadata; never resume one part as another.
        session.fingerprint += "-partial-" + session.id;
    }

    auto existing = sessions_.find_active(session.fingerprint, session.owner);
    if (existing.is_error()) {
        return Err<CreateResult, Error>(existing.error());
    }
    if (existing.value()) {
        events::UploadCreatedEvent event;
        event.upload_id = existing.value()->id;
        event.owner = existing.value()->owner;
        event.filename = existing.value()->filename;
        event.size = existing.value()->size;
        event.offset = existing.value()->offset;
        event.resumed = true;
        event.cloud = existing.value()->cloud.active;
        bus_.emit(event);
        return Ok<CreateResult, Error>(CreateResult{*existing.value(), false});
    }

    auto strategy = backends_.place(size, session.partial);
    if (auto begun = strategy.begin(session); begun.is_error()) {
        return Err<CreateResult, Error>(begun.error());
    }

    auto stored = sessions_.create_or_resume(session);
    if (stored.is_error()) {
        if (auto cleaned = strategy.abort(session); cleaned.is_error()) {
            spdlog::warn("Upload {}: cleanup after failed create: {}", session.id, cleaned.error().message);
        }
        return Err<CreateResult, Error>(stored.error());
    }
    if (!stored.value().second) {
        // Lost a race with an identical create.
        if (auto cleaned = strategy.abort(session); cleaned.is_error()) {
            spdlog::warn("Upload {}: cleanup of duplicate create: {}", session.id, cleaned.error().message);
        }
        return Ok<CreateResult, Error>(CreateResult{stored.value().first, false});
    }

    events::UploadCreatedEvent event;
    event.upload_id = session.id;
    event.owner = session.owner;
    event.filename = session.filename;
    event.size = session.size;
    event.cloud = session.cloud.active;
    bus_.emit(event);

    if (size == 0) {
        if (auto completed = mark_completed(session); completed.is_error()) {
            return Err<CreateResult, Error>(completed.error());
        }
    }
    return Ok<CreateResult, Error>(CreateResult{session, true});
}

Result<CreateResult, Error> UploadService::create_final(const auth::Owner& owner, const CreateRequest& request) {
    std::vector<UploadSession> parts;
    std::uint64_t total = 0;

    for (const auto& part_id : request.concat.final_parts) {
        auto found = sessions_.find(part_id);
        if (found.is_error()) {
            return Err<CreateResult, Error>(found.error());
        }
        const auto& part = found.value();
        if (!part || part->owner != owner.name) {
            return Fail<CreateResult>(ErrorCode::Validation, "unknown partial upload " + part_id);
        }
        if (!part->partial) {
            return Fail<CreateResult>(ErrorCode::Validation, "upload " + part_id + " is not a partial upload");
        }
        if (part->status != UploadStatus::Completed) {
            return Fail<CreateResult>(ErrorCode::Validation, "partial upload " + part_id + " is not complete");
        }
        total += part->size;
        parts.push_back(*part);
    }

    if (max_upload_bytes_ > 0 && total > max_upload_bytes_) {
        return Fail<CreateResult>(ErrorCode::PayloadTooLarge, "concatenated upload exceeds the size limit");
    }

    UploadSession session;
    session.id = core::random_hex_id();
    session.owner = owner.name;
    const auto raw_filename = metadata_value(request.metadata, metadata_keys::kFilename);
    session.filename = sanitize_filename(raw_filename.value_or(parts.front().filename), session.id);
    session.content_type = metadata_value(request.metadata, metadata_keys::kFiletype)
                               .value_or(parts.front().content_type);
    session.metadata = request.metadata;
    session.metadata.erase(metadata_keys::kCredential);
    session.concat_parts = request.concat.final_parts;
    session.size = total;
    session.offset = total;
    session.status = UploadStatus::Completed;
    session.created_at = session.updated_at = unix_now();
    session.fingerprint = make_final_fingerprint(session.filename, total, session.concat_parts);

    auto previous = sessions_.find_by_fingerprint(session.fingerprint, session.owner);
    if (previous.is_error()) {
        return Err<CreateResult, Error>(previous.error());
    }
    if (previous.value()) {
        return Ok<CreateResult, Error>(CreateResult{*previous.value(), false});
    }

    ChunkWriter& writer = backends_.writer();
    {
        std::ofstream out(writer.path_for(session.id), std::ios::binary | std::ios::trunc);
        std::vector<char> buffer(kConcatBufferSize);
        std::uint64_t copied = 0;
        for (const auto& part : parts) {
            std::ifstream in(writer.path_for(part.id), std::ios::binary);
            if (!in) {
                break;
            }
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto n = in.gcount();
                if (n > 0) {
                    out.write(buffer.data(), n);
                    copied += static_cast<std::uint64_t>(n);
                }
            }
        }
        out.flush();
        if (!out || copied != total) {
            out.close();
            if (auto removed = writer.remove(session.id); removed.is_error()) {
                spdlog::warn("Upload {}: {}", session.id, removed.error().message);
            }
            return Fail<CreateResult>(ErrorCode::StorageFailure,
                                      "concatenation produced " + std::to_string(copied) + " of " +
                                      std::to_string(total) + " bytes");
        }
    }

    auto stored = sessions_.insert_unless_live(session);
    if (stored.is_error() || !stored.value().second) {
        if (auto removed = writer.remove(session.id); removed.is_error()) {
            spdlog::warn("Upload {}: {}", session.id, removed.error().message);
        }
        if (stored.is_error()) {
            return Err<CreateResult, Error>(stored.error());
        }
        // An identical final request got there first.
        return Ok<CreateResult, Error>(CreateResult{stored.value().first, false});
    }

    events::UploadCreatedEvent created;
    created.upload_id = session.id;
    created.owner = session.owner;
    created.filename = session.filename;
    created.size = session.size;
    created.offset = session.offset;
    bus_.emit(created);

    events::UploadCompletedEvent completed;
    completed.upload_id = session.id;
    completed.owner = session.owner;
    completed.size = session.size;
    bus_.emit(completed);

    // Parts stay until the janitor's retention window passes.
    schedule_completion(session);
    return Ok<CreateResult, Error>(CreateResult{session, true});
}

// ════════════════════════════════════════════════════════
// Inspect / Append / Cancel
// ════════════════════════════════════════════════════════

Result<OffsetInfo, Error> UploadService::inspect(const std::string& upload_id) {
    auto found = sessions_.find(upload_id);
    if (found.is_error()) {
        return Err<OffsetInfo, Error>(found.error());
    }
    if (!found.value() || found.value()->status == UploadStatus::Aborted) {
        return Fail<OffsetInfo>(ErrorCode::NotFound, "unknown upload " + upload_id);
    }

    const auto& session = *found.value();
    OffsetInfo info;
    info.offset = session.offset;
    info.size = session.size;
    info.status = session.status;
    info.partial = session.partial;
    info.concat_parts = session.concat_parts;
    info.metadata = session.metadata;
    return Ok<OffsetInfo, Error>(std::move(info));
}

Result<AppendResult, Error> UploadService::append(const std::string& upload_id,
                                                  std::uint64_t declared_offset,
                                                  const std::string& content_type,
                                                  const char* data,
                                                  std::size_t len,
                                                  bool truncated) {
    if (lowercase_media_type(content_type) != kOffsetContentType) {
        return Fail<AppendResult>(ErrorCode::UnsupportedMediaType,
                                  std::string("Content-Type must be ") + kOffsetContentType);
    }

    auto mutex = session_mutex(upload_id);
    std::lock_guard lock(*mutex);

    auto found = sessions_.find(upload_id);
    if (found.is_error()) {
        return Err<AppendResult, Error>(found.error());
    }
    if (!found.value() || found.value()->status == UploadStatus::Aborted) {
        return Fail<AppendResult>(ErrorCode::NotFound, "unknown upload " + upload_id);
    }

    UploadSession session = *found.value();
    if (declared_offset != session.offset) {
        return Fail<AppendResult>(ErrorCode::OffsetConflict,
                                  "Upload-Offset " + std::to_string(declared_offset) +
                                  " does not match current offset " + std::to_string(session.offset));
    }
    if (session.status != UploadStatus::Active) {
        if (len > 0) {
            return Fail<AppendResult>(ErrorCode::Validation, "upload " + upload_id + " is already complete");
        }
        if (session.status == UploadStatus::Completed && !session.partial && !session.cloud.active) {
            // The earlier import failed; finalize() ignores a duplicate.
            spdlog::info("Upload {}: retrying import", upload_id);
            schedule_completion(session);
        }
        return Ok<AppendResult, Error>(AppendResult{session.offset, true});
    }

    const std::uint64_t previous = session.offset;
    auto strategy = backends_.select(session);
    auto written = strategy.append(session, data, len);
    if (written.is_error()) {
        spdlog::warn("Upload {}: append at {} failed: {}", upload_id, previous, written.error().message);
        return Err<AppendResult, Error>(written.error());
    }

    auto committed = sessions_.commit_append(upload_id, previous, written.value(), session.cloud);
    if (committed.is_error()) {
        // Bytes past `previous` are unconfirmed; the next append cuts them off.
        return Err<AppendResult, Error>(committed.error());
    }
    if (!committed.value()) {
        return Fail<AppendResult>(ErrorCode::OffsetConflict, "upload " + upload_id + " changed concurrently");
    }
    session.offset = written.value();

    events::ChunkAppendedEvent event;
    event.upload_id = upload_id;
    event.previous_offset = previous;
    event.new_offset = session.offset;
    event.size = session.size;
    event.truncated = truncated;
    bus_.emit(event);

    AppendResult result{session.offset, false};
    if (session.bytes_complete()) {
        if (auto completed = mark_completed(session); completed.is_error()) {
            return Err<AppendResult, Error>(completed.error());
        }
        result.completed = true;
    }
    return Ok<AppendResult, Error>(result);
}

Result<void, Error> UploadService::cancel(const std::string& upload_id) {
    auto mutex = session_mutex(upload_id);
    std::lock_guard lock(*mutex);

    auto found = sessions_.find(upload_id);
    if (found.is_error()) {
        return Err<void, Error>(found.error());
    }
    if (!found.value()) {
        return Fail<void>(ErrorCode::NotFound, "unknown upload " + upload_id);
    }

    UploadSession session = *found.value();
    if (session.status != UploadStatus::Active && session.status != UploadStatus::Completed) {
        return Fail<void>(ErrorCode::NotFound, "upload " + upload_id + " is no longer cancellable");
    }

    // Flip the status first so a finalizer that has not claimed it yet never will.
    auto aborted = sessions_.transition(upload_id, session.status, UploadStatus::Aborted);
    if (aborted.is_error()) {
        return Err<void, Error>(aborted.error());
    }
    if (!aborted.value()) {
        return Fail<void>(ErrorCode::NotFound, "upload " + upload_id + " is no longer cancellable");
    }

    auto strategy = backends_.select(session);
    if (auto cleaned = strategy.abort(session); cleaned.is_error()) {
        spdlog::warn("Upload {}: backing data not removed: {}", upload_id, cleaned.error().message);
    }

    events::UploadAbortedEvent event;
    event.upload_id = upload_id;
    event.reason = "client";
    bus_.emit(event);

    return Done();
}

// ════════════════════════════════════════════════════════
// Completion
// ════════════════════════════════════════════════════════

Result<void, Error> UploadService::mark_completed(UploadSession& session) {
    auto moved = sessions_.transition(session.id, UploadStatus::Active, UploadStatus::Completed);
    if (moved.is_error()) {
        return Err<void, Error>(moved.error());
    }
    if (!moved.value()) {
        return Done();
    }
    session.status = UploadStatus::Completed;

    events::UploadCompletedEvent event;
    event.upload_id = session.id;
    event.owner = session.owner;
    event.size = session.size;
    event.partial = session.partial;
    bus_.emit(event);

    schedule_completion(session);
    return Done();
}

void UploadService::schedule_completion(UploadSession session) {
    executor_([this, session = std::move(session)]() mutable {
        complete(session);
    });
}

bool UploadService::complete(UploadSession& session) {
    if (session.cloud.active) {
        auto strategy = backends_.select(session);
        if (auto done = strategy.complete(session); done.is_error()) {
            spdlog::error("Upload {}: completing storage failed: {}", session.id, done.error().message);
            return false;
        }
        if (auto saved = sessions_.update_cloud(session.id, session.cloud); saved.is_error()) {
            spdlog::error("Upload {}: {}", session.id, saved.error().message);
        }
    }
    if (session.partial) {
        return false;
    }
    auto finalized = finalizer_.finalize(session.id);
    if (finalized.is_error()) {
        spdlog::error("Upload {}: import failed, will retry: {}", session.id, finalized.error().message);
        return false;
    }
    return finalized.value().imported;
}

std::size_t UploadService::retry_completed() {
    auto completed = sessions_.list_by_status(UploadStatus::Completed);
    if (completed.is_error()) {
        spdlog::error("Import retry: {}", completed.error().message);
        return 0;
    }

    std::size_t imported = 0;
    for (auto& session : completed.value()) {
        if (session.partial || session.cloud.active) {
            continue;
        }
        if (complete(session)) {
            ++imported;
        }
    }
    if (imported > 0) {
        spdlog::info("Imported {} uploads on retry", imported);
    }
    return imported;
}

std::size_t UploadService::recover_pending() {
    finalizer_.release_interrupted();

    for (auto status : {UploadStatus::Active, UploadStatus::Completed}) {
        auto listed = sessions_.list_by_status(status);
        if (listed.is_error()) {
            spdlog::error("Upload recovery: {}", listed.error().message);
            continue;
        }
        for (const auto& session : listed.value()) {
            if (session.cloud.active && backends_.arbiter()) {
                backends_.arbiter()->adopt();
            }
        }
    }

    auto completed = sessions_.list_by_status(UploadStatus::Completed);
    if (completed.is_error()) {
        spdlog::error("Upload recovery: {}", completed.error().message);
        return 0;
    }

    std::size_t scheduled = 0;
    for (const auto& session : completed.value()) {
        if (session.partial) {
            continue;
        }
        schedule_completion(session);
        ++scheduled;
    }
    if (scheduled > 0) {
        spdlog::info("Rescheduled {} completed uploads for import", scheduled);
    }
    return scheduled;
}

} // namespace nexus::upload
