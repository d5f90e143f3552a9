#include "nexus/upload/storage_strategy.hpp"

#include "nexus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace nexus::upload {
namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════
// LocalStorage
// ════════════════════════════════════════════════════════

Result<void, Error> LocalStorage::begin(UploadSession& session) {
    return writer_.create(session.id);
}

Result<std::uint64_t, Error> LocalStorage::append(UploadSession& session, const char* data, std::size_t len) {
    return writer_.append(session, data, len);
}

Result<void, Error> LocalStorage::complete(UploadSession&) {
    return Done();
}

Result<void, Error> LocalStorage::abort(UploadSession& session) {
    return writer_.remove(session.id);
}

// ════════════════════════════════════════════════════════
// CloudStorage
// ════════════════════════════════════════════════════════

CloudStorage::CloudStorage(ChunkWriter& writer,
                           cloud::ObjectStore& store,
                           cloud::Arbiter& arbiter,
                           cloud::UsageCounters& usage,
                           events::EventBus& bus)
    : writer_(writer), store_(store), arbiter_(arbiter), usage_(usage), bus_(bus) {}

void CloudStorage::fall_back(UploadSession& session, const std::string& reason) {
    spdlog::warn("Upload {}: cloud path failed ({}), continuing locally", session.id, reason);

    if (session.cloud.active && !session.cloud.multipart_id.empty()) {
        usage_.record_class_a();
        auto aborted = store_.abort_multipart(session.cloud.object_key, session.cloud.multipart_id);
        if (aborted.is_error()) {
            spdlog::warn("Upload {}: abort of multipart {} failed: {}",
                         session.id, session.cloud.multipart_id, aborted.error().message);
        }
    } else if (session.cloud.active && !session.cloud.object_key.empty()) {
        // Assembled but never fetched; drop the object.
        usage_.record_class_a();
        auto removed = store_.remove(session.cloud.object_key);
        if (removed.is_error()) {
            spdlog::warn("Upload {}: could not delete object {}: {}",
                         session.id, session.cloud.object_key, removed.error().message);
        } else {
            usage_.release_storage(session.size);
        }
    }
    session.cloud = CloudState{};
    arbiter_.release();

    events::CloudFallbackEvent event;
    event.upload_id = session.id;
    event.reason = reason;
    bus_.emit(event);
}

Result<void, Error> CloudStorage::begin(UploadSession& session) {
    if (auto created = writer_.create(session.id); created.is_error()) {
        arbiter_.release();
        return created;
    }

    const std::string key = "uploads/" + session.owner + "/" + session.id;
    usage_.record_class_a();
    auto multipart = store_.create_multipart(key, session.content_type);
    if (multipart.is_error()) {
        fall_back(session, multipart.error().message);
        return Done();
    }

    session.cloud = CloudState{};
    session.cloud.active = true;
    session.cloud.object_key = key;
    session.cloud.multipart_id = multipart.value();
    return Done();
}

Result<void, Error> CloudStorage::upload_parts(UploadSession& session, std::uint64_t available, bool tail) {
    const std::uint64_t part_size = arbiter_.config().part_size_bytes;
    const auto path = writer_.path_for(session.id);

    while (session.cloud.uploaded_bytes < available) {
        const std::uint64_t pending = available - session.cloud.uploaded_bytes;
        if (pending < part_size && !tail) {
            break;
        }
        const std::uint64_t len = std::min(pending, part_size);

        std::string buffer(static_cast<std::size_t>(len), '\0');
        std::ifstream in(path, std::ios::binary);
        in.seekg(static_cast<std::streamoff>(session.cloud.uploaded_bytes));
        in.read(buffer.data(), static_cast<std::streamsize>(len));
        if (in.gcount() != static_cast<std::streamsize>(len)) {
            return Fail<void>(ErrorCode::StorageFailure, "short read from " + path.string());
        }

        const int number = static_cast<int>(session.cloud.parts.size()) + 1;
        usage_.record_class_a();
        auto etag = store_.upload_part(session.cloud.object_key, session.cloud.multipart_id, number, buffer);
        if (etag.is_error()) {
            return Err<void, Error>(etag.error());
        }
        usage_.record_transit(len);

        session.cloud.parts.push_back(CloudPart{number, etag.value(), len});
        session.cloud.uploaded_bytes += len;
    }
    return Done();
}

Result<std::uint64_t, Error> CloudStorage::append(UploadSession& session, const char* data, std::size_t len) {
    auto written = writer_.append(session, data, len);
    if (written.is_error() || !session.cloud.active) {
        return written;
    }

    if (auto shipped = upload_parts(session, written.value(), false); shipped.is_error()) {
        fall_back(session, shipped.error().message);
    }
    return written;
}

Result<void, Error> CloudStorage::materialize(UploadSession& session) {
    if (auto shipped = upload_parts(session, session.size, true); shipped.is_error()) {
        return shipped;
    }

    cloud::CompletedParts parts;
    parts.reserve(session.cloud.parts.size());
    for (const auto& part : session.cloud.parts) {
        parts.emplace_back(part.number, part.etag);
    }

    usage_.record_class_a();
    if (auto completed = store_.complete_multipart(session.cloud.object_key, session.cloud.multipart_id, parts);
        completed.is_error()) {
        return completed;
    }
    usage_.add_storage(session.size);
    // The multipart upload no longer exists; nothing left to abort.
    session.cloud.multipart_id.clear();

    const auto backing = writer_.path_for(session.id);
    const fs::path staging = backing.string() + ".download";

    usage_.record_class_b();
    auto downloaded = store_.download(session.cloud.object_key, staging);
    if (downloaded.is_error()) {
        return downloaded;
    }
    usage_.record_transit(session.size);

    std::error_code ec;
    const auto fetched = fs::file_size(staging, ec);
    if (ec || fetched != session.size) {
        fs::remove(staging, ec);
        return Fail<void>(ErrorCode::StorageFailure, "downloaded object has the wrong size");
    }
    fs::rename(staging, backing, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(staging, cleanup);
        return Fail<void>(ErrorCode::StorageFailure, "replace " + backing.string() + ": " + ec.message());
    }

    usage_.record_class_a();
    auto removed = store_.remove(session.cloud.object_key);
    if (removed.is_error()) {
        // The object stays billed until a later cleanup; the upload itself is fine.
        spdlog::warn("Upload {}: could not delete transient object {}: {}",
                     session.id, session.cloud.object_key, removed.error().message);
    } else {
        usage_.release_storage(session.size);
    }
    return Done();
}

Result<void, Error> CloudStorage::complete(UploadSession& session) {
    if (!session.cloud.active) {
        return Done();
    }

    auto materialized = materialize(session);
    if (materialized.is_error()) {
        fall_back(session, materialized.error().message);
        return Done();
    }

    events::CloudTransferCompletedEvent event;
    event.upload_id = session.id;
    event.bytes = session.size;
    event.parts = session.cloud.parts.size();
    bus_.emit(event);

    session.cloud = CloudState{};
    arbiter_.release();
    return Done();
}

Result<void, Error> CloudStorage::abort(UploadSession& session) {
    if (session.cloud.active && !session.cloud.multipart_id.empty()) {
        usage_.record_class_a();
        auto aborted = store_.abort_multipart(session.cloud.object_key, session.cloud.multipart_id);
        if (aborted.is_error()) {
            spdlog::warn("Upload {}: abort of multipart {} failed: {}",
                         session.id, session.cloud.multipart_id, aborted.error().message);
        }
    }
    if (session.cloud.active) {
        arbiter_.release();
    }
    session.cloud = CloudState{};
    return writer_.remove(session.id);
}

// ════════════════════════════════════════════════════════
// StorageStrategy
// ════════════════════════════════════════════════════════

Result<void, Error> StorageStrategy::begin(UploadSession& session) {
    return std::visit([&](auto& backend) { return backend.begin(session); }, backend_);
}

Result<std::uint64_t, Error> StorageStrategy::append(UploadSession& session, const char* data, std::size_t len) {
    return std::visit([&](auto& backend) { return backend.append(session, data, len); }, backend_);
}

Result<void, Error> StorageStrategy::complete(UploadSession& session) {
    return std::visit([&](auto& backend) { return backend.complete(session); }, backend_);
}

Result<void, Error> StorageStrategy::abort(UploadSession& session) {
    return std::visit([&](auto& backend) { return backend.abort(session); }, backend_);
}

// ════════════════════════════════════════════════════════
// StorageBackends
// ════════════════════════════════════════════════════════

StorageBackends::StorageBackends(ChunkWriter& writer,
                                 events::EventBus& bus,
                                 cloud::ObjectStore* store,
                                 cloud::Arbiter* arbiter,
                                 cloud::UsageCounters* usage)
    : writer_(writer), bus_(bus), store_(store), arbiter_(arbiter), usage_(usage) {}

StorageStrategy StorageBackends::place(std::uint64_t size, bool partial) {
    if (!cloud_available() || partial) {
        return StorageStrategy(LocalStorage(writer_));
    }
    const auto placement = arbiter_->try_acquire(size);
    if (placement != cloud::Placement::Cloud) {
        spdlog::debug("Placing {} byte upload: {}", size, cloud::to_string(placement));
        return StorageStrategy(LocalStorage(writer_));
    }
    return StorageStrategy(CloudStorage(writer_, *store_, *arbiter_, *usage_, bus_));
}

StorageStrategy StorageBackends::select(const UploadSession& session) {
    if (session.cloud.active && cloud_available()) {
        return StorageStrategy(CloudStorage(writer_, *store_, *arbiter_, *usage_, bus_));
    }
    return StorageStrategy(LocalStorage(writer_));
}

} // namespace nexus::upload
