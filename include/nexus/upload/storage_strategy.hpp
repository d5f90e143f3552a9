/**
 * @file storage_strategy.hpp
 * @brief Where an upload's bytes go: local chunk writes or cloud multipart
 *
 * The backend is chosen once per upload and carried on the session
 * (session.cloud.active). UploadService and Finalizer only talk to
 * StorageStrategy and never branch on the backend themselves.
 *
 * CLOUD BACKEND:
 * Bytes are always written locally first, then shipped as multipart parts
 * once a full part is buffered. On completion the object is assembled in
 * the bucket, downloaded over the local backing file and deleted. Any
 * cloud error aborts the multipart upload and the session continues as a
 * local one; the local copy is complete at every step, so nothing is lost.
 */

#pragma once

#include "nexus/cloud/arbiter.hpp"
#include "nexus/cloud/object_store.hpp"
#include "nexus/cloud/usage.hpp"
#include "nexus/core/error.hpp"
#include "nexus/events/event_bus.hpp"
#include "nexus/upload/chunk_writer.hpp"
#include "nexus/upload/session.hpp"

#include <cstddef>
#include <cstdint>
#include <variant>

namespace nexus::upload {

class LocalStorage {
public:
    explicit LocalStorage(ChunkWriter& writer) : writer_(writer) {}

    Result<void, Error> begin(UploadSession& session);
    Result<std::uint64_t, Error> append(UploadSession& session, const char* data, std::size_t len);
    Result<void, Error> complete(UploadSession& session);
    Result<void, Error> abort(UploadSession& session);

private:
    ChunkWriter& writer_;
};

class CloudStorage {
public:
    CloudStorage(ChunkWriter& writer,
                 cloud::ObjectStore& store,
                 cloud::Arbiter& arbiter,
                 cloud::UsageCounters& usage,
                 events::EventBus& bus);

    // Expects the caller to hold an arbiter slot; it is released on fallback.
    Result<void, Error> begin(UploadSession& session);
    Result<std::uint64_t, Error> append(UploadSession& session, const char* data, std::size_t len);
    Result<void, Error> complete(UploadSession& session);
    Result<void, Error> abort(UploadSession& session);

private:
    // Ship whole parts of [uploaded_bytes, available); with `tail` also the remainder.
    Result<void, Error> upload_parts(UploadSession& session, std::uint64_t available, bool tail);
    Result<void, Error> materialize(UploadSession& session);
    void fall_back(UploadSession& session, const std::string& reason);

    ChunkWriter& writer_;
    cloud::ObjectStore& store_;
    cloud::Arbiter& arbiter_;
    cloud::UsageCounters& usage_;
    events::EventBus& bus_;
};

class StorageStrategy {
public:
    using Backend = std::variant<LocalStorage, CloudStorage>;

    explicit StorageStrategy(Backend backend) : backend_(std::move(backend)) {}

    Result<void, Error> begin(UploadSession& session);
    Result<std::uint64_t, Error> append(UploadSession& session, const char* data, std::size_t len);
    Result<void, Error> complete(UploadSession& session);
    Result<void, Error> abort(UploadSession& session);

    bool is_cloud() const { return std::holds_alternative<CloudStorage>(backend_); }

private:
    Backend backend_;
};

/**
 * @brief Builds the strategy for a session
 *
 * The cloud pointers are null when no cloud backend is configured; every
 * session is then local.
 */
class StorageBackends {
public:
    StorageBackends(ChunkWriter& writer,
                    events::EventBus& bus,
                    cloud::ObjectStore* store = nullptr,
                    cloud::Arbiter* arbiter = nullptr,
                    cloud::UsageCounters* usage = nullptr);

    // Strategy for a new upload; takes an arbiter slot when placing it in the cloud.
    StorageStrategy place(std::uint64_t size, bool partial);

    // Strategy for an existing session, following its recorded backend.
    StorageStrategy select(const UploadSession& session);

    cloud::Arbiter* arbiter() { return arbiter_; }
    ChunkWriter& writer() { return writer_; }

private:
    bool cloud_available() const { return store_ && arbiter_ && usage_; }

    ChunkWriter& writer_;
    events::EventBus& bus_;
    cloud::ObjectStore* store_;
    cloud::Arbiter* arbiter_;
    cloud::UsageCounters* usage_;
};

} // namespace nexus::upload
