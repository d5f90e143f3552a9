/**
 * @file events.hpp
 * @brief Event type definitions for the upload pipeline
 *
 * NAMING CONVENTION:
 * Events are past-tense: UploadCreatedEvent, FileImportedEvent
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace nexus::events {

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted by UploadService::create
 *
 * `resumed` is set when an active session with the same fingerprint
 * was returned instead of creating a new one.
 */
struct UploadCreatedEvent {
    std::string upload_id;
    std::string owner;
    std::string filename;
    std::uint64_t size = 0;
    std::uint64_t offset = 0;
    bool resumed = false;
    bool cloud = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ChunkAppendedEvent {
    std::string upload_id;
    std::uint64_t previous_offset = 0;
    std::uint64_t new_offset = 0;
    std::uint64_t size = 0;
    bool truncated = false;   // body ended before Content-Length
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadCompletedEvent {
    std::string upload_id;
    std::string owner;
    std::uint64_t size = 0;
    bool partial = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadAbortedEvent {
    std::string upload_id;
    std::string reason;   // "client", "janitor"
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Storage Events
// ════════════════════════════════════════════════════════

struct FileImportedEvent {
    std::string upload_id;
    std::string owner;
    std::string filename;
    std::uint64_t size = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FinalizeFailedEvent {
    std::string upload_id;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileDeduplicatedEvent {
    std::string path;
    std::string canonical_path;
    std::string hash;
    std::uint64_t bytes_saved = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ReconcileCompletedEvent {
    std::size_t owners_scanned = 0;
    std::size_t inserted = 0;
    std::size_t deleted = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct JanitorSweepEvent {
    std::size_t examined = 0;
    std::size_t removed = 0;
    std::size_t failed = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when something in an owner's storage changed
 *
 * WHO EMITS: EventBusNotifier (the NotifyOwnerChanged collaborator)
 * WHO SUBSCRIBES: push-notification bridges outside this process
 */
struct OwnerChangedEvent {
    std::string owner;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Cloud Events
// ════════════════════════════════════════════════════════

struct CloudFallbackEvent {
    std::string upload_id;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct CloudTransferCompletedEvent {
    std::string upload_id;
    std::uint64_t bytes = 0;
    std::size_t parts = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    uint16_t port;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerStartedEvent(uint16_t p)
        : port(p),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace nexus::events
