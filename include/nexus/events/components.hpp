/**
 * @file components.hpp
 * @brief Event-driven components attached to the bus in main()
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "nexus/events/event_bus.hpp"
#include "nexus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace nexus::events {

/**
 * @brief Logger component - turns pipeline events into log lines
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadCreatedEvent>([](const UploadCreatedEvent& e) {
            spdlog::info("[UploadCreated] id={} owner={} file={} size={} offset={} resumed={} cloud={}",
                         e.upload_id, e.owner, e.filename, e.size, e.offset, e.resumed, e.cloud);
        });

        bus_.subscribe<ChunkAppendedEvent>([](const ChunkAppendedEvent& e) {
            spdlog::debug("[ChunkAppended] id={} offset={}->{} of {}{}",
                          e.upload_id, e.previous_offset, e.new_offset, e.size,
                          e.truncated ? " (truncated body)" : "");
        });

        bus_.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] id={} owner={} size={} partial={}",
                         e.upload_id, e.owner, e.size, e.partial);
        });

        bus_.subscribe<UploadAbortedEvent>([](const UploadAbortedEvent& e) {
            spdlog::info("[UploadAborted] id={} reason={}", e.upload_id, e.reason);
        });

        bus_.subscribe<FileImportedEvent>([](const FileImportedEvent& e) {
            spdlog::info("[FileImported] id={} owner={} file={} size={} duration={}ms",
                         e.upload_id, e.owner, e.filename, e.size, e.duration.count());
        });

        bus_.subscribe<FinalizeFailedEvent>([](const FinalizeFailedEvent& e) {
            spdlog::error("[FinalizeFailed] id={} error={}", e.upload_id, e.error_message);
        });

        bus_.subscribe<FileDeduplicatedEvent>([](const FileDeduplicatedEvent& e) {
            spdlog::info("[Deduplicated] {} -> {} saved={} hash={}",
                         e.path, e.canonical_path, e.bytes_saved, e.hash);
        });

        bus_.subscribe<ReconcileCompletedEvent>([](const ReconcileCompletedEvent& e) {
            spdlog::info("[Reconcile] owners={} inserted={} deleted={} duration={}ms",
                         e.owners_scanned, e.inserted, e.deleted, e.duration.count());
        });

        bus_.subscribe<JanitorSweepEvent>([](const JanitorSweepEvent& e) {
            spdlog::info("[Janitor] examined={} removed={} failed={}", e.examined, e.removed, e.failed);
        });

        bus_.subscribe<CloudFallbackEvent>([](const CloudFallbackEvent& e) {
            spdlog::warn("[CloudFallback] id={} reason={}", e.upload_id, e.reason);
        });

        bus_.subscribe<CloudTransferCompletedEvent>([](const CloudTransferCompletedEvent& e) {
            spdlog::info("[CloudTransfer] id={} bytes={} parts={}", e.upload_id, e.bytes, e.parts);
        });

        bus_.subscribe<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Upload server started on port {}", e.port);
            spdlog::info("════════════════════════════════════════════");
        });

        bus_.subscribe<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Server shutting down: {}", e.reason);
            spdlog::info("════════════════════════════════════════════");
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Metrics component - tracks pipeline counters
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_created{0};
        std::atomic<uint64_t> uploads_resumed{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_aborted{0};
        std::atomic<uint64_t> files_imported{0};
        std::atomic<uint64_t> bytes_imported{0};
        std::atomic<uint64_t> finalize_failures{0};
        std::atomic<uint64_t> files_deduplicated{0};
        std::atomic<uint64_t> bytes_saved{0};
        std::atomic<uint64_t> cloud_fallbacks{0};
        std::atomic<uint64_t> reconcile_runs{0};
        std::atomic<uint64_t> janitor_removed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadCreatedEvent>([this](const UploadCreatedEvent& e) {
            if (e.resumed) {
                stats_.uploads_resumed++;
            } else {
                stats_.uploads_created++;
            }
        });

        bus_.subscribe<ChunkAppendedEvent>([this](const ChunkAppendedEvent& e) {
            stats_.bytes_received += e.new_offset - e.previous_offset;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        });

        bus_.subscribe<UploadAbortedEvent>([this](const UploadAbortedEvent&) {
            stats_.uploads_aborted++;
        });

        bus_.subscribe<FileImportedEvent>([this](const FileImportedEvent& e) {
            stats_.files_imported++;
            stats_.bytes_imported += e.size;
        });

        bus_.subscribe<FinalizeFailedEvent>([this](const FinalizeFailedEvent&) {
            stats_.finalize_failures++;
        });

        bus_.subscribe<FileDeduplicatedEvent>([this](const FileDeduplicatedEvent& e) {
            stats_.files_deduplicated++;
            stats_.bytes_saved += e.bytes_saved;
        });

        bus_.subscribe<CloudFallbackEvent>([this](const CloudFallbackEvent&) {
            stats_.cloud_fallbacks++;
        });

        bus_.subscribe<ReconcileCompletedEvent>([this](const ReconcileCompletedEvent&) {
            stats_.reconcile_runs++;
        });

        bus_.subscribe<JanitorSweepEvent>([this](const JanitorSweepEvent& e) {
            stats_.janitor_removed += e.removed;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Uploads created:   {}", stats_.uploads_created.load());
        spdlog::info("  Uploads resumed:   {}", stats_.uploads_resumed.load());
        spdlog::info("  Bytes received:    {}", stats_.bytes_received.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads aborted:   {}", stats_.uploads_aborted.load());
        spdlog::info("  Files imported:    {}", stats_.files_imported.load());
        spdlog::info("  Bytes imported:    {}", stats_.bytes_imported.load());
        spdlog::info("  Finalize failures: {}", stats_.finalize_failures.load());
        spdlog::info("  Deduplicated:      {}", stats_.files_deduplicated.load());
        spdlog::info("  Bytes saved:       {}", stats_.bytes_saved.load());
        spdlog::info("  Cloud fallbacks:   {}", stats_.cloud_fallbacks.load());
        spdlog::info("  Reconcile runs:    {}", stats_.reconcile_runs.load());
        spdlog::info("  Janitor removed:   {}", stats_.janitor_removed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace nexus::events
