#include "nexus/events/components.hpp"
#include "nexus/events/event_bus.hpp"
#include "nexus/events/events.hpp"

#include <gtest/gtest.h>

using namespace nexus::events;

TEST(MetricsComponentTest, CountsUploadLifecycle) {
    EventBus bus;
    MetricsComponent metrics(bus);

    UploadCreatedEvent fresh;
    fresh.upload_id = "u1";
    fresh.size = 10;
    bus.emit(fresh);

    UploadCreatedEvent resumed = fresh;
    resumed.resumed = true;
    bus.emit(resumed);

    ChunkAppendedEvent chunk;
    chunk.upload_id = "u1";
    chunk.previous_offset = 0;
    chunk.new_offset = 6;
    bus.emit(chunk);
    chunk.previous_offset = 6;
    chunk.new_offset = 10;
    bus.emit(chunk);

    UploadCompletedEvent completed;
    completed.upload_id = "u1";
    completed.size = 10;
    bus.emit(completed);

    FileImportedEvent imported;
    imported.upload_id = "u1";
    imported.size = 10;
    bus.emit(imported);

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.uploads_created.load(), 1u);
    EXPECT_EQ(stats.uploads_resumed.load(), 1u);
    EXPECT_EQ(stats.bytes_received.load(), 10u);
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.files_imported.load(), 1u);
    EXPECT_EQ(stats.bytes_imported.load(), 10u);
}

TEST(MetricsComponentTest, CountsMaintenanceAndFailures) {
    EventBus bus;
    MetricsComponent metrics(bus);

    FileDeduplicatedEvent dedup;
    dedup.bytes_saved = 4096;
    bus.emit(dedup);
    bus.emit(FinalizeFailedEvent{"u2", "disk full"});
    bus.emit(CloudFallbackEvent{"u3", "quota"});
    bus.emit(ReconcileCompletedEvent{});

    JanitorSweepEvent sweep;
    sweep.examined = 3;
    sweep.removed = 2;
    bus.emit(sweep);

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_deduplicated.load(), 1u);
    EXPECT_EQ(stats.bytes_saved.load(), 4096u);
    EXPECT_EQ(stats.finalize_failures.load(), 1u);
    EXPECT_EQ(stats.cloud_fallbacks.load(), 1u);
    EXPECT_EQ(stats.reconcile_runs.load(), 1u);
    EXPECT_EQ(stats.janitor_removed.load(), 2u);
}
