#include "nexus/upload/finalizer.hpp"

#include "nexus/events/events.hpp"
#include "upload_fixture.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace nexus;
using namespace nexus::upload;
using nexus::testing::read_file;
using nexus::testing::write_file;
namespace fs = std::filesystem;

class FinalizerTest : public nexus::testing::UploadFixture {
protected:
    UploadSession completed_session(const std::string& id, const std::string& filename, const std::string& content,
                                    const std::string& owner = "alice") {
        UploadSession session;
        session.id = id;
        session.fingerprint = filename + "-" + std::to_string(content.size()) + "-" + id;
        session.owner = owner;
        session.filename = filename;
        session.size = content.size();
        session.offset = content.size();
        session.status = UploadStatus::Completed;
        session.created_at = session.updated_at = unix_now();
        EXPECT_TRUE(sessions_->insert(session).is_ok());
        write_file(writer_->path_for(id), content);
        return session;
    }
};

TEST_F(FinalizerTest, DoubleFinalizeImportsOnce) {
    completed_session("u1", "a.txt", "0123456789");

    int imported_events = 0;
    int owner_notifications = 0;
    bus_.subscribe<events::FileImportedEvent>([&](const events::FileImportedEvent&) { imported_events++; });
    bus_.subscribe<events::OwnerChangedEvent>([&](const events::OwnerChangedEvent&) { owner_notifications++; });

    auto first = finalizer_->finalize("u1");
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value().imported);
    EXPECT_EQ(first.value().filename, "a.txt");

    auto second = finalizer_->finalize("u1");
    ASSERT_TRUE(second.is_ok());
    EXPECT_FALSE(second.value().imported);

    EXPECT_EQ(imported_events, 1);
    EXPECT_EQ(owner_notifications, 1);
    EXPECT_EQ(index_->list_files("alice").value().size(), 1u);

    std::size_t files = 0;
    for (const auto& entry : fs::directory_iterator(dir_ / "uploads" / "alice")) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(FinalizerTest, NameCollisionGetsSuffix) {
    write_file(owner_path("a.txt"), "existing");
    completed_session("u1", "a.txt", "new content");

    auto result = finalizer_->finalize("u1");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().filename, "a_1.txt");
    EXPECT_EQ(read_file(owner_path("a.txt")), "existing");
    EXPECT_EQ(read_file(owner_path("a_1.txt")), "new content");

    completed_session("u2", "a.txt", "third");
    EXPECT_EQ(finalizer_->finalize("u2").value().filename, "a_2.txt");
}

TEST_F(FinalizerTest, SkipsSessionsNotReadyForImport) {
    auto aborted = completed_session("u1", "a.txt", "abc");
    ASSERT_TRUE(sessions_->transition("u1", UploadStatus::Completed, UploadStatus::Aborted).value());
    EXPECT_FALSE(finalizer_->finalize("u1").value().imported);

    UploadSession partial = aborted;
    partial.id = "p1";
    partial.fingerprint = "part";
    partial.partial = true;
    ASSERT_TRUE(sessions_->insert(partial).is_ok());
    EXPECT_FALSE(finalizer_->finalize("p1").value().imported);

    EXPECT_FALSE(finalizer_->finalize("unknown").value().imported);
    EXPECT_FALSE(fs::exists(owner_path("a.txt")));
}

TEST_F(FinalizerTest, FailureReleasesClaimForRetry) {
    completed_session("u1", "a.txt", "abc", "mallory");

    std::string failure;
    bus_.subscribe<events::FinalizeFailedEvent>([&](const events::FinalizeFailedEvent& e) { failure = e.upload_id; });

    auto result = finalizer_->finalize("u1");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_EQ(failure, "u1");

    auto session = sessions_->find("u1");
    ASSERT_TRUE(session.value().has_value());
    EXPECT_EQ(session.value()->status, UploadStatus::Completed);
    EXPECT_TRUE(fs::exists(writer_->path_for("u1")));
}

TEST_F(FinalizerTest, MissingBackingFileDropsSession) {
    completed_session("u1", "a.txt", "abc");
    fs::remove(writer_->path_for("u1"));

    auto result = finalizer_->finalize("u1");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().imported);
    EXPECT_FALSE(sessions_->find("u1").value().has_value());
}

TEST_F(FinalizerTest, ReleaseInterruptedImports) {
    completed_session("u1", "a.txt", "abc");
    ASSERT_TRUE(sessions_->transition("u1", UploadStatus::Completed, UploadStatus::Imported).value());

    // A finalize attempt while claimed is a no-op.
    EXPECT_FALSE(finalizer_->finalize("u1").value().imported);

    EXPECT_EQ(finalizer_->release_interrupted(), 1u);
    auto result = finalizer_->finalize("u1");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().imported);
}

TEST(UniqueDestinationTest, NumbersBeforeExtension) {
    auto dir = nexus::testing::create_temp_dir("nexus_unique_destination");
    EXPECT_EQ(unique_destination(dir, "report.tar"), dir / "report.tar");

    write_file(dir / "report.tar", "x");
    write_file(dir / "report_1.tar", "x");
    EXPECT_EQ(unique_destination(dir, "report.tar"), dir / "report_2.tar");

    write_file(dir / "README", "x");
    EXPECT_EQ(unique_destination(dir, "README"), dir / "README_1");
    fs::remove_all(dir);
}

TEST_F(FinalizerTest, IndexRecordsFileOnDisk) {
    completed_session("u9", "dated.txt", "abc");

    // The index takes size and time from the imported file, not the session.
    const auto backing = writer_->path_for("u9");
    write_file(backing, "abcdef");
    fs::last_write_time(backing, fs::last_write_time(backing) - std::chrono::hours(48));

    auto outcome = finalizer_->finalize("u9");
    ASSERT_TRUE(outcome.is_ok());
    ASSERT_TRUE(outcome.value().imported);

    auto entry = index_->find("alice", "dated.txt");
    ASSERT_TRUE(entry.is_ok());
    ASSERT_TRUE(entry.value().has_value());
    EXPECT_EQ(entry.value()->size_bytes, 6u);
    EXPECT_EQ(entry.value()->created_at,
              storage::iso_timestamp(storage::file_mtime_unix(owner_path("dated.txt"))));
    EXPECT_NE(entry.value()->created_at, storage::iso_timestamp_now());
}
