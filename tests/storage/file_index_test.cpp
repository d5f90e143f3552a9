#include "nexus/storage/file_index.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>

using namespace nexus;
using namespace nexus::storage;
namespace fs = std::filesystem;

namespace {

fs::path create_temp_dir() {
    static std::atomic<int> counter{0};
    auto dir = fs::temp_directory_path() / ("nexus_file_index_test_" + std::to_string(counter++));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

FileIndexEntry entry(const std::string& owner, const std::string& filename, std::uint64_t size) {
    FileIndexEntry e;
    e.owner = owner;
    e.filename = filename;
    e.size_bytes = size;
    e.created_at = iso_timestamp(1714564800);
    return e;
}

} // namespace

class FileIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = create_temp_dir();
        db_ = std::make_unique<Database>(dir_ / "index.db");
        index_ = std::make_unique<FileIndex>(*db_);
    }

    void TearDown() override {
        index_.reset();
        db_.reset();
        fs::remove_all(dir_);
    }

    fs::path dir_;
    std::unique_ptr<Database> db_;
    std::unique_ptr<FileIndex> index_;
};

TEST_F(FileIndexTest, UpsertInsertsThenRefreshes) {
    ASSERT_TRUE(index_->upsert(entry("alice", "a.txt", 10)).is_ok());
    ASSERT_TRUE(index_->upsert(entry("alice", "a.txt", 12)).is_ok());

    auto files = index_->list_files("alice");
    ASSERT_TRUE(files.is_ok());
    ASSERT_EQ(files.value().size(), 1u);
    EXPECT_EQ(files.value()[0].size_bytes, 12u);
    EXPECT_EQ(files.value()[0].created_at, "2024-05-01T12:00:00Z");
    EXPECT_FALSE(files.value()[0].locked);
    EXPECT_FALSE(files.value()[0].folder_id.has_value());
}

TEST_F(FileIndexTest, FilenamesAreScopedPerOwner) {
    ASSERT_TRUE(index_->upsert(entry("alice", "a.txt", 1)).is_ok());
    ASSERT_TRUE(index_->upsert(entry("bob", "a.txt", 2)).is_ok());

    auto owners = index_->list_owners();
    ASSERT_TRUE(owners.is_ok());
    EXPECT_EQ(owners.value(), (std::vector<std::string>{"alice", "bob"}));

    auto found = index_->find("bob", "a.txt");
    ASSERT_TRUE(found.is_ok());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->size_bytes, 2u);
}

TEST_F(FileIndexTest, ListIsOrderedByFilename) {
    ASSERT_TRUE(index_->upsert(entry("alice", "z.bin", 1)).is_ok());
    ASSERT_TRUE(index_->upsert(entry("alice", "docs/b.txt", 1)).is_ok());
    ASSERT_TRUE(index_->upsert(entry("alice", "a.txt", 1)).is_ok());

    auto files = index_->list_files("alice");
    ASSERT_TRUE(files.is_ok());
    ASSERT_EQ(files.value().size(), 3u);
    EXPECT_EQ(files.value()[0].filename, "a.txt");
    EXPECT_EQ(files.value()[1].filename, "docs/b.txt");
    EXPECT_EQ(files.value()[2].filename, "z.bin");
}

TEST_F(FileIndexTest, RemoveAndUsage) {
    ASSERT_TRUE(index_->upsert(entry("alice", "a.txt", 10)).is_ok());
    ASSERT_TRUE(index_->upsert(entry("alice", "b.txt", 32)).is_ok());

    auto usage = index_->usage_bytes("alice");
    ASSERT_TRUE(usage.is_ok());
    EXPECT_EQ(usage.value(), 42u);

    ASSERT_TRUE(index_->remove("alice", "a.txt").is_ok());
    auto gone = index_->find("alice", "a.txt");
    ASSERT_TRUE(gone.is_ok());
    EXPECT_FALSE(gone.value().has_value());

    EXPECT_EQ(index_->usage_bytes("alice").value(), 32u);
    EXPECT_EQ(index_->usage_bytes("nobody").value(), 0u);
}

TEST_F(FileIndexTest, ApplyDiffInsertsAndDeletes) {
    ASSERT_TRUE(index_->upsert(entry("alice", "old.txt", 5)).is_ok());

    auto applied = index_->apply_diff("alice", {entry("alice", "new.txt", 7)}, {"old.txt"});
    ASSERT_TRUE(applied.is_ok());

    auto files = index_->list_files("alice");
    ASSERT_TRUE(files.is_ok());
    ASSERT_EQ(files.value().size(), 1u);
    EXPECT_EQ(files.value()[0].filename, "new.txt");
}

TEST(IsoTimestampTest, FormatsUtc) {
    EXPECT_EQ(iso_timestamp(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(iso_timestamp_now().size(), 20u);
}
