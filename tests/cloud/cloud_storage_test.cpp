#include "nexus/upload/storage_strategy.hpp"

#include "nexus/events/events.hpp"
#include "nexus/upload/janitor.hpp"
#include "upload_fixture.hpp"

#include <gtest/gtest.h>

#include <map>

using namespace nexus;
using namespace nexus::upload;
using nexus::testing::read_file;
using nexus::testing::write_file;
namespace fs = std::filesystem;

namespace {

/**
 * ObjectStore keeping multipart uploads and objects in memory, with
 * switches to make individual operations fail.
 */
class MemoryObjectStore : public cloud::ObjectStore {
public:
    Result<std::string, Error> create_multipart(const std::string& key, const std::string&) override {
        if (fail_create) {
            return Fail<std::string>(ErrorCode::StorageFailure, "create refused");
        }
        const std::string id = "mp-" + std::to_string(++next_id_);
        multipart_[id] = {};
        return Ok<std::string, Error>(id);
    }

    Result<std::string, Error> upload_part(const std::string&, const std::string& upload_id,
                                           int part_number, const std::string& data) override {
        if (fail_part == part_number) {
            return Fail<std::string>(ErrorCode::StorageFailure, "part refused");
        }
        auto it = multipart_.find(upload_id);
        if (it == multipart_.end()) {
            return Fail<std::string>(ErrorCode::NotFound, "no such upload");
        }
        it->second[part_number] = data;
        part_sizes.push_back(data.size());
        return Ok<std::string, Error>("\"etag-" + std::to_string(part_number) + "\"");
    }

    Result<void, Error> complete_multipart(const std::string& key, const std::string& upload_id,
                                           const cloud::CompletedParts& parts) override {
        auto it = multipart_.find(upload_id);
        if (it == multipart_.end()) {
            return Fail<void>(ErrorCode::NotFound, "no such upload");
        }
        std::string object;
        for (const auto& [number, etag] : parts) {
            object += it->second.at(number);
        }
        objects[key] = object;
        multipart_.erase(it);
        return Done();
    }

    Result<void, Error> abort_multipart(const std::string&, const std::string& upload_id) override {
        ++aborted;
        multipart_.erase(upload_id);
        return Done();
    }

    Result<void, Error> download(const std::string& key, const fs::path& destination) override {
        if (fail_download) {
            return Fail<void>(ErrorCode::StorageFailure, "download refused");
        }
        auto it = objects.find(key);
        if (it == objects.end()) {
            return Fail<void>(ErrorCode::NotFound, "no such key");
        }
        write_file(destination, it->second);
        return Done();
    }

    Result<void, Error> remove(const std::string& key) override {
        ++removed;
        objects.erase(key);
        return Done();
    }

    std::size_t open_multiparts() const { return multipart_.size(); }

    bool fail_create = false;
    int fail_part = 0;
    bool fail_download = false;

    int aborted = 0;
    int removed = 0;
    std::vector<std::size_t> part_sizes;
    std::map<std::string, std::string> objects;

private:
    int next_id_ = 0;
    std::map<std::string, std::map<int, std::string>> multipart_;
};

} // namespace

class CloudStorageTest : public nexus::testing::UploadFixture {
protected:
    void SetUp() override {
        UploadFixture::SetUp();

        core::CloudConfig config;
        config.enabled = true;
        config.endpoint = "https://acct.r2.cloudflarestorage.com";
        config.bucket = "uploads";
        config.access_key_id = "key";
        config.secret_access_key = "secret";
        config.threshold_bytes = 8;
        config.part_size_bytes = 4;
        config.max_concurrent_uploads = 1;

        usage_ = std::make_unique<cloud::UsageCounters>(dir_ / "cloud_usage.json");
        arbiter_ = std::make_unique<cloud::Arbiter>(config, *usage_);

        service_.reset();
        backends_ = std::make_unique<StorageBackends>(*writer_, bus_, &store_, arbiter_.get(), usage_.get());
        make_service(0);

        bus_.subscribe<events::CloudFallbackEvent>([this](const events::CloudFallbackEvent& e) {
            fallbacks.push_back(e.reason);
        });
    }

    void TearDown() override {
        service_.reset();
        backends_.reset();
        arbiter_.reset();
        usage_.reset();
        UploadFixture::TearDown();
    }

    MemoryObjectStore store_;
    std::unique_ptr<cloud::UsageCounters> usage_;
    std::unique_ptr<cloud::Arbiter> arbiter_;
    std::vector<std::string> fallbacks;
};

TEST_F(CloudStorageTest, LargeUploadTransitsCloudAndLandsLocally) {
    auto session = create_upload("big.bin", 10);
    EXPECT_TRUE(session.cloud.active);
    EXPECT_EQ(arbiter_->active_slots(), 1u);

    ASSERT_TRUE(append(session.id, 0, "0123").is_ok());
    EXPECT_EQ(store_.part_sizes.size(), 1u);

    auto stored = sessions_->find(session.id);
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value()->cloud.uploaded_bytes, 4u);

    std::size_t transferred_parts = 0;
    bus_.subscribe<events::CloudTransferCompletedEvent>([&](const events::CloudTransferCompletedEvent& e) {
        transferred_parts = e.parts;
    });

    ASSERT_TRUE(append(session.id, 4, "456789").is_ok());

    EXPECT_EQ(store_.part_sizes, (std::vector<std::size_t>{4, 4, 2}));
    EXPECT_EQ(transferred_parts, 3u);
    EXPECT_EQ(read_file(owner_path("big.bin")), "0123456789");
    EXPECT_TRUE(store_.objects.empty());
    EXPECT_TRUE(fallbacks.empty());
    EXPECT_EQ(arbiter_->active_slots(), 0u);

    auto usage = usage_->snapshot();
    EXPECT_EQ(usage.class_a_ops, arbiter_->expected_class_a(10));
    EXPECT_EQ(usage.class_b_ops, 1u);
    EXPECT_EQ(usage.bytes_transited, 20u);
    EXPECT_EQ(usage.storage_bytes, 0u);
}

TEST_F(CloudStorageTest, SmallAndPartialUploadsStayLocal) {
    auto small = create_upload("small.bin", 8);
    EXPECT_FALSE(small.cloud.active);

    auto request = request_for("part.bin", 100);
    request.concat.partial = true;
    auto partial = service_->create(request);
    ASSERT_TRUE(partial.is_ok());
    EXPECT_FALSE(partial.value().session.cloud.active);

    EXPECT_EQ(arbiter_->active_slots(), 0u);
    EXPECT_EQ(usage_->snapshot().class_a_ops, 0u);
}

TEST_F(CloudStorageTest, BusySlotPlacesLocally) {
    auto first = create_upload("one.bin", 10);
    auto second = create_upload("two.bin", 10);
    EXPECT_TRUE(first.cloud.active);
    EXPECT_FALSE(second.cloud.active);
}

TEST_F(CloudStorageTest, FailedCreateFallsBackAtOnce) {
    store_.fail_create = true;

    auto session = create_upload("big.bin", 10);
    EXPECT_FALSE(session.cloud.active);
    EXPECT_EQ(fallbacks.size(), 1u);
    EXPECT_EQ(arbiter_->active_slots(), 0u);

    ASSERT_TRUE(append(session.id, 0, "0123456789").is_ok());
    EXPECT_EQ(read_file(owner_path("big.bin")), "0123456789");
}

TEST_F(CloudStorageTest, FailedPartContinuesLocally) {
    store_.fail_part = 2;
    auto session = create_upload("big.bin", 10);

    ASSERT_TRUE(append(session.id, 0, "0123").is_ok());
    auto second = append(session.id, 4, "4567");
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().offset, 8u);

    EXPECT_EQ(fallbacks.size(), 1u);
    EXPECT_EQ(store_.aborted, 1);
    EXPECT_EQ(store_.open_multiparts(), 0u);
    EXPECT_EQ(arbiter_->active_slots(), 0u);
    EXPECT_FALSE(sessions_->find(session.id).value()->cloud.active);

    ASSERT_TRUE(append(session.id, 8, "89").is_ok());
    EXPECT_EQ(read_file(owner_path("big.bin")), "0123456789");
}

TEST_F(CloudStorageTest, FailedDownloadKeepsLocalCopy) {
    store_.fail_download = true;
    auto session = create_upload("big.bin", 10);

    ASSERT_TRUE(append(session.id, 0, "0123456789").is_ok());

    EXPECT_EQ(fallbacks.size(), 1u);
    EXPECT_EQ(store_.removed, 1);
    EXPECT_TRUE(store_.objects.empty());
    EXPECT_EQ(usage_->snapshot().storage_bytes, 0u);
    EXPECT_EQ(arbiter_->active_slots(), 0u);
    EXPECT_EQ(read_file(owner_path("big.bin")), "0123456789");
}

TEST_F(CloudStorageTest, CancelAbortsMultipart) {
    auto session = create_upload("big.bin", 10);
    ASSERT_TRUE(append(session.id, 0, "0123").is_ok());

    ASSERT_TRUE(service_->cancel(session.id).is_ok());
    EXPECT_EQ(store_.aborted, 1);
    EXPECT_EQ(store_.open_multiparts(), 0u);
    EXPECT_EQ(arbiter_->active_slots(), 0u);
    EXPECT_FALSE(fs::exists(writer_->path_for(session.id)));
}

TEST_F(CloudStorageTest, RecoveryAdoptsCloudSlots) {
    auto session = create_upload("big.bin", 10);
    ASSERT_TRUE(session.cloud.active);

    // A restart loses the in-memory slot count.
    arbiter_->release();
    ASSERT_EQ(arbiter_->active_slots(), 0u);

    service_->recover_pending();
    EXPECT_EQ(arbiter_->active_slots(), 1u);
}

TEST_F(CloudStorageTest, JanitorAbortsStaleMultipart) {
    auto session = create_upload("big.bin", 10);
    ASSERT_TRUE(append(session.id, 0, "0123").is_ok());
    const auto class_a_before = usage_->snapshot().class_a_ops;

    Janitor janitor(*sessions_, *backends_, bus_, std::chrono::seconds(3600));
    auto stats = janitor.sweep(unix_now() + 7200);

    EXPECT_EQ(stats.removed, 1u);
    EXPECT_EQ(store_.aborted, 1);
    EXPECT_EQ(store_.open_multiparts(), 0u);
    EXPECT_EQ(usage_->snapshot().class_a_ops, class_a_before + 1);
    EXPECT_EQ(arbiter_->active_slots(), 0u);
    EXPECT_FALSE(sessions_->find(session.id).value().has_value());
}
