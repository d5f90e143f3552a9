#include "nexus/cloud/arbiter.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace nexus;
using namespace nexus::cloud;

namespace {

core::CloudConfig configured_cloud() {
    core::CloudConfig config;
    config.enabled = true;
    config.endpoint = "https://acct.r2.cloudflarestorage.com";
    config.bucket = "uploads";
    config.access_key_id = "key";
    config.secret_access_key = "secret";
    config.threshold_bytes = 100;
    config.part_size_bytes = 10;
    config.max_concurrent_uploads = 2;
    config.monthly_limit_class_a = 1000;
    config.monthly_limit_class_b = 1000;
    config.monthly_limit_bytes = 10000;
    return config;
}

} // namespace

class ArbiterTest : public ::testing::Test {
protected:
    UsageCounters usage_{std::filesystem::temp_directory_path() / "nexus_arbiter_usage.json"};
};

TEST_F(ArbiterTest, UnconfiguredStaysLocal) {
    auto config = configured_cloud();
    config.secret_access_key.clear();
    Arbiter arbiter(config, usage_);
    EXPECT_EQ(arbiter.try_acquire(1'000'000), Placement::LocalNotConfigured);

    config = configured_cloud();
    config.enabled = false;
    Arbiter disabled(config, usage_);
    EXPECT_EQ(disabled.try_acquire(1'000'000), Placement::LocalNotConfigured);
}

TEST_F(ArbiterTest, ThresholdIsExclusive) {
    Arbiter arbiter(configured_cloud(), usage_);
    EXPECT_EQ(arbiter.try_acquire(100), Placement::LocalBelowThreshold);
    EXPECT_EQ(arbiter.try_acquire(101), Placement::Cloud);
    EXPECT_EQ(arbiter.active_slots(), 1u);
}

TEST_F(ArbiterTest, SlotsAreLimited) {
    Arbiter arbiter(configured_cloud(), usage_);
    EXPECT_EQ(arbiter.try_acquire(200), Placement::Cloud);
    EXPECT_EQ(arbiter.try_acquire(200), Placement::Cloud);
    EXPECT_EQ(arbiter.try_acquire(200), Placement::LocalNoSlot);

    arbiter.release();
    EXPECT_EQ(arbiter.try_acquire(200), Placement::Cloud);

    arbiter.release();
    arbiter.release();
    arbiter.release();
    EXPECT_EQ(arbiter.active_slots(), 0u);

    arbiter.adopt();
    arbiter.adopt();
    EXPECT_EQ(arbiter.try_acquire(200), Placement::LocalNoSlot);
}

TEST_F(ArbiterTest, ExpectedClassAOperations) {
    Arbiter arbiter(configured_cloud(), usage_);
    EXPECT_EQ(arbiter.expected_class_a(10), 4u);
    EXPECT_EQ(arbiter.expected_class_a(11), 5u);
    EXPECT_EQ(arbiter.expected_class_a(0), 4u);
}

TEST_F(ArbiterTest, QuotaExhaustionStaysLocal) {
    auto config = configured_cloud();

    config.monthly_limit_class_a = 30;
    usage_.record_class_a(10);
    Arbiter tight_a(config, usage_);
    EXPECT_EQ(tight_a.try_acquire(101), Placement::Cloud);
    tight_a.release();
    EXPECT_EQ(tight_a.try_acquire(200), Placement::LocalQuotaExhausted);

    config = configured_cloud();
    config.monthly_limit_bytes = 150;
    Arbiter tight_storage(config, usage_);
    EXPECT_EQ(tight_storage.try_acquire(151), Placement::LocalQuotaExhausted);

    config = configured_cloud();
    config.monthly_limit_class_b = 1;
    usage_.record_class_b();
    Arbiter tight_b(config, usage_);
    EXPECT_EQ(tight_b.try_acquire(200), Placement::LocalQuotaExhausted);
    EXPECT_EQ(tight_b.active_slots(), 0u);
}
