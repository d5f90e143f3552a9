/**
 * @file arbiter.hpp
 * @brief Decides whether an upload goes through the cloud or stays local
 *
 * An upload is offloaded only when all of these hold:
 * - a cloud backend is fully configured
 * - the declared size exceeds the threshold
 * - one of max_concurrent_uploads slots is free
 * - the month's class A, class B and storage quotas have room for it
 *
 * Anything else means "local". The arbiter never fails an upload.
 */

#pragma once

#include "nexus/cloud/usage.hpp"
#include "nexus/core/config.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>

namespace nexus::cloud {

enum class Placement {
    Cloud,
    LocalNotConfigured,
    LocalBelowThreshold,
    LocalNoSlot,
    LocalQuotaExhausted
};

const char* to_string(Placement placement) noexcept;

class Arbiter {
public:
    Arbiter(core::CloudConfig config, UsageCounters& usage);

    /**
     * @brief Evaluate and, when the answer is Cloud, take a slot
     *
     * The caller owns the slot and must release() it when the upload
     * completes, aborts or falls back to local.
     */
    Placement try_acquire(std::uint64_t size);

    void release();

    // Count a slot held by a cloud upload that survived a restart.
    void adopt();

    std::size_t active_slots() const;

    // Class A operations a cloud upload of this size will consume.
    std::uint64_t expected_class_a(std::uint64_t size) const;

    const core::CloudConfig& config() const { return config_; }

private:
    core::CloudConfig config_;
    UsageCounters& usage_;
    mutable std::mutex mutex_;
    std::size_t active_ = 0;
};

} // namespace nexus::cloud
