#include "nexus/cloud/arbiter.hpp"

#include <spdlog/spdlog.h>

namespace nexus::cloud {

const char* to_string(Placement placement) noexcept {
    switch (placement) {
        case Placement::Cloud: return "cloud";
        case Placement::LocalNotConfigured: return "local (cloud not configured)";
        case Placement::LocalBelowThreshold: return "local (below threshold)";
        case Placement::LocalNoSlot: return "local (no free cloud slot)";
        case Placement::LocalQuotaExhausted: return "local (monthly quota exhausted)";
    }
    return "local";
}

Arbiter::Arbiter(core::CloudConfig config, UsageCounters& usage)
    : config_(std::move(config)), usage_(usage) {}

std::uint64_t Arbiter::expected_class_a(std::uint64_t size) const {
    const std::uint64_t part = config_.part_size_bytes == 0 ? 1 : config_.part_size_bytes;
    const std::uint64_t parts = size == 0 ? 1 : (size + part - 1) / part;
    // create + parts + complete + delete
    return parts + 3;
}

Placement Arbiter::try_acquire(std::uint64_t size) {
    if (!config_.configured()) {
        return Placement::LocalNotConfigured;
    }
    if (size <= config_.threshold_bytes) {
        return Placement::LocalBelowThreshold;
    }

    const auto usage = usage_.snapshot();
    if (usage.class_a_ops + expected_class_a(size) > config_.monthly_limit_class_a ||
        usage.class_b_ops + 1 > config_.monthly_limit_class_b ||
        usage.storage_bytes + size > config_.monthly_limit_bytes) {
        spdlog::warn("Cloud quota for {} would be exceeded by a {} byte upload (A {}/{}, B {}/{}, storage {}/{})",
                     usage.period, size,
                     usage.class_a_ops, config_.monthly_limit_class_a,
                     usage.class_b_ops, config_.monthly_limit_class_b,
                     usage.storage_bytes, config_.monthly_limit_bytes);
        return Placement::LocalQuotaExhausted;
    }

    std::lock_guard lock(mutex_);
    if (active_ >= config_.max_concurrent_uploads) {
        return Placement::LocalNoSlot;
    }
    ++active_;
    return Placement::Cloud;
}

void Arbiter::release() {
    std::lock_guard lock(mutex_);
    if (active_ > 0) {
        --active_;
    }
}

void Arbiter::adopt() {
    std::lock_guard lock(mutex_);
    ++active_;
}

std::size_t Arbiter::active_slots() const {
    std::lock_guard lock(mutex_);
    return active_;
}

} // namespace nexus::cloud
