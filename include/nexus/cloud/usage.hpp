/**
 * @file usage.hpp
 * @brief Monthly cloud usage counters with period rollover
 *
 * Class A operations are writes (multipart create, part upload, complete,
 * abort, delete); class B operations are reads (download). storage_bytes
 * tracks what currently sits in the bucket and drops again when an
 * object is deleted right after ingest.
 *
 * Every accessor first compares the stored period with the clock's
 * current period and resets all counters when they differ. The counters
 * are persisted by flush(), which only writes when something changed.
 */

#pragma once

#include "nexus/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>

namespace nexus::cloud {

struct UsageSnapshot {
    std::string period;   // YYYY-MM, UTC
    std::uint64_t class_a_ops = 0;
    std::uint64_t class_b_ops = 0;
    std::uint64_t bytes_transited = 0;
    std::uint64_t storage_bytes = 0;
};

class UsageCounters {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit UsageCounters(std::filesystem::path file, Clock clock = [] { return std::chrono::system_clock::now(); });

    // A missing file starts a fresh period.
    Result<void, Error> load();

    // Returns true when the file was written.
    Result<bool, Error> flush();

    void record_class_a(std::uint64_t ops = 1);
    void record_class_b(std::uint64_t ops = 1);
    void record_transit(std::uint64_t bytes);
    void add_storage(std::uint64_t bytes);
    void release_storage(std::uint64_t bytes);

    UsageSnapshot snapshot();

    static std::string period_of(std::chrono::system_clock::time_point tp);

private:
    void roll_over_locked();

    std::filesystem::path file_;
    Clock clock_;
    std::mutex mutex_;
    UsageSnapshot counters_;
    bool dirty_ = false;
};

} // namespace nexus::cloud
