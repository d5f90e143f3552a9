/**
 * @file janitor.hpp
 * @brief Removes abandoned upload sessions and their temp files
 *
 * A session is removed exactly when now - created_at > retention and it
 * never reached `imported`. Younger sessions are never touched. A failure
 * on one session is counted and the sweep moves on; the record stays so
 * the next sweep retries it.
 */

#pragma once

#include "nexus/events/event_bus.hpp"
#include "nexus/upload/session_store.hpp"
#include "nexus/upload/storage_strategy.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace nexus::upload {

struct SweepStats {
    std::size_t examined = 0;
    std::size_t removed = 0;
    std::size_t failed = 0;
    std::size_t orphans_removed = 0;   // temp files without a session record
};

class Janitor {
public:
    Janitor(SessionStore& sessions, StorageBackends& backends, events::EventBus& bus, std::chrono::seconds retention);

    SweepStats sweep(std::int64_t now_unix, const std::atomic<bool>* stop = nullptr);

    std::chrono::seconds retention() const { return retention_; }

private:
    std::size_t sweep_orphans(std::int64_t cutoff, const std::atomic<bool>* stop);

    SessionStore& sessions_;
    StorageBackends& backends_;
    events::EventBus& bus_;
    std::chrono::seconds retention_;
};

} // namespace nexus::upload
