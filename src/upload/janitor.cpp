#include "nexus/upload/janitor.hpp"

#include "nexus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace nexus::upload {
namespace fs = std::filesystem;

Janitor::Janitor(SessionStore& sessions, StorageBackends& backends, events::EventBus& bus,
                 std::chrono::seconds retention)
    : sessions_(sessions), backends_(backends), bus_(bus), retention_(retention) {}

SweepStats Janitor::sweep(std::int64_t now_unix, const std::atomic<bool>* stop) {
    SweepStats stats;
    const std::int64_t cutoff = now_unix - static_cast<std::int64_t>(retention_.count());

    auto stale = sessions_.list_created_before(cutoff);
    if (stale.is_error()) {
        spdlog::error("Janitor: cannot list sessions: {}", stale.error().message);
        ++stats.failed;
        return stats;
    }

    for (auto& session : stale.value()) {
        if (stop && stop->load()) {
            spdlog::info("Janitor: stopping early after {} sessions", stats.examined);
            break;
        }
        ++stats.examined;

        auto strategy = backends_.select(session);
        if (auto cleaned = strategy.abort(session); cleaned.is_error()) {
            ++stats.failed;
            spdlog::warn("Janitor: upload {}: {}", session.id, cleaned.error().message);
            continue;
        }
        if (auto removed = sessions_.remove(session.id); removed.is_error()) {
            ++stats.failed;
            spdlog::warn("Janitor: upload {}: {}", session.id, removed.error().message);
            continue;
        }
        ++stats.removed;

        events::UploadAbortedEvent event;
        event.upload_id = session.id;
        event.reason = "janitor";
        bus_.emit(event);
    }

    if (!(stop && stop->load())) {
        stats.orphans_removed = sweep_orphans(cutoff, stop);
    }

    events::JanitorSweepEvent event;
    event.examined = stats.examined;
    event.removed = stats.removed;
    event.failed = stats.failed;
    bus_.emit(event);
    return stats;
}

std::size_t Janitor::sweep_orphans(std::int64_t cutoff, const std::atomic<bool>* stop) {
    const fs::path& root = backends_.writer().temp_root();
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return 0;
    }

    const auto cutoff_time = fs::file_time_type::clock::now() -
        std::chrono::seconds(unix_now() - cutoff);

    std::size_t removed = 0;
    for (auto it = fs::directory_iterator(root, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (stop && stop->load()) {
            break;
        }
        if (!it->is_regular_file(ec) || it->last_write_time(ec) >= cutoff_time || ec) {
            continue;
        }

        const std::string id = it->path().stem().string();
        auto known = sessions_.find(id);
        if (known.is_error() || known.value()) {
            continue;
        }
        std::error_code rm;
        if (fs::remove(it->path(), rm)) {
            ++removed;
        } else if (rm) {
            spdlog::warn("Janitor: cannot remove orphan {}: {}", it->path().string(), rm.message());
        }
    }
    if (removed > 0) {
        spdlog::info("Janitor: removed {} orphaned temp files", removed);
    }
    return removed;
}

} // namespace nexus::upload
