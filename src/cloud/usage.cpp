#include "nexus/cloud/usage.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <sstream>

namespace nexus::cloud {

using json = nlohmann::json;

UsageCounters::UsageCounters(std::filesystem::path file, Clock clock)
    : file_(std::move(file)), clock_(std::move(clock)) {
    counters_.period = period_of(clock_());
}

std::string UsageCounters::period_of(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m", &tm);
    return buf;
}

void UsageCounters::roll_over_locked() {
    const auto current = period_of(clock_());
    if (current == counters_.period) {
        return;
    }
    spdlog::info("Cloud usage period rolled over from {} to {}", counters_.period, current);
    counters_ = UsageSnapshot{};
    counters_.period = current;
    dirty_ = true;
}

Result<void, Error> UsageCounters::load() {
    std::ifstream in(file_);
    if (!in) {
        return Done();
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        const auto j = json::parse(buffer.str());
        std::lock_guard lock(mutex_);
        counters_.period = j.value("period", period_of(clock_()));
        counters_.class_a_ops = j.value("class_a_ops", std::uint64_t{0});
        counters_.class_b_ops = j.value("class_b_ops", std::uint64_t{0});
        counters_.bytes_transited = j.value("bytes_transited", std::uint64_t{0});
        counters_.storage_bytes = j.value("storage_bytes", std::uint64_t{0});
        dirty_ = false;
        roll_over_locked();
    } catch (const json::exception& e) {
        return Fail<void>(ErrorCode::Validation, "cloud usage file " + file_.string() + ": " + e.what());
    }
    return Done();
}

Result<bool, Error> UsageCounters::flush() {
    json j;
    {
        std::lock_guard lock(mutex_);
        roll_over_locked();
        if (!dirty_) {
            return Ok<bool, Error>(false);
        }
        j = json{
            {"period", counters_.period},
            {"class_a_ops", counters_.class_a_ops},
            {"class_b_ops", counters_.class_b_ops},
            {"bytes_transited", counters_.bytes_transited},
            {"storage_bytes", counters_.storage_bytes}
        };
        dirty_ = false;
    }

    std::error_code ec;
    if (file_.has_parent_path()) {
        std::filesystem::create_directories(file_.parent_path(), ec);
    }
    const auto staging = file_.string() + ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        out << j.dump(2);
        if (!out) {
            std::lock_guard lock(mutex_);
            dirty_ = true;
            return Fail<bool>(ErrorCode::StorageFailure, "cannot write " + staging);
        }
    }
    std::filesystem::rename(staging, file_, ec);
    if (ec) {
        std::lock_guard lock(mutex_);
        dirty_ = true;
        return Fail<bool>(ErrorCode::StorageFailure, "cannot replace " + file_.string() + ": " + ec.message());
    }
    return Ok<bool, Error>(true);
}

void UsageCounters::record_class_a(std::uint64_t ops) {
    std::lock_guard lock(mutex_);
    roll_over_locked();
    counters_.class_a_ops += ops;
    dirty_ = true;
}

void UsageCounters::record_class_b(std::uint64_t ops) {
    std::lock_guard lock(mutex_);
    roll_over_locked();
    counters_.class_b_ops += ops;
    dirty_ = true;
}

void UsageCounters::record_transit(std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    roll_over_locked();
    counters_.bytes_transited += bytes;
    dirty_ = true;
}

void UsageCounters::add_storage(std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    roll_over_locked();
    counters_.storage_bytes += bytes;
    dirty_ = true;
}

void UsageCounters::release_storage(std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    roll_over_locked();
    counters_.storage_bytes = bytes > counters_.storage_bytes ? 0 : counters_.storage_bytes - bytes;
    dirty_ = true;
}

UsageSnapshot UsageCounters::snapshot() {
    std::lock_guard lock(mutex_);
    roll_over_locked();
    return counters_;
}

} // namespace nexus::cloud
