#include "nexus/core/periodic_task.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace nexus::core {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Work work, bool run_at_start)
    : name_(std::move(name)),
      interval_(interval),
      work_(std::move(work)),
      run_at_start_(run_at_start) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true)) {
        return;
    }
    stop_requested_ = false;
    thread_ = std::thread([this] { loop(); });
    spdlog::debug("Background task '{}' started", name_);
}

void PeriodicTask::stop() {
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        spdlog::debug("Background task '{}' stopped", name_);
    }
    running_ = false;
}

void PeriodicTask::trigger() {
    {
        std::lock_guard lock(mutex_);
        triggered_ = true;
    }
    cv_.notify_all();
}

void PeriodicTask::loop() {
    if (run_at_start_) {
        run_once();
    }

    while (!stop_requested_) {
        std::unique_lock lock(mutex_);
        auto wake = [this] { return stop_requested_.load() || triggered_; };
        if (interval_.count() > 0) {
            cv_.wait_for(lock, interval_, wake);
        } else {
            cv_.wait(lock, wake);
        }
        if (stop_requested_) {
            break;
        }
        triggered_ = false;
        lock.unlock();
        run_once();
    }
}

void PeriodicTask::run_once() {
    try {
        work_(stop_requested_);
    } catch (const std::exception& e) {
        spdlog::error("Background task '{}' failed: {}", name_, e.what());
    }
    ++runs_;
}

} // namespace nexus::core
