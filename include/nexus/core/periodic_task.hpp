/**
 * @file periodic_task.hpp
 * @brief Cancellable background task owned by the process lifecycle
 *
 * A PeriodicTask owns one thread. The work function runs once at start,
 * then every `interval` (when non-zero) and whenever trigger() is called.
 * stop() asks the work to finish cooperatively and joins the thread; the
 * work sees the request through the flag it receives and is expected to
 * check it between units of work.
 *
 * EXAMPLE:
 * PeriodicTask janitor("janitor", std::chrono::hours(1),
 *     [&](const std::atomic<bool>& stop) { janitor.sweep(now(), &stop); });
 * janitor.start();
 * ...
 * janitor.stop();
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace nexus::core {

class PeriodicTask {
public:
    using Work = std::function<void(const std::atomic<bool>& stop_requested)>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Work work, bool run_at_start = true);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();

    // Request cancellation and wait for the current run to finish.
    void stop();

    // Schedule an extra run as soon as the worker is idle.
    void trigger();

    bool running() const { return running_.load(); }
    std::uint64_t completed_runs() const { return runs_.load(); }
    const std::string& name() const noexcept { return name_; }

private:
    void loop();
    void run_once();

    std::string name_;
    std::chrono::milliseconds interval_;
    Work work_;
    bool run_at_start_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool triggered_ = false;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> runs_{0};
};

} // namespace nexus::core
