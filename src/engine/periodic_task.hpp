#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace pileup {

/**
 * Periodic Task
 *
 * Runs a callback on its own thread every period. The wait between runs is
 * a condition-variable wait, so stop() returns without waiting out the period.
 */
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds period, Callback callback);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    bool isRunning() const { return running_; }
    uint64_t runCount() const { return runs_; }
    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::chrono::milliseconds period_;
    Callback callback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runs_{0};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;

    void loop();
};

} // namespace pileup
