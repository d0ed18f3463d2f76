#include "periodic_task.hpp"
#include "pileup/logging.hpp"
#include <exception>

namespace pileup {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds period, Callback callback)
    : name_(std::move(name))
    , period_(period.count() > 0 ? period : std::chrono::milliseconds(1))
    , callback_(std::move(callback))
{}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_) return;

    running_ = true;
    thread_ = std::thread(&PeriodicTask::loop, this);
    LOG_ENGINE(DEBUG, "Task '%s' started (%lld ms)", name_.c_str(),
               static_cast<long long>(period_.count()));
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_ENGINE(DEBUG, "Task '%s' stopped after %llu runs", name_.c_str(),
               static_cast<unsigned long long>(runs_.load()));
}

void PeriodicTask::loop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, period_, [this] { return !running_; });
        }

        if (!running_) break;

        try {
            callback_();
        } catch (const std::exception& e) {
            LOG_ENGINE(ERROR, "Task '%s' failed: %s", name_.c_str(), e.what());
        }
        runs_++;
    }
}

} // namespace pileup
