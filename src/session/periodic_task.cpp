#include "session/periodic_task.hpp"
#include <spdlog/spdlog.h>

namespace execore::session {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> task)
    : name_(std::move(name))
    , interval_(interval)
    , task_(std::move(task)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    worker_ = std::thread([this]() { run_loop(); });
    spdlog::debug("Periodic task '{}' started (interval={}ms)", name_, interval_.count());
}

void PeriodicTask::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::debug("Periodic task '{}' stopped", name_);
}

void PeriodicTask::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        try {
            task_();
        } catch (const std::exception& e) {
            spdlog::error("Periodic task '{}' failed: {}", name_, e.what());
        }
        run_count_++;
        lock.lock();
    }
}

} // namespace execore::session
