#pragma once
#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <chrono>

namespace execore::session {

// Runs `task` every `interval` on a worker thread until stopped.
// stop() wakes the worker immediately instead of waiting out the interval.
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> task);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();
    bool running() const { return running_; }
    uint64_t run_count() const { return run_count_; }

private:
    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> task_;

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> run_count_{0};

    void run_loop();
};

} // namespace execore::session
