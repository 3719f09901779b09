#ifndef PERIODIC_TASK_HPP
#define PERIODIC_TASK_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Background thread that runs a task on a fixed interval
 *
 * Failures back off exponentially; after MAX_CONSECUTIVE_FAILURES in a row
 * the task gives up and its thread exits. stop() interrupts the wait.
 */
class PeriodicTask {
public:
    static constexpr int MAX_CONSECUTIVE_FAILURES = 5;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> task);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    uint64_t runCount() const { return runs_.load(std::memory_order_relaxed); }
    uint64_t failureCount() const { return failures_.load(std::memory_order_relaxed); }
    const std::string& name() const { return name_; }

private:
    void loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> task_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runs_{0};
    std::atomic<uint64_t> failures_{0};
};

#endif // PERIODIC_TASK_HPP
