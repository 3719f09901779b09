#include "periodic_task.hpp"
#include "file_logger.hpp"
#include <algorithm>

namespace {

constexpr std::chrono::milliseconds MAX_BACKOFF{30000};

} // namespace

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> task)
    : name_(std::move(name)),
      interval_(std::max(interval, std::chrono::milliseconds(1))),
      task_(std::move(task))
{
}

PeriodicTask::~PeriodicTask()
{
    stop();
}

void PeriodicTask::start()
{
    if (thread_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this]() { loop(); });
}

void PeriodicTask::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false, std::memory_order_release);
}

void PeriodicTask::loop()
{
    int consecutive_failures = 0;
    std::chrono::milliseconds wait = interval_;

    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, wait, [this]() { return stop_requested_; })) {
                break;
            }
        }

        try {
            task_();
            runs_.fetch_add(1, std::memory_order_relaxed);
            consecutive_failures = 0;
            wait = interval_;
            continue;
        } catch (const std::exception& e) {
            TRAFFIC_SENTINEL_LOG_ERROR("Periodic task '" + name_ + "' failed: " + e.what());
        }

        failures_.fetch_add(1, std::memory_order_relaxed);
        if (++consecutive_failures >= MAX_CONSECUTIVE_FAILURES) {
            TRAFFIC_SENTINEL_LOG_ERROR("Too many consecutive failures, stopping periodic task '" + name_ + "'");
            break;
        }
        wait = std::min(interval_ * (1 << consecutive_failures), std::max(MAX_BACKOFF, interval_));
    }
    running_.store(false, std::memory_order_release);
}
