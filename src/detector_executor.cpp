#include "detector_executor.hpp"
#include <algorithm>

namespace detection {

DetectorExecutor::DetectorExecutor(size_t thread_count, size_t max_pending)
{
    thread_count = std::max<size_t>(thread_count, 1);
    max_pending_ = max_pending > 0 ? max_pending : DEFAULT_PENDING_PER_THREAD * thread_count;
    workers_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
}

DetectorExecutor::~DetectorExecutor()
{
    shutdown();
}

std::future<std::vector<Detection>> DetectorExecutor::submit(Task task, Deadline deadline)
{
    auto packaged = std::make_shared<std::packaged_task<std::vector<Detection>()>>(std::move(task));
    std::future<std::vector<Detection>> result = packaged->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return {};
        }
        if (tasks_.size() >= max_pending_) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return {};
        }
        tasks_.push_back(QueuedTask{std::move(packaged), deadline});
    }
    cv_.notify_one();
    return result;
}

void DetectorExecutor::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t DetectorExecutor::pendingTasks() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void DetectorExecutor::workerLoop()
{
    for (;;) {
        QueuedTask next;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            next = std::move(tasks_.front());
            tasks_.pop_front();
        }
        if (std::chrono::steady_clock::now() >= next.deadline) {
            // Nobody waits on it any more; dropping the task breaks its promise
            expired_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        // Exceptions land in the future
        (*next.task)();
    }
}

} // namespace detection
