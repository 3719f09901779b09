#ifndef DETECTOR_EXECUTOR_HPP
#define DETECTOR_EXECUTOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "detection.hpp"

namespace detection {
    /**
     * @brief Fixed thread pool that runs the model-backed detectors
     *
     * The coordinator waits on the returned futures with a deadline. The
     * queue holds at most max_pending tasks; submit() refuses work beyond
     * that, and a task whose deadline passed while queued is dropped without
     * running. A task already running when its deadline passes finishes and
     * its result is discarded.
     */
    class DetectorExecutor {
    public:
        using Task = std::function<std::vector<Detection>()>;
        using Deadline = std::chrono::steady_clock::time_point;

        // max_pending of 0 selects DEFAULT_PENDING_PER_THREAD * thread_count
        explicit DetectorExecutor(size_t thread_count, size_t max_pending = 0);
        ~DetectorExecutor();

        DetectorExecutor(const DetectorExecutor&) = delete;
        DetectorExecutor& operator=(const DetectorExecutor&) = delete;

        // Returns an invalid future once shutdown() has been called or the queue is full
        std::future<std::vector<Detection>> submit(Task task, Deadline deadline = Deadline::max());

        // Runs the queued tasks to completion and joins the threads
        void shutdown();

        size_t threadCount() const { return workers_.size(); }
        size_t pendingTasks() const;
        size_t maxPending() const { return max_pending_; }
        uint64_t rejectedTasks() const { return rejected_.load(std::memory_order_relaxed); }
        uint64_t expiredTasks() const { return expired_.load(std::memory_order_relaxed); }

        static constexpr size_t DEFAULT_PENDING_PER_THREAD = 8;

    private:
        struct QueuedTask {
            std::shared_ptr<std::packaged_task<std::vector<Detection>()>> task;
            Deadline deadline;
        };

        void workerLoop();

        std::vector<std::thread> workers_;
        std::deque<QueuedTask> tasks_;
        size_t max_pending_;
        std::atomic<uint64_t> rejected_{0};
        std::atomic<uint64_t> expired_{0};
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        bool stopping_ = false;
    };
}

#endif // DETECTOR_EXECUTOR_HPP
