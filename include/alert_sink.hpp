#ifndef ALERT_SINK_HPP
#define ALERT_SINK_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "persistence_sink.hpp"

struct SentinelConfig;

struct AlertSinkOptions {
    std::chrono::seconds dedup_window{300};
    int retry_limit = 3;
    size_t queue_capacity = 10000;
    size_t failed_buffer = 1000;
    std::chrono::milliseconds retry_backoff{50};

    static AlertSinkOptions from(const SentinelConfig& config);
};

struct AlertSinkMetrics {
    uint64_t new_alerts = 0;
    uint64_t deduplicated = 0;
    uint64_t persisted = 0;
    uint64_t persistence_failures = 0;
    size_t queue_depth = 0;
    size_t active_alerts = 0;
    size_t failed_buffered = 0;
};

/**
 * @brief Deduplicates detections into alerts and hands new alerts to persistence
 *
 * At most one new alert exists per (source IP, detector kind, description)
 * inside the dedup window, measured from the alert's creation. Repeats bump
 * last_seen and the occurrence count of the existing alert. Persistence runs
 * on a writer thread so a slow or failing sink never blocks submit().
 */
class AlertSink {
public:
    using Clock = std::chrono::system_clock;
    using Callback = std::function<void(const Alert&)>;

    explicit AlertSink(std::shared_ptr<IPersistenceSink> persistence,
                       AlertSinkOptions options = AlertSinkOptions{});
    ~AlertSink();

    AlertSink(const AlertSink&) = delete;
    AlertSink& operator=(const AlertSink&) = delete;

    Alert submit(const Detection& detection, std::optional<Clock::time_point> now = std::nullopt);

    uint64_t subscribe(Callback callback);
    bool unsubscribe(uint64_t subscription_id);

    bool resolve(const std::string& alert_id);

    // Removes expired dedup entries, returns how many were removed
    size_t sweep(Clock::time_point now);

    std::vector<Alert> activeAlerts(std::optional<Clock::time_point> now = std::nullopt) const;
    std::vector<Alert> failedAlerts() const;

    // Blocks until every queued alert has been handled or the timeout expires
    bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    // Drains the queue and joins the writer; further alerts are counted as failures
    void stop();

    AlertSinkMetrics metrics() const;
    std::chrono::seconds dedupWindow() const { return options_.dedup_window; }

    static std::string dedupKey(const Detection& detection);
    static std::string generateId();

private:
    bool expired(const Alert& alert, Clock::time_point now) const;
    bool enqueue(const Alert& alert);
    void recordFailure(const Alert& alert);
    void notifySubscribers(const Alert& alert);
    void writerLoop();
    bool persistWithRetry(const Alert& alert);

    std::shared_ptr<IPersistenceSink> persistence_;
    AlertSinkOptions options_;

    mutable std::mutex index_mutex_;
    std::unordered_map<std::string, Alert> index_;      // dedup key -> alert
    std::unordered_map<std::string, std::string> ids_;  // alert id -> dedup key

    mutable std::mutex subscribers_mutex_;
    std::map<uint64_t, Callback> subscribers_;
    uint64_t next_subscription_ = 1;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    std::deque<Alert> queue_;
    bool writer_busy_ = false;
    bool stopping_ = false;
    std::thread writer_;

    mutable std::mutex failed_mutex_;
    std::deque<Alert> failed_;

    std::atomic<uint64_t> new_alerts_{0};
    std::atomic<uint64_t> deduplicated_{0};
    std::atomic<uint64_t> persisted_{0};
    std::atomic<uint64_t> persistence_failures_{0};
};

#endif // ALERT_SINK_HPP
