#include "alert_sink.hpp"
#include "file_logger.hpp"
#include "sentinel_config.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

AlertSinkOptions AlertSinkOptions::from(const SentinelConfig& config)
{
    AlertSinkOptions options;
    options.dedup_window = std::chrono::seconds(config.alerts.alert_dedup_window_seconds);
    options.retry_limit = config.alerts.persistence_retry_limit;
    options.queue_capacity = config.alerts.persistence_queue_capacity;
    options.failed_buffer = config.alerts.failed_persistence_buffer;
    return options;
}

AlertSink::AlertSink(std::shared_ptr<IPersistenceSink> persistence, AlertSinkOptions options)
    : persistence_(std::move(persistence)), options_(options)
{
    if (options_.retry_limit < 1) {
        options_.retry_limit = 1;
    }
    if (!persistence_) {
        TRAFFIC_SENTINEL_LOG_WARNING("Alert sink created without persistence; alerts stay in memory only");
    }
    writer_ = std::thread([this]() { writerLoop(); });
}

AlertSink::~AlertSink()
{
    stop();
}

std::string AlertSink::dedupKey(const Detection& detection)
{
    return detection.src_ip + '|' + toString(detection.kind) + '|' + detection.description;
}

std::string AlertSink::generateId()
{
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream id;
    id << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    return id.str();
}

bool AlertSink::expired(const Alert& alert, Clock::time_point now) const
{
    return alert.resolved || now - alert.created_at >= options_.dedup_window;
}

Alert AlertSink::submit(const Detection& detection, std::optional<Clock::time_point> now)
{
    const Clock::time_point at = now.value_or(Clock::now());
    const std::string key = dedupKey(detection);

    Alert alert;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = index_.find(key);
        if (it != index_.end() && !expired(it->second, at)) {
            Alert& existing = it->second;
            existing.last_seen = std::max(existing.last_seen, at);
            existing.occurrence_count += 1;
            deduplicated_.fetch_add(1, std::memory_order_relaxed);
            return existing;
        }
        if (it != index_.end()) {
            ids_.erase(it->second.id);
            index_.erase(it);
        }

        alert.id = generateId();
        alert.detection = detection;
        alert.created_at = at;
        alert.last_seen = at;
        index_.emplace(key, alert);
        ids_.emplace(alert.id, key);
    }

    new_alerts_.fetch_add(1, std::memory_order_relaxed);
    if (!enqueue(alert)) {
        TRAFFIC_SENTINEL_LOG_ERROR("Alert queue full, alert " + alert.id + " not persisted");
        recordFailure(alert);
    }
    notifySubscribers(alert);
    return alert;
}

bool AlertSink::enqueue(const Alert& alert)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ || queue_.size() >= options_.queue_capacity) {
            return false;
        }
        queue_.push_back(alert);
    }
    queue_cv_.notify_one();
    return true;
}

void AlertSink::recordFailure(const Alert& alert)
{
    persistence_failures_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(failed_mutex_);
    failed_.push_back(alert);
    while (failed_.size() > options_.failed_buffer) {
        failed_.pop_front();
    }
}

void AlertSink::notifySubscribers(const Alert& alert)
{
    std::vector<std::pair<uint64_t, Callback>> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        callbacks.assign(subscribers_.begin(), subscribers_.end());
    }
    for (const auto& [id, callback] : callbacks) {
        try {
            callback(alert);
        } catch (const std::exception& e) {
            TRAFFIC_SENTINEL_LOG_ERROR("Alert subscriber " + std::to_string(id) + " failed: " + e.what());
        }
    }
}

uint64_t AlertSink::subscribe(Callback callback)
{
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    const uint64_t id = next_subscription_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

bool AlertSink::unsubscribe(uint64_t subscription_id)
{
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.erase(subscription_id) > 0;
}

bool AlertSink::resolve(const std::string& alert_id)
{
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto id_it = ids_.find(alert_id);
    if (id_it == ids_.end()) {
        return false;
    }
    auto it = index_.find(id_it->second);
    if (it == index_.end()) {
        return false;
    }
    it->second.resolved = true;
    return true;
}

size_t AlertSink::sweep(Clock::time_point now)
{
    std::lock_guard<std::mutex> lock(index_mutex_);
    size_t removed = 0;
    for (auto it = index_.begin(); it != index_.end();) {
        if (expired(it->second, now)) {
            ids_.erase(it->second.id);
            it = index_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<Alert> AlertSink::activeAlerts(std::optional<Clock::time_point> now) const
{
    const Clock::time_point at = now.value_or(Clock::now());
    std::vector<Alert> active;
    std::lock_guard<std::mutex> lock(index_mutex_);
    for (const auto& [key, alert] : index_) {
        if (!expired(alert, at)) {
            active.push_back(alert);
        }
    }
    return active;
}

std::vector<Alert> AlertSink::failedAlerts() const
{
    std::lock_guard<std::mutex> lock(failed_mutex_);
    return {failed_.begin(), failed_.end()};
}

bool AlertSink::persistWithRetry(const Alert& alert)
{
    if (!persistence_) {
        return false;
    }
    for (int attempt = 1; attempt <= options_.retry_limit; ++attempt) {
        try {
            if (persistence_->persistAlert(alert)) {
                return true;
            }
            TRAFFIC_SENTINEL_LOG_WARNING("Persisting alert " + alert.id + " failed (attempt " +
                                         std::to_string(attempt) + "/" +
                                         std::to_string(options_.retry_limit) + ")");
        } catch (const std::exception& e) {
            TRAFFIC_SENTINEL_LOG_WARNING("Persisting alert " + alert.id + " threw (attempt " +
                                         std::to_string(attempt) + "/" +
                                         std::to_string(options_.retry_limit) + "): " + e.what());
        }
        if (attempt < options_.retry_limit) {
            std::this_thread::sleep_for(options_.retry_backoff * (1 << (attempt - 1)));
        }
    }
    return false;
}

void AlertSink::writerLoop()
{
    for (;;) {
        Alert alert;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            alert = std::move(queue_.front());
            queue_.pop_front();
            writer_busy_ = true;
        }

        if (persistWithRetry(alert)) {
            persisted_.fetch_add(1, std::memory_order_relaxed);
        } else {
            TRAFFIC_SENTINEL_LOG_ERROR("Alert " + alert.id + " (" + alert.detection.description +
                                       " from " + alert.detection.src_ip +
                                       ") could not be persisted, keeping it in memory");
            recordFailure(alert);
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            writer_busy_ = false;
        }
        drained_cv_.notify_all();
    }
}

bool AlertSink::flush(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return drained_cv_.wait_for(lock, timeout, [this]() { return queue_.empty() && !writer_busy_; });
}

void AlertSink::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }
    drained_cv_.notify_all();
}

AlertSinkMetrics AlertSink::metrics() const
{
    AlertSinkMetrics m;
    m.new_alerts = new_alerts_.load(std::memory_order_relaxed);
    m.deduplicated = deduplicated_.load(std::memory_order_relaxed);
    m.persisted = persisted_.load(std::memory_order_relaxed);
    m.persistence_failures = persistence_failures_.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        m.queue_depth = queue_.size();
    }
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        m.active_alerts = index_.size();
    }
    {
        std::lock_guard<std::mutex> lock(failed_mutex_);
        m.failed_buffered = failed_.size();
    }
    return m;
}
