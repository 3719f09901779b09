#include "pipeline.hpp"
#include "file_logger.hpp"
#include "file_persistence_sink.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace {

constexpr std::chrono::seconds PERFORMANCE_METRICS_INTERVAL{5};

const SentinelConfig& requireValid(const SentinelConfig& config)
{
    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        std::string message = "Invalid traffic sentinel configuration:";
        for (const auto& error : errors) {
            message += " " + error + ";";
        }
        throw std::runtime_error(message);
    }
    return config;
}

} // namespace

std::string PipelineMetrics::toString() const
{
    std::ostringstream oss;
    oss << "received=" << received
        << " processed=" << processed
        << " dropped_queue=" << dropped_queue
        << " dropped_shutdown=" << dropped_shutdown
        << " rejected=" << rejected
        << " processing_errors=" << processing_errors
        << " queue_depth=" << queue_depth
        << " connections=" << tracked_connections
        << " analyzed=" << coordinator.analyzed;
    for (size_t i = 0; i < DETECTOR_KIND_COUNT; ++i) {
        const std::string kind = ::toString(static_cast<DetectorKind>(i));
        oss << ' ' << kind << "_detections=" << coordinator.detections[i]
            << ' ' << kind << "_failures=" << coordinator.detector_failures[i]
            << ' ' << kind << "_timeouts=" << coordinator.detector_timeouts[i]
            << ' ' << kind << "_skipped=" << coordinator.detector_skipped[i];
    }
    oss << " alerts_new=" << alerts.new_alerts
        << " alerts_deduplicated=" << alerts.deduplicated
        << " alerts_persisted=" << alerts.persisted
        << " alerts_failed=" << alerts.persistence_failures;
    return oss.str();
}

Pipeline::Pipeline(const SentinelConfig& config, std::shared_ptr<IPersistenceSink> persistence)
    : config_(requireValid(config)),
      trackers_(config_),
      history_(std::chrono::seconds(config_.signatures.history_window_seconds),
               config_.signatures.history_max_packets, config_.trackers.max_tracked_keys),
      signature_(std::make_shared<detection::SignatureDetector>(
          detection::SignatureDetector::thresholdsFrom(config_))),
      anomaly_(std::make_shared<detection::AnomalyDetector>(detection::AnomalyOptions::from(config_))),
      classification_(std::make_shared<detection::ClassificationDetector>(
          config_.detection.classification_threshold, config_.detection.classification_model_path)),
      executor_(std::make_shared<detection::DetectorExecutor>(2 * config_.effectiveWorkerCount())),
      persistence_(persistence ? std::move(persistence)
                               : std::make_shared<FilePersistenceSink>(g_file_logger)),
      queue_(config_.pipeline.queue_capacity)
{
    const std::string& classifier_path = config_.detection.classification_model_path;
    if (!classifier_path.empty() && !classification_->loadModel(classifier_path)) {
        throw std::runtime_error("Classification model configured but not loadable: " + classifier_path);
    }

    const std::string& anomaly_path = config_.detection.anomaly_model_path;
    if (!anomaly_path.empty() && std::filesystem::exists(anomaly_path) && !anomaly_->loadModel(anomaly_path)) {
        TRAFFIC_SENTINEL_LOG_WARNING("Anomaly detector starts collecting samples from scratch");
    }

    coordinator_ = std::make_unique<detection::DetectionCoordinator>(
        FeatureExtractor(config_.detection.feature_set), trackers_, history_,
        detection::DetectorSet{signature_, anomaly_, classification_}, executor_,
        std::chrono::milliseconds(config_.detection.detector_timeout_ms));

    alerts_ = std::make_unique<AlertSink>(persistence_, AlertSinkOptions::from(config_));

    StatsAggregatorOptions stats_options;
    stats_options.top_talkers = config_.stats.top_talkers;
    stats_options.retry_limit = config_.alerts.persistence_retry_limit;
    stats_ = std::make_unique<StatsAggregator>(persistence_, stats_options);
    stats_->setActiveConnectionsProvider([this]() { return trackers_.connections().activeCount(); });

    TRAFFIC_SENTINEL_LOG_INFO("Pipeline configured: " + config_.getSummary());
}

Pipeline::~Pipeline()
{
    shutdown();
}

void Pipeline::start()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load(std::memory_order_acquire) || shut_down_) {
        return;
    }

    const size_t worker_count = config_.effectiveWorkerCount();
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
    startTimers();

    running_.store(true, std::memory_order_release);
    accepting_.store(true, std::memory_order_release);
    TRAFFIC_SENTINEL_LOG_INFO("Pipeline started with " + std::to_string(worker_count) + " workers");
}

bool Pipeline::submit(PacketRecord packet)
{
    if (!accepting_.load(std::memory_order_acquire)) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    received_.fetch_add(1, std::memory_order_relaxed);
    if (queue_.tryPush(std::move(packet))) {
        return true;
    }
    if (queue_.closed()) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
    } else {
        stats_->recordDropped(1);
    }
    return false;
}

std::vector<Detection> Pipeline::processNow(const PacketRecord& packet)
{
    std::vector<Detection> detections = coordinator_->analyze(packet);
    for (const auto& d : detections) {
        stats_->recordDetection(d);
        alerts_->submit(d, d.timestamp);
    }
    stats_->record(packet);
    processed_.fetch_add(1, std::memory_order_relaxed);
    return detections;
}

void Pipeline::process(const PacketRecord& packet)
{
    try {
        processNow(packet);
    } catch (const std::exception& e) {
        processing_errors_.fetch_add(1, std::memory_order_relaxed);
        processed_.fetch_add(1, std::memory_order_relaxed);
        TRAFFIC_SENTINEL_LOG_ERROR("Packet from " + packet.src_ip + " failed processing: " + e.what());
    }
}

void Pipeline::workerLoop()
{
    while (auto packet = queue_.pop()) {
        process(*packet);
    }
}

void Pipeline::startTimers()
{
    using std::chrono::seconds;

    timers_.push_back(std::make_unique<PeriodicTask>(
        "tracker-sweep", seconds(config_.trackers.tracker_sweep_interval_seconds), [this]() {
            const TimePoint now = SentinelClock::now();
            const size_t evicted = trackers_.sweep(now) + history_.sweep(now);
            if (evicted > 0) {
                TRAFFIC_SENTINEL_LOG_DEBUG("Tracker sweep evicted " + std::to_string(evicted) + " entries");
            }
        }));

    timers_.push_back(std::make_unique<PeriodicTask>(
        "alert-dedup-sweep", seconds(config_.trackers.tracker_sweep_interval_seconds), [this]() {
            alerts_->sweep(AlertSink::Clock::now());
        }));

    timers_.push_back(std::make_unique<PeriodicTask>(
        "anomaly-retrain", seconds(config_.detection.anomaly_retrain_interval_seconds), [this]() {
            if (anomaly_->state() != detection::AnomalyState::Trained) {
                return;
            }
            if (!anomaly_->retrain()) {
                TRAFFIC_SENTINEL_LOG_WARNING("Scheduled anomaly retrain skipped, active model kept");
            }
        }));

    timers_.push_back(std::make_unique<PeriodicTask>(
        "stats-flush", seconds(config_.stats.stats_flush_interval_seconds), [this]() {
            stats_->flush();
        }));

    if (config_.detection.classification_reload_interval_seconds > 0) {
        timers_.push_back(std::make_unique<PeriodicTask>(
            "classifier-reload", seconds(config_.detection.classification_reload_interval_seconds), [this]() {
                if (!classification_->reload()) {
                    TRAFFIC_SENTINEL_LOG_WARNING("Classification model reload failed, previous model kept");
                }
            }));
    }

    timers_.push_back(std::make_unique<PeriodicTask>(
        "performance-metrics", PERFORMANCE_METRICS_INTERVAL, [this]() { writePerformanceMetrics(); }));

    for (auto& timer : timers_) {
        timer->start();
    }
}

void Pipeline::stopTimers()
{
    for (auto& timer : timers_) {
        timer->stop();
    }
    timers_.clear();
}

void Pipeline::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
    }

    accepting_.store(false, std::memory_order_release);
    queue_.close();

    if (!config_.pipeline.drain_on_shutdown) {
        const size_t discarded = queue_.clear();
        if (discarded > 0) {
            dropped_shutdown_.fetch_add(discarded, std::memory_order_relaxed);
            stats_->recordDropped(discarded);
            TRAFFIC_SENTINEL_LOG_WARNING("Shutdown discarded " + std::to_string(discarded) + " queued packets");
        }
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    // Packets queued without any worker to take them
    const size_t stranded = queue_.clear();
    if (stranded > 0) {
        dropped_shutdown_.fetch_add(stranded, std::memory_order_relaxed);
        stats_->recordDropped(stranded);
    }

    stopTimers();
    stats_->flush();

    if (!alerts_->flush()) {
        TRAFFIC_SENTINEL_LOG_WARNING("Alert persistence queue not drained before shutdown");
    }
    alerts_->stop();
    executor_->shutdown();

    running_.store(false, std::memory_order_release);
    writePerformanceMetrics();
    TRAFFIC_SENTINEL_LOG_INFO("Pipeline stopped: " + metrics().toString());
}

size_t Pipeline::runMaintenance(TimePoint now)
{
    return trackers_.sweep(now) + history_.sweep(now) + alerts_->sweep(now);
}

PipelineMetrics Pipeline::metrics() const
{
    PipelineMetrics m;
    m.received = received_.load(std::memory_order_relaxed);
    m.processed = processed_.load(std::memory_order_relaxed);
    m.dropped_queue = queue_.dropped();
    m.dropped_shutdown = dropped_shutdown_.load(std::memory_order_relaxed);
    m.rejected = rejected_.load(std::memory_order_relaxed);
    m.processing_errors = processing_errors_.load(std::memory_order_relaxed);
    m.queue_depth = queue_.size();
    m.tracked_connections = trackers_.connections().activeCount();
    m.coordinator = coordinator_->metrics();
    m.alerts = alerts_->metrics();
    return m;
}

void Pipeline::writePerformanceMetrics() const
{
    g_file_logger.write_performance_metrics(metrics().toString());
}
