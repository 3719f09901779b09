#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "alert_sink.hpp"
#include "anomaly_detector.hpp"
#include "classification_detector.hpp"
#include "detection_coordinator.hpp"
#include "feature_trackers.hpp"
#include "packet_history.hpp"
#include "packet_queue.hpp"
#include "periodic_task.hpp"
#include "sentinel_config.hpp"
#include "signature_detector.hpp"
#include "stats_aggregator.hpp"

struct PipelineMetrics {
    uint64_t received = 0;
    uint64_t processed = 0;
    uint64_t dropped_queue = 0;
    uint64_t dropped_shutdown = 0;
    uint64_t rejected = 0;     // offered before start() or after shutdown()
    uint64_t processing_errors = 0;
    size_t queue_depth = 0;
    size_t tracked_connections = 0;
    detection::CoordinatorMetrics coordinator;
    AlertSinkMetrics alerts;

    uint64_t dropped() const { return dropped_queue + dropped_shutdown; }
    std::string toString() const;
};

/**
 * @brief Owns every detection component and drives packets through them
 *
 * Capture threads call submit(); a fixed worker pool pops packets and runs
 * analyze -> alert submit -> stats record. Background timers sweep trackers
 * and dedup entries, retrain the anomaly model, reload the classifier and
 * flush statistics.
 *
 * Throws std::runtime_error from the constructor when the configuration is
 * invalid or a configured classification model cannot be loaded.
 */
class Pipeline {
public:
    explicit Pipeline(const SentinelConfig& config,
                      std::shared_ptr<IPersistenceSink> persistence = nullptr);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    void start();

    // False when the packet was dropped or the pipeline is not accepting
    bool submit(PacketRecord packet);

    // Full analysis on the calling thread, bypassing the queue
    std::vector<Detection> processNow(const PacketRecord& packet);

    // Stop accepting, drain, join workers, stop timers, flush stats and alerts
    void shutdown();

    // Tracker, history and dedup sweeps at @p now
    size_t runMaintenance(TimePoint now);

    PipelineMetrics metrics() const;
    void writePerformanceMetrics() const;

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    const SentinelConfig& config() const { return config_; }

    FeatureTrackers& trackers() { return trackers_; }
    SourceHistoryTracker& history() { return history_; }
    detection::SignatureDetector& signatureDetector() { return *signature_; }
    detection::AnomalyDetector& anomalyDetector() { return *anomaly_; }
    detection::ClassificationDetector& classificationDetector() { return *classification_; }
    detection::DetectionCoordinator& coordinator() { return *coordinator_; }
    AlertSink& alertSink() { return *alerts_; }
    StatsAggregator& stats() { return *stats_; }

private:
    void workerLoop();
    void process(const PacketRecord& packet);
    void startTimers();
    void stopTimers();

    SentinelConfig config_;
    FeatureTrackers trackers_;
    SourceHistoryTracker history_;

    std::shared_ptr<detection::SignatureDetector> signature_;
    std::shared_ptr<detection::AnomalyDetector> anomaly_;
    std::shared_ptr<detection::ClassificationDetector> classification_;
    std::shared_ptr<detection::DetectorExecutor> executor_;
    std::unique_ptr<detection::DetectionCoordinator> coordinator_;

    std::shared_ptr<IPersistenceSink> persistence_;
    std::unique_ptr<AlertSink> alerts_;
    std::unique_ptr<StatsAggregator> stats_;

    PacketQueue queue_;
    std::vector<std::thread> workers_;
    std::vector<std::unique_ptr<PeriodicTask>> timers_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> accepting_{false};
    std::atomic<bool> running_{false};
    bool shut_down_ = false;

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> dropped_shutdown_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> processing_errors_{0};
};

#endif // PIPELINE_HPP
