#include "detection_coordinator.hpp"
#include "file_logger.hpp"
#include <stdexcept>

namespace detection {

namespace {

std::atomic<uint64_t> g_correlation_counter{1};

// Inputs copied onto the heap so a task that outlives its deadline stays valid
struct SharedInput {
    PacketRecord packet;
    FeatureVector features;
    HistorySummary history;
};

} // namespace

uint64_t DetectionCoordinator::nextCorrelationId()
{
    return g_correlation_counter.fetch_add(1, std::memory_order_relaxed);
}

DetectionCoordinator::DetectionCoordinator(FeatureExtractor extractor,
                                           FeatureTrackers& trackers,
                                           SourceHistoryTracker& history,
                                           DetectorSet detectors,
                                           std::shared_ptr<DetectorExecutor> executor,
                                           std::chrono::milliseconds detector_timeout)
    : extractor_(std::move(extractor)),
      trackers_(trackers),
      history_(history),
      detectors_(std::move(detectors)),
      executor_(std::move(executor)),
      detector_timeout_(detector_timeout)
{
    for (size_t i = 0; i < DETECTOR_KIND_COUNT; ++i) {
        if (detectors_[i] && kindIndex(detectors_[i]->kind()) != i) {
            TRAFFIC_SENTINEL_LOG_WARNING("Detector '" + detectors_[i]->getName() +
                                         "' registered in the wrong slot, ignoring it");
            detectors_[i].reset();
        }
    }
}

DetectionCoordinator::Outcome DetectionCoordinator::runDetector(IDetector& detector, const DetectionInput& input)
{
    Outcome outcome;
    try {
        outcome.detections = detector.detect(input);
    } catch (const std::exception& e) {
        TRAFFIC_SENTINEL_LOG_ERROR("Detector '" + detector.getName() + "' failed: " + e.what());
        outcome.failed = true;
    } catch (...) {
        TRAFFIC_SENTINEL_LOG_ERROR("Detector '" + detector.getName() + "' failed with a non-standard exception");
        outcome.failed = true;
    }
    return outcome;
}

void DetectionCoordinator::collect(DetectorKind kind, Outcome outcome, std::vector<Detection>& out)
{
    const size_t index = kindIndex(kind);
    if (outcome.failed) {
        failures_[index].fetch_add(1, std::memory_order_relaxed);
        return;
    }
    detections_[index].fetch_add(outcome.detections.size(), std::memory_order_relaxed);
    for (auto& d : outcome.detections) {
        out.push_back(std::move(d));
    }
}

std::vector<Detection> DetectionCoordinator::analyze(const PacketRecord& packet)
{
    const TimePoint now = packet.timestamp == TimePoint{} ? SentinelClock::now() : packet.timestamp;

    auto input = std::make_shared<SharedInput>();
    input->packet = packet;
    input->features = extractor_.extract(packet, trackers_);
    if (!packet.src_ip.empty()) {
        history_.record(packet, now);
        input->history = history_.summarize(packet.src_ip, now);
    }

    const DetectionInput view{input->packet, input->features, input->history};
    std::vector<Detection> merged;

    // Model layers go out first so they overlap with the signature pass
    const auto deadline = std::chrono::steady_clock::now() + detector_timeout_;
    std::array<std::future<std::vector<Detection>>, DETECTOR_KIND_COUNT> pending;
    std::array<bool, DETECTOR_KIND_COUNT> offloaded{};
    for (DetectorKind kind : {DetectorKind::Anomaly, DetectorKind::Classification}) {
        const size_t index = kindIndex(kind);
        auto detector = detectors_[index];
        if (!detector || !detector->isEnabled() || !executor_) {
            continue;
        }
        offloaded[index] = true;
        pending[index] = executor_->submit([detector, input]() {
            DetectionInput task_view{input->packet, input->features, input->history};
            Outcome outcome = runDetector(*detector, task_view);
            if (outcome.failed) {
                throw std::runtime_error("detector failed");
            }
            return std::move(outcome.detections);
        }, deadline);
        if (!pending[index].valid()) {
            // Executor saturated or stopped
            skipped_[index].fetch_add(1, std::memory_order_relaxed);
        }
    }

    for (size_t i = 0; i < DETECTOR_KIND_COUNT; ++i) {
        auto& detector = detectors_[i];
        if (!detector || !detector->isEnabled() || offloaded[i]) {
            continue;
        }
        // Signature always, and the model layers when no executor is available
        collect(detector->kind(), runDetector(*detector, view), merged);
    }

    for (size_t i = 0; i < DETECTOR_KIND_COUNT; ++i) {
        if (!pending[i].valid()) {
            continue;
        }
        const auto kind = static_cast<DetectorKind>(i);
        if (pending[i].wait_until(deadline) != std::future_status::ready) {
            timeouts_[i].fetch_add(1, std::memory_order_relaxed);
            TRAFFIC_SENTINEL_LOG_DEBUG("Detector '" + detectors_[i]->getName() + "' timed out after " +
                                       std::to_string(detector_timeout_.count()) + "ms");
            continue;
        }
        Outcome outcome;
        try {
            outcome.detections = pending[i].get();
        } catch (const std::exception&) {
            // Already logged inside the task
            outcome.failed = true;
        }
        collect(kind, std::move(outcome), merged);
    }

    const uint64_t correlation_id = nextCorrelationId();
    for (auto& d : merged) {
        d.correlation_id = correlation_id;
        if (d.timestamp == TimePoint{}) {
            d.timestamp = now;
        }
    }

    analyzed_.fetch_add(1, std::memory_order_relaxed);
    return merged;
}

CoordinatorMetrics DetectionCoordinator::metrics() const
{
    CoordinatorMetrics m;
    m.analyzed = analyzed_.load(std::memory_order_relaxed);
    for (size_t i = 0; i < DETECTOR_KIND_COUNT; ++i) {
        m.detector_failures[i] = failures_[i].load(std::memory_order_relaxed);
        m.detector_timeouts[i] = timeouts_[i].load(std::memory_order_relaxed);
        m.detector_skipped[i] = skipped_[i].load(std::memory_order_relaxed);
        m.detections[i] = detections_[i].load(std::memory_order_relaxed);
    }
    return m;
}

} // namespace detection
