#ifndef DETECTION_COORDINATOR_HPP
#define DETECTION_COORDINATOR_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>
#include "detector_executor.hpp"
#include "detector_interface.hpp"
#include "feature_extractor.hpp"
#include "feature_trackers.hpp"
#include "packet_history.hpp"

namespace detection {
    using DetectorSet = std::array<std::shared_ptr<IDetector>, DETECTOR_KIND_COUNT>;

    struct CoordinatorMetrics {
        uint64_t analyzed = 0;
        std::array<uint64_t, DETECTOR_KIND_COUNT> detector_failures{};
        std::array<uint64_t, DETECTOR_KIND_COUNT> detector_timeouts{};
        std::array<uint64_t, DETECTOR_KIND_COUNT> detector_skipped{};
        std::array<uint64_t, DETECTOR_KIND_COUNT> detections{};
    };

    /**
     * @brief Runs the three detection layers for one packet and merges the verdicts
     *
     * Features are extracted once. The signature layer runs on the calling
     * thread while the model layers run on the executor and are awaited up to
     * the configured timeout. Every detection from one packet carries the same
     * correlation id. A detector that throws or times out contributes nothing,
     * and neither does a model layer the saturated executor refused.
     */
    class DetectionCoordinator {
    public:
        DetectionCoordinator(FeatureExtractor extractor,
                             FeatureTrackers& trackers,
                             SourceHistoryTracker& history,
                             DetectorSet detectors,
                             std::shared_ptr<DetectorExecutor> executor,
                             std::chrono::milliseconds detector_timeout);

        std::vector<Detection> analyze(const PacketRecord& packet);

        CoordinatorMetrics metrics() const;
        std::shared_ptr<IDetector> detector(DetectorKind kind) const { return detectors_[kindIndex(kind)]; }
        const FeatureExtractor& extractor() const { return extractor_; }

        static uint64_t nextCorrelationId();

    private:
        struct Outcome {
            std::vector<Detection> detections;
            bool failed = false;
        };

        static Outcome runDetector(IDetector& detector, const DetectionInput& input);
        void collect(DetectorKind kind, Outcome outcome, std::vector<Detection>& out);

        FeatureExtractor extractor_;
        FeatureTrackers& trackers_;
        SourceHistoryTracker& history_;
        DetectorSet detectors_;
        std::shared_ptr<DetectorExecutor> executor_;
        std::chrono::milliseconds detector_timeout_;

        std::atomic<uint64_t> analyzed_{0};
        std::array<std::atomic<uint64_t>, DETECTOR_KIND_COUNT> failures_{};
        std::array<std::atomic<uint64_t>, DETECTOR_KIND_COUNT> timeouts_{};
        std::array<std::atomic<uint64_t>, DETECTOR_KIND_COUNT> skipped_{};
        std::array<std::atomic<uint64_t>, DETECTOR_KIND_COUNT> detections_{};
    };
}

#endif // DETECTION_COORDINATOR_HPP
