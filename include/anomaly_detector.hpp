#ifndef ANOMALY_DETECTOR_HPP
#define ANOMALY_DETECTOR_HPP

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "detector_interface.hpp"
#include "isolation_forest.hpp"

struct SentinelConfig;

namespace detection {
    enum class AnomalyState : std::uint8_t {
        Untrained = 0,
        Collecting = 1,
        Trained = 2,
        Retraining = 3
    };

    std::string toString(AnomalyState state);

    struct AnomalyOptions {
        size_t min_samples = 100;
        double threshold = 0.5;
        size_t buffer_size = 10000;
        IsolationForest::Params forest;
        std::string model_path;     // empty: no persistence

        static AnomalyOptions from(const SentinelConfig& config);
    };

    /**
     * @brief Unsupervised outlier detector with online training
     *
     * Buffers feature vectors until min_samples is reached, then trains
     * synchronously on the worker that crossed the threshold. Retraining
     * builds a fresh model and swaps the shared pointer, so in-flight
     * scoring keeps using the model it started with.
     */
    class AnomalyDetector : public BaseDetector {
    public:
        AnomalyDetector();
        explicit AnomalyDetector(const AnomalyOptions& options);

        std::vector<Detection> detect(const DetectionInput& input) override;

        // Confidence for @p features under the active model, or empty when untrained
        std::optional<double> confidence(const FeatureVector& features) const;

        // Trains a replacement model from the sample buffer. Returns false if
        // another training is running or there are too few samples.
        bool retrain();

        bool loadModel(const std::string& path);
        bool saveModel(const std::string& path) const;

        AnomalyState state() const { return state_.load(std::memory_order_acquire); }
        size_t sampleCount() const;
        size_t trainingCount() const { return training_count_.load(std::memory_order_acquire); }
        const AnomalyOptions& options() const { return options_; }

    private:
        // Returns the buffered sample count after insertion
        size_t addSample(const std::vector<double>& sample);
        bool train();
        std::shared_ptr<const IsolationForest> currentModel() const;

        AnomalyOptions options_;

        mutable std::shared_mutex model_mutex_;
        std::shared_ptr<const IsolationForest> model_;

        mutable std::mutex samples_mutex_;
        std::deque<std::vector<double>> samples_;
        size_t sample_width_ = 0;

        std::atomic<AnomalyState> state_{AnomalyState::Untrained};
        std::atomic<bool> training_{false};
        std::atomic<size_t> training_count_{0};
    };
}

#endif // ANOMALY_DETECTOR_HPP
