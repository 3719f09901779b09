#include "anomaly_detector.hpp"
#include "file_logger.hpp"
#include "sentinel_config.hpp"
#include <sstream>

namespace detection {

std::string toString(AnomalyState state)
{
    switch (state) {
        case AnomalyState::Untrained: return "untrained";
        case AnomalyState::Collecting: return "collecting";
        case AnomalyState::Trained: return "trained";
        case AnomalyState::Retraining: return "retraining";
        default: return "unknown";
    }
}

AnomalyOptions AnomalyOptions::from(const SentinelConfig& config)
{
    AnomalyOptions options;
    options.min_samples = config.detection.min_anomaly_samples;
    options.threshold = config.detection.anomaly_threshold;
    options.buffer_size = config.detection.anomaly_sample_buffer_size;
    options.forest.trees = config.detection.anomaly_trees;
    options.forest.subsample_size = config.detection.anomaly_subsample_size;
    options.forest.contamination = config.detection.anomaly_contamination;
    options.forest.seed = config.detection.anomaly_seed;
    options.model_path = config.detection.anomaly_model_path;
    return options;
}

AnomalyDetector::AnomalyDetector() : AnomalyDetector(AnomalyOptions{}) {}

AnomalyDetector::AnomalyDetector(const AnomalyOptions& options)
    : BaseDetector("anomaly", DetectorKind::Anomaly, 200), options_(options)
{
    if (options_.buffer_size < options_.min_samples) {
        options_.buffer_size = options_.min_samples;
    }
}

size_t AnomalyDetector::sampleCount() const
{
    std::lock_guard<std::mutex> lock(samples_mutex_);
    return samples_.size();
}

std::shared_ptr<const IsolationForest> AnomalyDetector::currentModel() const
{
    std::shared_lock<std::shared_mutex> lock(model_mutex_);
    return model_;
}

size_t AnomalyDetector::addSample(const std::vector<double>& sample)
{
    std::lock_guard<std::mutex> lock(samples_mutex_);
    if (sample_width_ == 0) {
        sample_width_ = sample.size();
    }
    std::vector<double> row = sample;
    row.resize(sample_width_, 0.0);
    samples_.push_back(std::move(row));
    while (samples_.size() > options_.buffer_size) {
        samples_.pop_front();
    }
    return samples_.size();
}

std::vector<Detection> AnomalyDetector::detect(const DetectionInput& input)
{
    if (!isEnabled() || input.features.empty()) {
        return {};
    }

    const size_t buffered = addSample(input.features.values);

    if (!currentModel()) {
        AnomalyState expected = AnomalyState::Untrained;
        state_.compare_exchange_strong(expected, AnomalyState::Collecting, std::memory_order_acq_rel);

        if (buffered < options_.min_samples || !train()) {
            return {};
        }
    }

    std::optional<double> conf = confidence(input.features);
    if (!conf || *conf <= options_.threshold) {
        return {};
    }

    Detection d;
    d.kind = DetectorKind::Anomaly;
    d.severity = *conf >= 0.8 ? Severity::High : Severity::Medium;
    d.confidence = *conf;
    d.rule_id = "isolation_forest";
    d.description = "Anomalous traffic pattern";
    std::ostringstream details;
    details << "anomaly_confidence=" << *conf;
    d.details = details.str();
    attachFlow(d, input.packet);
    return {std::move(d)};
}

std::optional<double> AnomalyDetector::confidence(const FeatureVector& features) const
{
    auto model = currentModel();
    if (!model) {
        return std::nullopt;
    }
    std::vector<double> row = features.values;
    row.resize(model->featureCount(), 0.0);
    return model->confidence(model->score(row));
}

bool AnomalyDetector::retrain()
{
    if (sampleCount() < options_.min_samples) {
        return false;
    }
    return train();
}

bool AnomalyDetector::train()
{
    bool expected = false;
    if (!training_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return false;
    }

    const bool had_model = static_cast<bool>(currentModel());
    if (had_model) {
        state_.store(AnomalyState::Retraining, std::memory_order_release);
    }

    std::vector<std::vector<double>> samples;
    {
        std::lock_guard<std::mutex> lock(samples_mutex_);
        samples.assign(samples_.begin(), samples_.end());
    }

    bool trained = false;
    try {
        auto forest = std::make_shared<IsolationForest>(options_.forest);
        if (forest->fit(samples)) {
            {
                std::unique_lock<std::shared_mutex> lock(model_mutex_);
                model_ = std::move(forest);
            }
            trained = true;
        } else {
            TRAFFIC_SENTINEL_LOG_WARNING("Anomaly model training rejected " +
                                         std::to_string(samples.size()) + " samples");
        }
    } catch (const std::exception& e) {
        TRAFFIC_SENTINEL_LOG_ERROR(std::string("Anomaly model training failed: ") + e.what());
    }

    if (trained) {
        training_count_.fetch_add(1, std::memory_order_acq_rel);
        state_.store(AnomalyState::Trained, std::memory_order_release);
        TRAFFIC_SENTINEL_LOG_INFO("Anomaly model trained on " + std::to_string(samples.size()) +
                                  " samples (training #" + std::to_string(trainingCount()) + ")");
        if (!options_.model_path.empty() && !saveModel(options_.model_path)) {
            TRAFFIC_SENTINEL_LOG_WARNING("Could not save anomaly model to " + options_.model_path);
        }
    } else {
        state_.store(had_model ? AnomalyState::Trained : AnomalyState::Collecting,
                     std::memory_order_release);
    }

    training_.store(false, std::memory_order_release);
    return trained;
}

bool AnomalyDetector::loadModel(const std::string& path)
{
    auto forest = std::make_shared<IsolationForest>();
    if (!forest->load(path)) {
        TRAFFIC_SENTINEL_LOG_WARNING("Could not load anomaly model from " + path);
        return false;
    }
    {
        std::unique_lock<std::shared_mutex> lock(model_mutex_);
        model_ = std::move(forest);
    }
    state_.store(AnomalyState::Trained, std::memory_order_release);
    TRAFFIC_SENTINEL_LOG_INFO("Anomaly model loaded from " + path);
    return true;
}

bool AnomalyDetector::saveModel(const std::string& path) const
{
    auto model = currentModel();
    return model && model->save(path);
}

} // namespace detection
