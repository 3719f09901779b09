#include "classification_detector.hpp"
#include "file_logger.hpp"
#include <sstream>

namespace detection {

ClassificationDetector::ClassificationDetector(double classification_threshold, std::string model_path)
    : BaseDetector("classification", DetectorKind::Classification, 100),
      threshold_(classification_threshold),
      model_path_(std::move(model_path))
{
}

std::shared_ptr<const RandomForestModel> ClassificationDetector::currentModel() const
{
    std::shared_lock<std::shared_mutex> lock(model_mutex_);
    return model_;
}

bool ClassificationDetector::hasModel() const
{
    return static_cast<bool>(currentModel());
}

size_t ClassificationDetector::modelFeatureCount() const
{
    auto model = currentModel();
    return model ? model->featureCount() : 0;
}

bool ClassificationDetector::loadModel(const std::string& path)
{
    auto model = std::make_shared<RandomForestModel>();
    if (!model->load(path)) {
        TRAFFIC_SENTINEL_LOG_ERROR("Could not load classification model from " + path);
        return false;
    }

    const size_t features = model->featureCount();
    const size_t trees = model->treeCount();
    {
        std::unique_lock<std::shared_mutex> lock(model_mutex_);
        model_ = std::move(model);
        model_path_ = path;
    }
    {
        std::lock_guard<std::mutex> lock(warned_mutex_);
        warned_sizes_.clear();
    }
    TRAFFIC_SENTINEL_LOG_INFO("Classification model loaded from " + path + " (" +
                              std::to_string(trees) + " trees, " + std::to_string(features) +
                              " features)");
    return true;
}

bool ClassificationDetector::reload()
{
    std::string path;
    {
        std::shared_lock<std::shared_mutex> lock(model_mutex_);
        path = model_path_;
    }
    if (path.empty()) {
        return false;
    }
    return loadModel(path);
}

std::vector<double> ClassificationDetector::alignFeatures(const std::vector<double>& values, size_t expected)
{
    std::vector<double> aligned(values.begin(),
                                values.begin() + static_cast<std::ptrdiff_t>(std::min(values.size(), expected)));
    aligned.resize(expected, 0.0);
    return aligned;
}

void ClassificationDetector::warnMismatchOnce(size_t input_size, size_t model_size) const
{
    {
        std::lock_guard<std::mutex> lock(warned_mutex_);
        if (!warned_sizes_.insert(input_size).second) {
            return;
        }
    }
    TRAFFIC_SENTINEL_LOG_WARNING("Feature count mismatch: got " + std::to_string(input_size) +
                                 ", model expects " + std::to_string(model_size) +
                                 (input_size < model_size ? " (padding with zeros)" : " (truncating)"));
}

ClassificationResult ClassificationDetector::classify(const FeatureVector& features) const
{
    ClassificationResult result;
    result.input_features = features.size();

    auto model = currentModel();
    if (!model) {
        return result;
    }

    const size_t expected = model->featureCount();
    result.model_features = expected;
    if (features.size() != expected) {
        warnMismatchOnce(features.size(), expected);
    }

    const double p_malicious = model->maliciousProbability(alignFeatures(features.values, expected));
    const bool malicious = p_malicious >= model->optimalThreshold();

    result.status = ClassificationStatus::Ok;
    result.confidence = malicious ? p_malicious : 1.0 - p_malicious;
    result.label = malicious ? labels::MALICIOUS : labels::BENIGN;

    if (result.confidence < threshold_) {
        result.label = labels::BENIGN;
    }
    return result;
}

std::vector<Detection> ClassificationDetector::detect(const DetectionInput& input)
{
    if (!isEnabled()) {
        return {};
    }

    ClassificationResult result = classify(input.features);
    if (!result.isMalicious()) {
        return {};
    }

    Detection d;
    d.kind = DetectorKind::Classification;
    d.severity = result.confidence >= 0.9 ? Severity::High : Severity::Medium;
    d.confidence = result.confidence;
    d.rule_id = "random_forest";
    d.description = "Malicious traffic classified";
    std::ostringstream details;
    details << "p_malicious=" << result.confidence << " features=" << result.input_features
            << "/" << result.model_features;
    d.details = details.str();
    attachFlow(d, input.packet);
    return {std::move(d)};
}

} // namespace detection
