#ifndef CLASSIFICATION_DETECTOR_HPP
#define CLASSIFICATION_DETECTOR_HPP

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include "detector_interface.hpp"
#include "random_forest_model.hpp"

namespace detection {
    enum class ClassificationStatus : std::uint8_t {
        Ok = 0,
        Unavailable = 1
    };

    namespace labels {
        inline const std::string BENIGN = "benign";
        inline const std::string MALICIOUS = "malicious";
        inline const std::string UNAVAILABLE = "unavailable";
    }

    struct ClassificationResult {
        ClassificationStatus status = ClassificationStatus::Unavailable;
        std::string label = labels::UNAVAILABLE;
        double confidence = 0.0;
        size_t model_features = 0;
        size_t input_features = 0;

        bool available() const { return status == ClassificationStatus::Ok; }
        bool isMalicious() const { return available() && label == labels::MALICIOUS; }
    };

    /**
     * @brief Supervised classifier over a pre-trained random forest
     *
     * Live vectors are aligned to the model width: right-padded with zeros
     * when short, truncated when long. A mismatch is logged once per input
     * width. Low-confidence verdicts are reported as benign.
     */
    class ClassificationDetector : public BaseDetector {
    public:
        explicit ClassificationDetector(double classification_threshold = 0.7,
                                        std::string model_path = "");

        // Parses a fresh model and swaps it in; the previous model stays on failure
        bool loadModel(const std::string& path);
        bool reload();
        bool hasModel() const;
        size_t modelFeatureCount() const;
        const std::string& modelPath() const { return model_path_; }

        ClassificationResult classify(const FeatureVector& features) const;

        std::vector<Detection> detect(const DetectionInput& input) override;

        static std::vector<double> alignFeatures(const std::vector<double>& values, size_t expected);

    private:
        std::shared_ptr<const RandomForestModel> currentModel() const;
        void warnMismatchOnce(size_t input_size, size_t model_size) const;

        double threshold_;
        std::string model_path_;

        mutable std::shared_mutex model_mutex_;
        std::shared_ptr<const RandomForestModel> model_;

        mutable std::mutex warned_mutex_;
        mutable std::unordered_set<size_t> warned_sizes_;
    };
}

#endif // CLASSIFICATION_DETECTOR_HPP
