#ifndef RANDOM_FOREST_MODEL_HPP
#define RANDOM_FOREST_MODEL_HPP

#include <iosfwd>
#include <string>
#include <vector>

/**
 * @brief Pre-trained binary random forest loaded from a text artifact
 *
 *   random_forest v1
 *   features <n> <name_1> ... <name_n>
 *   threshold <optimal_threshold>
 *   trees <T>
 *   tree <N>
 *   <idx> <feature> <threshold> <left> <right> <p_benign> <p_malicious>   (N lines)
 *
 * Leaves have left = right = -1. Samples go left when x[feature] <= threshold.
 */
class RandomForestModel {
public:
    struct Node {
        int feature = -1;
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        double p[2] = {0.5, 0.5};

        bool isLeaf() const { return left < 0 && right < 0; }
    };

    bool load(const std::string& path);
    bool read(std::istream& in);

    // Mean leaf probability of the malicious class; @p x must have featureCount() entries
    double maliciousProbability(const std::vector<double>& x) const;

    size_t featureCount() const { return feature_names_.size(); }
    const std::vector<std::string>& featureNames() const { return feature_names_; }
    double optimalThreshold() const { return optimal_threshold_; }
    size_t treeCount() const { return trees_.size(); }

private:
    std::vector<std::string> feature_names_;
    double optimal_threshold_ = 0.5;
    std::vector<std::vector<Node>> trees_;
};

#endif // RANDOM_FOREST_MODEL_HPP
