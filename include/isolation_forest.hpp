#ifndef ISOLATION_FOREST_HPP
#define ISOLATION_FOREST_HPP

#include <cstdint>
#include <iosfwd>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Isolation forest outlier model (Liu, Ting, Zhou 2008)
 *
 * Immutable after fit(); concurrent score() calls on a fitted model are safe.
 */
class IsolationForest {
public:
    struct Params {
        size_t trees = 100;
        size_t subsample_size = 256;
        double contamination = 0.1;
        uint64_t seed = 42;
    };

    IsolationForest() = default;
    explicit IsolationForest(const Params& params) : params_(params) {}

    /**
     * @brief Build the trees and learn the score offset from @p samples
     * @return false when fewer than two samples or rows of unequal width are given
     */
    bool fit(const std::vector<std::vector<double>>& samples);

    // Raw isolation score in (0,1); higher is more anomalous
    double score(const std::vector<double>& sample) const;

    // Score mapped to [0,1] so that the learned offset sits at 0.5
    double confidence(double raw_score) const;

    bool isFitted() const { return !trees_.empty(); }
    size_t featureCount() const { return feature_count_; }
    size_t sampleCount() const { return sample_count_; }
    double offset() const { return offset_; }
    const Params& params() const { return params_; }

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // Average path length of an unsuccessful BST search over n points
    static double averagePathLength(size_t n);

private:
    struct Node {
        int feature = -1;         // -1 marks a leaf
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        size_t size = 0;          // samples reaching a leaf
    };

    using Tree = std::vector<Node>;

    int buildNode(Tree& tree, const std::vector<std::vector<double>>& samples,
                  std::vector<size_t>& indices, size_t begin, size_t end,
                  size_t depth, size_t max_depth, std::mt19937_64& rng) const;
    double pathLength(const Tree& tree, const std::vector<double>& sample) const;

    bool write(std::ostream& out) const;
    bool read(std::istream& in);

    Params params_;
    std::vector<Tree> trees_;
    size_t feature_count_ = 0;
    size_t sample_count_ = 0;   // per-tree subsample actually used
    double offset_ = 0.5;
};

#endif // ISOLATION_FOREST_HPP
