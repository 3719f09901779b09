#include "isolation_forest.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <numeric>

namespace {

constexpr double EULER_GAMMA = 0.5772156649015329;
constexpr const char* MODEL_HEADER = "isolation_forest";
constexpr const char* MODEL_VERSION = "v1";

} // namespace

double IsolationForest::averagePathLength(size_t n)
{
    if (n <= 1) {
        return 0.0;
    }
    if (n == 2) {
        return 1.0;
    }
    auto nd = static_cast<double>(n);
    return 2.0 * (std::log(nd - 1.0) + EULER_GAMMA) - 2.0 * (nd - 1.0) / nd;
}

bool IsolationForest::fit(const std::vector<std::vector<double>>& samples)
{
    if (samples.size() < 2 || samples.front().empty()) {
        return false;
    }
    const size_t width = samples.front().size();
    for (const auto& row : samples) {
        if (row.size() != width) {
            return false;
        }
    }

    std::mt19937_64 rng(params_.seed);
    const size_t subsample = std::min(std::max<size_t>(params_.subsample_size, 2), samples.size());
    const auto max_depth = static_cast<size_t>(std::ceil(std::log2(static_cast<double>(subsample))));

    std::vector<Tree> trees;
    trees.reserve(params_.trees);
    std::vector<size_t> all(samples.size());

    for (size_t t = 0; t < std::max<size_t>(params_.trees, 1); ++t) {
        std::iota(all.begin(), all.end(), 0);
        // Partial Fisher-Yates: the first `subsample` slots become the draw
        for (size_t i = 0; i < subsample; ++i) {
            std::uniform_int_distribution<size_t> pick(i, all.size() - 1);
            std::swap(all[i], all[pick(rng)]);
        }
        std::vector<size_t> indices(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(subsample));

        Tree tree;
        tree.reserve(2 * subsample);
        buildNode(tree, samples, indices, 0, indices.size(), 0, max_depth, rng);
        trees.push_back(std::move(tree));
    }

    trees_ = std::move(trees);
    feature_count_ = width;
    sample_count_ = subsample;

    // Offset: the (1 - contamination) quantile of the training scores
    std::vector<double> scores;
    scores.reserve(samples.size());
    for (const auto& row : samples) {
        scores.push_back(score(row));
    }
    std::sort(scores.begin(), scores.end());
    double q = std::clamp(1.0 - params_.contamination, 0.0, 1.0);
    auto idx = static_cast<size_t>(std::floor(q * static_cast<double>(scores.size() - 1)));
    offset_ = std::clamp(scores[idx], 0.01, 0.99);
    return true;
}

int IsolationForest::buildNode(Tree& tree, const std::vector<std::vector<double>>& samples,
                               std::vector<size_t>& indices, size_t begin, size_t end,
                               size_t depth, size_t max_depth, std::mt19937_64& rng) const
{
    const int node_index = static_cast<int>(tree.size());
    tree.push_back(Node{});
    tree.back().size = end - begin;

    if (depth >= max_depth || end - begin <= 1) {
        return node_index;
    }

    // Candidate features are those that still vary inside this node
    const size_t width = samples[indices[begin]].size();
    std::vector<std::pair<size_t, std::pair<double, double>>> candidates;
    for (size_t f = 0; f < width; ++f) {
        double lo = std::numeric_limits<double>::max();
        double hi = std::numeric_limits<double>::lowest();
        for (size_t i = begin; i < end; ++i) {
            double v = samples[indices[i]][f];
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
        if (hi > lo) {
            candidates.push_back({f, {lo, hi}});
        }
    }
    if (candidates.empty()) {
        return node_index;
    }

    std::uniform_int_distribution<size_t> pick_feature(0, candidates.size() - 1);
    const auto& [feature, range] = candidates[pick_feature(rng)];
    std::uniform_real_distribution<double> pick_split(range.first, range.second);
    const double threshold = pick_split(rng);

    auto first = indices.begin() + static_cast<std::ptrdiff_t>(begin);
    auto last = indices.begin() + static_cast<std::ptrdiff_t>(end);
    auto middle = std::partition(first, last, [&, f = feature](size_t idx) {
        return samples[idx][f] < threshold;
    });
    const auto split = begin + static_cast<size_t>(middle - first);
    if (split == begin || split == end) {
        return node_index;
    }

    int left = buildNode(tree, samples, indices, begin, split, depth + 1, max_depth, rng);
    int right = buildNode(tree, samples, indices, split, end, depth + 1, max_depth, rng);

    Node& node = tree[static_cast<size_t>(node_index)];
    node.feature = static_cast<int>(feature);
    node.threshold = threshold;
    node.left = left;
    node.right = right;
    return node_index;
}

double IsolationForest::pathLength(const Tree& tree, const std::vector<double>& sample) const
{
    size_t depth = 0;
    size_t i = 0;
    while (tree[i].feature >= 0) {
        const Node& node = tree[i];
        double value = static_cast<size_t>(node.feature) < sample.size() ? sample[static_cast<size_t>(node.feature)] : 0.0;
        i = static_cast<size_t>(value < node.threshold ? node.left : node.right);
        ++depth;
    }
    return static_cast<double>(depth) + averagePathLength(tree[i].size);
}

double IsolationForest::score(const std::vector<double>& sample) const
{
    if (trees_.empty()) {
        return 0.5;
    }
    double total = 0.0;
    for (const auto& tree : trees_) {
        total += pathLength(tree, sample);
    }
    const double mean = total / static_cast<double>(trees_.size());
    const double c = averagePathLength(sample_count_);
    if (c <= 0.0) {
        return 0.5;
    }
    return std::pow(2.0, -mean / c);
}

double IsolationForest::confidence(double raw_score) const
{
    if (raw_score >= offset_) {
        return std::clamp(0.5 + 0.5 * (raw_score - offset_) / (1.0 - offset_), 0.0, 1.0);
    }
    return std::clamp(0.5 * raw_score / offset_, 0.0, 1.0);
}

bool IsolationForest::save(const std::string& path) const
{
    if (!isFitted()) {
        return false;
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    return write(out);
}

bool IsolationForest::load(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }
    IsolationForest loaded;
    if (!loaded.read(in)) {
        return false;
    }
    *this = std::move(loaded);
    return true;
}

bool IsolationForest::write(std::ostream& out) const
{
    out << std::setprecision(17);
    out << MODEL_HEADER << ' ' << MODEL_VERSION << '\n';
    out << "params " << params_.trees << ' ' << params_.subsample_size << ' '
        << params_.contamination << ' ' << params_.seed << '\n';
    out << "features " << feature_count_ << " samples " << sample_count_
        << " offset " << offset_ << '\n';
    out << "trees " << trees_.size() << '\n';
    for (const auto& tree : trees_) {
        out << "tree " << tree.size() << '\n';
        for (const auto& node : tree) {
            out << node.feature << ' ' << node.threshold << ' ' << node.left << ' '
                << node.right << ' ' << node.size << '\n';
        }
    }
    return static_cast<bool>(out);
}

bool IsolationForest::read(std::istream& in)
{
    std::string tag, version;
    if (!(in >> tag >> version) || tag != MODEL_HEADER || version != MODEL_VERSION) {
        return false;
    }

    std::string word;
    if (!(in >> word) || word != "params" ||
        !(in >> params_.trees >> params_.subsample_size >> params_.contamination >> params_.seed)) {
        return false;
    }

    std::string samples_tag, offset_tag;
    if (!(in >> word >> feature_count_ >> samples_tag >> sample_count_ >> offset_tag >> offset_) ||
        word != "features" || samples_tag != "samples" || offset_tag != "offset") {
        return false;
    }
    if (feature_count_ == 0 || sample_count_ < 2 || offset_ <= 0.0 || offset_ >= 1.0) {
        return false;
    }

    size_t tree_count = 0;
    if (!(in >> word >> tree_count) || word != "trees" || tree_count == 0) {
        return false;
    }

    trees_.clear();
    trees_.reserve(tree_count);
    for (size_t t = 0; t < tree_count; ++t) {
        size_t node_count = 0;
        if (!(in >> word >> node_count) || word != "tree" || node_count == 0) {
            return false;
        }
        Tree tree(node_count);
        for (auto& node : tree) {
            if (!(in >> node.feature >> node.threshold >> node.left >> node.right >> node.size)) {
                return false;
            }
        }
        // Children must point forward inside the tree and features inside the width
        for (size_t i = 0; i < tree.size(); ++i) {
            const Node& node = tree[i];
            if (node.feature < 0) {
                continue;
            }
            const auto n = static_cast<int>(tree.size());
            if (static_cast<size_t>(node.feature) >= feature_count_ ||
                node.left <= static_cast<int>(i) || node.right <= static_cast<int>(i) ||
                node.left >= n || node.right >= n) {
                return false;
            }
        }
        trees_.push_back(std::move(tree));
    }
    return true;
}
