#include "random_forest_model.hpp"
#include <fstream>
#include <sstream>

double RandomForestModel::maliciousProbability(const std::vector<double>& x) const
{
    if (trees_.empty()) {
        return 0.0;
    }
    double benign = 0.0;
    double malicious = 0.0;
    for (const auto& tree : trees_) {
        size_t i = 0;
        while (!tree[i].isLeaf()) {
            const Node& node = tree[i];
            double value = static_cast<size_t>(node.feature) < x.size() ? x[static_cast<size_t>(node.feature)] : 0.0;
            i = static_cast<size_t>(value <= node.threshold ? node.left : node.right);
        }
        benign += tree[i].p[0];
        malicious += tree[i].p[1];
    }
    double total = benign + malicious;
    return total > 0.0 ? malicious / total : 0.0;
}

bool RandomForestModel::load(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        return false;
    }
    RandomForestModel parsed;
    if (!parsed.read(in)) {
        return false;
    }
    *this = std::move(parsed);
    return true;
}

bool RandomForestModel::read(std::istream& in)
{
    std::string tag, version;
    if (!(in >> tag >> version) || tag != "random_forest" || version != "v1") {
        return false;
    }

    std::string word;
    size_t n_features = 0;
    if (!(in >> word >> n_features) || word != "features" || n_features == 0) {
        return false;
    }
    feature_names_.resize(n_features);
    for (auto& name : feature_names_) {
        if (!(in >> name)) {
            return false;
        }
    }

    if (!(in >> word >> optimal_threshold_) || word != "threshold" ||
        optimal_threshold_ <= 0.0 || optimal_threshold_ >= 1.0) {
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
        std::vector<Node> tree(node_count);
        for (size_t i = 0; i < node_count; ++i) {
            size_t idx = 0;
            Node node;
            if (!(in >> idx >> node.feature >> node.threshold >> node.left >> node.right >>
                  node.p[0] >> node.p[1]) || idx >= node_count) {
                return false;
            }
            tree[idx] = node;
        }
        // Reject artifacts that would walk out of bounds or loop
        const auto n = static_cast<int>(node_count);
        for (size_t i = 0; i < node_count; ++i) {
            const Node& node = tree[i];
            if (node.isLeaf()) {
                continue;
            }
            if (node.feature < 0 || static_cast<size_t>(node.feature) >= n_features ||
                node.left <= static_cast<int>(i) || node.right <= static_cast<int>(i) ||
                node.left >= n || node.right >= n) {
                return false;
            }
        }
        trees_.push_back(std::move(tree));
    }
    return true;
}
