#include "models/IsolationModel.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace vigil {

namespace {

constexpr double kEulerGamma = 0.5772156649;

} // namespace

double IsolationModel::ExpectedPathLength(size_t n) {
    if (n <= 1) return 0.0;
    if (n == 2) return 1.0;
    const double m = static_cast<double>(n - 1);
    return 2.0 * (std::log(m) + kEulerGamma) - 2.0 * m / static_cast<double>(n);
}

int IsolationModel::BuildNode(IsolationTree& tree,
                              const std::vector<std::vector<double>>& rows,
                              std::vector<size_t> indices,
                              size_t depth,
                              size_t max_depth,
                              std::mt19937& rng) {
    const int index = static_cast<int>(tree.nodes.size());
    tree.nodes.emplace_back();
    tree.nodes[index].size = indices.size();

    if (depth >= max_depth || indices.size() <= 1) {
        return index;
    }

    // Candidate features that still vary within this partition.
    const size_t dim = rows[indices.front()].size();
    std::vector<size_t> candidates;
    std::vector<std::pair<double, double>> ranges(dim);
    for (size_t f = 0; f < dim; ++f) {
        double lo = rows[indices.front()][f];
        double hi = lo;
        for (size_t idx : indices) {
            lo = std::min(lo, rows[idx][f]);
            hi = std::max(hi, rows[idx][f]);
        }
        ranges[f] = {lo, hi};
        if (hi - lo > 1e-12) candidates.push_back(f);
    }
    if (candidates.empty()) {
        return index;
    }

    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    const size_t feature = candidates[pick(rng)];
    std::uniform_real_distribution<double> split(ranges[feature].first, ranges[feature].second);
    const double threshold = split(rng);

    std::vector<size_t> left;
    std::vector<size_t> right;
    for (size_t idx : indices) {
        if (rows[idx][feature] < threshold) {
            left.push_back(idx);
        } else {
            right.push_back(idx);
        }
    }
    if (left.empty() || right.empty()) {
        return index;
    }

    const int left_index = BuildNode(tree, rows, std::move(left), depth + 1, max_depth, rng);
    const int right_index = BuildNode(tree, rows, std::move(right), depth + 1, max_depth, rng);

    IsolationNode& node = tree.nodes[index];
    node.feature = static_cast<int>(feature);
    node.threshold = threshold;
    node.left = left_index;
    node.right = right_index;
    return index;
}

IsolationParams IsolationModel::Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config) {
    IsolationParams params;
    if (rows.empty()) {
        return params;
    }
    params.dimension = rows.front().size();
    params.subsample = std::min(config.isolation_subsample, rows.size());
    const size_t max_depth = static_cast<size_t>(
        std::ceil(std::log2(static_cast<double>(std::max<size_t>(params.subsample, 2)))));

    std::vector<size_t> all(rows.size());
    std::iota(all.begin(), all.end(), 0);

    params.trees.reserve(config.isolation_trees);
    for (size_t t = 0; t < config.isolation_trees; ++t) {
        std::mt19937 rng(config.seed + static_cast<uint32_t>(t) * 7919u);
        std::vector<size_t> sample = all;
        std::shuffle(sample.begin(), sample.end(), rng);
        sample.resize(params.subsample);

        IsolationTree tree;
        BuildNode(tree, rows, std::move(sample), 0, max_depth, rng);
        params.trees.push_back(std::move(tree));
    }
    return params;
}

double IsolationModel::PathLength(const IsolationTree& tree, const std::vector<double>& x) {
    int index = 0;
    double depth = 0.0;
    while (index >= 0 && static_cast<size_t>(index) < tree.nodes.size()) {
        const IsolationNode& node = tree.nodes[index];
        if (node.feature < 0) {
            return depth + ExpectedPathLength(node.size);
        }
        index = x[node.feature] < node.threshold ? node.left : node.right;
        depth += 1.0;
    }
    return depth;
}

double IsolationModel::AveragePathLength(const IsolationParams& params, const std::vector<double>& x) {
    if (params.trees.empty()) return 0.0;
    double total = 0.0;
    for (const auto& tree : params.trees) {
        total += PathLength(tree, x);
    }
    return total / static_cast<double>(params.trees.size());
}

double IsolationModel::Score(const IsolationParams& params, const ModalityInput& input) {
    const double c = ExpectedPathLength(params.subsample);
    if (c <= 0.0) return 1.0;
    const double anomaly = std::pow(2.0, -AveragePathLength(params, input.current) / c);
    return 1.0 - anomaly;
}

} // namespace vigil
