#pragma once

#include "core/Config.hpp"
#include "models/ModelTypes.hpp"
#include "models/ScoringModel.hpp"
#include <random>

namespace vigil {

// Isolation forest. Trees are stored flat (nodes[0] is the root) so they
// serialize without pointers. Seeds derive from the model seed and tree index,
// which keeps training deterministic.
class IsolationModel {
public:
    static IsolationParams Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config);
    static double Score(const IsolationParams& params, const ModalityInput& input);

    static double AveragePathLength(const IsolationParams& params, const std::vector<double>& x);

    // Expected path length of an unsuccessful BST search over n points.
    static double ExpectedPathLength(size_t n);

private:
    static int BuildNode(IsolationTree& tree,
                         const std::vector<std::vector<double>>& rows,
                         std::vector<size_t> indices,
                         size_t depth,
                         size_t max_depth,
                         std::mt19937& rng);
    static double PathLength(const IsolationTree& tree, const std::vector<double>& x);
};

} // namespace vigil
