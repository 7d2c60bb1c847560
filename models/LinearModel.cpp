#include "models/LinearModel.hpp"
#include <algorithm>
#include <cmath>

namespace vigil {

namespace {

constexpr double kDisplacement = 3.0;

} // namespace

std::vector<double> LinearModel::FeatureMap(const std::vector<double>& z) {
    std::vector<double> phi;
    phi.reserve(z.size() + 1);
    for (double v : z) {
        phi.push_back(v * v);
    }
    phi.push_back(1.0);
    return phi;
}

std::vector<double> LinearModel::SyntheticNegative(const std::vector<double>& z, std::mt19937& rng) {
    std::bernoulli_distribution sign(0.5);
    std::vector<double> out = z;
    for (auto& v : out) {
        v += sign(rng) ? kDisplacement : -kDisplacement;
    }
    return out;
}

void LinearModel::Step(LinearParams& params, const std::vector<double>& phi, double label) {
    const double loss = std::max(0.0, 1.0 - label * Dot(params.weights, phi));
    if (loss <= 0.0) return;
    const double norm_sq = Dot(phi, phi);
    if (norm_sq <= 0.0) return;
    const double tau = std::min(params.aggressiveness, loss / norm_sq);
    for (size_t i = 0; i < params.weights.size(); ++i) {
        params.weights[i] += tau * label * phi[i];
    }
}

LinearParams LinearModel::Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config) {
    LinearParams params;
    params.standardizer = Standardizer::Fit(rows);
    params.aggressiveness = config.linear_aggressiveness;
    params.seed = config.seed;
    params.weights.assign(params.standardizer.Dimension() + 1, 0.0);

    std::vector<std::vector<double>> z;
    z.reserve(rows.size());
    for (const auto& row : rows) {
        z.push_back(params.standardizer.Apply(row));
    }

    std::mt19937 rng(params.seed);
    for (size_t epoch = 0; epoch < config.linear_epochs; ++epoch) {
        for (const auto& row : z) {
            Step(params, FeatureMap(row), 1.0);
            Step(params, FeatureMap(SyntheticNegative(row, rng)), -1.0);
        }
    }
    return params;
}

double LinearModel::Margin(const LinearParams& params, const std::vector<double>& x) {
    return Dot(params.weights, FeatureMap(params.standardizer.Apply(x)));
}

double LinearModel::Score(const LinearParams& params, const ModalityInput& input) {
    return Sigmoid(Margin(params, input.current));
}

void LinearModel::Absorb(LinearParams& params, const std::vector<double>& x) {
    ++params.updates;
    std::mt19937 rng(params.seed ^ static_cast<uint32_t>(params.updates * 2654435761u));
    const std::vector<double> z = params.standardizer.Apply(x);
    Step(params, FeatureMap(z), 1.0);
    Step(params, FeatureMap(SyntheticNegative(z, rng)), -1.0);
}

} // namespace vigil
