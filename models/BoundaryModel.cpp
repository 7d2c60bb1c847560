#include "models/BoundaryModel.hpp"
#include <algorithm>
#include <cmath>

namespace vigil {

namespace {

constexpr double kMinSpread = 1e-3;

} // namespace

BoundaryParams BoundaryModel::Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config) {
    BoundaryParams params;
    params.standardizer = Standardizer::Fit(rows);
    const size_t dim = params.standardizer.Dimension();
    params.center.assign(dim, 0.0);
    if (rows.empty()) {
        return params;
    }

    std::vector<std::vector<double>> z;
    z.reserve(rows.size());
    for (const auto& row : rows) {
        z.push_back(params.standardizer.Apply(row));
        for (size_t i = 0; i < dim; ++i) {
            params.center[i] += z.back()[i];
        }
    }
    for (auto& c : params.center) {
        c /= static_cast<double>(rows.size());
    }

    std::vector<double> distances;
    RunningStats stats;
    distances.reserve(z.size());
    for (const auto& row : z) {
        const double d = Distance(row, params.center);
        distances.push_back(d);
        stats.Add(d);
    }

    params.radius = Quantile(distances, 1.0 - config.boundary_nu);
    params.spread = std::max(stats.StdDev(), kMinSpread);
    return params;
}

double BoundaryModel::SignedDistance(const BoundaryParams& params, const std::vector<double>& x) {
    return params.radius - Distance(params.standardizer.Apply(x), params.center);
}

double BoundaryModel::Score(const BoundaryParams& params, const ModalityInput& input) {
    return Sigmoid(SignedDistance(params, input.current) / params.spread);
}

} // namespace vigil
