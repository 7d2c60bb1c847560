#include "models/NeighborModel.hpp"
#include <algorithm>
#include <cmath>

namespace vigil {

namespace {

constexpr double kMinReference = 1e-6;

} // namespace

NeighborParams NeighborModel::Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config) {
    NeighborParams params;
    params.standardizer = Standardizer::Fit(rows);
    params.capacity = config.neighbor_capacity;
    params.k = config.neighbor_k;

    const size_t first = rows.size() > params.capacity ? rows.size() - params.capacity : 0;
    for (size_t i = first; i < rows.size(); ++i) {
        params.memory.push_back(params.standardizer.Apply(rows[i]));
    }

    if (params.memory.size() < 2) {
        params.reference_distance = 1.0;
        return params;
    }

    // Leave-one-out k-NN distance over the stored vectors.
    std::vector<double> loo;
    loo.reserve(params.memory.size());
    for (const auto& z : params.memory) {
        loo.push_back(MeanNeighborDistance(params, z, &z));
    }
    params.reference_distance = std::max(Median(loo), kMinReference);
    return params;
}

double NeighborModel::MeanNeighborDistance(const NeighborParams& params, const std::vector<double>& z,
                                           const std::vector<double>* exclude) {
    std::vector<double> distances;
    distances.reserve(params.memory.size());
    for (const auto& stored : params.memory) {
        if (&stored == exclude) continue;
        distances.push_back(Distance(stored, z));
    }
    if (distances.empty()) return 0.0;

    const size_t k = std::min(params.k, distances.size());
    std::partial_sort(distances.begin(), distances.begin() + k, distances.end());
    double sum = 0.0;
    for (size_t i = 0; i < k; ++i) sum += distances[i];
    return sum / static_cast<double>(k);
}

double NeighborModel::Score(const NeighborParams& params, const ModalityInput& input) {
    const double d = MeanNeighborDistance(params, params.standardizer.Apply(input.current));
    return params.reference_distance / (params.reference_distance + d);
}

void NeighborModel::Absorb(NeighborParams& params, const std::vector<double>& x) {
    params.memory.push_back(params.standardizer.Apply(x));
    while (params.memory.size() > params.capacity) {
        params.memory.pop_front();
    }
}

} // namespace vigil
