#include "models/SequenceModel.hpp"
#include <algorithm>
#include <cmath>

namespace vigil {

namespace {

constexpr double kMaxPhi = 0.95;
constexpr double kMinResidualScale = 1e-3;

} // namespace

SequenceParams SequenceModel::Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config) {
    SequenceParams params;
    params.standardizer = Standardizer::Fit(rows);
    params.sequence_length = config.sequence_length;
    params.padding = PaddingPolicy::REPEAT_OLDEST;

    const size_t dim = params.standardizer.Dimension();
    params.phi.assign(dim, 0.0);
    params.residual_scale.assign(dim, 1.0);
    if (rows.size() < 2) {
        return params;
    }

    std::vector<std::vector<double>> z;
    z.reserve(rows.size());
    for (const auto& row : rows) {
        z.push_back(params.standardizer.Apply(row));
    }

    for (size_t j = 0; j < dim; ++j) {
        double cross = 0.0;
        double lagged = 0.0;
        for (size_t t = 1; t < z.size(); ++t) {
            cross += z[t][j] * z[t - 1][j];
            lagged += z[t - 1][j] * z[t - 1][j];
        }
        const double phi = lagged > 0.0 ? cross / lagged : 0.0;
        params.phi[j] = std::clamp(phi, -kMaxPhi, kMaxPhi);

        double sq = 0.0;
        for (size_t t = 1; t < z.size(); ++t) {
            const double e = z[t][j] - params.phi[j] * z[t - 1][j];
            sq += e * e;
        }
        const double scale = std::sqrt(sq / static_cast<double>(z.size() - 1));
        params.residual_scale[j] = std::max(scale, kMinResidualScale);
    }
    return params;
}

double SequenceModel::Score(const SequenceParams& params, const ModalityInput& input) {
    const size_t length = std::max<size_t>(params.sequence_length, 2);

    // Most recent `length` windows ending at the current one.
    std::vector<const std::vector<double>*> sequence;
    sequence.reserve(length);
    const size_t from_history = std::min(input.history.size(), length - 1);
    for (size_t i = input.history.size() - from_history; i < input.history.size(); ++i) {
        sequence.push_back(input.history[i]);
    }
    sequence.push_back(&input.current);
    const std::vector<double>* oldest = sequence.front();
    while (sequence.size() < length) {
        sequence.insert(sequence.begin(), oldest);
    }

    std::vector<std::vector<double>> z;
    z.reserve(sequence.size());
    for (const auto* row : sequence) {
        z.push_back(params.standardizer.Apply(*row));
    }

    const size_t dim = params.phi.size();
    double total = 0.0;
    size_t terms = 0;
    for (size_t t = 1; t < z.size(); ++t) {
        for (size_t j = 0; j < dim; ++j) {
            const double r = (z[t][j] - params.phi[j] * z[t - 1][j]) / params.residual_scale[j];
            total += r * r;
            ++terms;
        }
    }
    if (terms == 0) return 1.0;

    const double mean_sq = total / static_cast<double>(terms);
    return std::exp(-0.5 * std::max(0.0, mean_sq - 1.0));
}

} // namespace vigil
