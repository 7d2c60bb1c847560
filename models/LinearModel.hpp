#pragma once

#include "core/Config.hpp"
#include "models/ModelTypes.hpp"
#include "models/ScoringModel.hpp"
#include <random>

namespace vigil {

// Passive-aggressive (PA-I) linear classifier over the quadratic map
// [z_1^2 .. z_d^2, 1]. Impostor-side samples are synthesized by displacing
// genuine vectors by +-3 sigma per feature.
class LinearModel {
public:
    static LinearParams Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config);
    static double Score(const LinearParams& params, const ModalityInput& input);
    static void Absorb(LinearParams& params, const std::vector<double>& x);

    static double Margin(const LinearParams& params, const std::vector<double>& x);

private:
    static std::vector<double> FeatureMap(const std::vector<double>& z);
    static std::vector<double> SyntheticNegative(const std::vector<double>& z, std::mt19937& rng);
    static void Step(LinearParams& params, const std::vector<double>& phi, double label);
};

} // namespace vigil
