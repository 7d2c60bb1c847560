#pragma once

#include "core/Config.hpp"
#include "models/ModelTypes.hpp"
#include "models/ScoringModel.hpp"

namespace vigil {

// Incremental k-NN over a bounded memory of recent genuine vectors.
// Eviction is oldest-first once capacity is reached.
class NeighborModel {
public:
    static NeighborParams Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config);
    static double Score(const NeighborParams& params, const ModalityInput& input);
    static void Absorb(NeighborParams& params, const std::vector<double>& x);

    static double MeanNeighborDistance(const NeighborParams& params, const std::vector<double>& z,
                                       const std::vector<double>* exclude = nullptr);
};

} // namespace vigil
