#pragma once

#include "core/Config.hpp"
#include "models/ModelTypes.hpp"
#include "models/ScoringModel.hpp"

namespace vigil {

// One-class hypersphere: the boundary encloses (1 - nu) of the calibration
// vectors in standardized space; the score squashes the signed distance.
class BoundaryModel {
public:
    static BoundaryParams Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config);
    static double Score(const BoundaryParams& params, const ModalityInput& input);

    // Positive inside the boundary, negative outside.
    static double SignedDistance(const BoundaryParams& params, const std::vector<double>& x);
};

} // namespace vigil
