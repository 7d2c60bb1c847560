#pragma once

#include "core/Config.hpp"
#include "models/ModelTypes.hpp"
#include "models/ScoringModel.hpp"

namespace vigil {

// PCA subspace detector: genuine vectors reconstruct well from the leading
// principal components of the calibration data.
class ReconstructionModel {
public:
    static ReconstructionParams Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config);
    static double Score(const ReconstructionParams& params, const ModalityInput& input);

    static double ReconstructionError(const ReconstructionParams& params, const std::vector<double>& x);
};

} // namespace vigil
