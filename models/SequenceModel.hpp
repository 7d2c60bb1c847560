#pragma once

#include "core/Config.hpp"
#include "models/ModelTypes.hpp"
#include "models/ScoringModel.hpp"

namespace vigil {

class SequenceModel {
public:
    static SequenceParams Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config);
    static double Score(const SequenceParams& params, const ModalityInput& input);
};

} // namespace vigil
