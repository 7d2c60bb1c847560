#pragma once

#include "core/Config.hpp"
#include "features/FeatureWindow.hpp"
#include "models/ModelTypes.hpp"
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vigil {

// Ordered training rows per modality (oldest first), one row per window in
// which the modality was present.
using TrainingData = std::map<Modality, std::vector<std::vector<double>>>;

// Previous windows of the session, oldest first, excluding the scored window.
using WindowHistory = std::deque<FeatureWindow>;

// One modality's view of the scored window plus its recent history.
struct ModalityInput {
    const std::vector<double>& current;
    std::vector<const std::vector<double>*> history; // oldest first
};

/**
 * ScoringModel: the capability set shared by all six detectors.
 *
 * Dispatch is over the ModelParams variant; each variant owns its parameter
 * struct and implements Fit/Score (and Update for the online variants).
 */
class ScoringModel {
public:
    static ModelProfile Train(ModelKind kind,
                              const std::string& user_id,
                              const TrainingData& data,
                              const ModelConfig& config,
                              uint64_t now_ms);

    // Genuineness in [0,1], averaged over the trained modalities present in
    // the window. nullopt when no trained modality is present.
    // Throws ModelUntrainedError / ModelScoreError.
    static std::optional<double> Score(const ModelProfile& profile,
                                       const FeatureWindow& window,
                                       const WindowHistory& history);

    static bool SupportsUpdate(ModelKind kind);

    // Returns a copy of the profile with one genuine sample absorbed.
    // Profiles of kinds without online learning are returned unchanged.
    static ModelProfile Update(const ModelProfile& profile, const FeatureWindow& window);

private:
    static double ScoreParams(const ModelParams& params, const ModalityInput& input);
};

} // namespace vigil
