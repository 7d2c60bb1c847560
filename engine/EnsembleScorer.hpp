#pragma once

#include "engine/ProfileArena.hpp"
#include "features/FeatureWindow.hpp"
#include "models/ScoringModel.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace vigil {

struct ScoreRecord {
    uint64_t window_id{0};
    std::string user_id;
    uint64_t timestamp{0};
    std::map<ModelKind, double> scores;        // raw, only models that scored
    std::map<ModelKind, std::string> errors;   // reason per omitted model
    std::map<ModelKind, double> calibrated;
    std::optional<double> aggregate;

    bool Complete() const { return scores.size() == kModelKindCount; }
};

/**
 * EnsembleScorer: runs all six models of the window's owner.
 *
 * A model that is missing, untrained, fails, or has none of its trained
 * modalities in the window is omitted from `scores` and explained in
 * `errors`; the remaining models still score.
 */
class EnsembleScorer {
public:
    explicit EnsembleScorer(const ProfileArena& arena);

    // Scores against the user's current set (or the last published one on
    // lock timeout). The set used is returned through `used` when given.
    ScoreRecord Score(const std::string& user_id,
                      const FeatureWindow& window,
                      const WindowHistory& history,
                      ProfileSetPtr* used = nullptr) const;

    static ScoreRecord ScoreWith(const ProfileSet* set,
                                 const std::string& user_id,
                                 const FeatureWindow& window,
                                 const WindowHistory& history);

private:
    const ProfileArena& arena_;
};

} // namespace vigil
