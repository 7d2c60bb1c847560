#include "engine/EnsembleScorer.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

namespace vigil {

EnsembleScorer::EnsembleScorer(const ProfileArena& arena) : arena_(arena) {}

ScoreRecord EnsembleScorer::Score(const std::string& user_id,
                                  const FeatureWindow& window,
                                  const WindowHistory& history,
                                  ProfileSetPtr* used) const {
    ProfileSetPtr set = arena_.AcquireOrFallback(user_id);
    ScoreRecord record = ScoreWith(set.get(), user_id, window, history);
    if (used) {
        *used = std::move(set);
    }
    return record;
}

ScoreRecord EnsembleScorer::ScoreWith(const ProfileSet* set,
                                      const std::string& user_id,
                                      const FeatureWindow& window,
                                      const WindowHistory& history) {
    ScoreRecord record;
    record.window_id = window.window_id;
    record.user_id = user_id;
    record.timestamp = window.end_time;

    for (ModelKind kind : kAllModelKinds) {
        const std::string name = ModelKindToString(kind);

        if (!set) {
            record.errors[kind] = "profile-missing";
            continue;
        }
        auto it = set->profiles.find(kind);
        if (it == set->profiles.end() || !it->second) {
            record.errors[kind] = "profile-missing";
            continue;
        }

        try {
            auto score = ScoringModel::Score(*it->second, window, history);
            if (score) {
                record.scores[kind] = *score;
            } else {
                record.errors[kind] = "modality-unavailable";
            }
        } catch (const ModelUntrainedError& ex) {
            record.errors[kind] = "untrained";
            LOG_DEBUG("Window {} of {}: {}", window.window_id, user_id, ex.what());
        } catch (const ModelScoreError& ex) {
            record.errors[kind] = std::string("score-error: ") + ex.what();
            LOG_WARN("Window {} of {}: {} model failed: {}", window.window_id, user_id, name, ex.what());
        } catch (const std::exception& ex) {
            record.errors[kind] = std::string("failure: ") + ex.what();
            LOG_ERROR("Window {} of {}: {} model threw: {}", window.window_id, user_id, name, ex.what());
        }
    }
    return record;
}

} // namespace vigil
