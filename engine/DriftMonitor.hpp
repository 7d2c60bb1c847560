#pragma once

#include "core/Config.hpp"
#include "core/Statistics.hpp"
#include "features/FeatureWindow.hpp"
#include "models/ScoringModel.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil {

// Persistable drift state for one user. The rolling statistics are rebuilt
// from `recent` when the state is restored.
struct DriftState {
    std::string user_id;
    std::map<Modality, std::vector<double>> baseline_mean;
    std::map<Modality, std::vector<double>> baseline_variance;
    std::deque<std::map<Modality, std::vector<double>>> recent; // oldest first
    double drift_score{0.0};
    uint32_t consecutive_above_alert{0};
    uint64_t baseline_captured_at{0};
    uint64_t last_recalibration{0};
};

struct DriftAssessment {
    double drift_score{0.0};
    bool available{false};            // enough windows held to compute drift
    bool above_alert{false};
    bool recalibration_suggested{false};
    bool intrusion_suspected{false};
    uint32_t consecutive_above_alert{0};
};

/**
 * DriftMonitor: baseline vs. live feature distribution per user.
 *
 * Drift is the mean standardized shift of the rolling feature means from the
 * calibration baseline. It is evaluated jointly with the aggregate score: a
 * large shift alone suggests recalibration, a large shift together with low
 * confidence suggests intrusion.
 */
class DriftMonitor {
public:
    DriftMonitor(const DriftConfig& drift, const ThresholdConfig& thresholds);

    // Captures the baseline from calibration rows and clears the live window.
    void SetBaseline(const std::string& user_id, const TrainingData& data, uint64_t now_ms);
    // Rebuilds the baseline from the feature distribution a profile was
    // trained on, for users whose drift state was never persisted.
    void SetBaseline(const std::string& user_id,
                     const std::map<Modality, FeatureSnapshot>& snapshot,
                     uint64_t captured_at);
    void Restore(const DriftState& state);
    void Forget(const std::string& user_id);

    // aggregate is nullopt when the window could not be scored; that counts
    // as below confidence for the intrusion check.
    DriftAssessment Observe(const std::string& user_id,
                            const FeatureWindow& window,
                            std::optional<double> aggregate);

    void MarkRecalibrated(const std::string& user_id, uint64_t now_ms);

    bool HasBaseline(const std::string& user_id) const;
    std::optional<double> CurrentDrift(const std::string& user_id) const;
    std::optional<DriftState> Snapshot(const std::string& user_id) const;

private:
    struct Tracker {
        DriftState state;
        std::map<Modality, std::vector<RunningStats>> current;
    };

    void Install(const std::string& user_id, Tracker tracker);
    static void AddSample(Tracker& tracker, const std::map<Modality, std::vector<double>>& sample);
    static void RemoveSample(Tracker& tracker, const std::map<Modality, std::vector<double>>& sample);
    double ComputeDrift(const Tracker& tracker) const;

    DriftConfig drift_;
    ThresholdConfig thresholds_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Tracker> trackers_;
};

} // namespace vigil
