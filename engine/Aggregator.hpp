#pragma once

#include "core/Config.hpp"
#include "models/ModelKind.hpp"
#include <cstdint>
#include <map>
#include <vector>

namespace vigil {

// Per-(user, model) affine map from raw model score to calibrated score.
struct CalibrationTransform {
    double scale{1.0};
    double offset{0.0};

    double Apply(double raw) const;

    // Maps the low/high percentiles of the calibration-time raw scores onto
    // [calibration_floor, 1].
    static CalibrationTransform Fit(const std::vector<double>& raw_scores, const CalibrationConfig& config);
};

using TransformSet = std::map<ModelKind, CalibrationTransform>;

struct AggregateResult {
    double aggregate{0.0};
    std::map<ModelKind, double> calibrated;
    size_t model_count{0};
    bool genuine{false};
    bool severe_anomaly{false};
    uint32_t consecutive_low{0};
    bool consecutive_limit_reached{false};
};

/**
 * Aggregator: calibrated weighted mean over the models that produced a score.
 *
 * Weights are renormalized over the present models only. The consecutive
 * low-confidence counter is per instance; each session owns one Aggregator.
 */
class Aggregator {
public:
    Aggregator(const ThresholdConfig& thresholds, const ModelConfig& models);

    // Pure combination. Throws ModelUntrainedError when scores is empty.
    double Combine(const std::map<ModelKind, double>& scores,
                   const TransformSet& transforms,
                   std::map<ModelKind, double>* calibrated = nullptr) const;

    // Combines and advances the consecutive low-confidence counter.
    AggregateResult Evaluate(const std::map<ModelKind, double>& scores, const TransformSet& transforms);

    // A window that could not be scored counts as low confidence.
    AggregateResult RecordUnscorable();

    bool IsGenuine(double aggregate) const { return aggregate >= thresholds_.confidence_threshold; }
    bool IsSevereAnomaly(double aggregate) const { return 1.0 - aggregate >= thresholds_.anomaly_score_threshold; }

    uint32_t ConsecutiveLow() const { return consecutive_low_; }
    void ResetCounter() { consecutive_low_ = 0; }

private:
    void Advance(AggregateResult& result);

    ThresholdConfig thresholds_;
    ModelConfig models_;
    uint32_t consecutive_low_{0};
};

} // namespace vigil
