#include "engine/Aggregator.hpp"
#include "core/Errors.hpp"
#include "core/Statistics.hpp"

namespace vigil {

double CalibrationTransform::Apply(double raw) const {
    return Clamp01(scale * raw + offset);
}

CalibrationTransform CalibrationTransform::Fit(const std::vector<double>& raw_scores,
                                               const CalibrationConfig& config) {
    CalibrationTransform transform;
    if (raw_scores.empty()) {
        return transform;
    }

    const double low = Quantile(raw_scores, config.low_percentile);
    const double high = Quantile(raw_scores, config.high_percentile);
    if (high - low < 1e-9) {
        // Degenerate calibration sample: no spread to map, keep raw scores.
        return transform;
    }

    transform.scale = (1.0 - config.calibration_floor) / (high - low);
    transform.offset = 1.0 - transform.scale * high;
    return transform;
}

Aggregator::Aggregator(const ThresholdConfig& thresholds, const ModelConfig& models)
    : thresholds_(thresholds), models_(models) {}

double Aggregator::Combine(const std::map<ModelKind, double>& scores,
                           const TransformSet& transforms,
                           std::map<ModelKind, double>* calibrated) const {
    if (scores.empty()) {
        throw ModelUntrainedError("Cannot aggregate a window with zero model scores");
    }

    double weighted = 0.0;
    double weight_sum = 0.0;
    for (const auto& [kind, raw] : scores) {
        auto it = transforms.find(kind);
        const double value = it != transforms.end() ? it->second.Apply(raw) : Clamp01(raw);
        if (calibrated) {
            (*calibrated)[kind] = value;
        }
        const double weight = models_.WeightFor(kind);
        weighted += weight * value;
        weight_sum += weight;
    }

    if (weight_sum <= 0.0) {
        throw ModelUntrainedError("All present models carry zero weight");
    }
    return Clamp01(weighted / weight_sum);
}

AggregateResult Aggregator::Evaluate(const std::map<ModelKind, double>& scores, const TransformSet& transforms) {
    AggregateResult result;
    result.aggregate = Combine(scores, transforms, &result.calibrated);
    result.model_count = scores.size();
    result.genuine = IsGenuine(result.aggregate);
    result.severe_anomaly = IsSevereAnomaly(result.aggregate);
    Advance(result);
    return result;
}

AggregateResult Aggregator::RecordUnscorable() {
    AggregateResult result;
    Advance(result);
    return result;
}

void Aggregator::Advance(AggregateResult& result) {
    if (result.genuine) {
        consecutive_low_ = 0;
    } else {
        ++consecutive_low_;
    }
    result.consecutive_low = consecutive_low_;
    result.consecutive_limit_reached = consecutive_low_ >= thresholds_.consecutive_anomalies_limit;
}

} // namespace vigil
