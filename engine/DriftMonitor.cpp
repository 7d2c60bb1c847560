#include "engine/DriftMonitor.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace vigil {

namespace {

// Floor on the baseline spread, relative to the baseline mean plus an
// absolute term, so features that were constant during calibration do not
// dominate the drift score.
constexpr double kRelativeScaleFloor = 0.05;
constexpr double kAbsoluteScaleFloor = 0.02;

double BaselineScale(double mean, double variance) {
    const double floor = kRelativeScaleFloor * std::fabs(mean) + kAbsoluteScaleFloor;
    const double sd = variance > 0.0 ? std::sqrt(variance) : 0.0;
    return std::max(sd, floor);
}

} // namespace

DriftMonitor::DriftMonitor(const DriftConfig& drift, const ThresholdConfig& thresholds)
    : drift_(drift), thresholds_(thresholds) {}

void DriftMonitor::SetBaseline(const std::string& user_id, const TrainingData& data, uint64_t now_ms) {
    Tracker tracker;
    tracker.state.user_id = user_id;
    tracker.state.baseline_captured_at = now_ms;

    for (const auto& [modality, rows] : data) {
        if (rows.empty()) continue;
        std::vector<RunningStats> stats(rows.front().size());
        for (const auto& row : rows) {
            for (size_t i = 0; i < stats.size() && i < row.size(); ++i) {
                if (std::isfinite(row[i])) {
                    stats[i].Add(row[i]);
                }
            }
        }
        auto& mean = tracker.state.baseline_mean[modality];
        auto& variance = tracker.state.baseline_variance[modality];
        for (const auto& s : stats) {
            mean.push_back(s.Mean());
            variance.push_back(s.Variance());
        }
    }

    Install(user_id, std::move(tracker));
    LOG_INFO("Drift baseline captured for user {} ({} modalities)", user_id, data.size());
}

void DriftMonitor::SetBaseline(const std::string& user_id,
                               const std::map<Modality, FeatureSnapshot>& snapshot,
                               uint64_t captured_at) {
    Tracker tracker;
    tracker.state.user_id = user_id;
    tracker.state.baseline_captured_at = captured_at;

    for (const auto& [modality, features] : snapshot) {
        if (features.mean.empty()) continue;
        auto& variance = tracker.state.baseline_variance[modality];
        for (size_t i = 0; i < features.mean.size(); ++i) {
            const double sd = i < features.stddev.size() ? features.stddev[i] : 0.0;
            variance.push_back(sd * sd);
        }
        tracker.state.baseline_mean[modality] = features.mean;
    }

    Install(user_id, std::move(tracker));
    LOG_INFO("Drift baseline rebuilt for user {} from a profile snapshot ({} modalities)",
             user_id, snapshot.size());
}

void DriftMonitor::Install(const std::string& user_id, Tracker tracker) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trackers_.find(user_id);
    if (it != trackers_.end()) {
        tracker.state.last_recalibration = it->second.state.last_recalibration;
    }
    trackers_[user_id] = std::move(tracker);
}

void DriftMonitor::Restore(const DriftState& state) {
    Tracker tracker;
    tracker.state = state;
    tracker.state.recent.clear();

    // Only the newest detection_window samples are kept.
    const size_t skip = state.recent.size() > drift_.detection_window
                            ? state.recent.size() - drift_.detection_window
                            : 0;
    for (size_t i = skip; i < state.recent.size(); ++i) {
        tracker.state.recent.push_back(state.recent[i]);
        AddSample(tracker, state.recent[i]);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    trackers_[state.user_id] = std::move(tracker);
}

void DriftMonitor::Forget(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    trackers_.erase(user_id);
}

void DriftMonitor::AddSample(Tracker& tracker, const std::map<Modality, std::vector<double>>& sample) {
    for (const auto& [modality, values] : sample) {
        auto& stats = tracker.current[modality];
        if (stats.size() < values.size()) {
            stats.resize(values.size());
        }
        for (size_t i = 0; i < values.size(); ++i) {
            if (std::isfinite(values[i])) {
                stats[i].Add(values[i]);
            }
        }
    }
}

void DriftMonitor::RemoveSample(Tracker& tracker, const std::map<Modality, std::vector<double>>& sample) {
    for (const auto& [modality, values] : sample) {
        auto it = tracker.current.find(modality);
        if (it == tracker.current.end()) continue;
        for (size_t i = 0; i < values.size() && i < it->second.size(); ++i) {
            if (std::isfinite(values[i])) {
                it->second[i].Remove(values[i]);
            }
        }
    }
}

double DriftMonitor::ComputeDrift(const Tracker& tracker) const {
    double total = 0.0;
    size_t features = 0;
    for (const auto& [modality, base_mean] : tracker.state.baseline_mean) {
        auto cur = tracker.current.find(modality);
        auto var = tracker.state.baseline_variance.find(modality);
        if (cur == tracker.current.end() || var == tracker.state.baseline_variance.end()) continue;

        for (size_t i = 0; i < base_mean.size() && i < cur->second.size() && i < var->second.size(); ++i) {
            const RunningStats& stats = cur->second[i];
            if (stats.Count() == 0 || !std::isfinite(base_mean[i]) || !std::isfinite(var->second[i])) continue;
            total += std::fabs(stats.Mean() - base_mean[i]) / BaselineScale(base_mean[i], var->second[i]);
            ++features;
        }
    }
    return features > 0 ? total / static_cast<double>(features) : 0.0;
}

DriftAssessment DriftMonitor::Observe(const std::string& user_id,
                                      const FeatureWindow& window,
                                      std::optional<double> aggregate) {
    DriftAssessment assessment;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trackers_.find(user_id);
    if (it == trackers_.end()) {
        return assessment;
    }
    Tracker& tracker = it->second;

    std::map<Modality, std::vector<double>> sample;
    for (Modality modality : kAllModalities) {
        if (window.Has(modality) && tracker.state.baseline_mean.count(modality)) {
            sample.emplace(modality, window.Block(modality).values);
        }
    }

    tracker.state.recent.push_back(sample);
    AddSample(tracker, sample);
    while (tracker.state.recent.size() > drift_.detection_window) {
        RemoveSample(tracker, tracker.state.recent.front());
        tracker.state.recent.pop_front();
    }

    if (tracker.state.recent.size() < drift_.min_windows) {
        return assessment;
    }

    const double drift = ComputeDrift(tracker);
    tracker.state.drift_score = drift;

    assessment.available = true;
    assessment.drift_score = drift;
    assessment.above_alert = drift > drift_.alert_threshold;

    if (assessment.above_alert) {
        ++tracker.state.consecutive_above_alert;
        if (tracker.state.consecutive_above_alert >= drift_.sustained_windows) {
            assessment.recalibration_suggested = true;
            LOG_INFO("Sustained drift for user {} (score={:.3f}, windows={}), recalibration suggested",
                     user_id, drift, tracker.state.consecutive_above_alert);
            tracker.state.consecutive_above_alert = 0;
        }
    } else {
        tracker.state.consecutive_above_alert = 0;
    }
    assessment.consecutive_above_alert = tracker.state.consecutive_above_alert;

    const bool low_confidence = !aggregate.has_value() || *aggregate < thresholds_.confidence_threshold;
    assessment.intrusion_suspected = drift > drift_.intrusion_threshold && low_confidence;
    if (assessment.intrusion_suspected) {
        LOG_WARN("Drift {:.3f} with low confidence for user {}, intrusion suspected", drift, user_id);
    }
    return assessment;
}

void DriftMonitor::MarkRecalibrated(const std::string& user_id, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trackers_.find(user_id);
    if (it != trackers_.end()) {
        it->second.state.last_recalibration = now_ms;
    }
}

bool DriftMonitor::HasBaseline(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trackers_.find(user_id);
    return it != trackers_.end() && !it->second.state.baseline_mean.empty();
}

std::optional<double> DriftMonitor::CurrentDrift(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trackers_.find(user_id);
    if (it == trackers_.end() || it->second.state.recent.size() < drift_.min_windows) {
        return std::nullopt;
    }
    return it->second.state.drift_score;
}

std::optional<DriftState> DriftMonitor::Snapshot(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trackers_.find(user_id);
    if (it == trackers_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

} // namespace vigil
