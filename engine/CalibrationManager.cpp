#include "engine/CalibrationManager.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "models/ScoringModel.hpp"
#include "persistence/ProfileStore.hpp"
#include <algorithm>

namespace vigil {

CalibrationManager::CalibrationManager(const EngineConfig& config,
                                       ProfileArena& arena,
                                       DriftMonitor& drift,
                                       ProfileStore* store)
    : config_(config), arena_(arena), drift_(drift), store_(store) {}

void CalibrationManager::AddWindow(const std::string& user_id, const FeatureWindow& window) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_[user_id].push_back(window);
}

void CalibrationManager::Discard(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(user_id);
}

size_t CalibrationManager::WindowCount(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(user_id);
    return it != pending_.end() ? it->second.size() : 0;
}

uint64_t CalibrationManager::Span(const std::vector<FeatureWindow>& windows) {
    if (windows.empty()) return 0;
    const uint64_t first = windows.front().start_time;
    const uint64_t last = windows.back().end_time;
    return last >= first ? last - first : 0;
}

uint64_t CalibrationManager::ElapsedMs(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(user_id);
    return it != pending_.end() ? Span(it->second) : 0;
}

bool CalibrationManager::Ready(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(user_id);
    if (it == pending_.end()) return false;
    return it->second.size() >= config_.calibration.min_calibration_windows &&
           Span(it->second) >= config_.calibration.min_calibration_time_ms;
}

CalibrationResult CalibrationManager::Calibrate(const std::string& user_id, uint64_t now_ms) {
    std::vector<FeatureWindow> windows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(user_id);
        if (it != pending_.end()) {
            windows = it->second;
        }
    }

    const uint64_t elapsed = Span(windows);
    if (elapsed < config_.calibration.min_calibration_time_ms) {
        throw CalibrationIncomplete("Calibration for user '" + user_id + "' has " +
                                    std::to_string(elapsed / 1000) + " s of data, " +
                                    std::to_string(config_.calibration.min_calibration_time_ms / 1000) +
                                    " s required");
    }

    CalibrationResult result = TrainAndPublish(user_id, windows, now_ms);
    Discard(user_id);
    return result;
}

CalibrationResult CalibrationManager::Recalibrate(const std::string& user_id,
                                                  const std::vector<FeatureWindow>& windows,
                                                  uint64_t now_ms) {
    LOG_INFO("Recalibrating user {} from {} recent windows", user_id, windows.size());
    CalibrationResult result = TrainAndPublish(user_id, windows, now_ms);
    drift_.MarkRecalibrated(user_id, now_ms);
    return result;
}

CalibrationResult CalibrationManager::TrainAndPublish(const std::string& user_id,
                                                      const std::vector<FeatureWindow>& windows,
                                                      uint64_t now_ms) {
    if (windows.size() < config_.calibration.min_calibration_windows) {
        throw CalibrationIncomplete("Calibration for user '" + user_id + "' has " +
                                    std::to_string(windows.size()) + " windows, " +
                                    std::to_string(config_.calibration.min_calibration_windows) +
                                    " required");
    }

    CalibrationResult result;
    result.user_id = user_id;
    result.windows = windows.size();
    result.elapsed_ms = Span(windows);

    TrainingData data;
    for (Modality modality : kAllModalities) {
        std::vector<std::vector<double>> rows;
        for (const auto& window : windows) {
            if (window.Has(modality)) {
                rows.push_back(window.Block(modality).values);
            }
        }
        result.modality_windows[modality] = rows.size();
        if (rows.size() >= config_.calibration.min_modality_windows) {
            data.emplace(modality, std::move(rows));
        } else {
            result.missing_modalities.push_back(modality);
        }
    }

    if (data.empty()) {
        throw InsufficientModalityData("No modality of user '" + user_id + "' reached " +
                                       std::to_string(config_.calibration.min_modality_windows) +
                                       " calibration windows");
    }
    if (!result.missing_modalities.empty()) {
        result.degraded = true;
        LOG_WARN("Insufficient {} data for user {} ({} windows), training a degraded profile",
                 ModalityToString(result.missing_modalities.front()), user_id,
                 result.modality_windows[result.missing_modalities.front()]);
    }

    // Scoring reads for this user wait (and fall back) while training runs.
    auto guard = arena_.LockExclusive(user_id);
    ProfileSetPtr previous = arena_.Published(user_id);

    ProfileSet set;
    set.user_id = user_id;
    set.degraded = result.degraded;
    set.missing_modalities = result.missing_modalities;

    for (ModelKind kind : kAllModelKinds) {
        ModelProfile profile = ScoringModel::Train(kind, user_id, data, config_.models, now_ms);
        profile.version = 1;
        if (previous) {
            auto it = previous->profiles.find(kind);
            if (it != previous->profiles.end() && it->second) {
                profile.version = it->second->version + 1;
            }
        }

        // In-sample raw scores, each window scored against its own history.
        std::vector<double> raw;
        raw.reserve(windows.size());
        WindowHistory history;
        for (const auto& window : windows) {
            auto score = ScoringModel::Score(profile, window, history);
            if (score) {
                raw.push_back(*score);
            }
            history.push_back(window);
            while (history.size() > config_.session.history_windows) {
                history.pop_front();
            }
        }
        set.transforms[kind] = CalibrationTransform::Fit(raw, config_.calibration);

        LOG_DEBUG("Trained {} model for user {} (version {}, {} windows)",
                  ModelKindToString(kind), user_id, profile.version, profile.training_windows);
        set.profiles[kind] = std::make_shared<const ModelProfile>(std::move(profile));
    }

    drift_.SetBaseline(user_id, data, now_ms);
    arena_.PublishLocked(std::move(set), guard);
    ProfileSetPtr published = arena_.Published(user_id);
    guard.unlock();

    result.generation = published ? published->generation : 0;
    if (published) {
        Persist(*published);
    }

    LOG_INFO("Calibration complete for user {}: {} windows over {} s{}",
             user_id, result.windows, result.elapsed_ms / 1000, result.degraded ? " (degraded)" : "");
    return result;
}

void CalibrationManager::Persist(const ProfileSet& set) {
    if (!store_) return;

    for (const auto& [kind, profile] : set.profiles) {
        if (profile && !store_->SaveProfile(*profile)) {
            LOG_WARN("Failed to persist {} profile for user {}", ModelKindToString(kind), set.user_id);
        }
    }
    if (!store_->SaveCalibration(set.user_id, set.transforms)) {
        LOG_WARN("Failed to persist calibration transforms for user {}", set.user_id);
    }
    auto drift_state = drift_.Snapshot(set.user_id);
    if (drift_state && !store_->SaveDriftState(set.user_id, *drift_state)) {
        LOG_WARN("Failed to persist drift baseline for user {}", set.user_id);
    }
}

} // namespace vigil
