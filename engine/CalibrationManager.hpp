#pragma once

#include "core/Config.hpp"
#include "engine/DriftMonitor.hpp"
#include "engine/ProfileArena.hpp"
#include "features/FeatureWindow.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil {

class ProfileStore;

struct CalibrationResult {
    std::string user_id;
    size_t windows{0};
    uint64_t elapsed_ms{0};
    uint64_t generation{0};
    bool degraded{false};
    std::vector<Modality> missing_modalities;
    std::map<Modality, size_t> modality_windows;
};

/**
 * CalibrationManager: collects calibration windows per user and trains the
 * six-model profile set from them.
 *
 * Training runs under the user's exclusive arena lock. The resulting set,
 * calibration transforms and drift baseline are published and persisted.
 */
class CalibrationManager {
public:
    CalibrationManager(const EngineConfig& config, ProfileArena& arena, DriftMonitor& drift, ProfileStore* store);

    void AddWindow(const std::string& user_id, const FeatureWindow& window);
    void Discard(const std::string& user_id);

    size_t WindowCount(const std::string& user_id) const;
    uint64_t ElapsedMs(const std::string& user_id) const;

    // Both the time and window-count minimums are met.
    bool Ready(const std::string& user_id) const;

    // Trains from the collected windows.
    // Throws CalibrationIncomplete or InsufficientModalityData.
    CalibrationResult Calibrate(const std::string& user_id, uint64_t now_ms);

    // Drift-triggered retraining from recent genuine windows; skips the
    // elapsed-time minimum. Throws CalibrationIncomplete or InsufficientModalityData.
    CalibrationResult Recalibrate(const std::string& user_id,
                                  const std::vector<FeatureWindow>& windows,
                                  uint64_t now_ms);

private:
    CalibrationResult TrainAndPublish(const std::string& user_id,
                                      const std::vector<FeatureWindow>& windows,
                                      uint64_t now_ms);
    void Persist(const ProfileSet& set);

    static uint64_t Span(const std::vector<FeatureWindow>& windows);

    EngineConfig config_;
    ProfileArena& arena_;
    DriftMonitor& drift_;
    ProfileStore* store_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<FeatureWindow>> pending_;
};

} // namespace vigil
