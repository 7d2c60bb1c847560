#pragma once

#include "models/ModelKind.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace vigil {

enum class SessionState {
    CALIBRATING,
    TRUSTED,
    SUSPICIOUS,
    LOCKED
};

inline std::string SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::CALIBRATING: return "Calibrating";
        case SessionState::TRUSTED:     return "Trusted";
        case SessionState::SUSPICIOUS:  return "Suspicious";
        case SessionState::LOCKED:      return "Locked";
        default:                        return "Unknown";
    }
}

// Reason codes carried by decision events.
namespace reason {
constexpr const char* kCalibrationComplete = "calibration-complete";
constexpr const char* kProfileLoaded = "profile-loaded";
constexpr const char* kConsecutiveLowConfidence = "consecutive-low-confidence";
constexpr const char* kSevereAnomaly = "severe-anomaly";
constexpr const char* kDriftIntrusion = "drift-intrusion";
constexpr const char* kRecovered = "recovered";
constexpr const char* kPersistentAnomaly = "persistent-anomaly";
constexpr const char* kWindowScored = "window-scored";
constexpr const char* kCalibrating = "calibrating";
constexpr const char* kScoringUnavailable = "scoring-unavailable";
} // namespace reason

struct DecisionEvent {
    std::string session_id;
    std::string user_id;
    uint64_t window_id{0};
    uint64_t timestamp{0};
    SessionState state{SessionState::CALIBRATING};
    SessionState previous_state{SessionState::CALIBRATING};
    std::optional<double> aggregate;
    std::map<ModelKind, double> model_scores;
    std::optional<double> drift_score;
    std::string reason;
    bool transition{false};
};

void to_json(nlohmann::json& j, const DecisionEvent& event);

} // namespace vigil
