#pragma once

#include "core/Config.hpp"
#include "engine/DriftMonitor.hpp"
#include "session/DecisionEvent.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vigil {

struct SessionTransition {
    SessionState from_state;
    SessionState to_state;
    uint64_t window_id;
    uint64_t timestamp;
    std::string reason;
};

// Per-window inputs to the state machine, produced by the aggregator and the
// drift monitor.
struct WindowSignals {
    uint64_t window_id{0};
    uint64_t timestamp{0};
    std::optional<double> aggregate;       // nullopt when the window was unscorable
    std::map<ModelKind, double> model_scores;
    bool severe_anomaly{false};
    bool consecutive_limit_reached{false};
    DriftAssessment drift;
};

/**
 * SessionStateMachine: trust state of one session.
 *
 *   Calibrating -> Trusted -> Suspicious -> Locked
 *                     ^            |
 *                     +------------+   (recovery)
 *
 * Locked is terminal. Every window and every transition yields a
 * DecisionEvent.
 */
class SessionStateMachine {
public:
    SessionStateMachine(std::string session_id,
                        std::string user_id,
                        const ThresholdConfig& thresholds,
                        const SessionConfig& session);

    // Calibrating -> Trusted. Reason is calibration-complete or profile-loaded.
    // Returns nullopt (and logs) when the session is not Calibrating.
    std::optional<DecisionEvent> CompleteCalibration(uint64_t window_id, uint64_t timestamp, const std::string& why);

    DecisionEvent OnWindow(const WindowSignals& signals);

    // Recalibration is only accepted from Trusted without an intrusion signal.
    bool AcceptRecalibration(bool intrusion_suspected) const;

    SessionState State() const { return state_; }
    const std::string& SessionId() const { return session_id_; }
    const std::string& UserId() const { return user_id_; }
    const std::vector<SessionTransition>& History() const { return history_; }
    uint32_t SuspiciousWindows() const { return suspicious_windows_; }

    static bool IsValidTransition(SessionState from, SessionState to);

private:
    bool TransitionState(SessionState new_state, const std::string& why, DecisionEvent& event);
    DecisionEvent MakeEvent(const WindowSignals& signals) const;

    void OnTrustedWindow(const WindowSignals& signals, DecisionEvent& event);
    void OnSuspiciousWindow(const WindowSignals& signals, DecisionEvent& event);

    std::string session_id_;
    std::string user_id_;
    ThresholdConfig thresholds_;
    SessionConfig session_;

    SessionState state_{SessionState::CALIBRATING};
    uint32_t recovery_streak_{0};
    uint32_t suspicious_windows_{0};
    std::vector<SessionTransition> history_;
};

} // namespace vigil
