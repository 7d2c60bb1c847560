#include "session/SessionStateMachine.hpp"
#include "core/Logger.hpp"

namespace vigil {

SessionStateMachine::SessionStateMachine(std::string session_id,
                                         std::string user_id,
                                         const ThresholdConfig& thresholds,
                                         const SessionConfig& session)
    : session_id_(std::move(session_id)),
      user_id_(std::move(user_id)),
      thresholds_(thresholds),
      session_(session) {}

bool SessionStateMachine::IsValidTransition(SessionState from, SessionState to) {
    switch (from) {
        case SessionState::CALIBRATING:
            return to == SessionState::TRUSTED;
        case SessionState::TRUSTED:
            return to == SessionState::SUSPICIOUS;
        case SessionState::SUSPICIOUS:
            return to == SessionState::TRUSTED || to == SessionState::LOCKED;
        case SessionState::LOCKED:
            return false;
        default:
            return false;
    }
}

bool SessionStateMachine::TransitionState(SessionState new_state, const std::string& why, DecisionEvent& event) {
    if (!IsValidTransition(state_, new_state)) {
        LOG_WARN("Invalid state transition for session {}: {} -> {}",
                 session_id_,
                 SessionStateToString(state_),
                 SessionStateToString(new_state));
        return false;
    }

    SessionTransition transition;
    transition.from_state = state_;
    transition.to_state = new_state;
    transition.window_id = event.window_id;
    transition.timestamp = event.timestamp;
    transition.reason = why;
    history_.push_back(transition);

    state_ = new_state;
    recovery_streak_ = 0;
    suspicious_windows_ = 0;

    event.previous_state = transition.from_state;
    event.state = new_state;
    event.reason = why;
    event.transition = true;

    LOG_INFO("Session {} state: {} -> {} (reason: {})",
             session_id_,
             SessionStateToString(transition.from_state),
             SessionStateToString(new_state),
             why);
    return true;
}

DecisionEvent SessionStateMachine::MakeEvent(const WindowSignals& signals) const {
    DecisionEvent event;
    event.session_id = session_id_;
    event.user_id = user_id_;
    event.window_id = signals.window_id;
    event.timestamp = signals.timestamp;
    event.state = state_;
    event.previous_state = state_;
    event.aggregate = signals.aggregate;
    event.model_scores = signals.model_scores;
    if (signals.drift.available) {
        event.drift_score = signals.drift.drift_score;
    }
    event.reason = signals.aggregate ? reason::kWindowScored : reason::kScoringUnavailable;
    return event;
}

std::optional<DecisionEvent> SessionStateMachine::CompleteCalibration(uint64_t window_id,
                                                                      uint64_t timestamp,
                                                                      const std::string& why) {
    if (state_ != SessionState::CALIBRATING) {
        LOG_WARN("Session {} is {}, ignoring calibration completion ({})",
                 session_id_, SessionStateToString(state_), why);
        return std::nullopt;
    }

    DecisionEvent event;
    event.session_id = session_id_;
    event.user_id = user_id_;
    event.window_id = window_id;
    event.timestamp = timestamp;
    event.state = state_;
    event.previous_state = state_;
    if (!TransitionState(SessionState::TRUSTED, why, event)) {
        return std::nullopt;
    }
    return event;
}

DecisionEvent SessionStateMachine::OnWindow(const WindowSignals& signals) {
    DecisionEvent event = MakeEvent(signals);

    switch (state_) {
        case SessionState::CALIBRATING:
            event.reason = reason::kCalibrating;
            break;
        case SessionState::TRUSTED:
            OnTrustedWindow(signals, event);
            break;
        case SessionState::SUSPICIOUS:
            OnSuspiciousWindow(signals, event);
            break;
        case SessionState::LOCKED:
            break;
    }
    return event;
}

void SessionStateMachine::OnTrustedWindow(const WindowSignals& signals, DecisionEvent& event) {
    if (signals.drift.intrusion_suspected) {
        TransitionState(SessionState::SUSPICIOUS, reason::kDriftIntrusion, event);
    } else if (signals.aggregate && signals.severe_anomaly) {
        TransitionState(SessionState::SUSPICIOUS, reason::kSevereAnomaly, event);
    } else if (signals.consecutive_limit_reached) {
        TransitionState(SessionState::SUSPICIOUS, reason::kConsecutiveLowConfidence, event);
    }
}

void SessionStateMachine::OnSuspiciousWindow(const WindowSignals& signals, DecisionEvent& event) {
    const bool genuine = signals.aggregate && *signals.aggregate >= thresholds_.confidence_threshold;
    recovery_streak_ = genuine ? recovery_streak_ + 1 : 0;

    const bool drift_settled = !signals.drift.above_alert;
    if (recovery_streak_ >= session_.recovery_windows && drift_settled) {
        TransitionState(SessionState::TRUSTED, reason::kRecovered, event);
        return;
    }

    ++suspicious_windows_;
    if (suspicious_windows_ > session_.suspicious_hard_cap) {
        TransitionState(SessionState::LOCKED, reason::kPersistentAnomaly, event);
    }
}

bool SessionStateMachine::AcceptRecalibration(bool intrusion_suspected) const {
    if (state_ != SessionState::TRUSTED || intrusion_suspected) {
        LOG_WARN("Session {}: recalibration rejected (state={}, intrusion_suspected={})",
                 session_id_, SessionStateToString(state_), intrusion_suspected);
        return false;
    }
    return true;
}

} // namespace vigil
