#include <gtest/gtest.h>
#include "engine/Aggregator.hpp"
#include "session/SessionStateMachine.hpp"

using namespace vigil;

class SessionStateMachineTest : public ::testing::Test {
protected:
    SessionStateMachine MakeTrusted() {
        SessionStateMachine machine("s1", "alice", thresholds_, session_);
        auto event = machine.CompleteCalibration(0, 1000, reason::kProfileLoaded);
        EXPECT_TRUE(event.has_value());
        return machine;
    }

    // Feeds one window with every model scoring `score` through the aggregator.
    DecisionEvent Feed(SessionStateMachine& machine, Aggregator& aggregator, double score,
                       DriftAssessment drift = DriftAssessment()) {
        std::map<ModelKind, double> scores;
        for (ModelKind kind : kAllModelKinds) {
            scores[kind] = score;
        }
        AggregateResult result = aggregator.Evaluate(scores, {});

        WindowSignals signals;
        signals.window_id = ++window_id_;
        signals.timestamp = window_id_ * 30000;
        signals.aggregate = result.aggregate;
        signals.model_scores = scores;
        signals.severe_anomaly = result.severe_anomaly;
        signals.consecutive_limit_reached = result.consecutive_limit_reached;
        signals.drift = drift;
        return machine.OnWindow(signals);
    }

    ThresholdConfig thresholds_;
    SessionConfig session_;
    ModelConfig models_;
    uint64_t window_id_{0};
};

TEST_F(SessionStateMachineTest, StartsCalibrating) {
    SessionStateMachine machine("s1", "alice", thresholds_, session_);

    EXPECT_EQ(machine.State(), SessionState::CALIBRATING);

    WindowSignals signals;
    signals.window_id = 1;
    DecisionEvent event = machine.OnWindow(signals);
    EXPECT_EQ(event.reason, reason::kCalibrating);
    EXPECT_FALSE(event.transition);
}

TEST_F(SessionStateMachineTest, CalibrationCompletionEntersTrusted) {
    SessionStateMachine machine("s1", "alice", thresholds_, session_);

    auto event = machine.CompleteCalibration(12, 360000, reason::kCalibrationComplete);

    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(event->transition);
    EXPECT_EQ(event->previous_state, SessionState::CALIBRATING);
    EXPECT_EQ(event->state, SessionState::TRUSTED);
    EXPECT_EQ(event->reason, reason::kCalibrationComplete);
    EXPECT_EQ(machine.History().size(), 1u);

    EXPECT_FALSE(machine.CompleteCalibration(13, 390000, reason::kCalibrationComplete).has_value());
}

TEST_F(SessionStateMachineTest, UniformHighScoresStayTrusted) {
    SessionStateMachine machine = MakeTrusted();
    Aggregator aggregator(thresholds_, models_);

    for (int i = 0; i < 10; ++i) {
        DecisionEvent event = Feed(machine, aggregator, 0.9);
        EXPECT_EQ(event.state, SessionState::TRUSTED);
        EXPECT_FALSE(event.transition);
        EXPECT_EQ(event.reason, reason::kWindowScored);
        ASSERT_TRUE(event.aggregate.has_value());
        EXPECT_NEAR(*event.aggregate, 0.9, 1e-12);
    }
    EXPECT_EQ(machine.History().size(), 1u);
}

TEST_F(SessionStateMachineTest, ThreeLowWindowsEnterSuspicious) {
    SessionStateMachine machine = MakeTrusted();
    Aggregator aggregator(thresholds_, models_);

    EXPECT_EQ(Feed(machine, aggregator, 0.3).state, SessionState::TRUSTED);
    EXPECT_EQ(Feed(machine, aggregator, 0.4).state, SessionState::TRUSTED);

    DecisionEvent third = Feed(machine, aggregator, 0.5);
    EXPECT_TRUE(third.transition);
    EXPECT_EQ(third.previous_state, SessionState::TRUSTED);
    EXPECT_EQ(third.state, SessionState::SUSPICIOUS);
    EXPECT_EQ(third.reason, reason::kConsecutiveLowConfidence);
    EXPECT_EQ(third.window_id, 3u);
}

TEST_F(SessionStateMachineTest, GenuineWindowBreaksLowStreak) {
    SessionStateMachine machine = MakeTrusted();
    Aggregator aggregator(thresholds_, models_);

    Feed(machine, aggregator, 0.3);
    Feed(machine, aggregator, 0.4);
    Feed(machine, aggregator, 0.9);
    Feed(machine, aggregator, 0.5);

    EXPECT_EQ(machine.State(), SessionState::TRUSTED);
}

TEST_F(SessionStateMachineTest, SevereAnomalyTransitionsImmediately) {
    SessionStateMachine machine = MakeTrusted();
    Aggregator aggregator(thresholds_, models_);

    DecisionEvent event = Feed(machine, aggregator, 0.1);

    EXPECT_EQ(event.state, SessionState::SUSPICIOUS);
    EXPECT_EQ(event.reason, reason::kSevereAnomaly);
}

TEST_F(SessionStateMachineTest, DriftIntrusionTakesPriority) {
    SessionStateMachine machine = MakeTrusted();
    Aggregator aggregator(thresholds_, models_);

    DriftAssessment drift;
    drift.available = true;
    drift.drift_score = 3.0;
    drift.above_alert = true;
    drift.intrusion_suspected = true;

    DecisionEvent event = Feed(machine, aggregator, 0.1, drift);

    EXPECT_EQ(event.state, SessionState::SUSPICIOUS);
    EXPECT_EQ(event.reason, reason::kDriftIntrusion);
    ASSERT_TRUE(event.drift_score.has_value());
    EXPECT_DOUBLE_EQ(*event.drift_score, 3.0);
}

TEST_F(SessionStateMachineTest, RecoveryNeedsGenuineStreakAndSettledDrift) {
    SessionStateMachine machine = MakeTrusted();
    Aggregator aggregator(thresholds_, models_);
    Feed(machine, aggregator, 0.1);
    ASSERT_EQ(machine.State(), SessionState::SUSPICIOUS);

    DriftAssessment drifting;
    drifting.available = true;
    drifting.drift_score = 1.5;
    drifting.above_alert = true;

    Feed(machine, aggregator, 0.9, drifting);
    Feed(machine, aggregator, 0.9, drifting);
    Feed(machine, aggregator, 0.9, drifting);
    EXPECT_EQ(machine.State(), SessionState::SUSPICIOUS);

    DecisionEvent recovered = Feed(machine, aggregator, 0.9);
    EXPECT_EQ(recovered.state, SessionState::TRUSTED);
    EXPECT_EQ(recovered.reason, reason::kRecovered);
}

TEST_F(SessionStateMachineTest, PersistentAnomalyLocksSession) {
    SessionStateMachine machine = MakeTrusted();
    Aggregator aggregator(thresholds_, models_);
    Feed(machine, aggregator, 0.1);
    ASSERT_EQ(machine.State(), SessionState::SUSPICIOUS);

    DecisionEvent event;
    for (uint32_t i = 0; i <= session_.suspicious_hard_cap; ++i) {
        event = Feed(machine, aggregator, 0.4);
    }

    EXPECT_EQ(event.state, SessionState::LOCKED);
    EXPECT_EQ(event.reason, reason::kPersistentAnomaly);
    EXPECT_TRUE(event.transition);
}

TEST_F(SessionStateMachineTest, LockedIsTerminal) {
    SessionStateMachine machine = MakeTrusted();
    Aggregator aggregator(thresholds_, models_);
    Feed(machine, aggregator, 0.1);
    for (uint32_t i = 0; i <= session_.suspicious_hard_cap; ++i) {
        Feed(machine, aggregator, 0.4);
    }
    ASSERT_EQ(machine.State(), SessionState::LOCKED);

    for (int i = 0; i < 5; ++i) {
        DecisionEvent event = Feed(machine, aggregator, 0.99);
        EXPECT_EQ(event.state, SessionState::LOCKED);
        EXPECT_FALSE(event.transition);
    }
    EXPECT_FALSE(machine.AcceptRecalibration(false));
}

TEST_F(SessionStateMachineTest, OnlyDeclaredEdgesAreValid) {
    EXPECT_TRUE(SessionStateMachine::IsValidTransition(SessionState::CALIBRATING, SessionState::TRUSTED));
    EXPECT_TRUE(SessionStateMachine::IsValidTransition(SessionState::TRUSTED, SessionState::SUSPICIOUS));
    EXPECT_TRUE(SessionStateMachine::IsValidTransition(SessionState::SUSPICIOUS, SessionState::TRUSTED));
    EXPECT_TRUE(SessionStateMachine::IsValidTransition(SessionState::SUSPICIOUS, SessionState::LOCKED));

    EXPECT_FALSE(SessionStateMachine::IsValidTransition(SessionState::CALIBRATING, SessionState::SUSPICIOUS));
    EXPECT_FALSE(SessionStateMachine::IsValidTransition(SessionState::TRUSTED, SessionState::LOCKED));
    EXPECT_FALSE(SessionStateMachine::IsValidTransition(SessionState::TRUSTED, SessionState::CALIBRATING));
    EXPECT_FALSE(SessionStateMachine::IsValidTransition(SessionState::LOCKED, SessionState::TRUSTED));
    EXPECT_FALSE(SessionStateMachine::IsValidTransition(SessionState::LOCKED, SessionState::SUSPICIOUS));
}

TEST_F(SessionStateMachineTest, RecalibrationOnlyAcceptedWhenTrustedWithoutIntrusion) {
    SessionStateMachine calibrating("s1", "alice", thresholds_, session_);
    EXPECT_FALSE(calibrating.AcceptRecalibration(false));

    SessionStateMachine machine = MakeTrusted();
    EXPECT_TRUE(machine.AcceptRecalibration(false));
    EXPECT_FALSE(machine.AcceptRecalibration(true));
}

TEST_F(SessionStateMachineTest, EveryWindowYieldsDecision) {
    SessionStateMachine machine = MakeTrusted();

    WindowSignals signals;
    signals.window_id = 7;
    signals.timestamp = 210000;
    DecisionEvent event = machine.OnWindow(signals);

    EXPECT_EQ(event.window_id, 7u);
    EXPECT_EQ(event.session_id, "s1");
    EXPECT_EQ(event.user_id, "alice");
    EXPECT_FALSE(event.aggregate.has_value());
    EXPECT_EQ(event.reason, reason::kScoringUnavailable);
}
