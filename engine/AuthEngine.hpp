#pragma once

#include "core/BehavioralEvent.hpp"
#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/ThreadPool.hpp"
#include "engine/CalibrationManager.hpp"
#include "engine/DriftMonitor.hpp"
#include "engine/ProfileArena.hpp"
#include "session/SessionRegistry.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace vigil {

class ProfileStore;

using DecisionHandler = std::function<void(const DecisionEvent&)>;

/**
 * AuthEngine: entry point of the continuous authentication pipeline.
 *
 * Owns the profile arena, the drift monitor, the calibration manager, the
 * background pool used for drift-triggered retraining, the decision bus and
 * the session registry. The store is borrowed and may be null.
 */
class AuthEngine {
public:
    explicit AuthEngine(const EngineConfig& config, ProfileStore* store = nullptr);
    ~AuthEngine();

    AuthEngine(const AuthEngine&) = delete;
    AuthEngine& operator=(const AuthEngine&) = delete;

    // Starts a worker for the session. Stored, verified profiles start it
    // Trusted; otherwise it calibrates. False when the id is already active.
    bool StartSession(const std::string& session_id, const std::string& user_id);

    // False when the session is unknown or stopping.
    bool PushEvent(const std::string& session_id, const BehavioralEvent& event);

    // Cancels the worker, discarding queued events, and persists online
    // profile updates and drift state.
    bool EndSession(const std::string& session_id);

    // Blocks until the session's queue is drained.
    void WaitForSession(const std::string& session_id);
    void WaitForBackground();

    std::optional<SessionState> GetSessionState(const std::string& session_id) const;
    size_t ActiveSessions() const { return registry_.Size(); }

    SubscriptionId SubscribeDecisions(DecisionHandler handler);
    void Unsubscribe(SubscriptionId id);

    EventBus& Bus() { return bus_; }
    ProfileArena& Arena() { return arena_; }
    DriftMonitor& Drift() { return drift_; }
    CalibrationManager& Calibration() { return calibration_; }
    const EngineConfig& Config() const { return config_; }

    void Shutdown();

private:
    // Publishes the user's stored profile set into the arena. False when it is
    // missing, incomplete or rejected.
    bool LoadProfiles(const std::string& user_id);
    void PersistSessionState(const SessionWorker& worker);

    EngineConfig config_;
    ProfileStore* store_;

    EventBus bus_;
    ProfileArena arena_;
    DriftMonitor drift_;
    CalibrationManager calibration_;
    ThreadPool background_;
    SessionRegistry registry_;
    bool shut_down_{false};
};

} // namespace vigil
