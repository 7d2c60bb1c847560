#pragma once

#include "core/BehavioralEvent.hpp"
#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/ThreadPool.hpp"
#include "engine/Aggregator.hpp"
#include "engine/CalibrationManager.hpp"
#include "engine/DriftMonitor.hpp"
#include "engine/EnsembleScorer.hpp"
#include "engine/ProfileArena.hpp"
#include "features/FeatureExtractor.hpp"
#include "session/SessionStateMachine.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace vigil {

class ProfileStore;

// Engine-owned collaborators shared by every session worker.
struct SessionContext {
    const EngineConfig& config;
    ProfileArena& arena;
    DriftMonitor& drift;
    CalibrationManager& calibration;
    EventBus& bus;
    ThreadPool& background;
    ProfileStore* store;
};

/**
 * SessionWorker: the ordered pipeline of one session.
 *
 * Events are appended to a queue and drained by a dedicated thread, so
 * extraction, scoring and state changes for a session are strictly
 * sequential. Stop() discards queued events; a window being processed is
 * finished first.
 */
class SessionWorker {
public:
    SessionWorker(std::string session_id,
                  std::string user_id,
                  SessionContext context,
                  bool profile_loaded);
    ~SessionWorker();

    SessionWorker(const SessionWorker&) = delete;
    SessionWorker& operator=(const SessionWorker&) = delete;

    void Start();
    void Stop();

    // False once the worker is stopping.
    bool Enqueue(const BehavioralEvent& event);

    // Blocks until every queued event has been processed.
    void WaitIdle();

    SessionState State() const { return state_.load(); }
    const std::string& SessionId() const { return session_id_; }
    const std::string& UserId() const { return user_id_; }
    uint64_t WindowsProcessed() const { return windows_processed_.load(); }
    bool HasOnlineUpdates() const { return online_updates_.load() > 0; }

private:
    void Run();
    void ProcessEvent(const BehavioralEvent& event);
    void ProcessWindow(const FeatureWindow& window);

    void HandleCalibrating(const FeatureWindow& window);
    void HandleScoring(const FeatureWindow& window);
    void ApplyOnlineUpdates(const ProfileSet& set, const FeatureWindow& window);
    void ConsiderRecalibration(const DriftAssessment& drift, uint64_t now_ms);

    void Emit(const DecisionEvent& decision);
    void Remember(const FeatureWindow& window);

    std::string session_id_;
    std::string user_id_;
    SessionContext context_;

    FeatureExtractor extractor_;
    EnsembleScorer scorer_;
    Aggregator aggregator_;
    SessionStateMachine machine_;
    bool profile_loaded_;

    WindowHistory history_;
    std::deque<FeatureWindow> genuine_windows_; // retraining input
    std::shared_ptr<std::atomic<bool>> recalibrating_;

    std::thread thread_;
    std::queue<BehavioralEvent> queue_;
    bool busy_{false};
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_condition_;
    std::atomic<bool> stop_{false};
    bool started_{false};

    std::atomic<SessionState> state_{SessionState::CALIBRATING};
    std::atomic<uint64_t> windows_processed_{0};
    std::atomic<uint64_t> online_updates_{0};
};

} // namespace vigil
