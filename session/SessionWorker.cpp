#include "session/SessionWorker.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "models/ScoringModel.hpp"
#include "persistence/ProfileStore.hpp"
#include <vector>

namespace vigil {

SessionWorker::SessionWorker(std::string session_id,
                             std::string user_id,
                             SessionContext context,
                             bool profile_loaded)
    : session_id_(std::move(session_id)),
      user_id_(std::move(user_id)),
      context_(context),
      extractor_(context.config.window, session_id_),
      scorer_(context.arena),
      aggregator_(context.config.thresholds, context.config.models),
      machine_(session_id_, user_id_, context.config.thresholds, context.config.session),
      profile_loaded_(profile_loaded),
      recalibrating_(std::make_shared<std::atomic<bool>>(false)) {}

SessionWorker::~SessionWorker() {
    Stop();
}

void SessionWorker::Start() {
    if (started_) return;
    started_ = true;

    if (profile_loaded_) {
        auto decision = machine_.CompleteCalibration(0, Event::GetCurrentTimestamp(), reason::kProfileLoaded);
        if (decision) {
            Emit(*decision);
        }
    }
    state_ = machine_.State();

    thread_ = std::thread(&SessionWorker::Run, this);
    LOG_INFO("Session {} started for user {} in state {}",
             session_id_, user_id_, SessionStateToString(machine_.State()));
}

void SessionWorker::Stop() {
    size_t discarded = 0;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
        discarded = queue_.size();
        std::queue<BehavioralEvent>().swap(queue_);
    }
    condition_.notify_all();
    idle_condition_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("Session {} stopped ({} windows processed, {} queued events discarded)",
             session_id_, windows_processed_.load(), discarded);
}

bool SessionWorker::Enqueue(const BehavioralEvent& event) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return false;
        }
        queue_.push(event);
    }
    condition_.notify_one();
    return true;
}

void SessionWorker::WaitIdle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] { return stop_ || (queue_.empty() && !busy_); });
}

void SessionWorker::Run() {
    while (true) {
        BehavioralEvent event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !queue_.empty(); });

            if (stop_) {
                return;
            }

            event = queue_.front();
            queue_.pop();
            busy_ = true;
        }

        try {
            ProcessEvent(event);
        } catch (const std::exception& ex) {
            LOG_ERROR("Session {}: failed to process {} event at {}: {}",
                      session_id_, EventKindToString(event.kind), event.timestamp, ex.what());
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            busy_ = false;
            if (queue_.empty()) {
                idle_condition_.notify_all();
            }
        }
    }
}

void SessionWorker::ProcessEvent(const BehavioralEvent& event) {
    auto window = extractor_.Push(event);
    if (window) {
        ProcessWindow(*window);
    }
}

void SessionWorker::ProcessWindow(const FeatureWindow& window) {
    ++windows_processed_;
    if (machine_.State() == SessionState::CALIBRATING) {
        HandleCalibrating(window);
    } else {
        HandleScoring(window);
    }
    Remember(window);
    state_ = machine_.State();
}

void SessionWorker::HandleCalibrating(const FeatureWindow& window) {
    // Another session of the same user may have completed calibration.
    ProfileSetPtr existing = context_.arena.Published(user_id_);
    if (existing && existing->Complete()) {
        context_.calibration.Discard(user_id_);
        auto decision = machine_.CompleteCalibration(window.window_id, window.end_time, reason::kProfileLoaded);
        if (decision) {
            Emit(*decision);
        }
        return;
    }

    context_.calibration.AddWindow(user_id_, window);

    WindowSignals signals;
    signals.window_id = window.window_id;
    signals.timestamp = window.end_time;
    Emit(machine_.OnWindow(signals));

    if (!context_.calibration.Ready(user_id_)) {
        return;
    }

    try {
        CalibrationResult result = context_.calibration.Calibrate(user_id_, window.end_time);
        auto decision = machine_.CompleteCalibration(window.window_id, window.end_time,
                                                     reason::kCalibrationComplete);
        if (decision) {
            Emit(*decision);
        }

        Event published(EventType::PROFILE_PUBLISHED, session_id_, user_id_);
        published.metadata["generation"] = std::to_string(result.generation);
        published.metadata["degraded"] = result.degraded ? "true" : "false";
        published.metadata["trigger"] = "calibration";
        context_.bus.Publish(published);
    } catch (const InsufficientModalityData& ex) {
        LOG_WARN("Session {}: calibration deferred: {}", session_id_, ex.what());
        Event failed(EventType::CALIBRATION_FAILED, session_id_, user_id_);
        failed.metadata["error"] = ex.what();
        context_.bus.Publish(failed);
    } catch (const CalibrationIncomplete& ex) {
        LOG_DEBUG("Session {}: {}", session_id_, ex.what());
    }
}

void SessionWorker::HandleScoring(const FeatureWindow& window) {
    ProfileSetPtr set;
    ScoreRecord record = scorer_.Score(user_id_, window, history_, &set);

    AggregateResult aggregate;
    if (record.scores.empty()) {
        aggregate = aggregator_.RecordUnscorable();
        LOG_WARN("Session {}: window {} could not be scored by any model", session_id_, window.window_id);
    } else {
        aggregate = aggregator_.Evaluate(record.scores, set ? set->transforms : TransformSet());
        record.aggregate = aggregate.aggregate;
        record.calibrated = aggregate.calibrated;
    }

    DriftAssessment drift = context_.drift.Observe(user_id_, window, record.aggregate);

    WindowSignals signals;
    signals.window_id = window.window_id;
    signals.timestamp = window.end_time;
    signals.aggregate = record.aggregate;
    signals.model_scores = record.scores;
    signals.severe_anomaly = aggregate.severe_anomaly;
    signals.consecutive_limit_reached = aggregate.consecutive_limit_reached;
    signals.drift = drift;
    Emit(machine_.OnWindow(signals));

    if (machine_.State() == SessionState::TRUSTED && aggregate.genuine && !drift.intrusion_suspected) {
        genuine_windows_.push_back(window);
        while (genuine_windows_.size() > context_.config.drift.detection_window) {
            genuine_windows_.pop_front();
        }
        ProfileSetPtr latest = context_.arena.Published(user_id_);
        if (latest) {
            ApplyOnlineUpdates(*latest, window);
        }
    }

    if (drift.recalibration_suggested) {
        ConsiderRecalibration(drift, window.end_time);
    }
}

void SessionWorker::ApplyOnlineUpdates(const ProfileSet& set, const FeatureWindow& window) {
    for (ModelKind kind : kAllModelKinds) {
        if (!ScoringModel::SupportsUpdate(kind)) continue;
        auto it = set.profiles.find(kind);
        if (it == set.profiles.end() || !it->second || !it->second->trained) continue;

        try {
            ModelProfile updated = ScoringModel::Update(*it->second, window);
            ++updated.version;
            if (context_.arena.ReplaceProfile(user_id_, std::make_shared<const ModelProfile>(std::move(updated)))) {
                ++online_updates_;
            }
        } catch (const ModelScoreError& ex) {
            LOG_WARN("Session {}: online update of {} model skipped: {}",
                     session_id_, ModelKindToString(kind), ex.what());
        }
    }
}

void SessionWorker::ConsiderRecalibration(const DriftAssessment& drift, uint64_t now_ms) {
    if (!machine_.AcceptRecalibration(drift.intrusion_suspected)) {
        Event rejected(EventType::RECALIBRATION_REJECTED, session_id_, user_id_);
        rejected.metadata["drift_score"] = std::to_string(drift.drift_score);
        rejected.metadata["state"] = SessionStateToString(machine_.State());
        context_.bus.Publish(rejected);
        return;
    }
    if (recalibrating_->exchange(true)) {
        LOG_DEBUG("Session {}: recalibration already running for user {}", session_id_, user_id_);
        return;
    }

    Event suggested(EventType::RECALIBRATION_SUGGESTED, session_id_, user_id_);
    suggested.metadata["drift_score"] = std::to_string(drift.drift_score);
    suggested.metadata["windows"] = std::to_string(genuine_windows_.size());
    context_.bus.Publish(suggested);

    std::vector<FeatureWindow> windows(genuine_windows_.begin(), genuine_windows_.end());
    auto flag = recalibrating_;
    CalibrationManager& calibration = context_.calibration;
    EventBus& bus = context_.bus;
    const std::string session_id = session_id_;
    const std::string user_id = user_id_;

    try {
        context_.background.Submit("recalibrate:" + user_id_,
            [flag, &calibration, &bus, session_id, user_id, windows = std::move(windows), now_ms]() {
                try {
                    CalibrationResult result = calibration.Recalibrate(user_id, windows, now_ms);
                    Event published(EventType::PROFILE_PUBLISHED, session_id, user_id);
                    published.metadata["generation"] = std::to_string(result.generation);
                    published.metadata["degraded"] = result.degraded ? "true" : "false";
                    published.metadata["trigger"] = "drift";
                    bus.Publish(published);
                } catch (const VigilError& ex) {
                    LOG_WARN("Recalibration of user {} failed: {}", user_id, ex.what());
                    Event failed(EventType::CALIBRATION_FAILED, session_id, user_id);
                    failed.metadata["error"] = ex.what();
                    bus.Publish(failed);
                }
                flag->store(false);
            });
    } catch (const std::runtime_error& ex) {
        flag->store(false);
        LOG_ERROR("Session {}: could not schedule recalibration: {}", session_id_, ex.what());
    }
}

void SessionWorker::Emit(const DecisionEvent& decision) {
    state_ = decision.state;

    Event event(EventType::WINDOW_DECISION, session_id_, user_id_);
    event.metadata["reason"] = decision.reason;
    event.decision = decision;
    context_.bus.Publish(event);

    if (decision.transition) {
        Event transition(EventType::STATE_TRANSITION, session_id_, user_id_);
        transition.metadata["from_state"] = SessionStateToString(decision.previous_state);
        transition.metadata["to_state"] = SessionStateToString(decision.state);
        transition.metadata["reason"] = decision.reason;
        transition.decision = decision;
        context_.bus.Publish(transition);
    }

    if (context_.store && !context_.store->RecordDecision(decision)) {
        LOG_WARN("Session {}: decision for window {} not journaled", session_id_, decision.window_id);
    }
}

void SessionWorker::Remember(const FeatureWindow& window) {
    history_.push_back(window);
    while (history_.size() > context_.config.session.history_windows) {
        history_.pop_front();
    }
}

} // namespace vigil
