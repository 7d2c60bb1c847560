#include "engine/AuthEngine.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "models/ScoringModel.hpp"
#include "persistence/ProfileStore.hpp"

namespace vigil {

AuthEngine::AuthEngine(const EngineConfig& config, ProfileStore* store)
    : config_(config),
      store_(store),
      arena_(std::chrono::milliseconds(config.session.profile_lock_timeout_ms)),
      drift_(config.drift, config.thresholds),
      calibration_(config_, arena_, drift_, store),
      background_(config.session.background_threads) {
    config_.Validate();
    LOG_INFO("AuthEngine initialized (window={} ms, confidence={}, background_threads={})",
             config_.window.window_size_ms, config_.thresholds.confidence_threshold,
             background_.GetThreadCount());
}

AuthEngine::~AuthEngine() {
    Shutdown();
}

bool AuthEngine::LoadProfiles(const std::string& user_id) {
    ProfileSetPtr existing = arena_.Published(user_id);
    if (existing && existing->Complete()) {
        return true;
    }
    if (!store_) {
        return false;
    }

    try {
        ProfileSet set;
        set.user_id = user_id;
        for (ModelKind kind : kAllModelKinds) {
            auto profile = store_->LoadProfile(user_id, kind);
            if (!profile || !profile->trained) {
                LOG_INFO("No stored {} profile for user {}, calibration required",
                         ModelKindToString(kind), user_id);
                return false;
            }
            set.profiles[kind] = std::make_shared<const ModelProfile>(std::move(*profile));
        }

        auto transforms = store_->LoadCalibration(user_id);
        if (transforms) {
            set.transforms = *transforms;
        } else {
            LOG_WARN("No calibration transforms stored for user {}, using identity", user_id);
        }

        const ModelProfile& reference = *set.profiles.at(ModelKind::SEQUENCE);
        for (Modality modality : kAllModalities) {
            if (!reference.HasModality(modality)) {
                set.missing_modalities.push_back(modality);
            }
        }
        set.degraded = !set.missing_modalities.empty();

        auto drift_state = store_->LoadBaselineStats(user_id);
        if (drift_state) {
            drift_.Restore(*drift_state);
        } else if (!reference.snapshot.empty()) {
            LOG_WARN("No drift baseline stored for user {}, rebuilding it from the {} profile",
                     user_id, ModelKindToString(reference.kind));
            drift_.SetBaseline(user_id, reference.snapshot, reference.trained_at);
        } else {
            LOG_WARN("No drift baseline stored for user {}, calibration required", user_id);
            return false;
        }

        arena_.Publish(std::move(set));
        return true;
    } catch (const ModelLoadError& ex) {
        LOG_ERROR("Stored profiles for user {} rejected, session will calibrate: {}", user_id, ex.what());
        return false;
    }
}

bool AuthEngine::StartSession(const std::string& session_id, const std::string& user_id) {
    if (shut_down_) {
        LOG_WARN("StartSession: engine is shut down, session {} rejected", session_id);
        return false;
    }
    if (registry_.Find(session_id)) {
        LOG_WARN("StartSession: session {} already active", session_id);
        return false;
    }

    const bool loaded = LoadProfiles(user_id);
    SessionContext context{config_, arena_, drift_, calibration_, bus_, background_, store_};
    auto worker = std::make_shared<SessionWorker>(session_id, user_id, context, loaded);
    if (!registry_.Add(worker)) {
        LOG_WARN("StartSession: session {} already active", session_id);
        return false;
    }
    worker->Start();
    return true;
}

bool AuthEngine::PushEvent(const std::string& session_id, const BehavioralEvent& event) {
    auto worker = registry_.Find(session_id);
    if (!worker) {
        LOG_WARN("PushEvent: unknown session {}", session_id);
        return false;
    }
    return worker->Enqueue(event);
}

bool AuthEngine::EndSession(const std::string& session_id) {
    auto worker = registry_.Remove(session_id);
    if (!worker) {
        LOG_WARN("EndSession: unknown session {}", session_id);
        return false;
    }
    worker->Stop();

    bool user_still_active = false;
    for (const auto& other : registry_.Snapshot()) {
        if (other->UserId() == worker->UserId()) {
            user_still_active = true;
            break;
        }
    }
    if (!user_still_active) {
        calibration_.Discard(worker->UserId());
    }

    PersistSessionState(*worker);
    return true;
}

void AuthEngine::PersistSessionState(const SessionWorker& worker) {
    if (!store_) return;
    const std::string& user_id = worker.UserId();

    if (worker.HasOnlineUpdates()) {
        ProfileSetPtr set = arena_.Published(user_id);
        if (set) {
            for (const auto& [kind, profile] : set->profiles) {
                if (profile && ScoringModel::SupportsUpdate(kind) && !store_->SaveProfile(*profile)) {
                    LOG_WARN("Failed to persist online-updated {} profile for user {}",
                             ModelKindToString(kind), user_id);
                }
            }
        }
    }

    auto drift_state = drift_.Snapshot(user_id);
    if (drift_state && !store_->SaveDriftState(user_id, *drift_state)) {
        LOG_WARN("Failed to persist drift state for user {}", user_id);
    }
}

void AuthEngine::WaitForSession(const std::string& session_id) {
    auto worker = registry_.Find(session_id);
    if (worker) {
        worker->WaitIdle();
    }
}

void AuthEngine::WaitForBackground() {
    background_.WaitIdle();
}

std::optional<SessionState> AuthEngine::GetSessionState(const std::string& session_id) const {
    auto worker = registry_.Find(session_id);
    if (!worker) {
        return std::nullopt;
    }
    return worker->State();
}

SubscriptionId AuthEngine::SubscribeDecisions(DecisionHandler handler) {
    return bus_.Subscribe(EventType::WINDOW_DECISION, [handler = std::move(handler)](const Event& event) {
        if (event.decision) {
            handler(*event.decision);
        }
    });
}

void AuthEngine::Unsubscribe(SubscriptionId id) {
    bus_.Unsubscribe(id);
}

void AuthEngine::Shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    for (const auto& worker : registry_.Snapshot()) {
        EndSession(worker->SessionId());
    }
    background_.Shutdown();
    LOG_INFO("AuthEngine shutdown");
}

} // namespace vigil
