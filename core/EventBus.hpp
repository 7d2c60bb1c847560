#pragma once

#include "session/DecisionEvent.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil {

enum class EventType {
    WINDOW_DECISION,
    STATE_TRANSITION,
    RECALIBRATION_SUGGESTED,
    RECALIBRATION_REJECTED,
    PROFILE_PUBLISHED,
    CALIBRATION_FAILED
};

struct Event {
    EventType type;
    uint64_t timestamp;
    std::string session_id;
    std::string user_id;
    std::unordered_map<std::string, std::string> metadata;
    std::optional<DecisionEvent> decision;

    Event(EventType t, std::string session, std::string user)
        : type(t), timestamp(GetCurrentTimestamp()), session_id(std::move(session)), user_id(std::move(user)) {}

    static uint64_t GetCurrentTimestamp();
};

using EventHandler = std::function<void(const Event&)>;
using SubscriptionId = uint64_t;

// Topic-based fan-out owned by the engine. Handlers run on the publishing
// thread, so a session's decisions reach subscribers in window order.
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId Subscribe(EventType type, EventHandler handler);
    void Unsubscribe(SubscriptionId id);
    void Publish(const Event& event);

    size_t GetSubscriberCount(EventType type) const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<EventType, std::vector<std::pair<SubscriptionId, EventHandler>>> subscribers_;
    SubscriptionId next_id_ = 1;
};

inline std::string EventTypeToString(EventType type) {
    switch (type) {
        case EventType::WINDOW_DECISION:         return "WINDOW_DECISION";
        case EventType::STATE_TRANSITION:        return "STATE_TRANSITION";
        case EventType::RECALIBRATION_SUGGESTED: return "RECALIBRATION_SUGGESTED";
        case EventType::RECALIBRATION_REJECTED:  return "RECALIBRATION_REJECTED";
        case EventType::PROFILE_PUBLISHED:       return "PROFILE_PUBLISHED";
        case EventType::CALIBRATION_FAILED:      return "CALIBRATION_FAILED";
        default:                                 return "UNKNOWN";
    }
}

} // namespace vigil
