#include "session/DecisionEvent.hpp"

namespace vigil {

void to_json(nlohmann::json& j, const DecisionEvent& event) {
    nlohmann::json scores = nlohmann::json::object();
    for (const auto& [kind, score] : event.model_scores) {
        scores[ModelKindToString(kind)] = score;
    }

    j = nlohmann::json{
        {"session_id", event.session_id},
        {"user_id", event.user_id},
        {"window_id", event.window_id},
        {"timestamp", event.timestamp},
        {"state", SessionStateToString(event.state)},
        {"previous_state", SessionStateToString(event.previous_state)},
        {"model_scores", scores},
        {"reason", event.reason},
        {"transition", event.transition}
    };
    j["aggregate"] = event.aggregate ? nlohmann::json(*event.aggregate) : nlohmann::json(nullptr);
    j["drift_score"] = event.drift_score ? nlohmann::json(*event.drift_score) : nlohmann::json(nullptr);
}

} // namespace vigil
