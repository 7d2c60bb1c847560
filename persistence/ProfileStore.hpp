#pragma once

#include "engine/Aggregator.hpp"
#include "engine/DriftMonitor.hpp"
#include "models/ModelTypes.hpp"
#include "session/DecisionEvent.hpp"
#include <optional>
#include <string>

namespace vigil {

/**
 * ProfileStore: storage collaborator for learned state.
 *
 * Loads return nullopt when nothing is stored and throw ModelLoadError when
 * something is stored but unreadable or fails its integrity check. Saves
 * return false on failure after logging it.
 */
class ProfileStore {
public:
    virtual ~ProfileStore() = default;

    virtual std::optional<ModelProfile> LoadProfile(const std::string& user_id, ModelKind kind) = 0;
    virtual bool SaveProfile(const ModelProfile& profile) = 0;

    virtual std::optional<DriftState> LoadBaselineStats(const std::string& user_id) = 0;
    virtual bool SaveDriftState(const std::string& user_id, const DriftState& state) = 0;

    virtual std::optional<TransformSet> LoadCalibration(const std::string& user_id) = 0;
    virtual bool SaveCalibration(const std::string& user_id, const TransformSet& transforms) = 0;

    virtual bool RecordDecision(const DecisionEvent& event) = 0;
};

} // namespace vigil
