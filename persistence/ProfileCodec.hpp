#pragma once

#include "engine/Aggregator.hpp"
#include "engine/DriftMonitor.hpp"
#include "models/ModelTypes.hpp"
#include <nlohmann/json.hpp>

namespace vigil {

// JSON payloads for persisted state. Decoders throw ModelLoadError on
// malformed input.
nlohmann::json EncodeProfile(const ModelProfile& profile);
ModelProfile DecodeProfile(const nlohmann::json& j);

nlohmann::json EncodeDriftState(const DriftState& state);
DriftState DecodeDriftState(const nlohmann::json& j);

nlohmann::json EncodeTransforms(const TransformSet& transforms);
TransformSet DecodeTransforms(const nlohmann::json& j);

} // namespace vigil
