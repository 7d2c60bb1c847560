#include "persistence/ProfileCodec.hpp"
#include "core/Errors.hpp"

namespace vigil {

using nlohmann::json;

// --- Parameter structs ---

void to_json(json& j, const Standardizer& s) {
    j = json{{"mean", s.mean}, {"scale", s.scale}};
}

void from_json(const json& j, Standardizer& s) {
    j.at("mean").get_to(s.mean);
    j.at("scale").get_to(s.scale);
    if (s.mean.size() != s.scale.size()) {
        throw ModelLoadError("Standardizer mean/scale length mismatch");
    }
}

void to_json(json& j, const SequenceParams& p) {
    j = json{{"standardizer", p.standardizer},
             {"phi", p.phi},
             {"residual_scale", p.residual_scale},
             {"sequence_length", p.sequence_length},
             {"padding", "repeat_oldest"}};
}

void from_json(const json& j, SequenceParams& p) {
    j.at("standardizer").get_to(p.standardizer);
    j.at("phi").get_to(p.phi);
    j.at("residual_scale").get_to(p.residual_scale);
    j.at("sequence_length").get_to(p.sequence_length);
    if (j.value("padding", "repeat_oldest") != "repeat_oldest") {
        throw ModelLoadError("Unknown sequence padding policy");
    }
    p.padding = PaddingPolicy::REPEAT_OLDEST;
}

void to_json(json& j, const ReconstructionParams& p) {
    j = json{{"standardizer", p.standardizer},
             {"components", p.components},
             {"error_reference", p.error_reference}};
}

void from_json(const json& j, ReconstructionParams& p) {
    j.at("standardizer").get_to(p.standardizer);
    j.at("components").get_to(p.components);
    j.at("error_reference").get_to(p.error_reference);
}

void to_json(json& j, const BoundaryParams& p) {
    j = json{{"standardizer", p.standardizer},
             {"center", p.center},
             {"radius", p.radius},
             {"spread", p.spread}};
}

void from_json(const json& j, BoundaryParams& p) {
    j.at("standardizer").get_to(p.standardizer);
    j.at("center").get_to(p.center);
    j.at("radius").get_to(p.radius);
    j.at("spread").get_to(p.spread);
}

void to_json(json& j, const NeighborParams& p) {
    j = json{{"standardizer", p.standardizer},
             {"memory", p.memory},
             {"capacity", p.capacity},
             {"k", p.k},
             {"reference_distance", p.reference_distance}};
}

void from_json(const json& j, NeighborParams& p) {
    j.at("standardizer").get_to(p.standardizer);
    j.at("memory").get_to(p.memory);
    j.at("capacity").get_to(p.capacity);
    j.at("k").get_to(p.k);
    j.at("reference_distance").get_to(p.reference_distance);
}

void to_json(json& j, const LinearParams& p) {
    j = json{{"standardizer", p.standardizer},
             {"weights", p.weights},
             {"aggressiveness", p.aggressiveness},
             {"seed", p.seed},
             {"updates", p.updates}};
}

void from_json(const json& j, LinearParams& p) {
    j.at("standardizer").get_to(p.standardizer);
    j.at("weights").get_to(p.weights);
    j.at("aggressiveness").get_to(p.aggressiveness);
    j.at("seed").get_to(p.seed);
    j.at("updates").get_to(p.updates);
}

void to_json(json& j, const IsolationNode& n) {
    j = json::array({n.feature, n.threshold, n.left, n.right, n.size});
}

void from_json(const json& j, IsolationNode& n) {
    if (!j.is_array() || j.size() != 5) {
        throw ModelLoadError("Malformed isolation tree node");
    }
    j.at(0).get_to(n.feature);
    j.at(1).get_to(n.threshold);
    j.at(2).get_to(n.left);
    j.at(3).get_to(n.right);
    j.at(4).get_to(n.size);
}

void to_json(json& j, const IsolationParams& p) {
    json trees = json::array();
    for (const auto& tree : p.trees) {
        trees.push_back(tree.nodes);
    }
    j = json{{"dimension", p.dimension}, {"subsample", p.subsample}, {"trees", trees}};
}

void from_json(const json& j, IsolationParams& p) {
    j.at("dimension").get_to(p.dimension);
    j.at("subsample").get_to(p.subsample);
    p.trees.clear();
    for (const auto& tree : j.at("trees")) {
        IsolationTree t;
        tree.get_to(t.nodes);
        p.trees.push_back(std::move(t));
    }
}

void to_json(json& j, const FeatureSnapshot& s) {
    j = json{{"mean", s.mean}, {"stddev", s.stddev}, {"windows", s.windows}};
}

void from_json(const json& j, FeatureSnapshot& s) {
    j.at("mean").get_to(s.mean);
    j.at("stddev").get_to(s.stddev);
    j.at("windows").get_to(s.windows);
}

namespace {

ModelParams DecodeParams(ModelKind kind, const json& j) {
    switch (kind) {
        case ModelKind::SEQUENCE:         return j.get<SequenceParams>();
        case ModelKind::RECONSTRUCTION:   return j.get<ReconstructionParams>();
        case ModelKind::BOUNDARY:         return j.get<BoundaryParams>();
        case ModelKind::NEAREST_NEIGHBOR: return j.get<NeighborParams>();
        case ModelKind::ONLINE_LINEAR:    return j.get<LinearParams>();
        case ModelKind::ISOLATION:        return j.get<IsolationParams>();
    }
    throw ModelLoadError("Unhandled model kind");
}

json EncodeModalityVectors(const std::map<Modality, std::vector<double>>& values) {
    json out = json::object();
    for (const auto& [modality, v] : values) {
        out[ModalityToString(modality)] = v;
    }
    return out;
}

std::map<Modality, std::vector<double>> DecodeModalityVectors(const json& j) {
    std::map<Modality, std::vector<double>> out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        out[ModalityFromString(it.key())] = it.value().get<std::vector<double>>();
    }
    return out;
}

// Runs a decoder, mapping parse and range failures to ModelLoadError.
template<typename F>
auto Decode(const char* what, F&& decode) -> decltype(decode()) {
    try {
        return decode();
    } catch (const ModelLoadError&) {
        throw;
    } catch (const json::exception& ex) {
        throw ModelLoadError(std::string("Malformed ") + what + " payload: " + ex.what());
    } catch (const std::runtime_error& ex) {
        throw ModelLoadError(std::string("Invalid ") + what + " payload: " + ex.what());
    }
}

} // namespace

// --- Profiles ---

json EncodeProfile(const ModelProfile& profile) {
    json modalities = json::object();
    for (const auto& [modality, params] : profile.params) {
        json entry;
        entry["params"] = std::visit([](const auto& p) { return json(p); }, params);
        auto snap = profile.snapshot.find(modality);
        if (snap != profile.snapshot.end()) {
            entry["snapshot"] = snap->second;
        }
        modalities[ModalityToString(modality)] = entry;
    }

    return json{{"user_id", profile.user_id},
                {"kind", ModelKindToString(profile.kind)},
                {"version", profile.version},
                {"trained_at", profile.trained_at},
                {"trained", profile.trained},
                {"training_windows", profile.training_windows},
                {"modalities", modalities}};
}

ModelProfile DecodeProfile(const json& j) {
    return Decode("profile", [&j]() {
        ModelProfile profile;
        j.at("user_id").get_to(profile.user_id);
        profile.kind = ModelKindFromString(j.at("kind").get<std::string>());
        j.at("version").get_to(profile.version);
        j.at("trained_at").get_to(profile.trained_at);
        j.at("trained").get_to(profile.trained);
        j.at("training_windows").get_to(profile.training_windows);

        const json& modalities = j.at("modalities");
        for (auto it = modalities.begin(); it != modalities.end(); ++it) {
            const Modality modality = ModalityFromString(it.key());
            profile.params.emplace(modality, DecodeParams(profile.kind, it.value().at("params")));
            if (it.value().contains("snapshot")) {
                profile.snapshot.emplace(modality, it.value().at("snapshot").get<FeatureSnapshot>());
            }
        }
        if (profile.trained && profile.params.empty()) {
            throw ModelLoadError("Trained profile carries no parameters");
        }
        return profile;
    });
}

// --- Drift state ---

json EncodeDriftState(const DriftState& state) {
    json recent = json::array();
    for (const auto& sample : state.recent) {
        recent.push_back(EncodeModalityVectors(sample));
    }
    return json{{"user_id", state.user_id},
                {"baseline_mean", EncodeModalityVectors(state.baseline_mean)},
                {"baseline_variance", EncodeModalityVectors(state.baseline_variance)},
                {"recent", recent},
                {"drift_score", state.drift_score},
                {"consecutive_above_alert", state.consecutive_above_alert},
                {"baseline_captured_at", state.baseline_captured_at},
                {"last_recalibration", state.last_recalibration}};
}

DriftState DecodeDriftState(const json& j) {
    return Decode("drift state", [&j]() {
        DriftState state;
        j.at("user_id").get_to(state.user_id);
        state.baseline_mean = DecodeModalityVectors(j.at("baseline_mean"));
        state.baseline_variance = DecodeModalityVectors(j.at("baseline_variance"));
        for (const auto& sample : j.at("recent")) {
            state.recent.push_back(DecodeModalityVectors(sample));
        }
        j.at("drift_score").get_to(state.drift_score);
        j.at("consecutive_above_alert").get_to(state.consecutive_above_alert);
        j.at("baseline_captured_at").get_to(state.baseline_captured_at);
        j.at("last_recalibration").get_to(state.last_recalibration);
        return state;
    });
}

// --- Calibration transforms ---

json EncodeTransforms(const TransformSet& transforms) {
    json out = json::object();
    for (const auto& [kind, transform] : transforms) {
        out[ModelKindToString(kind)] = json{{"scale", transform.scale}, {"offset", transform.offset}};
    }
    return out;
}

TransformSet DecodeTransforms(const json& j) {
    return Decode("calibration", [&j]() {
        TransformSet transforms;
        for (auto it = j.begin(); it != j.end(); ++it) {
            CalibrationTransform transform;
            it.value().at("scale").get_to(transform.scale);
            it.value().at("offset").get_to(transform.offset);
            transforms[ModelKindFromString(it.key())] = transform;
        }
        return transforms;
    });
}

} // namespace vigil
