#include "core/Config.hpp"
#include "core/Errors.hpp"
#include <yaml-cpp/yaml.h>

namespace vigil {

namespace {

template<typename T>
void ReadValue(const YAML::Node& section, const char* key, T& target) {
    if (section && section[key]) {
        target = section[key].as<T>();
    }
}

void ReadMilliseconds(const YAML::Node& section, const char* seconds_key, uint64_t& target_ms) {
    if (section && section[seconds_key]) {
        double seconds = section[seconds_key].as<double>();
        if (seconds < 0.0) {
            throw ConfigError(std::string(seconds_key) + " must be non-negative");
        }
        target_ms = static_cast<uint64_t>(seconds * 1000.0);
    }
}

EngineConfig FromNode(const YAML::Node& root) {
    EngineConfig config;

    const YAML::Node windowing = root["windowing"];
    ReadMilliseconds(windowing, "window_size_seconds", config.window.window_size_ms);
    ReadValue(windowing, "min_keystroke_events", config.window.min_keystroke_events);
    ReadValue(windowing, "min_mouse_events", config.window.min_mouse_events);
    ReadValue(windowing, "min_modality_events", config.window.min_modality_events);

    const YAML::Node thresholds = root["thresholds"];
    ReadValue(thresholds, "confidence_threshold", config.thresholds.confidence_threshold);
    ReadValue(thresholds, "anomaly_score_threshold", config.thresholds.anomaly_score_threshold);
    ReadValue(thresholds, "consecutive_anomalies_limit", config.thresholds.consecutive_anomalies_limit);

    const YAML::Node calibration = root["calibration"];
    ReadMilliseconds(calibration, "min_calibration_time_seconds", config.calibration.min_calibration_time_ms);
    ReadValue(calibration, "min_calibration_windows", config.calibration.min_calibration_windows);
    ReadValue(calibration, "min_modality_windows", config.calibration.min_modality_windows);
    ReadValue(calibration, "calibration_floor", config.calibration.calibration_floor);
    ReadValue(calibration, "low_percentile", config.calibration.low_percentile);
    ReadValue(calibration, "high_percentile", config.calibration.high_percentile);

    const YAML::Node drift = root["drift"];
    ReadValue(drift, "detection_window", config.drift.detection_window);
    ReadValue(drift, "min_windows", config.drift.min_windows);
    ReadValue(drift, "alert_threshold", config.drift.alert_threshold);
    ReadValue(drift, "intrusion_threshold", config.drift.intrusion_threshold);
    ReadValue(drift, "sustained_windows", config.drift.sustained_windows);

    const YAML::Node session = root["session"];
    ReadValue(session, "recovery_windows", config.session.recovery_windows);
    ReadValue(session, "suspicious_hard_cap", config.session.suspicious_hard_cap);
    ReadValue(session, "profile_lock_timeout_ms", config.session.profile_lock_timeout_ms);
    ReadValue(session, "history_windows", config.session.history_windows);
    ReadValue(session, "background_threads", config.session.background_threads);

    const YAML::Node models = root["models"];
    ReadValue(models, "sequence_length", config.models.sequence_length);
    ReadValue(models, "pca_components", config.models.pca_components);
    ReadValue(models, "boundary_nu", config.models.boundary_nu);
    ReadValue(models, "neighbor_capacity", config.models.neighbor_capacity);
    ReadValue(models, "neighbor_k", config.models.neighbor_k);
    ReadValue(models, "linear_aggressiveness", config.models.linear_aggressiveness);
    ReadValue(models, "linear_epochs", config.models.linear_epochs);
    ReadValue(models, "isolation_trees", config.models.isolation_trees);
    ReadValue(models, "isolation_subsample", config.models.isolation_subsample);
    ReadValue(models, "seed", config.models.seed);

    if (models && models["weights"]) {
        for (const auto& entry : models["weights"]) {
            ModelKind kind = ModelKind::SEQUENCE;
            try {
                kind = ModelKindFromString(entry.first.as<std::string>());
            } catch (const std::runtime_error& ex) {
                throw ConfigError(ex.what());
            }
            config.models.weights[kind] = entry.second.as<double>();
        }
    }

    const YAML::Node storage = root["storage"];
    ReadValue(storage, "database_path", config.storage.database_path);
    ReadValue(storage, "integrity_key", config.storage.integrity_key);

    const YAML::Node logging = root["logging"];
    ReadValue(logging, "file", config.logging.file_path);
    ReadValue(logging, "console", config.logging.console);
    if (logging && logging["level"]) {
        try {
            config.logging.level = ParseLogLevel(logging["level"].as<std::string>());
        } catch (const std::invalid_argument& ex) {
            throw ConfigError(ex.what());
        }
    }

    config.Validate();
    return config;
}

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

} // namespace

double ModelConfig::WeightFor(ModelKind kind) const {
    auto it = weights.find(kind);
    return it != weights.end() ? it->second : 1.0;
}

void EngineConfig::Validate() const {
    Require(window.window_size_ms > 0, "window_size_seconds must be positive");
    Require(window.min_keystroke_events > 0, "min_keystroke_events must be positive");
    Require(window.min_mouse_events > 0, "min_mouse_events must be positive");
    Require(window.min_modality_events >= 2, "min_modality_events must be at least 2");

    Require(thresholds.confidence_threshold > 0.0 && thresholds.confidence_threshold < 1.0,
            "confidence_threshold must lie in (0,1)");
    Require(thresholds.anomaly_score_threshold > 0.0 && thresholds.anomaly_score_threshold < 1.0,
            "anomaly_score_threshold must lie in (0,1)");
    Require(thresholds.consecutive_anomalies_limit > 0, "consecutive_anomalies_limit must be positive");

    Require(calibration.min_calibration_windows > 0, "min_calibration_windows must be positive");
    Require(calibration.calibration_floor > 0.0 && calibration.calibration_floor < 1.0,
            "calibration_floor must lie in (0,1)");
    Require(calibration.low_percentile >= 0.0 && calibration.low_percentile < calibration.high_percentile &&
            calibration.high_percentile <= 1.0,
            "calibration percentiles must satisfy 0 <= low < high <= 1");

    Require(drift.detection_window > 1, "drift detection_window must exceed 1");
    Require(drift.min_windows > 0 && drift.min_windows <= drift.detection_window,
            "drift min_windows must lie in [1, detection_window]");
    Require(drift.alert_threshold > 0.0 && drift.intrusion_threshold > drift.alert_threshold,
            "drift thresholds must satisfy 0 < alert < intrusion");
    Require(drift.sustained_windows > 0, "drift sustained_windows must be positive");

    Require(session.recovery_windows > 0, "recovery_windows must be positive");
    Require(session.suspicious_hard_cap > 0, "suspicious_hard_cap must be positive");
    Require(session.background_threads > 0, "background_threads must be positive");

    Require(models.sequence_length >= 2, "sequence_length must be at least 2");
    Require(models.pca_components > 0, "pca_components must be positive");
    Require(models.boundary_nu > 0.0 && models.boundary_nu < 0.5, "boundary_nu must lie in (0,0.5)");
    Require(models.neighbor_k > 0 && models.neighbor_capacity >= models.neighbor_k,
            "neighbor_capacity must be at least neighbor_k");
    Require(models.isolation_trees > 0 && models.isolation_subsample > 1,
            "isolation forest needs trees and a subsample above 1");
    for (const auto& [kind, weight] : models.weights) {
        Require(weight >= 0.0, "weight for " + ModelKindToString(kind) + " must be non-negative");
    }
}

EngineConfig LoadEngineConfig(const std::string& path) {
    try {
        return FromNode(YAML::LoadFile(path));
    } catch (const YAML::Exception& ex) {
        throw ConfigError("Failed to parse config " + path + ": " + ex.what());
    }
}

EngineConfig ParseEngineConfig(const std::string& yaml_text) {
    try {
        return FromNode(YAML::Load(yaml_text));
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("Failed to parse config: ") + ex.what());
    }
}

} // namespace vigil
