#pragma once

#include "core/Logger.hpp"
#include "models/ModelKind.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace vigil {

struct WindowConfig {
    uint64_t window_size_ms = 30000;      // WINDOW_SIZE
    size_t min_keystroke_events = 20;
    size_t min_mouse_events = 15;
    size_t min_modality_events = 3;       // below this a modality block is flagged missing
};

struct ThresholdConfig {
    double confidence_threshold = 0.7;    // CONFIDENCE_THRESHOLD
    double anomaly_score_threshold = 0.8; // ANOMALY_SCORE_THRESHOLD, inverted scale
    uint32_t consecutive_anomalies_limit = 3;
};

struct CalibrationConfig {
    uint64_t min_calibration_time_ms = 300000; // MIN_CALIBRATION_TIME
    size_t min_calibration_windows = 10;
    size_t min_modality_windows = 5;
    double calibration_floor = 0.75;
    double low_percentile = 0.05;
    double high_percentile = 0.95;
};

struct DriftConfig {
    size_t detection_window = 100;         // DRIFT_DETECTION_WINDOW
    size_t min_windows = 10;
    double alert_threshold = 1.0;
    double intrusion_threshold = 2.5;
    uint32_t sustained_windows = 10;
};

struct SessionConfig {
    uint32_t recovery_windows = 3;
    uint32_t suspicious_hard_cap = 5;
    uint32_t profile_lock_timeout_ms = 50;
    size_t history_windows = 16;
    size_t background_threads = 2;
};

struct ModelConfig {
    size_t sequence_length = 5;
    size_t pca_components = 4;
    double boundary_nu = 0.05;
    size_t neighbor_capacity = 200;
    size_t neighbor_k = 5;
    double linear_aggressiveness = 0.5;
    size_t linear_epochs = 5;
    size_t isolation_trees = 100;
    size_t isolation_subsample = 64;
    uint32_t seed = 42;

    // Missing kinds weigh 1.0.
    std::map<ModelKind, double> weights;

    double WeightFor(ModelKind kind) const;
};

struct StorageConfig {
    std::string database_path = "data/vigil.db";
    std::string integrity_key = "vigil-profile-integrity";
};

struct EngineConfig {
    WindowConfig window;
    ThresholdConfig thresholds;
    CalibrationConfig calibration;
    DriftConfig drift;
    SessionConfig session;
    ModelConfig models;
    StorageConfig storage;
    LoggingOptions logging;

    // Throws ConfigError on out-of-range values.
    void Validate() const;
};

EngineConfig LoadEngineConfig(const std::string& path);
EngineConfig ParseEngineConfig(const std::string& yaml_text);

} // namespace vigil
