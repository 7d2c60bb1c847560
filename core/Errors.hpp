#pragma once

#include <stdexcept>
#include <string>

namespace vigil {

class VigilError : public std::runtime_error {
public:
    explicit VigilError(const std::string& message) : std::runtime_error(message) {}
};

// Calibration was requested before enough time/windows were collected.
class CalibrationIncomplete : public VigilError {
public:
    using VigilError::VigilError;
};

// No input modality has enough calibration data to train on.
class InsufficientModalityData : public VigilError {
public:
    using VigilError::VigilError;
};

class ModelUntrainedError : public VigilError {
public:
    using VigilError::VigilError;
};

// Window dimensionality does not match the trained profile.
class ModelScoreError : public VigilError {
public:
    using VigilError::VigilError;
};

// Persisted profile is missing, unparsable or fails its integrity tag.
class ModelLoadError : public VigilError {
public:
    using VigilError::VigilError;
};

class ProfileLockTimeout : public VigilError {
public:
    using VigilError::VigilError;
};

class ConfigError : public VigilError {
public:
    using VigilError::VigilError;
};

} // namespace vigil
