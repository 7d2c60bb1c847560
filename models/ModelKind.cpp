#include "models/ModelKind.hpp"
#include <stdexcept>

namespace vigil {

std::string ModelKindToString(ModelKind kind) {
    switch (kind) {
        case ModelKind::SEQUENCE:         return "sequence";
        case ModelKind::RECONSTRUCTION:   return "reconstruction";
        case ModelKind::BOUNDARY:         return "boundary";
        case ModelKind::NEAREST_NEIGHBOR: return "nearest_neighbor";
        case ModelKind::ONLINE_LINEAR:    return "online_linear";
        case ModelKind::ISOLATION:        return "isolation";
    }
    return "sequence";
}

ModelKind ModelKindFromString(const std::string& value) {
    if (value == "sequence") {
        return ModelKind::SEQUENCE;
    }
    if (value == "reconstruction") {
        return ModelKind::RECONSTRUCTION;
    }
    if (value == "boundary") {
        return ModelKind::BOUNDARY;
    }
    if (value == "nearest_neighbor") {
        return ModelKind::NEAREST_NEIGHBOR;
    }
    if (value == "online_linear") {
        return ModelKind::ONLINE_LINEAR;
    }
    if (value == "isolation") {
        return ModelKind::ISOLATION;
    }
    throw std::runtime_error("Unknown model kind: " + value);
}

std::string ModalityToString(Modality modality) {
    return modality == Modality::KEYSTROKE ? "keystroke" : "mouse";
}

Modality ModalityFromString(const std::string& value) {
    if (value == "keystroke") {
        return Modality::KEYSTROKE;
    }
    if (value == "mouse") {
        return Modality::MOUSE;
    }
    throw std::runtime_error("Unknown modality: " + value);
}

} // namespace vigil
