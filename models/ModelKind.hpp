#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace vigil {

enum class ModelKind {
    SEQUENCE,
    RECONSTRUCTION,
    BOUNDARY,
    NEAREST_NEIGHBOR,
    ONLINE_LINEAR,
    ISOLATION
};

constexpr size_t kModelKindCount = 6;

constexpr std::array<ModelKind, kModelKindCount> kAllModelKinds = {
    ModelKind::SEQUENCE,
    ModelKind::RECONSTRUCTION,
    ModelKind::BOUNDARY,
    ModelKind::NEAREST_NEIGHBOR,
    ModelKind::ONLINE_LINEAR,
    ModelKind::ISOLATION
};

std::string ModelKindToString(ModelKind kind);
ModelKind ModelKindFromString(const std::string& value);

enum class Modality {
    KEYSTROKE,
    MOUSE
};

constexpr size_t kModalityCount = 2;

constexpr std::array<Modality, kModalityCount> kAllModalities = {
    Modality::KEYSTROKE,
    Modality::MOUSE
};

inline size_t ModalityIndex(Modality modality) {
    return modality == Modality::KEYSTROKE ? 0 : 1;
}

std::string ModalityToString(Modality modality);
Modality ModalityFromString(const std::string& value);

} // namespace vigil
