#pragma once

#include "models/ModelKind.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace vigil {

constexpr size_t kKeystrokeFeatureCount = 8;
constexpr size_t kMouseFeatureCount = 8;

// Feature names per modality, in vector order.
const std::vector<std::string>& FeatureNames(Modality modality);

inline size_t FeatureCount(Modality modality) {
    return modality == Modality::KEYSTROKE ? kKeystrokeFeatureCount : kMouseFeatureCount;
}

struct FeatureBlock {
    bool present{false};
    size_t event_count{0};
    std::vector<double> values; // NaN-filled when !present
};

// One completed window reduced to per-modality feature vectors.
struct FeatureWindow {
    uint64_t window_id{0};
    std::string session_id;
    uint64_t start_time{0};
    uint64_t end_time{0};
    std::array<FeatureBlock, kModalityCount> blocks;

    const FeatureBlock& Block(Modality modality) const { return blocks[ModalityIndex(modality)]; }
    FeatureBlock& Block(Modality modality) { return blocks[ModalityIndex(modality)]; }

    bool Has(Modality modality) const { return Block(modality).present; }
    uint64_t DurationMs() const { return end_time >= start_time ? end_time - start_time : 0; }
    size_t EventCount() const;
};

// Windows equal when every field matches; NaN values compare equal to NaN.
bool operator==(const FeatureWindow& a, const FeatureWindow& b);
inline bool operator!=(const FeatureWindow& a, const FeatureWindow& b) { return !(a == b); }

} // namespace vigil
