#pragma once

#include "core/Statistics.hpp"
#include "models/ModelKind.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace vigil {

// Sequence model: per-feature AR(1) over standardized windows.
// Truncation keeps the most recent sequence_length windows; shorter histories
// are padded at the front by repeating the oldest available window.
enum class PaddingPolicy {
    REPEAT_OLDEST
};

struct SequenceParams {
    Standardizer standardizer;
    std::vector<double> phi;
    std::vector<double> residual_scale;
    size_t sequence_length{5};
    PaddingPolicy padding{PaddingPolicy::REPEAT_OLDEST};
};

struct ReconstructionParams {
    Standardizer standardizer;
    std::vector<std::vector<double>> components; // orthonormal rows
    double error_reference{1.0};                 // 95th percentile training error
};

struct BoundaryParams {
    Standardizer standardizer;
    std::vector<double> center;
    double radius{1.0};
    double spread{1.0};
};

struct NeighborParams {
    Standardizer standardizer;
    std::deque<std::vector<double>> memory; // oldest at front
    size_t capacity{200};
    size_t k{5};
    double reference_distance{1.0};
};

struct LinearParams {
    Standardizer standardizer;
    std::vector<double> weights; // quadratic map [z_1^2 .. z_d^2, 1]
    double aggressiveness{0.5};
    uint32_t seed{42};
    uint64_t updates{0};
};

struct IsolationNode {
    int feature{-1};     // -1 marks a leaf
    double threshold{0.0};
    int left{-1};
    int right{-1};
    size_t size{0};      // training samples that reached the leaf
};

struct IsolationTree {
    std::vector<IsolationNode> nodes; // nodes[0] is the root
};

struct IsolationParams {
    size_t dimension{0};
    size_t subsample{0};
    std::vector<IsolationTree> trees;
};

using ModelParams = std::variant<SequenceParams,
                                 ReconstructionParams,
                                 BoundaryParams,
                                 NeighborParams,
                                 LinearParams,
                                 IsolationParams>;

ModelKind KindOf(const ModelParams& params);
size_t DimensionOf(const ModelParams& params);

// Feature distribution the profile was trained on.
struct FeatureSnapshot {
    std::vector<double> mean;
    std::vector<double> stddev;
    size_t windows{0};
};

struct ModelProfile {
    std::string user_id;
    ModelKind kind{ModelKind::SEQUENCE};
    uint64_t version{0};
    uint64_t trained_at{0};
    bool trained{false};
    size_t training_windows{0};
    std::map<Modality, ModelParams> params;
    std::map<Modality, FeatureSnapshot> snapshot;

    bool HasModality(Modality modality) const { return params.count(modality) > 0; }
};

} // namespace vigil
