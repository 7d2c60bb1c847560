#include "models/ScoringModel.hpp"
#include "core/Errors.hpp"
#include "models/BoundaryModel.hpp"
#include "models/IsolationModel.hpp"
#include "models/LinearModel.hpp"
#include "models/NeighborModel.hpp"
#include "models/ReconstructionModel.hpp"
#include "models/SequenceModel.hpp"
#include <algorithm>
#include <stdexcept>
#include <type_traits>

namespace vigil {

namespace {

ModelParams FitParams(ModelKind kind, const std::vector<std::vector<double>>& rows, const ModelConfig& config) {
    switch (kind) {
        case ModelKind::SEQUENCE:         return SequenceModel::Fit(rows, config);
        case ModelKind::RECONSTRUCTION:   return ReconstructionModel::Fit(rows, config);
        case ModelKind::BOUNDARY:         return BoundaryModel::Fit(rows, config);
        case ModelKind::NEAREST_NEIGHBOR: return NeighborModel::Fit(rows, config);
        case ModelKind::ONLINE_LINEAR:    return LinearModel::Fit(rows, config);
        case ModelKind::ISOLATION:        return IsolationModel::Fit(rows, config);
    }
    throw std::runtime_error("Unhandled model kind");
}

FeatureSnapshot Snapshot(const std::vector<std::vector<double>>& rows) {
    FeatureSnapshot snap;
    snap.windows = rows.size();
    if (rows.empty()) return snap;

    const size_t dim = rows.front().size();
    std::vector<RunningStats> stats(dim);
    for (const auto& row : rows) {
        for (size_t i = 0; i < dim && i < row.size(); ++i) {
            stats[i].Add(row[i]);
        }
    }
    for (const auto& s : stats) {
        snap.mean.push_back(s.Mean());
        snap.stddev.push_back(s.StdDev());
    }
    return snap;
}

void CheckDimension(const ModelProfile& profile, Modality modality, const ModelParams& params,
                    const std::vector<double>& values) {
    const size_t expected = DimensionOf(params);
    if (values.size() != expected) {
        throw ModelScoreError(ModelKindToString(profile.kind) + " profile for user '" + profile.user_id +
                              "' expects " + std::to_string(expected) + " " + ModalityToString(modality) +
                              " features, window has " + std::to_string(values.size()));
    }
}

} // namespace

ModelKind KindOf(const ModelParams& params) {
    return std::visit([](const auto& p) -> ModelKind {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, SequenceParams>) return ModelKind::SEQUENCE;
        else if constexpr (std::is_same_v<T, ReconstructionParams>) return ModelKind::RECONSTRUCTION;
        else if constexpr (std::is_same_v<T, BoundaryParams>) return ModelKind::BOUNDARY;
        else if constexpr (std::is_same_v<T, NeighborParams>) return ModelKind::NEAREST_NEIGHBOR;
        else if constexpr (std::is_same_v<T, LinearParams>) return ModelKind::ONLINE_LINEAR;
        else return ModelKind::ISOLATION;
    }, params);
}

size_t DimensionOf(const ModelParams& params) {
    return std::visit([](const auto& p) -> size_t {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, SequenceParams>) return p.phi.size();
        else if constexpr (std::is_same_v<T, BoundaryParams>) return p.center.size();
        else if constexpr (std::is_same_v<T, IsolationParams>) return p.dimension;
        else return p.standardizer.Dimension();
    }, params);
}

ModelProfile ScoringModel::Train(ModelKind kind,
                                 const std::string& user_id,
                                 const TrainingData& data,
                                 const ModelConfig& config,
                                 uint64_t now_ms) {
    ModelProfile profile;
    profile.user_id = user_id;
    profile.kind = kind;
    profile.trained_at = now_ms;

    for (const auto& [modality, rows] : data) {
        if (rows.empty()) continue;
        profile.params.emplace(modality, FitParams(kind, rows, config));
        profile.snapshot.emplace(modality, Snapshot(rows));
        profile.training_windows = std::max(profile.training_windows, rows.size());
    }
    profile.trained = !profile.params.empty();
    return profile;
}

double ScoringModel::ScoreParams(const ModelParams& params, const ModalityInput& input) {
    return std::visit([&input](const auto& p) -> double {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, SequenceParams>) return SequenceModel::Score(p, input);
        else if constexpr (std::is_same_v<T, ReconstructionParams>) return ReconstructionModel::Score(p, input);
        else if constexpr (std::is_same_v<T, BoundaryParams>) return BoundaryModel::Score(p, input);
        else if constexpr (std::is_same_v<T, NeighborParams>) return NeighborModel::Score(p, input);
        else if constexpr (std::is_same_v<T, LinearParams>) return LinearModel::Score(p, input);
        else return IsolationModel::Score(p, input);
    }, params);
}

std::optional<double> ScoringModel::Score(const ModelProfile& profile,
                                          const FeatureWindow& window,
                                          const WindowHistory& history) {
    if (!profile.trained) {
        throw ModelUntrainedError(ModelKindToString(profile.kind) + " model for user '" +
                                  profile.user_id + "' has not completed training");
    }

    double total = 0.0;
    size_t scored = 0;
    for (const auto& [modality, params] : profile.params) {
        if (!window.Has(modality)) continue;

        const auto& current = window.Block(modality).values;
        CheckDimension(profile, modality, params, current);

        ModalityInput input{current, {}};
        for (const auto& past : history) {
            const FeatureBlock& block = past.Block(modality);
            if (block.present && block.values.size() == current.size()) {
                input.history.push_back(&block.values);
            }
        }

        total += Clamp01(ScoreParams(params, input));
        ++scored;
    }

    if (scored == 0) {
        return std::nullopt;
    }
    return total / static_cast<double>(scored);
}

bool ScoringModel::SupportsUpdate(ModelKind kind) {
    return kind == ModelKind::NEAREST_NEIGHBOR || kind == ModelKind::ONLINE_LINEAR;
}

ModelProfile ScoringModel::Update(const ModelProfile& profile, const FeatureWindow& window) {
    ModelProfile updated = profile;
    if (!SupportsUpdate(profile.kind) || !profile.trained) {
        return updated;
    }

    for (auto& [modality, params] : updated.params) {
        if (!window.Has(modality)) continue;
        const auto& values = window.Block(modality).values;
        CheckDimension(profile, modality, params, values);

        if (auto* nn = std::get_if<NeighborParams>(&params)) {
            NeighborModel::Absorb(*nn, values);
        } else if (auto* linear = std::get_if<LinearParams>(&params)) {
            LinearModel::Absorb(*linear, values);
        }
    }
    return updated;
}

} // namespace vigil
