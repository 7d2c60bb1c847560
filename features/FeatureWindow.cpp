#include "features/FeatureWindow.hpp"
#include <cmath>

namespace vigil {

const std::vector<std::string>& FeatureNames(Modality modality) {
    static const std::vector<std::string> keystroke = {
        "hold_mean", "hold_std",
        "flight_mean", "flight_std",
        "digraph_mean", "digraph_std",
        "typing_rate", "correction_ratio"
    };
    static const std::vector<std::string> mouse = {
        "velocity_mean", "velocity_std",
        "accel_mean", "accel_std",
        "curvature_mean", "click_dwell_mean",
        "click_rate", "scroll_rate"
    };
    return modality == Modality::KEYSTROKE ? keystroke : mouse;
}

size_t FeatureWindow::EventCount() const {
    size_t total = 0;
    for (const auto& block : blocks) {
        total += block.event_count;
    }
    return total;
}

namespace {

bool SameValue(double a, double b) {
    if (std::isnan(a) && std::isnan(b)) return true;
    return a == b;
}

bool SameBlock(const FeatureBlock& a, const FeatureBlock& b) {
    if (a.present != b.present || a.event_count != b.event_count ||
        a.values.size() != b.values.size()) {
        return false;
    }
    for (size_t i = 0; i < a.values.size(); ++i) {
        if (!SameValue(a.values[i], b.values[i])) return false;
    }
    return true;
}

} // namespace

bool operator==(const FeatureWindow& a, const FeatureWindow& b) {
    if (a.window_id != b.window_id || a.session_id != b.session_id ||
        a.start_time != b.start_time || a.end_time != b.end_time) {
        return false;
    }
    for (size_t i = 0; i < kModalityCount; ++i) {
        if (!SameBlock(a.blocks[i], b.blocks[i])) return false;
    }
    return true;
}

} // namespace vigil
