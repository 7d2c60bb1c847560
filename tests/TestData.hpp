#pragma once

#include "core/BehavioralEvent.hpp"
#include "core/Config.hpp"
#include "features/FeatureWindow.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <vector>

namespace vigil {
namespace testdata {

constexpr uint64_t kEpoch = 1700000000000ULL;

// Feature-space description of one typist.
struct Persona {
    std::vector<double> keystroke;
    std::vector<double> mouse;
    double jitter{0.08}; // relative standard deviation per feature
};

inline Persona Genuine() {
    Persona p;
    p.keystroke = {95.0, 20.0, 120.0, 40.0, 210.0, 60.0, 4.5, 0.05};
    p.mouse = {0.8, 0.3, 0.01, 0.005, 0.6, 180.0, 0.3, 0.1};
    return p;
}

inline Persona Impostor() {
    Persona p;
    p.keystroke = {260.0, 70.0, 420.0, 150.0, 690.0, 220.0, 1.4, 0.3};
    p.mouse = {2.9, 1.4, 0.06, 0.03, 1.9, 620.0, 1.1, 0.6};
    return p;
}

inline std::vector<double> Sample(const std::vector<double>& mean, double jitter, std::mt19937& rng) {
    std::normal_distribution<double> noise(0.0, jitter);
    std::vector<double> out;
    out.reserve(mean.size());
    for (double m : mean) {
        out.push_back(m * (1.0 + noise(rng)));
    }
    return out;
}

inline FeatureBlock Present(std::vector<double> values, size_t events = 40) {
    FeatureBlock block;
    block.present = true;
    block.event_count = events;
    block.values = std::move(values);
    return block;
}

inline FeatureBlock Absent(Modality modality) {
    FeatureBlock block;
    block.values.assign(FeatureCount(modality), std::numeric_limits<double>::quiet_NaN());
    return block;
}

inline FeatureWindow MakeWindow(uint64_t id,
                                uint64_t start,
                                uint64_t length_ms,
                                std::optional<std::vector<double>> keystroke,
                                std::optional<std::vector<double>> mouse) {
    FeatureWindow window;
    window.window_id = id;
    window.session_id = "test-session";
    window.start_time = start;
    window.end_time = start + length_ms;
    window.Block(Modality::KEYSTROKE) = keystroke ? Present(std::move(*keystroke)) : Absent(Modality::KEYSTROKE);
    window.Block(Modality::MOUSE) = mouse ? Present(std::move(*mouse)) : Absent(Modality::MOUSE);
    return window;
}

// Consecutive windows of `length_ms` each, drawn from the persona.
inline std::vector<FeatureWindow> PersonaWindows(const Persona& persona,
                                                 size_t count,
                                                 uint32_t seed,
                                                 uint64_t start = kEpoch,
                                                 uint64_t length_ms = 30000,
                                                 uint64_t first_id = 1,
                                                 bool with_keystroke = true,
                                                 bool with_mouse = true) {
    std::mt19937 rng(seed);
    std::vector<FeatureWindow> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::optional<std::vector<double>> keys;
        std::optional<std::vector<double>> mouse;
        if (with_keystroke) keys = Sample(persona.keystroke, persona.jitter, rng);
        if (with_mouse) mouse = Sample(persona.mouse, persona.jitter, rng);
        out.push_back(MakeWindow(first_id + i, start + i * length_ms, length_ms, std::move(keys), std::move(mouse)));
    }
    return out;
}

// Raw input stream with steady rhythm. `hold_ms` and `gap_ms` shape the
// keystroke features, `step_px` the pointer velocity.
struct TypingStyle {
    double hold_ms{95.0};
    double gap_ms{160.0};
    double step_px{12.0};
    double move_interval_ms{120.0};
};

inline TypingStyle GenuineStyle() { return TypingStyle{}; }

inline TypingStyle ImpostorStyle() {
    TypingStyle style;
    style.hold_ms = 240.0;
    style.gap_ms = 520.0;
    style.step_px = 55.0;
    style.move_interval_ms = 300.0;
    return style;
}

// Interleaved keystroke and mouse events covering [start, start + duration_ms).
inline std::vector<BehavioralEvent> GenerateEvents(const TypingStyle& style,
                                                   uint64_t start,
                                                   uint64_t duration_ms,
                                                   uint32_t seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> hold(style.hold_ms, style.hold_ms * 0.15);
    std::normal_distribution<double> gap(style.gap_ms, style.gap_ms * 0.15);
    std::normal_distribution<double> step(style.step_px, style.step_px * 0.2);
    std::uniform_real_distribution<double> heading(-0.4, 0.4);
    std::uniform_int_distribution<uint32_t> key(65, 90);

    std::vector<BehavioralEvent> events;
    const uint64_t end = start + duration_ms;

    double next_key = static_cast<double>(start);
    double next_move = static_cast<double>(start) + 5.0;
    double x = 400.0;
    double y = 300.0;
    double angle = 0.0;
    size_t moves = 0;

    while (true) {
        const bool key_first = next_key <= next_move;
        const double t = key_first ? next_key : next_move;
        if (t >= static_cast<double>(end)) break;
        const uint64_t ts = static_cast<uint64_t>(t);

        if (key_first) {
            const uint64_t held = static_cast<uint64_t>(std::max(20.0, hold(rng)));
            events.push_back(BehavioralEvent::Keystroke(key(rng), ts, ts + held));
            next_key = t + static_cast<double>(held) + std::max(30.0, gap(rng));
        } else {
            angle += heading(rng);
            const double d = std::max(1.0, step(rng));
            x += d * std::cos(angle);
            y += d * std::sin(angle);
            if (++moves % 25 == 0) {
                events.push_back(BehavioralEvent::MouseClick(x, y, ts, 1));
            } else {
                events.push_back(BehavioralEvent::MouseMove(x, y, ts));
            }
            next_move = t + style.move_interval_ms;
        }
    }
    return events;
}

// Small windows and calibration minimums so engine tests run quickly.
inline EngineConfig FastEngineConfig() {
    EngineConfig config;
    config.window.window_size_ms = 10000;
    config.window.min_keystroke_events = 1000;
    config.window.min_mouse_events = 1000;
    config.calibration.min_calibration_time_ms = 300000;
    config.calibration.min_calibration_windows = 10;
    config.drift.min_windows = 5;
    config.drift.detection_window = 20;
    config.models.isolation_trees = 30;
    config.models.isolation_subsample = 16;
    config.storage.database_path = ":memory:";
    return config;
}

} // namespace testdata
} // namespace vigil
