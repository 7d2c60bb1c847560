#include "features/FeatureExtractor.hpp"
#include "core/Logger.hpp"
#include "core/Statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace vigil {

namespace {

constexpr uint32_t kKeyBackspace = 8;
constexpr uint32_t kKeyDelete = 46;
constexpr double kPi = 3.14159265358979323846;

double SpanSeconds(uint64_t start, uint64_t end) {
    const uint64_t span_ms = end > start ? end - start : 1;
    return static_cast<double>(span_ms) / 1000.0;
}

FeatureBlock MissingBlock(Modality modality, size_t event_count) {
    FeatureBlock block;
    block.present = false;
    block.event_count = event_count;
    block.values.assign(FeatureCount(modality), std::numeric_limits<double>::quiet_NaN());
    return block;
}

bool HasFiniteFields(const BehavioralEvent& event) {
    return std::isfinite(event.x) && std::isfinite(event.y) && std::isfinite(event.scroll_delta);
}

double AngleBetween(double dx0, double dy0, double dx1, double dy1) {
    double delta = std::atan2(dy1, dx1) - std::atan2(dy0, dx0);
    while (delta > kPi) delta -= 2.0 * kPi;
    while (delta < -kPi) delta += 2.0 * kPi;
    return std::abs(delta);
}

} // namespace

FeatureExtractor::FeatureExtractor(const WindowConfig& config, std::string session_id)
    : config_(config), session_id_(std::move(session_id)) {
}

void FeatureExtractor::Reset() {
    pending_.clear();
    pending_keystrokes_ = 0;
    pending_mouse_ = 0;
    window_start_ = 0;
    last_timestamp_ = 0;
    has_last_ = false;
    next_window_id_ = 1;
    dropped_ = 0;
}

std::optional<FeatureWindow> FeatureExtractor::Push(const BehavioralEvent& event) {
    if (!HasFiniteFields(event)) {
        ++dropped_;
        LOG_WARN("Session {}: dropping {} event at {} with non-finite coordinates",
                 session_id_, EventKindToString(event.kind), event.timestamp);
        return std::nullopt;
    }
    if (has_last_ && event.timestamp < last_timestamp_) {
        ++dropped_;
        LOG_DEBUG("Session {}: dropping out-of-order {} event at {} (last {})",
                  session_id_, EventKindToString(event.kind), event.timestamp, last_timestamp_);
        return std::nullopt;
    }

    std::optional<FeatureWindow> completed;

    // Time boundary: the incoming event belongs to the next window.
    if (!pending_.empty() && event.timestamp >= window_start_ + config_.window_size_ms) {
        completed = Emit();
    }

    if (pending_.empty()) {
        window_start_ = event.timestamp;
    }
    pending_.push_back(event);
    if (event.IsKeyboard()) {
        ++pending_keystrokes_;
    } else {
        ++pending_mouse_;
    }
    last_timestamp_ = event.timestamp;
    has_last_ = true;

    if (!completed && CountTriggerReached()) {
        completed = Emit();
    }
    return completed;
}

bool FeatureExtractor::CountTriggerReached() const {
    return pending_keystrokes_ >= config_.min_keystroke_events ||
           pending_mouse_ >= config_.min_mouse_events;
}

FeatureWindow FeatureExtractor::Emit() {
    FeatureWindow window;
    window.window_id = next_window_id_++;
    window.session_id = session_id_;
    window.start_time = window_start_;
    window.end_time = window_start_;
    for (const auto& e : pending_) {
        window.end_time = std::max(window.end_time, e.timestamp);
    }

    window.Block(Modality::KEYSTROKE) = ComputeKeystrokeBlock();
    window.Block(Modality::MOUSE) = ComputeMouseBlock();

    LOG_TRACE("Session {}: window {} [{}..{}] keys={} mouse={}",
              session_id_, window.window_id, window.start_time, window.end_time,
              pending_keystrokes_, pending_mouse_);

    pending_.clear();
    pending_keystrokes_ = 0;
    pending_mouse_ = 0;
    return window;
}

FeatureBlock FeatureExtractor::ComputeKeystrokeBlock() const {
    if (pending_keystrokes_ < config_.min_modality_events) {
        return MissingBlock(Modality::KEYSTROKE, pending_keystrokes_);
    }

    RunningStats hold;
    RunningStats flight;
    RunningStats digraph;
    size_t corrections = 0;
    const BehavioralEvent* prev = nullptr;
    uint64_t first_press = 0;
    uint64_t last_press = 0;

    for (const auto& e : pending_) {
        if (!e.IsKeyboard()) continue;

        if (e.release_time >= e.press_time) {
            hold.Add(static_cast<double>(e.release_time - e.press_time));
        }
        if (e.key_id == kKeyBackspace || e.key_id == kKeyDelete) {
            ++corrections;
        }
        if (prev) {
            // Flight may be negative when keys overlap (rollover typing).
            flight.Add(static_cast<double>(e.press_time) - static_cast<double>(prev->release_time));
            digraph.Add(static_cast<double>(e.press_time - prev->press_time));
        } else {
            first_press = e.press_time;
        }
        last_press = e.press_time;
        prev = &e;
    }

    FeatureBlock block;
    block.present = true;
    block.event_count = pending_keystrokes_;
    block.values = {
        hold.Mean(), hold.StdDev(),
        flight.Mean(), flight.StdDev(),
        digraph.Mean(), digraph.StdDev(),
        static_cast<double>(pending_keystrokes_) / SpanSeconds(first_press, last_press),
        static_cast<double>(corrections) / static_cast<double>(pending_keystrokes_)
    };
    return block;
}

FeatureBlock FeatureExtractor::ComputeMouseBlock() const {
    if (pending_mouse_ < config_.min_modality_events) {
        return MissingBlock(Modality::MOUSE, pending_mouse_);
    }

    RunningStats velocity;
    RunningStats accel;
    RunningStats curvature;
    RunningStats dwell;
    size_t clicks = 0;
    size_t scrolls = 0;

    const BehavioralEvent* prev_move = nullptr;
    double prev_velocity = 0.0;
    bool has_prev_velocity = false;
    double prev_dx = 0.0;
    double prev_dy = 0.0;
    bool has_prev_segment = false;
    uint64_t first_ts = 0;
    uint64_t last_ts = 0;
    bool has_first = false;

    for (const auto& e : pending_) {
        if (!e.IsMouse()) continue;

        if (!has_first) {
            first_ts = e.timestamp;
            has_first = true;
        }
        last_ts = e.timestamp;

        switch (e.kind) {
            case EventKind::MOUSE_MOVE: {
                if (prev_move) {
                    const double dx = e.x - prev_move->x;
                    const double dy = e.y - prev_move->y;
                    const uint64_t dt = e.timestamp - prev_move->timestamp;
                    const double dist = std::sqrt(dx * dx + dy * dy);
                    if (dt > 0) {
                        const double v = dist / static_cast<double>(dt);
                        velocity.Add(v);
                        if (has_prev_velocity) {
                            accel.Add(std::abs(v - prev_velocity) / static_cast<double>(dt));
                        }
                        prev_velocity = v;
                        has_prev_velocity = true;
                    }
                    if (dist > 0.0) {
                        if (has_prev_segment) {
                            curvature.Add(AngleBetween(prev_dx, prev_dy, dx, dy));
                        }
                        prev_dx = dx;
                        prev_dy = dy;
                        has_prev_segment = true;
                    }
                }
                prev_move = &e;
                break;
            }
            case EventKind::MOUSE_CLICK:
                ++clicks;
                if (prev_move) {
                    dwell.Add(static_cast<double>(e.timestamp - prev_move->timestamp));
                }
                break;
            case EventKind::SCROLL:
                ++scrolls;
                break;
            default:
                break;
        }
    }

    const double span = SpanSeconds(first_ts, last_ts);

    FeatureBlock block;
    block.present = true;
    block.event_count = pending_mouse_;
    block.values = {
        velocity.Mean(), velocity.StdDev(),
        accel.Mean(), accel.StdDev(),
        curvature.Mean(), dwell.Mean(),
        static_cast<double>(clicks) / span,
        static_cast<double>(scrolls) / span
    };
    return block;
}

// --- WindowSequence ---

WindowSequence::WindowSequence(const std::vector<BehavioralEvent>& events,
                               const WindowConfig& config,
                               std::string session_id)
    : events_(events), extractor_(config, std::move(session_id)) {
}

std::optional<FeatureWindow> WindowSequence::Next() {
    while (cursor_ < events_.size()) {
        auto window = extractor_.Push(events_[cursor_++]);
        if (window) {
            return window;
        }
    }
    return std::nullopt;
}

void WindowSequence::Rewind() {
    extractor_.Reset();
    cursor_ = 0;
}

std::vector<FeatureWindow> WindowSequence::Collect() {
    std::vector<FeatureWindow> out;
    while (auto window = Next()) {
        out.push_back(std::move(*window));
    }
    return out;
}

} // namespace vigil
