#pragma once

#include "core/BehavioralEvent.hpp"
#include "core/Config.hpp"
#include "features/FeatureWindow.hpp"
#include <optional>
#include <string>
#include <vector>

namespace vigil {

/**
 * FeatureExtractor: incremental tumbling windower for one session.
 *
 * A window completes once its span reaches WINDOW_SIZE or either modality
 * reaches its event-count trigger. Time-based completion is observed when the
 * next event lands past the boundary; that event opens the following window.
 * Trailing partial data is never emitted.
 */
class FeatureExtractor {
public:
    FeatureExtractor(const WindowConfig& config, std::string session_id);

    // Returns the window completed by this event, if any.
    std::optional<FeatureWindow> Push(const BehavioralEvent& event);

    void Reset();

    size_t PendingEventCount() const { return pending_.size(); }
    uint64_t EmittedCount() const { return next_window_id_ - 1; }
    uint64_t DroppedCount() const { return dropped_; }
    const std::string& SessionId() const { return session_id_; }

private:
    bool CountTriggerReached() const;
    FeatureWindow Emit();

    FeatureBlock ComputeKeystrokeBlock() const;
    FeatureBlock ComputeMouseBlock() const;

    WindowConfig config_;
    std::string session_id_;

    std::vector<BehavioralEvent> pending_;
    size_t pending_keystrokes_{0};
    size_t pending_mouse_{0};
    uint64_t window_start_{0};
    uint64_t last_timestamp_{0};
    bool has_last_{false};
    uint64_t next_window_id_{1};
    uint64_t dropped_{0};
};

/**
 * WindowSequence: lazy pull view over a recorded event stream. Next() consumes
 * events only until the next window completes; Rewind() restarts from the
 * first event with a fresh extractor, so replays are identical.
 */
class WindowSequence {
public:
    WindowSequence(const std::vector<BehavioralEvent>& events,
                   const WindowConfig& config,
                   std::string session_id);

    std::optional<FeatureWindow> Next();
    void Rewind();

    // Drains the rest of the sequence.
    std::vector<FeatureWindow> Collect();

private:
    const std::vector<BehavioralEvent>& events_;
    FeatureExtractor extractor_;
    size_t cursor_{0};
};

} // namespace vigil
