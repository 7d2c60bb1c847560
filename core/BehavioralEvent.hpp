#pragma once

#include <cstdint>
#include <string>

namespace vigil {

enum class EventKind {
    KEYSTROKE,
    MOUSE_MOVE,
    MOUSE_CLICK,
    SCROLL
};

inline std::string EventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::KEYSTROKE:   return "KEYSTROKE";
        case EventKind::MOUSE_MOVE:  return "MOUSE_MOVE";
        case EventKind::MOUSE_CLICK: return "MOUSE_CLICK";
        case EventKind::SCROLL:      return "SCROLL";
        default:                     return "UNKNOWN";
    }
}

// Raw input sample. Timestamps are milliseconds since epoch; for keystrokes the
// timestamp is the press time. Built through the factories and passed around
// by const reference once recorded.
struct BehavioralEvent {
    EventKind kind{EventKind::MOUSE_MOVE};
    uint64_t timestamp{0};

    // Keystroke
    uint32_t key_id{0};
    uint64_t press_time{0};
    uint64_t release_time{0};

    // Mouse / scroll
    double x{0.0};
    double y{0.0};
    int32_t button{0};
    double scroll_delta{0.0};

    static BehavioralEvent Keystroke(uint32_t key_id, uint64_t press_time, uint64_t release_time) {
        BehavioralEvent e;
        e.kind = EventKind::KEYSTROKE;
        e.timestamp = press_time;
        e.key_id = key_id;
        e.press_time = press_time;
        e.release_time = release_time;
        return e;
    }

    static BehavioralEvent MouseMove(double x, double y, uint64_t timestamp) {
        BehavioralEvent e;
        e.kind = EventKind::MOUSE_MOVE;
        e.timestamp = timestamp;
        e.x = x;
        e.y = y;
        return e;
    }

    static BehavioralEvent MouseClick(double x, double y, uint64_t timestamp, int32_t button) {
        BehavioralEvent e;
        e.kind = EventKind::MOUSE_CLICK;
        e.timestamp = timestamp;
        e.x = x;
        e.y = y;
        e.button = button;
        return e;
    }

    static BehavioralEvent Scroll(double x, double y, uint64_t timestamp, double delta) {
        BehavioralEvent e;
        e.kind = EventKind::SCROLL;
        e.timestamp = timestamp;
        e.x = x;
        e.y = y;
        e.scroll_delta = delta;
        return e;
    }

    bool IsKeyboard() const { return kind == EventKind::KEYSTROKE; }
    bool IsMouse() const { return kind != EventKind::KEYSTROKE; }
};

} // namespace vigil
