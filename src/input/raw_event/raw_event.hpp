#ifndef RAW_EVENT_HPP
#define RAW_EVENT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// platform independent copies of the events the input layer delivers, each variant only carries what is needed to
// render it

struct DeviceEvent {
    enum class Kind { added, removed, other };
    Kind kind = Kind::other;
    std::string device_name;
};

struct KeyboardKeyEvent {
    std::uint32_t key_code = 0;
    bool pressed = false;
};

struct KeyboardOtherEvent {};

struct PointerMotionEvent {
    double dx = 0.0;
    double dy = 0.0;
};

struct PointerMotionAbsoluteEvent {
    double x = 0.0;
    double y = 0.0;
};

struct PointerButtonEvent {
    std::uint32_t button_code = 0;
    bool pressed = false;
};

struct PointerScrollWheelEvent {
    // v120 units, 0 when the wheel reported nothing on that axis
    double horizontal = 0.0;
    double vertical = 0.0;
};

// an axis the wheel reported nothing on renders as 0
inline PointerScrollWheelEvent make_scroll_wheel_event(std::optional<double> horizontal,
                                                       std::optional<double> vertical) {
    return PointerScrollWheelEvent{horizontal.value_or(0.0), vertical.value_or(0.0)};
}

struct PointerScrollEvent {
    enum class Source { finger, continuous };
    Source source = Source::finger;
};

struct PointerOtherEvent {
    std::string kind_name;
};

struct TouchEvent {
    enum class Kind { down, up, motion, cancel, frame };
    Kind kind = Kind::frame;
};

// begin, update and end phases all map to their gesture family
struct GestureEvent {
    enum class Kind { swipe, pinch, hold };
    Kind kind = Kind::swipe;
};

struct TabletEvent {};

struct SwitchEvent {};

// anything the conversion layer has no variant for, the raw platform type is kept for logging
struct OtherEvent {
    int platform_type = 0;
};

using RawEvent =
    std::variant<DeviceEvent, KeyboardKeyEvent, KeyboardOtherEvent, PointerMotionEvent, PointerMotionAbsoluteEvent,
                 PointerButtonEvent, PointerScrollWheelEvent, PointerScrollEvent, PointerOtherEvent, TouchEvent,
                 GestureEvent, TabletEvent, SwitchEvent, OtherEvent>;

#endif // RAW_EVENT_HPP
