#include "event_formatter.hpp"

#include "input/code_tables/code_tables.hpp"
#include "utility/terminal/terminal_colors.hpp"

#include <fmt/format.h>

using namespace terminal_colors;

namespace {

class EventLineVisitor {
  public:
    explicit EventLineVisitor(SessionState &session_state) : session_state(session_state) {}

    std::vector<std::string> operator()(const DeviceEvent &event) const {
        switch (event.kind) {
        case DeviceEvent::Kind::added:
            return {fmt::format("{}➕ Device Added{}", green, reset)};
        case DeviceEvent::Kind::removed:
            return {fmt::format("{}➖ Device Removed{}", red, reset)};
        case DeviceEvent::Kind::other:
            break;
        }
        return {fmt::format("{}📱 Other Device Event{}", blue, reset)};
    }

    std::vector<std::string> operator()(const KeyboardKeyEvent &event) const {
        std::string name = code_tables::key_name(static_cast<int>(event.key_code));

        if (!event.pressed) {
            return {fmt::format("{}⌨️  KEY RELEASE DETECTED --> [ {} ] <-- (code: {}){}", blue, name, event.key_code,
                                reset)};
        }

        Counters &counters = session_state.counters;
        counters.key_press_count++;
        return {
            fmt::format("{}⌨️  KEY PRESS DETECTED --> {}{}[ {} ]{}{} {}<-- (code: {}){}", yellow, magenta, bold, name,
                        reset, yellow, bold, event.key_code, reset),
            fmt::format("{}🔠 YOU PRESSED: [ {} ] (Total key presses: {}){}", green, name, counters.key_press_count,
                        reset),
        };
    }

    std::vector<std::string> operator()(const KeyboardOtherEvent &) const {
        return {fmt::format("{}⌨️  Other Keyboard Event{}", cyan, reset)};
    }

    std::vector<std::string> operator()(const PointerMotionEvent &event) const {
        PointerState &pointer = session_state.pointer;
        pointer.dx = event.dx;
        pointer.dy = event.dy;
        pointer.x += event.dx;
        pointer.y += event.dy;
        return {fmt::format("{}🖱️  Mouse motion - Position: ({:.2f}, {:.2f}), Delta: ({:.2f}, {:.2f}){}", cyan,
                            pointer.x, pointer.y, pointer.dx, pointer.dy, reset)};
    }

    std::vector<std::string> operator()(const PointerMotionAbsoluteEvent &event) const {
        PointerState &pointer = session_state.pointer;
        pointer.x = event.x;
        pointer.y = event.y;
        return {fmt::format("{}🖱️  Mouse absolute position: ({:.2f}, {:.2f}){}", cyan, pointer.x, pointer.y, reset)};
    }

    std::vector<std::string> operator()(const PointerButtonEvent &event) const {
        const PointerState &pointer = session_state.pointer;
        std::string description = fmt::format("🖱️  Mouse button [ {} ] ({})",
                                              code_tables::button_name(static_cast<int>(event.button_code)),
                                              event.button_code);

        if (!event.pressed) {
            return {fmt::format("{}{} - RELEASED at position: ({:.2f}, {:.2f}){}", blue, description, pointer.x,
                                pointer.y, reset)};
        }

        Counters &counters = session_state.counters;
        counters.click_count++;
        return {fmt::format("{}{} - PRESSED at position: ({:.2f}, {:.2f}) (Total clicks: {}){}", magenta, description,
                            pointer.x, pointer.y, counters.click_count, reset)};
    }

    std::vector<std::string> operator()(const PointerScrollWheelEvent &event) const {
        return {fmt::format("{}🖱️  Scroll wheel: horizontal: {:.2f}, vertical: {:.2f}{}", cyan, event.horizontal,
                            event.vertical, reset)};
    }

    std::vector<std::string> operator()(const PointerScrollEvent &event) const {
        if (event.source == PointerScrollEvent::Source::finger)
            return {fmt::format("{}🖱️  Scroll finger event{}", cyan, reset)};
        return {fmt::format("{}🖱️  Scroll continuous event{}", cyan, reset)};
    }

    std::vector<std::string> operator()(const PointerOtherEvent &event) const {
        return {fmt::format("{}🖱️  Pointer Event: {}{}", cyan, event.kind_name, reset)};
    }

    std::vector<std::string> operator()(const TouchEvent &event) const {
        return {fmt::format("{}👆 Touch Event: {}{}", magenta, touch_kind_name(event.kind), reset)};
    }

    std::vector<std::string> operator()(const GestureEvent &event) const {
        return {fmt::format("{}🤲 Gesture Event: {}{}", magenta, gesture_kind_name(event.kind), reset)};
    }

    std::vector<std::string> operator()(const TabletEvent &) const {
        return {fmt::format("{}✏️ Tablet Event{}", yellow, reset)};
    }

    std::vector<std::string> operator()(const SwitchEvent &) const {
        return {fmt::format("{}🔄 Switch Event{}", yellow, reset)};
    }

    std::vector<std::string> operator()(const OtherEvent &) const {
        return {fmt::format("{}⚠️ Other Event{}", red, reset)};
    }

  private:
    SessionState &session_state;
};

} // namespace

std::vector<std::string> format_event(const RawEvent &event, SessionState &session_state) {
    return std::visit(EventLineVisitor(session_state), event);
}

std::string touch_kind_name(TouchEvent::Kind kind) {
    switch (kind) {
    case TouchEvent::Kind::down:
        return "Down";
    case TouchEvent::Kind::up:
        return "Up";
    case TouchEvent::Kind::motion:
        return "Motion";
    case TouchEvent::Kind::cancel:
        return "Cancel";
    case TouchEvent::Kind::frame:
        return "Frame";
    }
    return "Unknown";
}

std::string gesture_kind_name(GestureEvent::Kind kind) {
    switch (kind) {
    case GestureEvent::Kind::swipe:
        return "Swipe";
    case GestureEvent::Kind::pinch:
        return "Pinch";
    case GestureEvent::Kind::hold:
        return "Hold";
    }
    return "Unknown";
}
