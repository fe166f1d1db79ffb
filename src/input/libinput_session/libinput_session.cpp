#include "libinput_session.hpp"

#include "utility/logger/logger.hpp"

#include <libinput.h>
#include <libudev.h>

#include <optional>
#include <stdexcept>
#include <system_error>

namespace {

// libinput keeps the pointer, so the interface has to live as long as the process
const libinput_interface restricted_interface = {
    LibinputSession::open_restricted,
    LibinputSession::close_restricted,
};

std::optional<double> scroll_axis_value(libinput_event_pointer *pointer_event, libinput_pointer_axis axis) {
    if (!libinput_event_pointer_has_axis(pointer_event, axis))
        return std::nullopt;
    return libinput_event_pointer_get_scroll_value_v120(pointer_event, axis);
}

RawEvent convert_pointer_event(libinput_event_type type, libinput_event *event) {
    libinput_event_pointer *pointer_event = libinput_event_get_pointer_event(event);

    switch (type) {
    case LIBINPUT_EVENT_POINTER_MOTION:
        return PointerMotionEvent{libinput_event_pointer_get_dx(pointer_event),
                                  libinput_event_pointer_get_dy(pointer_event)};
    case LIBINPUT_EVENT_POINTER_MOTION_ABSOLUTE:
        return PointerMotionAbsoluteEvent{libinput_event_pointer_get_absolute_x(pointer_event),
                                          libinput_event_pointer_get_absolute_y(pointer_event)};
    case LIBINPUT_EVENT_POINTER_BUTTON:
        return PointerButtonEvent{libinput_event_pointer_get_button(pointer_event),
                                  libinput_event_pointer_get_button_state(pointer_event) ==
                                      LIBINPUT_BUTTON_STATE_PRESSED};
    case LIBINPUT_EVENT_POINTER_SCROLL_WHEEL:
        return make_scroll_wheel_event(
            scroll_axis_value(pointer_event, LIBINPUT_POINTER_AXIS_SCROLL_HORIZONTAL),
            scroll_axis_value(pointer_event, LIBINPUT_POINTER_AXIS_SCROLL_VERTICAL));
    case LIBINPUT_EVENT_POINTER_SCROLL_FINGER:
        return PointerScrollEvent{PointerScrollEvent::Source::finger};
    case LIBINPUT_EVENT_POINTER_SCROLL_CONTINUOUS:
        return PointerScrollEvent{PointerScrollEvent::Source::continuous};
    case LIBINPUT_EVENT_POINTER_AXIS:
        // legacy axis event, libinput sends it alongside the scroll events above
        return PointerOtherEvent{"Axis"};
    default:
        return PointerOtherEvent{"Unknown"};
    }
}

} // namespace

LibinputSession::LibinputSession(const MonitorConfig &config) {
    udev_context = udev_new();
    if (!udev_context)
        throw std::runtime_error("failed to create udev context");

    libinput_context = libinput_udev_create_context(&restricted_interface, this, udev_context);
    if (!libinput_context) {
        udev_unref(udev_context);
        throw std::runtime_error("failed to create libinput context");
    }

    if (libinput_udev_assign_seat(libinput_context, config.seat_name.c_str()) != 0) {
        libinput_unref(libinput_context);
        udev_unref(udev_context);
        throw std::runtime_error("failed to assign seat " + config.seat_name);
    }

    global_logger->info("libinput session bound to {}", config.seat_name);
}

LibinputSession::~LibinputSession() {
    // releases every device still open through close_restricted
    libinput_unref(libinput_context);
    udev_unref(udev_context);
    if (device_registry.open_count() > 0)
        global_logger->debug("{} device(s) left open by libinput, closing them", device_registry.open_count());
}

void LibinputSession::dispatch() {
    int rc = libinput_dispatch(libinput_context);
    if (rc < 0)
        throw std::system_error(-rc, std::generic_category(), "libinput dispatch failed");
}

std::vector<RawEvent> LibinputSession::drain_events() {
    std::vector<RawEvent> events;
    libinput_event *event;
    while ((event = libinput_get_event(libinput_context)) != nullptr) {
        events.push_back(convert_event(event));
        libinput_event_destroy(event);
    }
    return events;
}

// the registry never throws, which matters here since libinput's c frames are on the stack
int LibinputSession::open_restricted(const char *path, int flags, void *user_data) {
    auto *session = static_cast<LibinputSession *>(user_data);
    return session->device_registry.open(path, flags);
}

void LibinputSession::close_restricted(int fd, void *user_data) {
    auto *session = static_cast<LibinputSession *>(user_data);
    session->device_registry.close(fd);
}

RawEvent LibinputSession::convert_event(libinput_event *event) {
    libinput_event_type type = libinput_event_get_type(event);

    switch (type) {
    case LIBINPUT_EVENT_DEVICE_ADDED:
    case LIBINPUT_EVENT_DEVICE_REMOVED: {
        const char *name = libinput_device_get_name(libinput_event_get_device(event));
        DeviceEvent device_event;
        device_event.kind =
            type == LIBINPUT_EVENT_DEVICE_ADDED ? DeviceEvent::Kind::added : DeviceEvent::Kind::removed;
        device_event.device_name = name ? name : "";
        global_logger->info("device {}: {}", type == LIBINPUT_EVENT_DEVICE_ADDED ? "added" : "removed",
                            device_event.device_name);
        return device_event;
    }

    case LIBINPUT_EVENT_KEYBOARD_KEY: {
        libinput_event_keyboard *keyboard_event = libinput_event_get_keyboard_event(event);
        return KeyboardKeyEvent{libinput_event_keyboard_get_key(keyboard_event),
                                libinput_event_keyboard_get_key_state(keyboard_event) == LIBINPUT_KEY_STATE_PRESSED};
    }

    case LIBINPUT_EVENT_POINTER_MOTION:
    case LIBINPUT_EVENT_POINTER_MOTION_ABSOLUTE:
    case LIBINPUT_EVENT_POINTER_BUTTON:
    case LIBINPUT_EVENT_POINTER_AXIS:
    case LIBINPUT_EVENT_POINTER_SCROLL_WHEEL:
    case LIBINPUT_EVENT_POINTER_SCROLL_FINGER:
    case LIBINPUT_EVENT_POINTER_SCROLL_CONTINUOUS:
        return convert_pointer_event(type, event);

    case LIBINPUT_EVENT_TOUCH_DOWN:
        return TouchEvent{TouchEvent::Kind::down};
    case LIBINPUT_EVENT_TOUCH_UP:
        return TouchEvent{TouchEvent::Kind::up};
    case LIBINPUT_EVENT_TOUCH_MOTION:
        return TouchEvent{TouchEvent::Kind::motion};
    case LIBINPUT_EVENT_TOUCH_CANCEL:
        return TouchEvent{TouchEvent::Kind::cancel};
    case LIBINPUT_EVENT_TOUCH_FRAME:
        return TouchEvent{TouchEvent::Kind::frame};

    case LIBINPUT_EVENT_GESTURE_SWIPE_BEGIN:
    case LIBINPUT_EVENT_GESTURE_SWIPE_UPDATE:
    case LIBINPUT_EVENT_GESTURE_SWIPE_END:
        return GestureEvent{GestureEvent::Kind::swipe};
    case LIBINPUT_EVENT_GESTURE_PINCH_BEGIN:
    case LIBINPUT_EVENT_GESTURE_PINCH_UPDATE:
    case LIBINPUT_EVENT_GESTURE_PINCH_END:
        return GestureEvent{GestureEvent::Kind::pinch};
    case LIBINPUT_EVENT_GESTURE_HOLD_BEGIN:
    case LIBINPUT_EVENT_GESTURE_HOLD_END:
        return GestureEvent{GestureEvent::Kind::hold};

    case LIBINPUT_EVENT_TABLET_TOOL_AXIS:
    case LIBINPUT_EVENT_TABLET_TOOL_PROXIMITY:
    case LIBINPUT_EVENT_TABLET_TOOL_TIP:
    case LIBINPUT_EVENT_TABLET_TOOL_BUTTON:
    case LIBINPUT_EVENT_TABLET_PAD_BUTTON:
    case LIBINPUT_EVENT_TABLET_PAD_RING:
    case LIBINPUT_EVENT_TABLET_PAD_STRIP:
    case LIBINPUT_EVENT_TABLET_PAD_KEY:
        return TabletEvent{};

    case LIBINPUT_EVENT_SWITCH_TOGGLE:
        return SwitchEvent{};

    default:
        global_logger->debug("unhandled libinput event type {}", static_cast<int>(type));
        return OtherEvent{static_cast<int>(type)};
    }
}
