#ifndef EVENT_FORMATTER_HPP
#define EVENT_FORMATTER_HPP

#include "input/raw_event/raw_event.hpp"
#include "input/session_state/session_state.hpp"

#include <string>
#include <vector>

/**
 * @brief classifies one event, updates the session state it implies and returns the colored lines to print for it,
 * in print order
 *
 * every variant has an arm and every code lookup is total, so there is no failure path: an event the formatter has no
 * specific rendering for still produces its generic line
 */
std::vector<std::string> format_event(const RawEvent &event, SessionState &session_state);

std::string touch_kind_name(TouchEvent::Kind kind);
std::string gesture_kind_name(GestureEvent::Kind kind);

#endif // EVENT_FORMATTER_HPP
