#ifndef RENDER_LOOP_HPP
#define RENDER_LOOP_HPP

#include "input/event_source/event_source.hpp"
#include "input/session_state/session_state.hpp"
#include "utility/terminal/linux_terminal.hpp"

#include <chrono>
#include <cstddef>
#include <functional>

/**
 * @brief poll, print, sleep, repeat
 *
 * events are printed one by one in the order the source hands them over, there is no batching and no reordering. the
 * loop only ever stops when the termination condition says so or when the source throws.
 */
class RenderLoop {
  public:
    RenderLoop(EventSource &event_source, const LinuxTerminal &terminal, std::chrono::milliseconds idle_interval);

    bool logging_enabled = false;

    // runs a single poll cycle and returns how many lines it printed
    std::size_t poll_once();

    void start(const std::function<bool()> &termination_condition);

    const SessionState &get_session_state() const { return session_state; }
    std::size_t get_poll_count() const { return poll_count; }

  private:
    EventSource &event_source;
    const LinuxTerminal &terminal;
    std::chrono::milliseconds idle_interval;
    SessionState session_state;
    std::size_t poll_count = 0;
};

#endif // RENDER_LOOP_HPP
