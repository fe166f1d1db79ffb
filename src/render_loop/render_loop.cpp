#include "render_loop.hpp"

#include "input/event_formatter/event_formatter.hpp"
#include "utility/logger/logger.hpp"

#include <thread>

RenderLoop::RenderLoop(EventSource &event_source, const LinuxTerminal &terminal,
                       std::chrono::milliseconds idle_interval)
    : event_source(event_source), terminal(terminal), idle_interval(idle_interval) {}

std::size_t RenderLoop::poll_once() {
    GlobalLogSection _("poll", logging_enabled);
    poll_count++;

    event_source.dispatch();

    std::size_t lines_printed = 0;
    for (const RawEvent &event : event_source.drain_events()) {
        for (const std::string &line : format_event(event, session_state)) {
            terminal.print_line(line);
            lines_printed++;
        }
    }

    if (logging_enabled)
        global_logger->debug("printed {} line(s)", lines_printed);

    return lines_printed;
}

void RenderLoop::start(const std::function<bool()> &termination_condition) {
    while (!termination_condition()) {
        poll_once();
        std::this_thread::sleep_for(idle_interval);
    }

    global_logger->info("render loop stopped after {} polls, {} key presses, {} clicks", poll_count,
                        session_state.counters.key_press_count, session_state.counters.click_count);
}
