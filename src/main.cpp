#include "config/monitor_config.hpp"
#include "input/libinput_session/libinput_session.hpp"
#include "render_loop/render_loop.hpp"
#include "utility/logger/logger.hpp"
#include "utility/terminal/linux_terminal.hpp"

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

namespace {

volatile std::sig_atomic_t interrupt_received = 0;

void handle_interrupt(int) { interrupt_received = 1; }

void configure_logging(const MonitorConfig &config) {
    global_logger->set_level(config.log_level);
    if (!config.log_file_path.empty())
        global_logger->add_file_sink(config.log_file_path);
}

} // namespace

int main() {
    MonitorConfig config;
    configure_logging(config);

    // the loop checks the flag between polls so that the session is torn down and every device closed on ctrl+c
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    LinuxTerminal terminal(std::cout);

    try {
        LibinputSession session(config);
        terminal.print_banner();

        RenderLoop render_loop(session, terminal, config.idle_interval);
        render_loop.logging_enabled = config.logging_enabled;

        auto term = []() { return interrupt_received != 0; };
        render_loop.start(term);
    } catch (const std::exception &e) {
        terminal.flush();
        global_logger->critical("input_monitor: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
