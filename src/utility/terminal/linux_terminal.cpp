#include "linux_terminal.hpp"

#include "terminal_colors.hpp"

LinuxTerminal::LinuxTerminal(std::ostream &out) : out(out) {}

void LinuxTerminal::print_line(const std::string &line) const {
    out << line << '\n';
    flush();
}

void LinuxTerminal::print_banner() const {
    using namespace terminal_colors;
    const std::string border = "══════════════════════════════════════════════════════";

    clear();
    out << cyan << border << reset << '\n';
    out << cyan << bold << "           🎮 INPUT MONITOR 🎮           " << reset << '\n';
    out << cyan << border << reset << '\n';
    out << '\n';
    out << green << "A real-time view of every event your input devices send" << reset << '\n';
    out << '\n';
    out << yellow << "Waiting for input events..." << reset << " (press " << red << "Ctrl+C" << reset << " to exit)\n";
    out << '\n';
    out << cyan << "------------------------------------------" << reset << '\n';

    // the banner has to be on screen before the first event line
    flush();
}
