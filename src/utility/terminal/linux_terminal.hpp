#ifndef LINUX_TERMINAL_HPP
#define LINUX_TERMINAL_HPP

#include <ostream>
#include <string>

/**
 * @brief line oriented writer for an ansi terminal, every line is flushed as soon as it is printed so the output
 * order always matches the order events arrived in
 */
class LinuxTerminal {
  public:
    explicit LinuxTerminal(std::ostream &out);

    void clear() const { out << "\033[2J\033[H"; }
    void flush() const { out.flush(); }

    void print_line(const std::string &line) const;
    void print_banner() const;

  private:
    std::ostream &out;
};

#endif // LINUX_TERMINAL_HPP
