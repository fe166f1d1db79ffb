#ifndef TERMINAL_COLORS_HPP
#define TERMINAL_COLORS_HPP

// ansi escape sequences for the event stream
namespace terminal_colors {
inline constexpr const char *reset = "\033[0m";
inline constexpr const char *red = "\033[31m";
inline constexpr const char *green = "\033[32m";
inline constexpr const char *yellow = "\033[33m";
inline constexpr const char *blue = "\033[34m";
inline constexpr const char *magenta = "\033[35m";
inline constexpr const char *cyan = "\033[36m";
inline constexpr const char *bold = "\033[1m";
} // namespace terminal_colors

#endif // TERMINAL_COLORS_HPP
