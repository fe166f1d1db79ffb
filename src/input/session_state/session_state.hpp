#ifndef SESSION_STATE_HPP
#define SESSION_STATE_HPP

#include <cstdint>

struct PointerState {
    double x = 0.0;
    double y = 0.0;
    double dx = 0.0;
    double dy = 0.0;
};

// both counters only ever go up
struct Counters {
    std::uint64_t key_press_count = 0;
    std::uint64_t click_count = 0;
};

/**
 * @brief everything the formatter remembers between events, owned by the render loop and handed to the formatter by
 * reference
 */
struct SessionState {
    PointerState pointer;
    Counters counters;
};

#endif // SESSION_STATE_HPP
