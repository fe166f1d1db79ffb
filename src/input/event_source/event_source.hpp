#ifndef EVENT_SOURCE_HPP
#define EVENT_SOURCE_HPP

#include "input/raw_event/raw_event.hpp"

#include <vector>

/**
 * @brief where the render loop gets its events from
 */
class EventSource {
  public:
    virtual ~EventSource() = default;

    // asks the platform for anything new, throws if the platform reports an error
    virtual void dispatch() = 0;

    // takes every pending event out of the queue, oldest first
    virtual std::vector<RawEvent> drain_events() = 0;
};

#endif // EVENT_SOURCE_HPP
