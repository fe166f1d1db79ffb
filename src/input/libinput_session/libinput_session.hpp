#ifndef LIBINPUT_SESSION_HPP
#define LIBINPUT_SESSION_HPP

#include "config/monitor_config.hpp"
#include "input/device_access/device_access.hpp"
#include "input/event_source/event_source.hpp"

#include <string>
#include <vector>

struct libinput;
struct libinput_event;
struct udev;

/**
 * @brief a libinput context bound to one udev seat, the devices libinput opens go through a DeviceRegistry owned by
 * the session
 */
class LibinputSession : public EventSource {
  public:
    explicit LibinputSession(const MonitorConfig &config);
    ~LibinputSession() override;

    LibinputSession(const LibinputSession &) = delete;
    LibinputSession &operator=(const LibinputSession &) = delete;

    void dispatch() override;
    std::vector<RawEvent> drain_events() override;

    // the libinput interface callbacks land here, user_data is the session
    static int open_restricted(const char *path, int flags, void *user_data);
    static void close_restricted(int fd, void *user_data);

  private:
    static RawEvent convert_event(libinput_event *event);

    // declared first so that it outlives the libinput context, whose teardown closes the remaining devices
    DeviceRegistry device_registry;
    udev *udev_context = nullptr;
    libinput *libinput_context = nullptr;
};

#endif // LIBINPUT_SESSION_HPP
