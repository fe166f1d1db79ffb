#ifndef DEVICE_ACCESS_HPP
#define DEVICE_ACCESS_HPP

#include <cstddef>
#include <string>
#include <unordered_map>

/**
 * @brief owns one open device file descriptor and closes it exactly once, when it goes out of scope or when it is
 * released explicitly
 */
class DeviceHandle {
  public:
    DeviceHandle() = default;
    explicit DeviceHandle(int fd, std::string path = "");
    ~DeviceHandle();

    DeviceHandle(DeviceHandle &&other) noexcept;
    DeviceHandle &operator=(DeviceHandle &&other) noexcept;
    DeviceHandle(const DeviceHandle &) = delete;
    DeviceHandle &operator=(const DeviceHandle &) = delete;

    int fd() const { return file_descriptor; }
    const std::string &path() const { return device_path; }
    bool is_open() const { return file_descriptor >= 0; }

    void close();

  private:
    int file_descriptor = -1;
    std::string device_path;
};

/**
 * @brief opens the device node at path with the given open(2) flags
 *
 * the access mode must be one of O_RDONLY, O_WRONLY or O_RDWR. returns the new file descriptor, or the negated errno
 * on failure which is what libinput expects back from its open callback.
 */
int open_device(const std::string &path, int flags);

// reads the kernel's name for an input node, ie /dev/input/event3 -> "Logitech USB Receiver"
std::string sysfs_device_name(const std::string &event_path);

/**
 * @brief every device the input layer currently has open, keyed by descriptor
 *
 * handles still registered when the registry is destroyed are closed by their own destructors, so no exit path can
 * leak a device.
 */
class DeviceRegistry {
  public:
    // returns the descriptor or the negated errno, failures are logged and otherwise left to the caller. neither call
    // throws, both are reached from libinput's c callbacks
    int open(const std::string &path, int flags) noexcept;

    // closes the handle that owns fd, returns false if no such handle is registered
    bool close(int fd) noexcept;

    std::size_t open_count() const { return fd_to_handle.size(); }

  private:
    std::unordered_map<int, DeviceHandle> fd_to_handle;
};

#endif // DEVICE_ACCESS_HPP
