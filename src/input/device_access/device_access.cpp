#include "device_access.hpp"

#include "utility/logger/logger.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <unistd.h>

#include <utility>

DeviceHandle::DeviceHandle(int fd, std::string path) : file_descriptor(fd), device_path(std::move(path)) {}

DeviceHandle::~DeviceHandle() { close(); }

DeviceHandle::DeviceHandle(DeviceHandle &&other) noexcept
    : file_descriptor(std::exchange(other.file_descriptor, -1)), device_path(std::move(other.device_path)) {}

DeviceHandle &DeviceHandle::operator=(DeviceHandle &&other) noexcept {
    if (this != &other) {
        close();
        file_descriptor = std::exchange(other.file_descriptor, -1);
        device_path = std::move(other.device_path);
    }
    return *this;
}

void DeviceHandle::close() {
    if (file_descriptor < 0)
        return;

    if (::close(file_descriptor) < 0)
        global_logger->warn("closing {} (fd {}) failed: {}", device_path, file_descriptor, std::strerror(errno));
    else
        global_logger->debug("closed {} (fd {})", device_path, file_descriptor);

    file_descriptor = -1;
}

int open_device(const std::string &path, int flags) {
    int access_mode = flags & O_ACCMODE;
    if (access_mode != O_RDONLY && access_mode != O_WRONLY && access_mode != O_RDWR) {
        global_logger->warn("refusing to open {}: invalid access mode {}", path, access_mode);
        return -EINVAL;
    }

    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        int open_errno = errno;
        global_logger->warn("failed to open input device {}: {}", path, std::strerror(open_errno));
        return -open_errno;
    }

    return fd;
}

std::string sysfs_device_name(const std::string &event_path) {
    std::string filename = event_path.substr(event_path.find_last_of('/') + 1); // event3
    std::string sys_path = "/sys/class/input/" + filename + "/device/name";

    DeviceHandle name_file(::open(sys_path.c_str(), O_RDONLY | O_CLOEXEC), sys_path);
    if (!name_file.is_open())
        return "Unknown Device";

    char buf[256] = {};
    ssize_t n = ::read(name_file.fd(), buf, sizeof(buf) - 1);
    if (n <= 0)
        return "Unknown Device";

    std::string name(buf, static_cast<std::size_t>(n));
    while (!name.empty() && (name.back() == '\n' || name.back() == '\r'))
        name.pop_back();

    return name;
}

int DeviceRegistry::open(const std::string &path, int flags) noexcept {
    try {
        int fd = open_device(path, flags);
        if (fd < 0)
            return fd;

        // the sysfs lookup costs an extra open and read, only pay for it when the line is going to be written
        if (global_logger->level() <= spdlog::level::debug)
            global_logger->debug("opened {} ({}) as fd {}", path, sysfs_device_name(path), fd);

        // if registering throws, the temporary handle closes the descriptor again
        fd_to_handle.insert_or_assign(fd, DeviceHandle(fd, path));
        return fd;
    } catch (const std::exception &e) {
        global_logger->error("opening {} failed: {}", path, e.what());
        return -ENOMEM;
    }
}

bool DeviceRegistry::close(int fd) noexcept {
    try {
        auto it = fd_to_handle.find(fd);
        if (it == fd_to_handle.end()) {
            global_logger->warn("asked to close fd {} which was never opened through the registry", fd);
            return false;
        }

        // erasing destroys the handle, which closes the descriptor
        fd_to_handle.erase(it);
        return true;
    } catch (const std::exception &e) {
        global_logger->error("closing fd {} failed: {}", fd, e.what());
        return false;
    }
}
