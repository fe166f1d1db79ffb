#include <gtest/gtest.h>

#include "input/device_access/device_access.hpp"
#include "utility/logger/logger.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

bool fd_is_open(int fd) { return fcntl(fd, F_GETFD) != -1; }

} // namespace

class DeviceAccessTest : public ::testing::Test {
  protected:
    void SetUp() override {
        fake_device_path = (std::filesystem::temp_directory_path() /
                            ("input_monitor_fake_device_" + std::to_string(::getpid())))
                               .string();
        std::ofstream(fake_device_path) << "not really a device";
    }

    void TearDown() override { std::filesystem::remove(fake_device_path); }

    std::string fake_device_path;
};

TEST_F(DeviceAccessTest, OpenReturnsDescriptorForEveryAccessMode) {
    for (int mode : {O_RDONLY, O_WRONLY, O_RDWR}) {
        int fd = open_device(fake_device_path, mode | O_CLOEXEC);
        ASSERT_GE(fd, 0) << "mode " << mode;
        EXPECT_EQ(fcntl(fd, F_GETFL) & O_ACCMODE, mode);
        ::close(fd);
    }
}

TEST_F(DeviceAccessTest, MissingDeviceReportsNegatedErrno) {
    EXPECT_EQ(open_device("/dev/input/this_device_does_not_exist", O_RDONLY), -ENOENT);
}

TEST_F(DeviceAccessTest, InvalidAccessModeIsRejected) {
    EXPECT_EQ(open_device(fake_device_path, O_ACCMODE), -EINVAL);
}

TEST_F(DeviceAccessTest, HandleClosesOnScopeExit) {
    int fd = open_device(fake_device_path, O_RDONLY);
    ASSERT_GE(fd, 0);
    {
        DeviceHandle handle(fd, fake_device_path);
        EXPECT_TRUE(handle.is_open());
        EXPECT_TRUE(fd_is_open(fd));
    }
    EXPECT_FALSE(fd_is_open(fd));
}

TEST_F(DeviceAccessTest, HandleClosesExactlyOnce) {
    int fd = open_device(fake_device_path, O_RDONLY);
    ASSERT_GE(fd, 0);

    DeviceHandle handle(fd, fake_device_path);
    handle.close();
    EXPECT_FALSE(handle.is_open());
    EXPECT_FALSE(fd_is_open(fd));

    // a second close must not touch whatever reuses the descriptor number
    int reused = open_device(fake_device_path, O_RDONLY);
    ASSERT_GE(reused, 0);
    handle.close();
    EXPECT_TRUE(fd_is_open(reused));
    ::close(reused);
}

TEST_F(DeviceAccessTest, MovedHandleTransfersOwnership) {
    int fd = open_device(fake_device_path, O_RDONLY);
    ASSERT_GE(fd, 0);

    DeviceHandle original(fd, fake_device_path);
    DeviceHandle moved(std::move(original));
    EXPECT_FALSE(original.is_open());
    EXPECT_EQ(moved.fd(), fd);
    EXPECT_EQ(moved.path(), fake_device_path);

    original.close();
    EXPECT_TRUE(fd_is_open(fd));
}

TEST_F(DeviceAccessTest, HandleIsReleasedDuringUnwinding) {
    int fd = open_device(fake_device_path, O_RDONLY);
    ASSERT_GE(fd, 0);

    try {
        DeviceHandle handle(fd, fake_device_path);
        throw std::runtime_error("abrupt exit");
    } catch (const std::runtime_error &) {
    }
    EXPECT_FALSE(fd_is_open(fd));
}

TEST_F(DeviceAccessTest, RegistryOpensAndClosesByDescriptor) {
    DeviceRegistry registry;
    int fd = registry.open(fake_device_path, O_RDONLY);
    ASSERT_GE(fd, 0);
    EXPECT_EQ(registry.open_count(), 1u);
    EXPECT_TRUE(fd_is_open(fd));

    EXPECT_TRUE(registry.close(fd));
    EXPECT_EQ(registry.open_count(), 0u);
    EXPECT_FALSE(fd_is_open(fd));

    EXPECT_FALSE(registry.close(fd));
}

TEST_F(DeviceAccessTest, RegistryFailureLeavesNothingRegistered) {
    DeviceRegistry registry;
    EXPECT_EQ(registry.open("/dev/input/this_device_does_not_exist", O_RDONLY), -ENOENT);
    EXPECT_EQ(registry.open_count(), 0u);

    // the next device still opens fine
    int fd = registry.open(fake_device_path, O_RDONLY);
    EXPECT_GE(fd, 0);
    EXPECT_EQ(registry.open_count(), 1u);
}

TEST_F(DeviceAccessTest, RegistryClosesLeftoversWhenDestroyed) {
    int first;
    int second;
    {
        DeviceRegistry registry;
        first = registry.open(fake_device_path, O_RDONLY);
        second = registry.open(fake_device_path, O_RDWR);
        ASSERT_GE(first, 0);
        ASSERT_GE(second, 0);
    }
    EXPECT_FALSE(fd_is_open(first));
    EXPECT_FALSE(fd_is_open(second));
}

TEST_F(DeviceAccessTest, RegistryCallsCannotThrow) {
    DeviceRegistry registry;
    // libinput calls these from c code, an exception must never escape them
    static_assert(noexcept(registry.open(std::string(), 0)));
    static_assert(noexcept(registry.close(0)));
    EXPECT_EQ(registry.open("", O_RDONLY), -ENOENT);
}

TEST_F(DeviceAccessTest, DeviceNameIsOnlyLookedUpWhenDebugLoggingIsOn) {
    std::string log_path = fake_device_path + ".log";
    spdlog::level::level_enum previous_level = global_logger->level();
    global_logger->remove_all_sinks();
    global_logger->add_file_sink(log_path);

    DeviceRegistry registry;
    global_logger->set_level(spdlog::level::warn);
    ASSERT_GE(registry.open(fake_device_path, O_RDONLY), 0);
    global_logger->set_level(spdlog::level::debug);
    ASSERT_GE(registry.open(fake_device_path, O_RDONLY), 0);
    global_logger->flush();

    global_logger->set_level(previous_level);
    global_logger->remove_all_sinks();
    global_logger->add_stderr_sink();

    std::ifstream in(log_path);
    std::stringstream contents;
    contents << in.rdbuf();
    std::string log = contents.str();

    std::string opened_line = "opened " + fake_device_path + " (Unknown Device) as fd";
    std::size_t first = log.find(opened_line);
    EXPECT_NE(first, std::string::npos);
    // only the open made at debug level wrote the line
    EXPECT_EQ(log.find(opened_line, first + 1), std::string::npos);

    std::filesystem::remove(log_path);
}

TEST(SysfsDeviceNameTest, UnknownNodeHasPlaceholderName) {
    EXPECT_EQ(sysfs_device_name("/dev/input/event_that_does_not_exist"), "Unknown Device");
}
