#ifndef MONITOR_CONFIG_HPP
#define MONITOR_CONFIG_HPP

#include <spdlog/common.h>

#include <chrono>
#include <string>

/**
 * @brief compiled-in settings, the monitor takes no flags and reads no environment or files
 */
struct MonitorConfig {
    std::string seat_name = "seat0";

    // sleep between polls, events that arrive meanwhile are picked up on the next poll
    std::chrono::milliseconds idle_interval{5};

    spdlog::level::level_enum log_level = spdlog::level::warn;
    // empty means no file sink
    std::string log_file_path;

    // brackets every poll cycle with a log section, very noisy at debug level
    bool logging_enabled = false;
};

#endif // MONITOR_CONFIG_HPP
