#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief thin wrapper around a spdlog logger whose sinks can be swapped at runtime, the event stream owns stdout so
 * every sink here points somewhere else (stderr or a file)
 */
class Logger {
  public:
    explicit Logger(const std::string &name);

    void add_stderr_sink();
    void add_file_sink(const std::string &file_path);
    void remove_all_sinks();
    void flush();

    void set_level(spdlog::level::level_enum level);
    spdlog::level::level_enum level() const;

    // nested sections indent their messages so a poll cycle reads as a block
    void push_section(const std::string &section_name);
    void pop_section();

    template <typename... Args> void trace(spdlog::format_string_t<Args...> format_string, Args &&...args) {
        log(spdlog::level::trace, format_string, std::forward<Args>(args)...);
    }
    template <typename... Args> void debug(spdlog::format_string_t<Args...> format_string, Args &&...args) {
        log(spdlog::level::debug, format_string, std::forward<Args>(args)...);
    }
    template <typename... Args> void info(spdlog::format_string_t<Args...> format_string, Args &&...args) {
        log(spdlog::level::info, format_string, std::forward<Args>(args)...);
    }
    template <typename... Args> void warn(spdlog::format_string_t<Args...> format_string, Args &&...args) {
        log(spdlog::level::warn, format_string, std::forward<Args>(args)...);
    }
    template <typename... Args> void error(spdlog::format_string_t<Args...> format_string, Args &&...args) {
        log(spdlog::level::err, format_string, std::forward<Args>(args)...);
    }
    template <typename... Args> void critical(spdlog::format_string_t<Args...> format_string, Args &&...args) {
        log(spdlog::level::critical, format_string, std::forward<Args>(args)...);
    }

  private:
    template <typename... Args>
    void log(spdlog::level::level_enum level, spdlog::format_string_t<Args...> format_string, Args &&...args) {
        if (!spd_logger->should_log(level))
            return;
        spd_logger->log(level, "{}{}", indentation, fmt::format(format_string, std::forward<Args>(args)...));
    }

    std::shared_ptr<spdlog::logger> spd_logger;
    std::vector<std::string> section_stack;
    std::string indentation;
};

extern std::shared_ptr<Logger> global_logger;

/**
 * @brief RAII scope that brackets everything logged inside it with start/end markers on the global logger
 */
class GlobalLogSection {
  public:
    explicit GlobalLogSection(const std::string &section_name, bool enabled = true);
    ~GlobalLogSection();

    GlobalLogSection(const GlobalLogSection &) = delete;
    GlobalLogSection &operator=(const GlobalLogSection &) = delete;

  private:
    bool enabled;
};

#endif // LOGGER_HPP
