#include "logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<Logger> global_logger = std::make_shared<Logger>("input_monitor");

Logger::Logger(const std::string &name) : spd_logger(std::make_shared<spdlog::logger>(name)) {
    spd_logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spd_logger->set_level(spdlog::level::warn);
    add_stderr_sink();
}

void Logger::add_stderr_sink() {
    spd_logger->sinks().push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    // set_pattern only reaches the sinks present at the time of the call
    spd_logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
}

void Logger::add_file_sink(const std::string &file_path) {
    // truncate so that each run starts with a fresh log
    spd_logger->sinks().push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, true));
    spd_logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
}

void Logger::remove_all_sinks() { spd_logger->sinks().clear(); }

void Logger::flush() { spd_logger->flush(); }

void Logger::set_level(spdlog::level::level_enum level) { spd_logger->set_level(level); }

spdlog::level::level_enum Logger::level() const { return spd_logger->level(); }

void Logger::push_section(const std::string &section_name) {
    debug("=== start {} ===", section_name);
    section_stack.push_back(section_name);
    indentation.append("|   ");
}

void Logger::pop_section() {
    if (section_stack.empty())
        return;
    std::string section_name = section_stack.back();
    section_stack.pop_back();
    indentation.resize(indentation.size() - 4);
    debug("=== end {} ===", section_name);
}

GlobalLogSection::GlobalLogSection(const std::string &section_name, bool enabled) : enabled(enabled) {
    if (enabled)
        global_logger->push_section(section_name);
}

GlobalLogSection::~GlobalLogSection() {
    if (enabled)
        global_logger->pop_section();
}
