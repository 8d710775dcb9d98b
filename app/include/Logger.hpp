#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

class Logger {
public:
    // Registers core_logger and cli_logger. Throws spdlog::spdlog_ex on sink failure.
    static void setup_loggers();
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);
    static std::string get_log_file_path();

private:
    static spdlog::level::level_enum resolve_level();
};

#endif
