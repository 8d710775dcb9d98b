#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr const char* kLogLevelEnv = "FOLDER_TREE_LOG_LEVEL";
constexpr const char* kLoggerNames[] = {"core_logger", "cli_logger"};
}


std::string Logger::get_log_file_path()
{
    const std::filesystem::path log_dir =
        Utils::utf8_to_path(Utils::get_config_dir()) / "logs";
    return Utils::path_to_utf8(log_dir / "folder-tree.log");
}


spdlog::level::level_enum Logger::resolve_level()
{
    if (const char* value = std::getenv(kLogLevelEnv)) {
        const auto level = spdlog::level::from_str(value);
        // from_str maps unknown names to "off"
        if (level != spdlog::level::off || std::string(value) == "off") {
            return level;
        }
    }
    return spdlog::level::info;
}


void Logger::setup_loggers()
{
    const std::filesystem::path log_path = Utils::utf8_to_path(get_log_file_path());
    std::filesystem::create_directories(log_path.parent_path());

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        Utils::path_to_utf8(log_path), kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    console_sink->set_pattern("[%^%l%$] %v");

    const auto level = resolve_level();
    for (const char* name : kLoggerNames) {
        if (spdlog::get(name)) {
            continue;
        }
        std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
