#include "Settings.hpp"
#include "ErrorCode.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <utility>


namespace {
constexpr const char* kSection = "Settings";
constexpr const char* kRecentSection = "RecentFolders";

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::optional<int> parse_depth(const std::string& value)
{
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const int depth = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return depth;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void log_save_failure(const std::string& context)
{
    const auto info = ErrorCodes::ErrorCatalog::get_error_info(ErrorCodes::Code::CONFIG_SAVE_FAILED, context);
    settings_log(spdlog::level::err, "[{}] {} {}", static_cast<int>(info.code), info.message, info.context);
}

std::string recent_key(std::size_t index)
{
    return "Folder" + std::to_string(index);
}
}


Settings::Settings()
    : Settings(Utils::get_config_dir())
{
}


Settings::Settings(std::string dir)
    : config_dir(std::move(dir)),
      default_export_location(Utils::get_home_dir())
{
    config_path = Utils::path_to_utf8(Utils::utf8_to_path(config_dir) / "config.ini");
}


std::string Settings::get_config_dir() const
{
    return config_dir;
}


std::string Settings::get_config_path() const
{
    return config_path;
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    include_files = config.getValue(kSection, "IncludeFiles", "true") == "true";
    show_size = config.getValue(kSection, "ShowSize", "false") == "true";

    const std::string depth_value = config.getValue(kSection, "MaxDepth", "");
    max_depth = parse_depth(depth_value);
    if (!depth_value.empty() && !max_depth) {
        settings_log(spdlog::level::warn, "Invalid MaxDepth '{}' in {}, using unlimited depth",
                     depth_value, config_path);
    }

    const std::string unit_value = config.getValue(kSection, "SizeFormat", "auto");
    if (auto unit = size_unit_from_string(unit_value)) {
        size_unit = *unit;
    } else {
        settings_log(spdlog::level::warn, "Invalid SizeFormat '{}' in {}, using auto",
                     unit_value, config_path);
        size_unit = SizeUnit::Auto;
    }

    default_export_location = config.getValue(kSection, "DefaultExportLocation", default_export_location);

    recent_folders.clear();
    for (std::size_t i = 0; i < kMaxRecentFolders; ++i) {
        const std::string folder = config.getValue(kRecentSection, recent_key(i), "");
        if (!folder.empty()) {
            recent_folders.push_back(folder);
        }
    }

    settings_log(spdlog::level::info,
                 "Loaded settings from '{}' (include files: {}, max depth: {}, show size: {}, size format: {}, recent folders: {})",
                 config_path,
                 include_files,
                 max_depth ? std::to_string(*max_depth) : "unlimited",
                 show_size,
                 to_string(size_unit),
                 recent_folders.size());
    return true;
}


bool Settings::save()
{
    std::error_code ec;
    std::filesystem::create_directories(Utils::utf8_to_path(config_dir), ec);
    if (ec) {
        log_save_failure("Creating '" + config_dir + "': " + ec.message());
        return false;
    }

    config.setValue(kSection, "IncludeFiles", include_files ? "true" : "false");
    config.setValue(kSection, "MaxDepth", max_depth ? std::to_string(*max_depth) : "");
    config.setValue(kSection, "ShowSize", show_size ? "true" : "false");
    config.setValue(kSection, "SizeFormat", to_string(size_unit));
    config.setValue(kSection, "DefaultExportLocation", default_export_location);

    for (std::size_t i = 0; i < kMaxRecentFolders; ++i) {
        if (i < recent_folders.size()) {
            config.setValue(kRecentSection, recent_key(i), recent_folders[i]);
        } else {
            config.removeValue(kRecentSection, recent_key(i));
        }
    }

    if (!config.save(config_path)) {
        log_save_failure("Writing '" + config_path + "'");
        return false;
    }
    return true;
}


bool Settings::get_include_files() const
{
    return include_files;
}


void Settings::set_include_files(bool value)
{
    include_files = value;
}


std::optional<int> Settings::get_max_depth() const
{
    return max_depth;
}


void Settings::set_max_depth(std::optional<int> value)
{
    max_depth = value;
}


bool Settings::get_show_size() const
{
    return show_size;
}


void Settings::set_show_size(bool value)
{
    show_size = value;
}


SizeUnit Settings::get_size_unit() const
{
    return size_unit;
}


void Settings::set_size_unit(SizeUnit value)
{
    size_unit = value;
}


std::string Settings::get_default_export_location() const
{
    return default_export_location;
}


void Settings::set_default_export_location(const std::string& path)
{
    default_export_location = path;
}


const std::vector<std::string>& Settings::get_recent_folders() const
{
    return recent_folders;
}


void Settings::add_recent_folder(const std::string& folder)
{
    if (folder.empty()) {
        return;
    }
    recent_folders.erase(std::remove(recent_folders.begin(), recent_folders.end(), folder),
                         recent_folders.end());
    recent_folders.insert(recent_folders.begin(), folder);
    if (recent_folders.size() > kMaxRecentFolders) {
        recent_folders.resize(kMaxRecentFolders);
    }
}


void Settings::clear_recent_folders()
{
    recent_folders.clear();
}


ScanOptions Settings::to_scan_options() const
{
    ScanOptions options;
    options.include_files = include_files;
    options.max_depth = clamp_max_depth(max_depth);
    options.show_size = show_size;
    options.size_unit = size_unit;
    return options;
}
