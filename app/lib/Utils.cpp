#include "Utils.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <array>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <system_error>

namespace {
constexpr const char* kAppDirName = "FolderTreeViewer";
constexpr const char* kConfigDirEnv = "FOLDER_TREE_CONFIG_DIR";
constexpr std::array<const char*, 5> kSizeUnits = {"B", "KB", "MB", "GB", "TB"};

std::size_t unit_index(SizeUnit unit)
{
    switch (unit) {
        case SizeUnit::KB: return 1;
        case SizeUnit::MB: return 2;
        case SizeUnit::GB: return 3;
        case SizeUnit::TB: return 4;
        default: return 0;
    }
}

std::string format_time_t(std::time_t value)
{
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(value));
}
}


std::filesystem::path Utils::utf8_to_path(const std::string& value)
{
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
}


std::string Utils::path_to_utf8(const std::filesystem::path& path)
{
    const std::u8string utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
}


std::string Utils::get_home_dir()
{
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    return ec ? std::string(".") : path_to_utf8(cwd);
}


std::string Utils::get_config_dir()
{
    if (const char* override_root = std::getenv(kConfigDirEnv)) {
        return path_to_utf8(utf8_to_path(override_root) / kAppDirName);
    }
    return path_to_utf8(utf8_to_path(get_home_dir()) / ".config" / kAppDirName);
}


std::string Utils::format_size(std::uintmax_t size_bytes, SizeUnit unit)
{
    if (unit == SizeUnit::Bytes) {
        return fmt::format("{} B", size_bytes);
    }

    if (size_bytes == 0) {
        return "0 B";
    }

    double value = static_cast<double>(size_bytes);
    if (unit == SizeUnit::Auto) {
        std::size_t index = 0;
        while (value >= 1024.0 && index < kSizeUnits.size() - 1) {
            value /= 1024.0;
            ++index;
        }
        return fmt::format("{:.2f} {}", value, kSizeUnits[index]);
    }

    const std::size_t target = unit_index(unit);
    for (std::size_t i = 0; i < target; ++i) {
        value /= 1024.0;
    }
    return fmt::format("{:.2f} {}", value, kSizeUnits[target]);
}


std::string Utils::format_timestamp(std::filesystem::file_time_type time)
{
    const auto system_time = std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::file_clock::to_sys(time));
    return format_time_t(std::chrono::system_clock::to_time_t(system_time));
}


std::string Utils::current_timestamp()
{
    return format_time_t(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

