#ifndef UTILS_HPP
#define UTILS_HPP

#include "Types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

class Utils {
public:
    static std::filesystem::path utf8_to_path(const std::string& value);
    static std::string path_to_utf8(const std::filesystem::path& path);

    static std::string get_home_dir();

    /**
     * @brief Directory holding config.ini and the logs folder.
     *
     * Honors FOLDER_TREE_CONFIG_DIR, otherwise $HOME/.config/FolderTreeViewer.
     */
    static std::string get_config_dir();

    /**
     * @brief Render a byte count the way the tree annotates sizes.
     *
     * Bytes mode prints the raw integer. Auto mode divides by 1024 until the
     * value drops below 1024 or TB is reached. An explicit unit divides by
     * 1024 once per step to that unit. Scaled values use two decimals.
     */
    static std::string format_size(std::uintmax_t size_bytes, SizeUnit unit);

    // "YYYY-MM-DD HH:MM:SS" in local time
    static std::string format_timestamp(std::filesystem::file_time_type time);
    static std::string current_timestamp();
};

#endif
