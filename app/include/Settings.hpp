#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Persisted scanner defaults and recent folders (config.ini).
 */
class Settings
{
public:
    Settings();
    explicit Settings(std::string config_dir);

    bool load();
    bool save();

    std::string get_config_dir() const;
    std::string get_config_path() const;

    bool get_include_files() const;
    void set_include_files(bool value);

    std::optional<int> get_max_depth() const;
    void set_max_depth(std::optional<int> value);

    bool get_show_size() const;
    void set_show_size(bool value);

    SizeUnit get_size_unit() const;
    void set_size_unit(SizeUnit value);

    std::string get_default_export_location() const;
    void set_default_export_location(const std::string& path);

    const std::vector<std::string>& get_recent_folders() const;
    void add_recent_folder(const std::string& folder);
    void clear_recent_folders();

    // Per-call options with the max depth clamped to [0, kMaxDepthLimit]
    ScanOptions to_scan_options() const;

    static constexpr std::size_t kMaxRecentFolders = 10;

private:
    std::string config_dir;
    std::string config_path;
    IniConfig config;

    bool include_files{true};
    std::optional<int> max_depth;
    bool show_size{false};
    SizeUnit size_unit{SizeUnit::Auto};
    std::string default_export_location;
    std::vector<std::string> recent_folders;
};

#endif
