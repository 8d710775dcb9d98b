#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

class Settings;

struct CommandLineOptions {
    std::string folder;
    std::optional<bool> include_files;
    bool max_depth_given{false};
    std::optional<int> max_depth;
    std::optional<bool> show_size;
    std::optional<SizeUnit> size_unit;
    ExportFormat format{ExportFormat::Text};
    std::string output_path;
    bool save_settings{true};
    bool show_help{false};
    std::vector<std::string> warnings;
};

class CommandLine {
public:
    /**
     * @brief Parse arguments (program name excluded).
     * @throws ErrorCodes::AppException for unknown flags, missing values or a missing folder.
     */
    static CommandLineOptions parse(const std::vector<std::string>& args);

    /**
     * @brief Interpret a max depth string: empty means unlimited, values
     *        outside [0, 20] are clamped and unparseable input falls back to
     *        unlimited. Each adjustment adds a warning.
     */
    static std::optional<int> parse_max_depth(const std::string& value,
                                              std::vector<std::string>& warnings);

    // Explicit flags override the persisted defaults
    static void apply_to_settings(const CommandLineOptions& options, Settings& settings);

    static std::string usage(const std::string& program_name);
};

#endif
