#include "CommandLine.hpp"
#include "AppException.hpp"
#include "Settings.hpp"
#include "TreeExporter.hpp"

#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace {
const std::string& require_value(const std::vector<std::string>& args, std::size_t& index)
{
    if (index + 1 >= args.size()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                            "Missing value for " + args[index],
                            "Argument: " + args[index]);
    }
    ++index;
    return args[index];
}
}


std::optional<int> CommandLine::parse_max_depth(const std::string& value,
                                                std::vector<std::string>& warnings)
{
    if (value.empty()) {
        return std::nullopt;
    }

    int depth = 0;
    try {
        std::size_t consumed = 0;
        depth = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        warnings.emplace_back("Invalid max depth value. Using unlimited depth.");
        return std::nullopt;
    }

    if (depth < 0) {
        warnings.emplace_back("Max depth cannot be negative. Set to 0.");
    } else if (depth > kMaxDepthLimit) {
        warnings.emplace_back(fmt::format("Max depth cannot exceed {}. Set to {}.",
                                          kMaxDepthLimit, kMaxDepthLimit));
    }
    return clamp_max_depth(depth);
}


CommandLineOptions CommandLine::parse(const std::vector<std::string>& args)
{
    CommandLineOptions options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "--files") {
            options.include_files = true;
        } else if (arg == "--no-files") {
            options.include_files = false;
        } else if (arg == "--size") {
            options.show_size = true;
        } else if (arg == "--no-size") {
            options.show_size = false;
        } else if (arg == "--unlimited") {
            options.max_depth_given = true;
            options.max_depth.reset();
        } else if (arg == "--max-depth") {
            options.max_depth_given = true;
            options.max_depth = parse_max_depth(require_value(args, i), options.warnings);
        } else if (arg == "--unit") {
            const std::string& value = require_value(args, i);
            options.size_unit = size_unit_from_string(value);
            if (!options.size_unit) {
                THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                    "Unknown size unit: " + value,
                                    "Expected one of: auto, bytes, KB, MB, GB, TB");
            }
        } else if (arg == "--format") {
            options.format = TreeExporter::parse_format(require_value(args, i));
        } else if (arg == "-o" || arg == "--output") {
            options.output_path = require_value(args, i);
        } else if (arg == "--no-save") {
            options.save_settings = false;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                "Unknown option: " + arg, "Argument: " + arg);
        } else if (options.folder.empty()) {
            options.folder = arg;
        } else {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                "Unexpected argument: " + arg, "Folder already set to " + options.folder);
        }
    }

    if (options.folder.empty() && !options.show_help) {
        THROW_APP_ERROR(ErrorCodes::Code::PATH_INVALID, "Please select a folder first.");
    }
    return options;
}


void CommandLine::apply_to_settings(const CommandLineOptions& options, Settings& settings)
{
    if (options.include_files) {
        settings.set_include_files(*options.include_files);
    }
    if (options.max_depth_given) {
        settings.set_max_depth(options.max_depth);
    }
    if (options.show_size) {
        settings.set_show_size(*options.show_size);
    }
    if (options.size_unit) {
        settings.set_size_unit(*options.size_unit);
    }
}


std::string CommandLine::usage(const std::string& program_name)
{
    return fmt::format(
        "Usage: {} <folder> [options]\n"
        "\n"
        "Options:\n"
        "  --files / --no-files     Include or omit files (directories are always listed)\n"
        "  --max-depth N            Limit recursion; 0 lists the folder's direct children only (0-{})\n"
        "  --unlimited              Scan all subfolders\n"
        "  --size / --no-size       Annotate entries with their size\n"
        "  --unit UNIT              Size unit: auto, bytes, KB, MB, GB, TB\n"
        "  --format FORMAT          Output format: txt, json, csv (default txt)\n"
        "  -o, --output FILE        Write the export to FILE instead of stdout\n"
        "  --no-save                Do not persist options and recent folders\n"
        "  -h, --help               Show this help\n"
        "\n"
        "Omitted options default to the values saved in config.ini.\n",
        program_name, kMaxDepthLimit);
}
