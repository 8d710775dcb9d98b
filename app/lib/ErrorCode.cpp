#include "ErrorCode.hpp"

#include <fmt/format.h>
#include <unordered_map>

namespace ErrorCodes {

namespace {

struct CatalogEntry {
    const char* message;
    const char* resolution;
};

const std::unordered_map<Code, CatalogEntry>& catalog()
{
    static const std::unordered_map<Code, CatalogEntry> entries = {
        {Code::UNKNOWN_ERROR,
         {"An unexpected error occurred.",
          "Retry the operation. If the problem persists, check the log file."}},
        {Code::FILE_PERMISSION_DENIED,
         {"Permission denied. Cannot write to the selected location.",
          "Choose a different location or adjust the permissions of the target folder."}},
        {Code::FILE_WRITE_FAILED,
         {"Failed to write the file.",
          "Check free disk space and that the target location is writable."}},
        {Code::DIRECTORY_NOT_FOUND,
         {"The selected folder does not exist.",
          "Select an existing folder and try again."}},
        {Code::DIRECTORY_INVALID,
         {"The selected path is not a folder.",
          "Select a folder rather than a file."}},
        {Code::DIRECTORY_ACCESS_DENIED,
         {"You don't have permission to access this folder.",
          "Run with an account that can read the folder or pick another folder."}},
        {Code::DIRECTORY_CREATE_FAILED,
         {"Failed to create the folder.",
          "Check that the parent folder exists and is writable."}},
        {Code::PATH_INVALID,
         {"Invalid folder path.",
          "Provide a non-empty folder path."}},
        {Code::CONFIG_SAVE_FAILED,
         {"Failed to save configuration.",
          "Check that the configuration folder is writable."}},
        {Code::VALIDATION_INVALID_INPUT,
         {"Invalid input.",
          "Check the command line arguments and try again."}},
        {Code::SCAN_FAILED,
         {"Error during folder scan.",
          "Check that the folder is still accessible and try again."}},
        {Code::SCAN_CANCELLED,
         {"Scan cancelled.",
          "Start the scan again to produce a complete tree."}},
        {Code::EXPORT_UNSUPPORTED_FORMAT,
         {"Unsupported export format.",
          "Use one of: txt, json, csv."}},
        {Code::EXPORT_NOTHING_TO_EXPORT,
         {"No folder tree data to export.",
          "Scan a folder before exporting."}},
    };
    return entries;
}

} // namespace

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + "\n\n" + resolution;
}

std::string ErrorInfo::get_full_details() const
{
    std::string details = fmt::format("Error Code: {}\n{}", static_cast<int>(code), message);
    if (!resolution.empty()) {
        details += "\n\nResolution:\n" + resolution;
    }
    if (!context.empty()) {
        details += "\n\nTechnical details:\n" + context;
    }
    return details;
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const auto& entries = catalog();
    const auto it = entries.find(code);
    if (it == entries.end()) {
        const auto& fallback = entries.at(Code::UNKNOWN_ERROR);
        return ErrorInfo(code, fallback.message, fallback.resolution, context);
    }
    return ErrorInfo(code, it->second.message, it->second.resolution, context);
}

} // namespace ErrorCodes
