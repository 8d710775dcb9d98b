#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

enum class Code {
    SUCCESS = 0,
    UNKNOWN_ERROR = 1,

    // File System (1200-1299)
    FILE_PERMISSION_DENIED = 1201,
    FILE_WRITE_FAILED = 1202,
    DIRECTORY_NOT_FOUND = 1210,
    DIRECTORY_INVALID = 1211,
    DIRECTORY_ACCESS_DENIED = 1212,
    DIRECTORY_CREATE_FAILED = 1213,
    PATH_INVALID = 1220,

    // Configuration (1500-1599)
    CONFIG_SAVE_FAILED = 1501,

    // Validation (1600-1699)
    VALIDATION_INVALID_INPUT = 1600,

    // Scan (1800-1899)
    SCAN_FAILED = 1800,
    SCAN_CANCELLED = 1801,

    // Export (1900-1999)
    EXPORT_UNSUPPORTED_FORMAT = 1901,
    EXPORT_NOTHING_TO_EXPORT = 1902
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message followed by the resolution hint
    std::string get_user_message() const;

    // Code, message, resolution and technical context
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
