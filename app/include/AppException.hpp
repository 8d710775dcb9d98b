#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <stdexcept>
#include <string>
#include <system_error>

namespace ErrorCodes {

// Exception carrying a catalog error code
class AppException : public std::runtime_error {
public:
    // Catalog message, optional technical context
    explicit AppException(Code code, const std::string& context = "")
        : std::runtime_error(ErrorCatalog::get_error_info(code, context).message),
          error_code_(code),
          error_info_(ErrorCatalog::get_error_info(code, context)) {}

    // Custom message, catalog resolution
    AppException(Code code, const std::string& custom_message, const std::string& context)
        : std::runtime_error(custom_message),
          error_code_(code),
          error_info_(code, custom_message, ErrorCatalog::get_error_info(code).resolution, context) {}

    // Filesystem failure: catalog message plus the OS error text
    AppException(Code code, const std::error_code& system_error, const std::string& context)
        : AppException(code,
                       ErrorCatalog::get_error_info(code).message + " (" + system_error.message() + ")",
                       context) {
        system_error_ = system_error;
    }

    Code get_error_code() const noexcept { return error_code_; }

    const ErrorInfo& get_error_info() const noexcept { return error_info_; }

    std::string get_user_message() const { return error_info_.get_user_message(); }

    std::string get_full_details() const { return error_info_.get_full_details(); }

    int get_error_code_int() const noexcept { return static_cast<int>(error_code_); }

    // Empty unless constructed from a filesystem error
    const std::error_code& get_system_error() const noexcept { return system_error_; }

private:
    Code error_code_;
    ErrorInfo error_info_;
    std::error_code system_error_;
};

} // namespace ErrorCodes

#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

#define THROW_APP_ERROR_MSG(code, message, context) \
    throw ErrorCodes::AppException(code, message, context)

#endif // APPEXCEPTION_HPP
