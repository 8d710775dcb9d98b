#include "FolderScanner.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "TestHooks.hpp"
#include "TreeGlyphs.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace fs = std::filesystem;

struct FolderScanner::ScanContext {
    bool include_files{true};
    std::optional<int> max_depth;
    bool show_size{false};
    SizeUnit size_unit{SizeUnit::Auto};
    std::shared_ptr<spdlog::logger> logger;
};

namespace {
bool is_permission_error(const std::error_code& error)
{
    return error == std::errc::permission_denied ||
           error == std::errc::operation_not_permitted;
}
}


FolderScanner::FolderScanner(ResultCallback on_result, StatusCallback on_status)
    : on_result_(std::move(on_result)),
      on_status_(std::move(on_status))
{
}


FolderScanner::~FolderScanner()
{
    cancel();
    wait();
}


void FolderScanner::validate_folder(const std::string& folder_path)
{
    if (folder_path.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::PATH_INVALID, "Empty folder path");
    }

    const fs::path root = Utils::utf8_to_path(folder_path);
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_NOT_FOUND, "Folder: " + folder_path);
    }
    if (!fs::is_directory(root, ec)) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_INVALID, "Path: " + folder_path);
    }

    fs::directory_iterator probe(root, ec);
    if (ec) {
        if (is_permission_error(ec)) {
            THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_ACCESS_DENIED, "Folder: " + folder_path);
        }
        throw ErrorCodes::AppException(ErrorCodes::Code::SCAN_FAILED, ec, "Folder: " + folder_path);
    }
}


void FolderScanner::scan(const std::string& folder_path, const ScanOptions& options)
{
    validate_folder(folder_path);

    std::lock_guard<std::mutex> lock(control_mutex_);
    if (worker_.joinable()) {
        {
            std::lock_guard<std::mutex> state_lock(state_mutex_);
            if (state_ != ScanState::Idle) {
                stop_requested_ = true;
                state_ = ScanState::Cancelling;
            }
        }
        worker_.join();
    }

    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        stop_requested_ = false;
        state_ = ScanState::Running;
    }
    worker_ = std::thread(&FolderScanner::run, this, Utils::utf8_to_path(folder_path), options);
}


ScanResult FolderScanner::scan_and_wait(const std::string& folder_path, const ScanOptions& options)
{
    scan(folder_path, options);
    wait();
    if (auto result = last_result()) {
        return std::move(*result);
    }
    return ScanResult{ScanStatus::Failed, {}, "Error: scan produced no result"};
}


bool FolderScanner::cancel()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == ScanState::Idle) {
        return false;
    }
    stop_requested_ = true;
    state_ = ScanState::Cancelling;
    return true;
}


void FolderScanner::wait()
{
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}


ScanState FolderScanner::state() const
{
    return state_;
}


std::optional<ScanResult> FolderScanner::last_result() const
{
    std::lock_guard<std::mutex> lock(result_mutex_);
    return last_result_;
}


void FolderScanner::run(fs::path root, ScanOptions options)
{
    ScanContext context;
    context.include_files = options.include_files;
    context.max_depth = clamp_max_depth(options.max_depth);
    context.show_size = options.show_size;
    context.size_unit = options.size_unit;
    context.logger = Logger::get_logger("core_logger");

    if (context.logger) {
        if (context.max_depth != options.max_depth) {
            context.logger->warn("Max depth {} outside [0, {}], using {}",
                                 *options.max_depth, kMaxDepthLimit, *context.max_depth);
        }
        context.logger->debug("Scanning '{}' (files: {}, max depth: {}, sizes: {} [{}])",
                              Utils::path_to_utf8(root),
                              context.include_files,
                              context.max_depth ? std::to_string(*context.max_depth) : "unlimited",
                              context.show_size,
                              to_string(context.size_unit));
    }

    notify_status("Scanning folder structure...");

    ScanResult result;
    try {
        std::vector<TreeLine> lines;
        scan_directory(root, "", 0, context, lines);

        if (stop_requested_) {
            result.status = ScanStatus::Cancelled;
            result.message = "Scan cancelled";
            if (context.logger) {
                context.logger->info("Scan of '{}' cancelled", Utils::path_to_utf8(root));
            }
        } else {
            result.status = ScanStatus::Completed;
            result.message = fmt::format("Scan complete. Found {} items.", lines.size());
            result.lines = std::move(lines);
            if (context.logger) {
                context.logger->info("Scan of '{}' complete: {} line(s)",
                                     Utils::path_to_utf8(root), result.lines.size());
            }
        }
    } catch (const std::exception& ex) {
        result.status = ScanStatus::Failed;
        result.lines.clear();
        result.message = std::string("Error: ") + ex.what();
        if (context.logger) {
            context.logger->error("Scan of '{}' failed: {}", Utils::path_to_utf8(root), ex.what());
        }
    }

    finish(std::move(result));
}


void FolderScanner::finish(ScanResult result)
{
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        // A cancel that arrived after the walk still wins over completion
        if (stop_requested_ && result.status == ScanStatus::Completed) {
            result.status = ScanStatus::Cancelled;
            result.lines.clear();
            result.message = "Scan cancelled";
        }
        {
            std::lock_guard<std::mutex> lock(result_mutex_);
            last_result_ = result;
        }
        state_ = ScanState::Idle;
    }

    notify_status(result.message);
    if (on_result_) {
        on_result_(result);
    }
}


void FolderScanner::notify_status(const std::string& message) const
{
    if (on_status_) {
        on_status_(message);
    }
}


void FolderScanner::scan_directory(const fs::path& path,
                                   const std::string& prefix,
                                   int depth,
                                   const ScanContext& context,
                                   std::vector<TreeLine>& lines)
{
    if (stop_requested_) {
        return;
    }
    if (context.max_depth && depth > *context.max_depth) {
        return;
    }

    std::vector<std::string> directories;
    std::vector<std::string> files;
    std::error_code listing_error;
    if (!list_entries(path, context, directories, files, listing_error)) {
        lines.push_back(make_placeholder(prefix, path, listing_error, context));
        return;
    }

    std::sort(directories.begin(), directories.end());
    std::sort(files.begin(), files.end());

    for (std::size_t i = 0; i < directories.size(); ++i) {
        const fs::path dir_path = path / Utils::utf8_to_path(directories[i]);
        TestHooks::run_scan_entry_probe(dir_path);
        if (stop_requested_) {
            return;
        }

        TreeLine line;
        line.prefix = prefix;
        line.is_last = (i == directories.size() - 1) && files.empty();
        line.name = directories[i];
        line.is_directory = true;
        if (context.show_size) {
            line.size_label = directory_size_label(dir_path, context);
        }
        lines.push_back(line);

        const std::string child_prefix =
            prefix + std::string(line.is_last ? TreeGlyphs::kBlank : TreeGlyphs::kVertical);
        scan_directory(dir_path, child_prefix, depth + 1, context, lines);
        if (stop_requested_) {
            return;
        }
    }

    for (std::size_t i = 0; i < files.size(); ++i) {
        const fs::path file_path = path / Utils::utf8_to_path(files[i]);
        TestHooks::run_scan_entry_probe(file_path);
        if (stop_requested_) {
            return;
        }

        TreeLine line;
        line.prefix = prefix;
        line.is_last = (i == files.size() - 1);
        line.name = files[i];
        if (context.show_size) {
            line.size_label = file_size_label(file_path, context);
        }
        lines.push_back(std::move(line));
    }
}


bool FolderScanner::list_entries(const fs::path& path,
                                 const ScanContext& context,
                                 std::vector<std::string>& directories,
                                 std::vector<std::string>& files,
                                 std::error_code& error) const
{
    if (auto injected = TestHooks::run_directory_listing_probe(path)) {
        error = *injected;
        return false;
    }

    fs::directory_iterator it(path, error);
    if (error) {
        return false;
    }

    for (; it != fs::directory_iterator(); it.increment(error)) {
        if (error) {
            return false;
        }
        std::error_code type_error;
        const bool is_directory = it->is_directory(type_error);
        std::string name = Utils::path_to_utf8(it->path().filename());
        if (is_directory) {
            directories.push_back(std::move(name));
        } else if (context.include_files) {
            files.push_back(std::move(name));
        }
    }
    return !error;
}


TreeLine FolderScanner::make_placeholder(const std::string& prefix,
                                         const fs::path& path,
                                         const std::error_code& error,
                                         const ScanContext& context) const
{
    TreeLine line;
    line.prefix = prefix;
    line.is_placeholder = true;
    if (is_permission_error(error)) {
        line.name = std::string(TreeGlyphs::kAccessDenied);
        if (context.logger) {
            context.logger->warn("Access denied while listing '{}'", Utils::path_to_utf8(path));
        }
    } else {
        line.name = "[Error: " + error.message() + "]";
        if (context.logger) {
            context.logger->warn("Failed to list '{}': {}", Utils::path_to_utf8(path), error.message());
        }
    }
    return line;
}


std::string FolderScanner::directory_size_label(const fs::path& path, const ScanContext& context) const
{
    if (auto size = compute_directory_size(path)) {
        return Utils::format_size(*size, context.size_unit);
    }
    if (context.logger) {
        context.logger->warn("Failed to compute size of '{}'", Utils::path_to_utf8(path));
    }
    return std::string(TreeGlyphs::kSizeError);
}


std::string FolderScanner::file_size_label(const fs::path& path, const ScanContext& context) const
{
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        if (context.logger) {
            context.logger->warn("Failed to read size of '{}': {}", Utils::path_to_utf8(path), ec.message());
        }
        return std::string(TreeGlyphs::kSizeError);
    }
    return Utils::format_size(size, context.size_unit);
}


std::optional<std::uintmax_t> FolderScanner::compute_directory_size(const fs::path& path) const
{
    std::error_code ec;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::nullopt;
    }

    std::uintmax_t total = 0;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return std::nullopt;
        }
        if (stop_requested_) {
            break;
        }
        std::error_code entry_error;
        if (!it->is_regular_file(entry_error)) {
            continue;
        }
        const auto size = it->file_size(entry_error);
        if (!entry_error) {
            total += size;
        }
    }
    if (ec) {
        return std::nullopt;
    }
    return total;
}
