#ifndef FOLDER_SCANNER_HPP
#define FOLDER_SCANNER_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "Types.hpp"

namespace fs = std::filesystem;

/**
 * @brief Walks a folder on a background thread and renders it as tree lines.
 *
 * At most one scan is active per instance. Starting a scan while another is
 * running cancels the previous one and waits for it to unwind first.
 * Callbacks are invoked on the worker thread and must not call scan() or wait().
 */
class FolderScanner {
public:
    using ResultCallback = std::function<void(const ScanResult& result)>;
    using StatusCallback = std::function<void(const std::string& message)>;

    explicit FolderScanner(ResultCallback on_result = {}, StatusCallback on_status = {});
    ~FolderScanner();

    FolderScanner(const FolderScanner&) = delete;
    FolderScanner& operator=(const FolderScanner&) = delete;

    /**
     * @brief Start scanning @p folder_path asynchronously.
     * @throws ErrorCodes::AppException when the folder is missing, not a
     *         directory or cannot be listed. Nothing is started in that case.
     */
    void scan(const std::string& folder_path, const ScanOptions& options);

    /**
     * @brief Run a scan and block until it finishes, was cancelled or failed.
     */
    ScanResult scan_and_wait(const std::string& folder_path, const ScanOptions& options);

    /**
     * @brief Request cooperative cancellation of the active scan.
     * @return true when a scan was in flight. That scan then reports
     *         ScanStatus::Cancelled (or Failed), never Completed.
     */
    bool cancel();

    void wait();

    ScanState state() const;
    std::optional<ScanResult> last_result() const;

    static void validate_folder(const std::string& folder_path);

private:
    struct ScanContext;

    void run(fs::path root, ScanOptions options);
    void finish(ScanResult result);
    void notify_status(const std::string& message) const;

    void scan_directory(const fs::path& path,
                        const std::string& prefix,
                        int depth,
                        const ScanContext& context,
                        std::vector<TreeLine>& lines);
    bool list_entries(const fs::path& path,
                      const ScanContext& context,
                      std::vector<std::string>& directories,
                      std::vector<std::string>& files,
                      std::error_code& error) const;
    TreeLine make_placeholder(const std::string& prefix,
                              const fs::path& path,
                              const std::error_code& error,
                              const ScanContext& context) const;
    std::string directory_size_label(const fs::path& path, const ScanContext& context) const;
    std::string file_size_label(const fs::path& path, const ScanContext& context) const;
    std::optional<std::uintmax_t> compute_directory_size(const fs::path& path) const;

    ResultCallback on_result_;
    StatusCallback on_status_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<ScanState> state_{ScanState::Idle};
    std::thread worker_;
    std::mutex control_mutex_; ///< Serializes scan() and wait(); held while joining.
    std::mutex state_mutex_;   ///< Guards stop/state transitions; never held while joining.

    mutable std::mutex result_mutex_;
    std::optional<ScanResult> last_result_;
};

#endif
