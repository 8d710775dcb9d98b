#ifndef TYPES_HPP
#define TYPES_HPP

#include <optional>
#include <string>
#include <vector>

enum class FileType {File, Directory};

inline std::string to_string(FileType type) {
    switch (type) {
        case FileType::File: return "File";
        case FileType::Directory: return "Directory";
        default: return "Unknown";
    }
}

enum class SizeUnit {
    Auto,
    Bytes,
    KB,
    MB,
    GB,
    TB
};

std::string to_string(SizeUnit unit);
std::optional<SizeUnit> size_unit_from_string(const std::string& value);

/// Upper bound the front end clamps a requested depth to.
constexpr int kMaxDepthLimit = 20;

inline std::optional<int> clamp_max_depth(std::optional<int> value) {
    if (!value) {
        return std::nullopt;
    }
    if (*value < 0) return 0;
    if (*value > kMaxDepthLimit) return kMaxDepthLimit;
    return value;
}

/**
 * @brief Per-invocation scanner parameters. Immutable for the duration of a scan.
 */
struct ScanOptions {
    bool include_files{true};
    std::optional<int> max_depth; ///< Unset means unlimited; 0 lists the root's children only.
    bool show_size{false};
    SizeUnit size_unit{SizeUnit::Auto};
};

/**
 * @brief One rendered row of the folder tree.
 *
 * Placeholder rows ("[Access Denied]", "[Error: ...]") describe a listing
 * failure rather than an entry and are skipped by the tree codec.
 */
struct TreeLine {
    std::string prefix;
    bool is_last{false};
    std::string name;
    bool is_directory{false};
    std::optional<std::string> size_label;
    bool is_placeholder{false};

    std::string render() const;
};

std::string join_lines(const std::vector<TreeLine>& lines);

struct TreeNode {
    std::string name;
    FileType type{FileType::File};
    std::vector<TreeNode> children; ///< Only meaningful for directories.
};

struct TableRow {
    FileType type{FileType::File};
    std::string name;
    std::string path;
    std::string size;
    std::string modified;
};

enum class ScanState {
    Idle,
    Running,
    Cancelling
};

enum class ScanStatus {
    Completed,
    Cancelled,
    Failed
};

std::string to_string(ScanStatus status);

struct ScanResult {
    ScanStatus status{ScanStatus::Completed};
    std::vector<TreeLine> lines;
    std::string message;
};

enum class ExportFormat {
    Text,
    Json,
    Csv
};

#endif
