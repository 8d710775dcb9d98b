#include "TreeCodec.hpp"
#include "Logger.hpp"
#include "TreeGlyphs.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>
#include <sstream>
#include <string_view>

namespace {
bool starts_with_at(const std::string& text, std::size_t offset, std::string_view token)
{
    return text.compare(offset, token.size(), token) == 0;
}

bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

void log_skipped_line(const std::string& line)
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Skipping unparseable tree line '{}'", line);
    }
}

// Matches what the scanner appends: "123 B", "1.50 KB", "size error".
const std::regex& size_label_pattern()
{
    static const std::regex pattern(R"(^(\d+ B|\d+\.\d{2} (B|KB|MB|GB|TB)|size error)$)");
    return pattern;
}
}


std::vector<std::string> TreeCodec::split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}


std::size_t TreeCodec::find_body_start(const std::vector<std::string>& lines)
{
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].starts_with(TreeGlyphs::kHeaderSeparatorPrefix)) {
            std::size_t start = i + 1;
            if (start < lines.size() && is_blank(lines[start])) {
                ++start;
            }
            return start;
        }
    }
    return 0;
}


std::size_t TreeCodec::indentation_columns(const std::string& line, std::size_t& offset)
{
    std::size_t columns = 0;
    offset = 0;
    while (offset < line.size()) {
        if (line[offset] == ' ') {
            ++offset;
            ++columns;
        } else if (starts_with_at(line, offset, "│")) {
            offset += std::string_view("│").size();
            ++columns;
        } else {
            break;
        }
    }
    return columns;
}


bool TreeCodec::is_placeholder_label(const std::string& label)
{
    return label == TreeGlyphs::kAccessDenied ||
           (label.starts_with("[Error: ") && label.ends_with("]"));
}


bool TreeCodec::split_size_suffix(std::string& label, std::string& size)
{
    if (!label.ends_with("]")) {
        return false;
    }
    const auto open = label.rfind(" [");
    if (open == std::string::npos) {
        return false;
    }
    std::string candidate = label.substr(open + 2, label.size() - open - 3);
    if (!std::regex_match(candidate, size_label_pattern())) {
        return false;
    }
    size = std::move(candidate);
    label.erase(open);
    return true;
}


std::optional<TreeCodec::ParsedLine> TreeCodec::parse_line(const std::string& raw_line)
{
    // Trailing spaces belong to the entry name; only line endings are dropped
    std::string line = raw_line;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (line.empty()) {
        return std::nullopt;
    }

    std::size_t offset = 0;
    const std::size_t columns = indentation_columns(line, offset);

    // Bare continuation bars carry no entry
    if (offset == line.size()) {
        return std::nullopt;
    }

    std::string label;
    if (starts_with_at(line, offset, TreeGlyphs::kBranch)) {
        label = line.substr(offset + TreeGlyphs::kBranch.size());
    } else if (starts_with_at(line, offset, TreeGlyphs::kCorner)) {
        label = line.substr(offset + TreeGlyphs::kCorner.size());
    } else {
        log_skipped_line(raw_line);
        return std::nullopt;
    }

    if (label.empty() || is_placeholder_label(label)) {
        return std::nullopt;
    }

    ParsedLine parsed;
    parsed.depth = columns / TreeGlyphs::kIndentWidth;
    split_size_suffix(label, parsed.size);
    if (label.ends_with("/")) {
        parsed.is_directory = true;
        label.pop_back();
    }
    if (label.empty()) {
        log_skipped_line(raw_line);
        return std::nullopt;
    }
    parsed.name = std::move(label);
    return parsed;
}


std::vector<TreeNode> TreeCodec::parse_to_tree(const std::vector<std::string>& lines)
{
    struct Frame {
        std::vector<TreeNode>* container;
        long owner_depth;
    };

    std::vector<TreeNode> forest;
    std::vector<Frame> stack{{&forest, -1}};

    for (std::size_t i = find_body_start(lines); i < lines.size(); ++i) {
        const auto parsed = parse_line(lines[i]);
        if (!parsed) {
            continue;
        }

        const long depth = static_cast<long>(parsed->depth);
        while (stack.size() > 1 && depth <= stack.back().owner_depth) {
            stack.pop_back();
        }

        auto& container = *stack.back().container;
        container.push_back(TreeNode{parsed->name,
                                     parsed->is_directory ? FileType::Directory : FileType::File,
                                     {}});
        if (parsed->is_directory) {
            stack.push_back(Frame{&container.back().children, depth});
        }
    }
    return forest;
}


std::vector<TableRow> TreeCodec::parse_to_rows(const std::vector<std::string>& lines,
                                               const std::string& root_path)
{
    std::vector<TableRow> rows;
    std::vector<std::string> path_stack;
    const std::filesystem::path root = Utils::utf8_to_path(root_path);

    for (std::size_t i = find_body_start(lines); i < lines.size(); ++i) {
        auto parsed = parse_line(lines[i]);
        if (!parsed) {
            continue;
        }

        path_stack.resize(std::min(parsed->depth, path_stack.size()));
        path_stack.push_back(parsed->name);

        std::filesystem::path full_path = root;
        for (const auto& segment : path_stack) {
            full_path /= Utils::utf8_to_path(segment);
        }

        TableRow row;
        row.type = parsed->is_directory ? FileType::Directory : FileType::File;
        row.name = std::move(parsed->name);
        row.path = Utils::path_to_utf8(full_path);
        row.size = std::move(parsed->size);

        std::error_code ec;
        if (std::filesystem::exists(full_path, ec)) {
            const auto modified = std::filesystem::last_write_time(full_path, ec);
            if (!ec) {
                row.modified = Utils::format_timestamp(modified);
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}
