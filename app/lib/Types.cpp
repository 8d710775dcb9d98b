#include "Types.hpp"
#include "TreeGlyphs.hpp"

#include <algorithm>
#include <cctype>

std::string to_string(SizeUnit unit)
{
    switch (unit) {
        case SizeUnit::Auto: return "auto";
        case SizeUnit::Bytes: return "bytes";
        case SizeUnit::KB: return "KB";
        case SizeUnit::MB: return "MB";
        case SizeUnit::GB: return "GB";
        case SizeUnit::TB: return "TB";
        default: return "auto";
    }
}

std::optional<SizeUnit> size_unit_from_string(const std::string& value)
{
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lowered == "auto") return SizeUnit::Auto;
    if (lowered == "bytes" || lowered == "b") return SizeUnit::Bytes;
    if (lowered == "kb") return SizeUnit::KB;
    if (lowered == "mb") return SizeUnit::MB;
    if (lowered == "gb") return SizeUnit::GB;
    if (lowered == "tb") return SizeUnit::TB;
    return std::nullopt;
}

std::string to_string(ScanStatus status)
{
    switch (status) {
        case ScanStatus::Completed: return "completed";
        case ScanStatus::Cancelled: return "cancelled";
        case ScanStatus::Failed: return "failed";
        default: return "unknown";
    }
}

std::string TreeLine::render() const
{
    std::string out = prefix;
    out += (is_last && !is_placeholder) ? TreeGlyphs::kCorner : TreeGlyphs::kBranch;
    out += name;
    if (is_directory) {
        out += '/';
    }
    if (size_label) {
        out += " [" + *size_label + "]";
    }
    return out;
}

std::string join_lines(const std::vector<TreeLine>& lines)
{
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += lines[i].render();
    }
    return out;
}
