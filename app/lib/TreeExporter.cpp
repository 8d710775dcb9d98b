#include "TreeExporter.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "TreeCodec.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace {
constexpr std::size_t kSeparatorWidth = 80;
constexpr const char* kCsvLineEnd = "\r\n";

std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

bool has_content(const std::string& text)
{
    return text.find_first_not_of(" \t\r\n") != std::string::npos;
}

Json::Value node_to_json(const TreeNode& node)
{
    Json::Value item(Json::objectValue);
    item["name"] = node.name;
    item["type"] = node.type == FileType::Directory ? "directory" : "file";
    if (node.type == FileType::Directory) {
        Json::Value children(Json::arrayValue);
        for (const auto& child : node.children) {
            children.append(node_to_json(child));
        }
        item["children"] = std::move(children);
    }
    return item;
}
}


std::string TreeExporter::build_report(const std::string& folder_path,
                                       const std::string& tree_text,
                                       const std::string& generated)
{
    std::string report = "Folder Tree: " + folder_path + "\n";
    report += "Generated: " + generated + "\n";
    report += std::string(kSeparatorWidth, '-') + "\n\n";
    report += tree_text;
    return report;
}


ExportFormat TreeExporter::parse_format(const std::string& value)
{
    const std::string lowered = to_lower_copy(value);
    if (lowered == "txt" || lowered == "text") {
        return ExportFormat::Text;
    }
    if (lowered == "json") {
        return ExportFormat::Json;
    }
    if (lowered == "csv") {
        return ExportFormat::Csv;
    }
    THROW_APP_ERROR(ErrorCodes::Code::EXPORT_UNSUPPORTED_FORMAT, "Format: " + value);
}


std::string TreeExporter::default_extension(ExportFormat format)
{
    switch (format) {
        case ExportFormat::Json: return ".json";
        case ExportFormat::Csv: return ".csv";
        case ExportFormat::Text:
        default: return ".txt";
    }
}


std::string TreeExporter::resolve_output_path(const std::string& output_path, ExportFormat format)
{
    if (output_path.empty() || Utils::utf8_to_path(output_path).has_extension()) {
        return output_path;
    }
    return output_path + default_extension(format);
}


std::string TreeExporter::export_report(ExportFormat format,
                                        const std::string& report_text,
                                        const std::string& folder_path,
                                        const std::string& generated)
{
    if (!has_content(report_text)) {
        THROW_APP_ERROR(ErrorCodes::Code::EXPORT_NOTHING_TO_EXPORT, "Folder: " + folder_path);
    }

    switch (format) {
        case ExportFormat::Text:
            return report_text;
        case ExportFormat::Json:
            return to_json(folder_path, TreeCodec::split_lines(report_text), generated);
        case ExportFormat::Csv:
            return to_csv(TreeCodec::split_lines(report_text), folder_path);
    }
    THROW_APP_ERROR(ErrorCodes::Code::EXPORT_UNSUPPORTED_FORMAT,
                    "Format id: " + std::to_string(static_cast<int>(format)));
}


Json::Value TreeExporter::to_json_value(const std::vector<TreeNode>& forest)
{
    Json::Value structure(Json::arrayValue);
    for (const auto& node : forest) {
        structure.append(node_to_json(node));
    }
    return structure;
}


std::string TreeExporter::to_json(const std::string& folder_path,
                                  const std::vector<std::string>& lines,
                                  const std::string& generated)
{
    Json::Value root(Json::objectValue);
    root["folder"] = folder_path;
    root["generated"] = generated;
    root["structure"] = to_json_value(TreeCodec::parse_to_tree(lines));

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, root);
}


std::string TreeExporter::escape_csv_field(const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char ch : field) {
        if (ch == '"') {
            escaped += '"';
        }
        escaped += ch;
    }
    escaped += '"';
    return escaped;
}


std::string TreeExporter::to_csv(const std::vector<std::string>& lines,
                                 const std::string& folder_path)
{
    std::ostringstream out;
    out << "Type,Name,Path,Size,Modified" << kCsvLineEnd;
    for (const auto& row : TreeCodec::parse_to_rows(lines, folder_path)) {
        out << escape_csv_field(to_string(row.type)) << ','
            << escape_csv_field(row.name) << ','
            << escape_csv_field(row.path) << ','
            << escape_csv_field(row.size) << ','
            << escape_csv_field(row.modified) << kCsvLineEnd;
    }
    return out.str();
}


void TreeExporter::write_export(const std::string& file_path, const std::string& content)
{
    if (file_path.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::PATH_INVALID, "Empty export path");
    }

    const std::filesystem::path target = Utils::utf8_to_path(file_path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw ErrorCodes::AppException(ErrorCodes::Code::DIRECTORY_CREATE_FAILED, ec,
                                           "Path: " + Utils::path_to_utf8(target.parent_path()));
        }
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        const int error = errno;
        if (error == EACCES || error == EPERM) {
            THROW_APP_ERROR(ErrorCodes::Code::FILE_PERMISSION_DENIED, "Path: " + file_path);
        }
        THROW_APP_ERROR_MSG(ErrorCodes::Code::FILE_WRITE_FAILED,
                            std::string("Failed to open export file: ") + std::strerror(error),
                            "Path: " + file_path);
    }

    out << content;
    out.flush();
    if (!out) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, "Path: " + file_path);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Tree exported to '{}' ({} bytes)", file_path, content.size());
    }
}
