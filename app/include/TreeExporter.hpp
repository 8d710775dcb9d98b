#ifndef TREE_EXPORTER_HPP
#define TREE_EXPORTER_HPP

#include <string>
#include <vector>
#include <json/json.h>
#include "Types.hpp"

class TreeExporter {
public:
    /**
     * @brief Prefix the rendered tree with the "Folder Tree:" header block.
     *
     * The header ends with a dashed separator and a blank line, which is what
     * the tree codec skips when parsing the report back.
     */
    static std::string build_report(const std::string& folder_path,
                                    const std::string& tree_text,
                                    const std::string& generated);

    static ExportFormat parse_format(const std::string& value);
    static std::string default_extension(ExportFormat format);

    // Appends the format's extension when @p output_path has none.
    static std::string resolve_output_path(const std::string& output_path, ExportFormat format);

    // Convert a report (header optional) into the requested format.
    static std::string export_report(ExportFormat format,
                                     const std::string& report_text,
                                     const std::string& folder_path,
                                     const std::string& generated);

    static Json::Value to_json_value(const std::vector<TreeNode>& forest);
    static std::string to_json(const std::string& folder_path,
                               const std::vector<std::string>& lines,
                               const std::string& generated);
    static std::string to_csv(const std::vector<std::string>& lines,
                              const std::string& folder_path);

    static std::string escape_csv_field(const std::string& field);

    /**
     * @brief Write @p content to @p file_path, creating the parent folder.
     * @throws ErrorCodes::AppException on permission or I/O failure.
     */
    static void write_export(const std::string& file_path, const std::string& content);
};

#endif
