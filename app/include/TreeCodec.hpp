#ifndef TREE_CODEC_HPP
#define TREE_CODEC_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

/**
 * @brief Parses the rendered tree text back into structured forms.
 *
 * Input is the report text (optional "Folder Tree:" header block followed by
 * the tree lines). Lines that do not look like tree entries, including the
 * scanner's placeholder rows, are skipped rather than treated as errors.
 */
class TreeCodec {
public:
    struct ParsedLine {
        std::size_t depth{0};
        std::string name;
        bool is_directory{false};
        std::string size;
    };

    static std::vector<std::string> split_lines(const std::string& text);

    // Index of the first tree line after the header block, 0 without a header.
    static std::size_t find_body_start(const std::vector<std::string>& lines);

    static std::optional<ParsedLine> parse_line(const std::string& line);

    static std::vector<TreeNode> parse_to_tree(const std::vector<std::string>& lines);

    /**
     * @brief Flatten the tree lines into table rows.
     * @param root_path Folder the tree was generated from; joined with the
     *        entry names to rebuild each path. Modified timestamps are looked
     *        up on disk and left empty when the path no longer exists.
     */
    static std::vector<TableRow> parse_to_rows(const std::vector<std::string>& lines,
                                               const std::string& root_path);

private:
    static std::size_t indentation_columns(const std::string& line, std::size_t& offset);
    static bool is_placeholder_label(const std::string& label);
    static bool split_size_suffix(std::string& label, std::string& size);
};

#endif
