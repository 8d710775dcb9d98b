#ifndef TREE_GLYPHS_HPP
#define TREE_GLYPHS_HPP

#include <cstddef>
#include <string_view>

// Shared by the scanner (rendering) and the tree codec (parsing). Every
// segment below is exactly kIndentWidth display columns wide.
namespace TreeGlyphs {

constexpr std::string_view kBranch = "├── ";
constexpr std::string_view kCorner = "└── ";
constexpr std::string_view kVertical = "│   ";
constexpr std::string_view kBlank = "    ";

constexpr std::size_t kIndentWidth = 4;

constexpr std::string_view kAccessDenied = "[Access Denied]";
constexpr std::string_view kSizeError = "size error";
constexpr std::string_view kHeaderSeparatorPrefix = "----";

} // namespace TreeGlyphs

#endif
