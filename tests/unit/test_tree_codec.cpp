#include <catch2/catch_test_macros.hpp>
#include "TreeCodec.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace {
const std::vector<std::string> kNestedTree = {
    "Folder Tree: /proj",
    "Generated: 2024-05-01 10:00:00",
    std::string(80, '-'),
    "",
    "├── a/",
    "│   ├── b/",
    "│   │   └── c.txt",
    "│   └── d.txt",
    "└── e/",
    "    └── f/",
    "        └── g.txt",
};
}

TEST_CASE("find_body_start skips the header block") {
    CHECK(TreeCodec::find_body_start(kNestedTree) == 4);
    CHECK(TreeCodec::find_body_start({"├── a/", "└── b"}) == 0);
    CHECK(TreeCodec::find_body_start({"----", "└── b"}) == 1);
}

TEST_CASE("split_lines handles CRLF and trailing newline") {
    const auto lines = TreeCodec::split_lines("├── a/\r\n│   └── b\r\n");
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "├── a/");
    CHECK(lines[1] == "│   └── b");
}

TEST_CASE("parse_line extracts depth, name, kind and size") {
    auto parsed = TreeCodec::parse_line("│   │   └── c.txt [1.50 KB]");
    REQUIRE(parsed);
    CHECK(parsed->depth == 2);
    CHECK(parsed->name == "c.txt");
    CHECK_FALSE(parsed->is_directory);
    CHECK(parsed->size == "1.50 KB");

    parsed = TreeCodec::parse_line("    ├── src/ [size error]");
    REQUIRE(parsed);
    CHECK(parsed->depth == 1);
    CHECK(parsed->name == "src");
    CHECK(parsed->is_directory);
    CHECK(parsed->size == "size error");
}

TEST_CASE("parse_line keeps bracketed names that are not sizes") {
    const auto parsed = TreeCodec::parse_line("└── notes [draft].txt");
    REQUIRE(parsed);
    CHECK(parsed->name == "notes [draft].txt");
    CHECK(parsed->size.empty());

    const auto tagged = TreeCodec::parse_line("└── report [final]");
    REQUIRE(tagged);
    CHECK(tagged->name == "report [final]");
}

TEST_CASE("parse_line keeps trailing spaces that belong to the name") {
    auto parsed = TreeCodec::parse_line("└── trail ");
    REQUIRE(parsed);
    CHECK(parsed->name == "trail ");
    CHECK_FALSE(parsed->is_directory);

    parsed = TreeCodec::parse_line("├── spaced dir /\r");
    REQUIRE(parsed);
    CHECK(parsed->name == "spaced dir ");
    CHECK(parsed->is_directory);

    parsed = TreeCodec::parse_line("└── trail  [4 B]");
    REQUIRE(parsed);
    CHECK(parsed->name == "trail ");
    CHECK(parsed->size == "4 B");
}

TEST_CASE("parse_line skips bars, placeholders and malformed text") {
    CHECK_FALSE(TreeCodec::parse_line("│   ").has_value());
    CHECK_FALSE(TreeCodec::parse_line("│").has_value());
    CHECK_FALSE(TreeCodec::parse_line("   ").has_value());
    CHECK_FALSE(TreeCodec::parse_line("│   ├── [Access Denied]").has_value());
    CHECK_FALSE(TreeCodec::parse_line("├── [Error: Input/output error]").has_value());
    CHECK_FALSE(TreeCodec::parse_line("just some text").has_value());
    CHECK_FALSE(TreeCodec::parse_line("├── ").has_value());
}

TEST_CASE("parse_to_tree nests children under their directories") {
    const auto forest = TreeCodec::parse_to_tree(kNestedTree);
    REQUIRE(forest.size() == 2);

    const auto& a = forest[0];
    CHECK(a.name == "a");
    CHECK(a.type == FileType::Directory);
    REQUIRE(a.children.size() == 2);
    CHECK(a.children[0].name == "b");
    REQUIRE(a.children[0].children.size() == 1);
    CHECK(a.children[0].children[0].name == "c.txt");
    CHECK(a.children[0].children[0].type == FileType::File);
    CHECK(a.children[1].name == "d.txt");

    const auto& e = forest[1];
    CHECK(e.name == "e");
    REQUIRE(e.children.size() == 1);
    CHECK(e.children[0].name == "f");
    REQUIRE(e.children[0].children.size() == 1);
    CHECK(e.children[0].children[0].name == "g.txt");
}

TEST_CASE("parse_to_tree produces a forest without a synthetic root") {
    const auto forest = TreeCodec::parse_to_tree({"├── one.txt", "├── two/", "└── three.txt"});
    REQUIRE(forest.size() == 3);
    CHECK(forest[0].type == FileType::File);
    CHECK(forest[1].type == FileType::Directory);
    CHECK(forest[1].children.empty());
    CHECK(forest[2].name == "three.txt");
}

TEST_CASE("parse_to_tree ignores placeholder rows under denied folders") {
    const auto forest = TreeCodec::parse_to_tree({
        "├── locked/",
        "│   ├── [Access Denied]",
        "└── open.txt",
    });
    REQUIRE(forest.size() == 2);
    CHECK(forest[0].name == "locked");
    CHECK(forest[0].children.empty());
    CHECK(forest[1].name == "open.txt");
}

TEST_CASE("parse_to_tree strips size annotations from directories") {
    const auto forest = TreeCodec::parse_to_tree({
        "└── data/ [2.00 MB]",
        "    └── blob.bin [2.00 MB]",
    });
    REQUIRE(forest.size() == 1);
    CHECK(forest[0].name == "data");
    CHECK(forest[0].type == FileType::Directory);
    REQUIRE(forest[0].children.size() == 1);
    CHECK(forest[0].children[0].name == "blob.bin");
}

TEST_CASE("parse_to_rows rebuilds paths from the root") {
    TempDir temp_dir;
    const auto root = temp_dir.path() / "gone";

    const auto rows = TreeCodec::parse_to_rows({
        "Folder Tree: x",
        "Generated: y",
        std::string(80, '-'),
        "",
        "├── src/ [10 B]",
        "│   └── a.txt [10 B]",
        "└── README.md [5 B]",
    }, root.string());

    REQUIRE(rows.size() == 3);
    CHECK(rows[0].type == FileType::Directory);
    CHECK(rows[0].name == "src");
    CHECK(rows[0].path == (root / "src").string());
    CHECK(rows[0].size == "10 B");
    CHECK(rows[1].type == FileType::File);
    CHECK(rows[1].path == (root / "src" / "a.txt").string());
    CHECK(rows[2].name == "README.md");
    CHECK(rows[2].path == (root / "README.md").string());
    for (const auto& row : rows) {
        CHECK(row.modified.empty());
    }
}

TEST_CASE("parse_to_rows pops the path stack when returning to a shallower level") {
    const auto rows = TreeCodec::parse_to_rows(kNestedTree, "/proj");
    REQUIRE(rows.size() == 7);
    CHECK(rows[2].path == "/proj/a/b/c.txt");
    CHECK(rows[3].path == "/proj/a/d.txt");
    CHECK(rows[4].path == "/proj/e");
    CHECK(rows[6].path == "/proj/e/f/g.txt");
}

TEST_CASE("parse_to_rows fills modified timestamps for existing entries") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "src" / "a.txt");

    const auto rows = TreeCodec::parse_to_rows({
        "├── src/",
        "│   └── a.txt",
        "└── renamed.txt",
    }, temp_dir.path().string());

    REQUIRE(rows.size() == 3);
    const std::regex layout(R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}$)");
    CHECK(std::regex_match(rows[0].modified, layout));
    CHECK(std::regex_match(rows[1].modified, layout));
    CHECK(rows[2].modified.empty());
}
