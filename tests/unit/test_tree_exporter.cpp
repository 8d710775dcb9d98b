#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "TreeCodec.hpp"
#include "TreeExporter.hpp"
#include "TestHelpers.hpp"

#include <json/json.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

namespace {
const std::string kTree =
    "├── src/\n"
    "│   └── a.txt\n"
    "└── README.md";

Json::Value parse_json(const std::string& text)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    REQUIRE(reader->parse(text.data(), text.data() + text.size(), &root, &errors));
    return root;
}

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}
}

TEST_CASE("build_report writes the header block before the tree") {
    const std::string report = TreeExporter::build_report("/proj", kTree, "2024-05-01 10:00:00");
    const auto lines = TreeCodec::split_lines(report);

    REQUIRE(lines.size() == 7);
    CHECK(lines[0] == "Folder Tree: /proj");
    CHECK(lines[1] == "Generated: 2024-05-01 10:00:00");
    CHECK(lines[2] == std::string(80, '-'));
    CHECK(lines[3].empty());
    CHECK(lines[4] == "├── src/");
    CHECK(TreeCodec::find_body_start(lines) == 4);
}

TEST_CASE("parse_format accepts txt, json and csv") {
    CHECK(TreeExporter::parse_format("txt") == ExportFormat::Text);
    CHECK(TreeExporter::parse_format("TEXT") == ExportFormat::Text);
    CHECK(TreeExporter::parse_format("Json") == ExportFormat::Json);
    CHECK(TreeExporter::parse_format("csv") == ExportFormat::Csv);
    CHECK(TreeExporter::default_extension(ExportFormat::Csv) == ".csv");

    try {
        TreeExporter::parse_format("xml");
        FAIL("expected AppException");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::EXPORT_UNSUPPORTED_FORMAT);
    }
}

TEST_CASE("output paths without an extension get the format's extension") {
    CHECK(TreeExporter::resolve_output_path("out/tree", ExportFormat::Json) == "out/tree.json");
    CHECK(TreeExporter::resolve_output_path("tree", ExportFormat::Text) == "tree.txt");
    CHECK(TreeExporter::resolve_output_path("out/tree.data", ExportFormat::Csv) == "out/tree.data");
    CHECK(TreeExporter::resolve_output_path("", ExportFormat::Csv).empty());
}

TEST_CASE("json export wraps the forest with folder and timestamp") {
    const std::string report = TreeExporter::build_report("/proj", kTree, "2024-05-01 10:00:00");
    const std::string json = TreeExporter::export_report(ExportFormat::Json, report, "/proj",
                                                         "2024-05-01 10:00:00");
    const Json::Value root = parse_json(json);

    CHECK(root["folder"].asString() == "/proj");
    CHECK(root["generated"].asString() == "2024-05-01 10:00:00");
    const Json::Value& structure = root["structure"];
    REQUIRE(structure.isArray());
    REQUIRE(structure.size() == 2);

    const Json::Value& src = structure[0];
    CHECK(src["name"].asString() == "src");
    CHECK(src["type"].asString() == "directory");
    REQUIRE(src["children"].size() == 1);
    CHECK(src["children"][0]["name"].asString() == "a.txt");
    CHECK(src["children"][0]["type"].asString() == "file");
    CHECK_FALSE(src["children"][0].isMember("children"));

    CHECK(structure[1]["name"].asString() == "README.md");
    CHECK_FALSE(structure[1].isMember("children"));
}

TEST_CASE("json export keeps non-ASCII names readable") {
    const std::string tree = "└── caf\xC3\xA9.txt";
    const std::string json = TreeExporter::to_json("/p", TreeCodec::split_lines(tree), "t");
    CHECK(json.find("caf\xC3\xA9.txt") != std::string::npos);
}

TEST_CASE("csv export has the fixed header and one row per entry") {
    TempDir temp_dir;
    const auto root = temp_dir.path() / "missing";
    const std::string report = TreeExporter::build_report(root.string(), kTree, "now");
    const std::string csv = TreeExporter::export_report(ExportFormat::Csv, report, root.string(), "now");

    const auto lines = TreeCodec::split_lines(csv);
    REQUIRE(lines.size() == 4);
    CHECK(lines[0] == "Type,Name,Path,Size,Modified");
    CHECK(lines[1] == "Directory,src," + (root / "src").string() + ",,");
    CHECK(lines[2] == "File,a.txt," + (root / "src" / "a.txt").string() + ",,");
    CHECK(lines[3] == "File,README.md," + (root / "README.md").string() + ",,");
    CHECK(csv.find("\r\n") != std::string::npos);
}

TEST_CASE("csv fields with separators or quotes are quoted") {
    CHECK(TreeExporter::escape_csv_field("plain") == "plain");
    CHECK(TreeExporter::escape_csv_field("a,b") == "\"a,b\"");
    CHECK(TreeExporter::escape_csv_field("say \"hi\"") == "\"say \"\"hi\"\"\"");
    CHECK(TreeExporter::escape_csv_field("") == "");

    const std::string csv = TreeExporter::to_csv({"└── one, two.txt [1.00 KB]"}, "/r");
    CHECK(csv.find("File,\"one, two.txt\",\"/r/one, two.txt\",1.00 KB,") != std::string::npos);
}

TEST_CASE("text export returns the report unchanged") {
    const std::string report = TreeExporter::build_report("/proj", kTree, "now");
    CHECK(TreeExporter::export_report(ExportFormat::Text, report, "/proj", "now") == report);
}

TEST_CASE("exporting empty text is rejected") {
    try {
        TreeExporter::export_report(ExportFormat::Json, "  \n\n", "/proj", "now");
        FAIL("expected AppException");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::EXPORT_NOTHING_TO_EXPORT);
    }
}

TEST_CASE("write_export creates missing folders and writes the content") {
    TempDir temp_dir;
    const auto target = temp_dir.path() / "exports" / "nested" / "tree.json";

    TreeExporter::write_export(target.string(), "{\"ok\": true}\n");
    REQUIRE(std::filesystem::exists(target));
    CHECK(read_file(target) == "{\"ok\": true}\n");

    TreeExporter::write_export(target.string(), "second");
    CHECK(read_file(target) == "second");
}

TEST_CASE("write_export reports an error when the target is a folder") {
    TempDir temp_dir;
    REQUIRE_THROWS_AS(TreeExporter::write_export(temp_dir.path().string(), "data"),
                      ErrorCodes::AppException);
    REQUIRE_THROWS_AS(TreeExporter::write_export("", "data"), ErrorCodes::AppException);
}

TEST_CASE("write_export keeps the filesystem error when the folder cannot be created") {
    TempDir temp_dir;
    const auto blocker = temp_dir.path() / "blocker";
    write_file(blocker);

    try {
        TreeExporter::write_export((blocker / "tree.txt").string(), "data");
        FAIL("expected AppException");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::DIRECTORY_CREATE_FAILED);
        CHECK(static_cast<bool>(ex.get_system_error()));
        CHECK(std::string(ex.what()).rfind("Failed to create the folder. (", 0) == 0);
    }
}
