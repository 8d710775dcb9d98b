#include <catch2/catch_test_macros.hpp>
#include "Utils.hpp"
#include "Types.hpp"
#include "TestHelpers.hpp"
#include <filesystem>
#include <regex>

TEST_CASE("format_size renders zero as bytes in every mode") {
    CHECK(Utils::format_size(0, SizeUnit::Auto) == "0 B");
    CHECK(Utils::format_size(0, SizeUnit::Bytes) == "0 B");
    CHECK(Utils::format_size(0, SizeUnit::MB) == "0 B");
}

TEST_CASE("format_size auto mode scales through the unit sequence") {
    CHECK(Utils::format_size(1536, SizeUnit::Auto) == "1.50 KB");
    CHECK(Utils::format_size(1048576, SizeUnit::Auto) == "1.00 MB");
    CHECK(Utils::format_size(1023, SizeUnit::Auto) == "1023.00 B");
    CHECK(Utils::format_size(3ULL * 1024 * 1024 * 1024, SizeUnit::Auto) == "3.00 GB");
}

TEST_CASE("format_size auto mode stops at terabytes") {
    const std::uintmax_t petabyte = 1024ULL * 1024 * 1024 * 1024 * 1024;
    CHECK(Utils::format_size(petabyte, SizeUnit::Auto) == "1024.00 TB");
}

TEST_CASE("format_size bytes mode prints the raw integer") {
    CHECK(Utils::format_size(500, SizeUnit::Bytes) == "500 B");
    CHECK(Utils::format_size(1048576, SizeUnit::Bytes) == "1048576 B");
}

TEST_CASE("format_size explicit unit divides exactly to that unit") {
    CHECK(Utils::format_size(512, SizeUnit::KB) == "0.50 KB");
    CHECK(Utils::format_size(1048576, SizeUnit::KB) == "1024.00 KB");
    CHECK(Utils::format_size(1048576, SizeUnit::MB) == "1.00 MB");
    CHECK(Utils::format_size(1048576, SizeUnit::GB) == "0.00 GB");
}

TEST_CASE("size_unit_from_string accepts known units case-insensitively") {
    CHECK(size_unit_from_string("auto") == SizeUnit::Auto);
    CHECK(size_unit_from_string("bytes") == SizeUnit::Bytes);
    CHECK(size_unit_from_string("kb") == SizeUnit::KB);
    CHECK(size_unit_from_string("MB") == SizeUnit::MB);
    CHECK(size_unit_from_string("Gb") == SizeUnit::GB);
    CHECK(size_unit_from_string("TB") == SizeUnit::TB);
    CHECK_FALSE(size_unit_from_string("PB").has_value());
    CHECK(to_string(SizeUnit::MB) == "MB");
}

TEST_CASE("clamp_max_depth keeps unlimited and bounds explicit depths") {
    CHECK_FALSE(clamp_max_depth(std::nullopt).has_value());
    CHECK(clamp_max_depth(-3) == 0);
    CHECK(clamp_max_depth(7) == 7);
    CHECK(clamp_max_depth(99) == kMaxDepthLimit);
}

TEST_CASE("get_config_dir honors the override variable") {
    TempDir temp_dir;
    EnvVarGuard guard("FOLDER_TREE_CONFIG_DIR", temp_dir.path().string());
    const std::filesystem::path expected = temp_dir.path() / "FolderTreeViewer";
    REQUIRE(Utils::get_config_dir() == expected.string());
}

TEST_CASE("get_config_dir defaults under the home directory") {
    TempDir temp_home;
    EnvVarGuard override_guard("FOLDER_TREE_CONFIG_DIR", std::nullopt);
    EnvVarGuard home_guard("HOME", temp_home.path().string());
    const std::filesystem::path expected = temp_home.path() / ".config" / "FolderTreeViewer";
    REQUIRE(Utils::get_config_dir() == expected.string());
}

TEST_CASE("format_timestamp uses the export timestamp layout") {
    TempDir temp_dir;
    const auto file = temp_dir.path() / "stamp.txt";
    write_file(file);

    const std::string stamp = Utils::format_timestamp(std::filesystem::last_write_time(file));
    const std::regex layout(R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}$)");
    CHECK(std::regex_match(stamp, layout));
    CHECK(std::regex_match(Utils::current_timestamp(), layout));
}

TEST_CASE("utf8 path conversion round-trips non-ASCII names") {
    const std::string name = "caf\xC3\xA9/\xE6\x96\x87\xE4\xBB\xB6.txt";
    CHECK(Utils::path_to_utf8(Utils::utf8_to_path(name)) == name);
}
