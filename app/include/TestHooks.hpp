#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <system_error>

namespace TestHooks {

// Called before the scanner processes each child entry.
using ScanEntryProbe = std::function<void(const std::filesystem::path& entry_path)>;
void set_scan_entry_probe(ScanEntryProbe probe);
void reset_scan_entry_probe();
void run_scan_entry_probe(const std::filesystem::path& entry_path);

// Returning an error code makes the scanner treat the directory as unlistable.
using DirectoryListingProbe =
    std::function<std::optional<std::error_code>(const std::filesystem::path& directory)>;
void set_directory_listing_probe(DirectoryListingProbe probe);
void reset_directory_listing_probe();
std::optional<std::error_code> run_directory_listing_probe(const std::filesystem::path& directory);

} // namespace TestHooks
