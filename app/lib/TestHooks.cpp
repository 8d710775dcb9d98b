#include "TestHooks.hpp"

#include <mutex>
#include <utility>

namespace TestHooks {

namespace {
std::mutex& probe_mutex()
{
    static std::mutex mutex;
    return mutex;
}

ScanEntryProbe& scan_entry_probe()
{
    static ScanEntryProbe probe;
    return probe;
}

DirectoryListingProbe& directory_listing_probe()
{
    static DirectoryListingProbe probe;
    return probe;
}
}

void set_scan_entry_probe(ScanEntryProbe probe)
{
    std::lock_guard<std::mutex> lock(probe_mutex());
    scan_entry_probe() = std::move(probe);
}

void reset_scan_entry_probe()
{
    set_scan_entry_probe({});
}

void run_scan_entry_probe(const std::filesystem::path& entry_path)
{
    ScanEntryProbe probe;
    {
        std::lock_guard<std::mutex> lock(probe_mutex());
        probe = scan_entry_probe();
    }
    if (probe) {
        probe(entry_path);
    }
}

void set_directory_listing_probe(DirectoryListingProbe probe)
{
    std::lock_guard<std::mutex> lock(probe_mutex());
    directory_listing_probe() = std::move(probe);
}

void reset_directory_listing_probe()
{
    set_directory_listing_probe({});
}

std::optional<std::error_code> run_directory_listing_probe(const std::filesystem::path& directory)
{
    DirectoryListingProbe probe;
    {
        std::lock_guard<std::mutex> lock(probe_mutex());
        probe = directory_listing_probe();
    }
    if (probe) {
        return probe(directory);
    }
    return std::nullopt;
}

} // namespace TestHooks
