#include "AppException.hpp"
#include "CommandLine.hpp"
#include "FolderScanner.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "TreeExporter.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;
constexpr int kExitCancelled = 130;

std::atomic<bool> interrupted{false};

void handle_interrupt(int)
{
    interrupted = true;
}

bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

void report_error(const ErrorCodes::AppException& ex)
{
    if (auto logger = Logger::get_logger("cli_logger")) {
        logger->error("[{}] {}", ex.get_error_code_int(), ex.what());
    }
    std::cerr << "Error " << ex.get_error_code_int() << ": " << ex.get_user_message() << "\n";
}

ScanResult run_scan(FolderScanner& scanner, const std::string& folder, const ScanOptions& options)
{
    scanner.scan(folder, options);
    while (scanner.state() != ScanState::Idle) {
        if (interrupted) {
            scanner.cancel();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    scanner.wait();
    if (auto result = scanner.last_result()) {
        return *result;
    }
    return ScanResult{ScanStatus::Failed, {}, "Error: scan produced no result"};
}

void persist_settings(Settings& settings, const CommandLineOptions& cli)
{
    settings.add_recent_folder(cli.folder);
    if (!cli.output_path.empty()) {
        const auto parent = Utils::utf8_to_path(cli.output_path).parent_path();
        if (!parent.empty()) {
            settings.set_default_export_location(Utils::path_to_utf8(parent));
        }
    }
    if (!settings.save()) {
        if (auto logger = Logger::get_logger("cli_logger")) {
            logger->warn("Failed to save configuration to '{}'", settings.get_config_path());
        }
    }
}

} // namespace


int main(int argc, char** argv)
{
    if (!initialize_loggers()) {
        std::fprintf(stderr, "Continuing without log file\n");
    }
    auto logger = Logger::get_logger("cli_logger");
    const std::string program_name = argc > 0 ? argv[0] : "folder-tree";

    CommandLineOptions cli;
    try {
        cli = CommandLine::parse(std::vector<std::string>(argv + std::min(argc, 1), argv + argc));
    } catch (const ErrorCodes::AppException& ex) {
        report_error(ex);
        std::cerr << "\n" << CommandLine::usage(program_name);
        return kExitUsage;
    }

    if (cli.show_help) {
        std::cout << CommandLine::usage(program_name);
        return kExitSuccess;
    }

    cli.output_path = TreeExporter::resolve_output_path(cli.output_path, cli.format);

    for (const auto& warning : cli.warnings) {
        std::cerr << warning << "\n";
        if (logger) {
            logger->warn("{}", warning);
        }
    }

    Settings settings;
    if (!settings.load() && logger) {
        logger->debug("No saved settings at '{}', using defaults", settings.get_config_path());
    }
    CommandLine::apply_to_settings(cli, settings);
    const ScanOptions options = settings.to_scan_options();

    std::signal(SIGINT, handle_interrupt);

    FolderScanner scanner({}, [](const std::string& message) {
        std::cerr << message << "\n";
    });

    ScanResult result;
    try {
        result = run_scan(scanner, cli.folder, options);
    } catch (const ErrorCodes::AppException& ex) {
        report_error(ex);
        return kExitFailure;
    }

    if (result.status == ScanStatus::Cancelled) {
        report_error(ErrorCodes::AppException(ErrorCodes::Code::SCAN_CANCELLED, "Folder: " + cli.folder));
        return kExitCancelled;
    }
    if (result.status == ScanStatus::Failed) {
        if (logger) {
            logger->error("{}", result.message);
        }
        return kExitFailure;
    }

    const std::string generated = Utils::current_timestamp();
    const std::string report =
        TreeExporter::build_report(cli.folder, join_lines(result.lines), generated);

    try {
        const std::string content = TreeExporter::export_report(cli.format, report, cli.folder, generated);
        if (cli.output_path.empty()) {
            std::cout << content;
            if (!content.empty() && content.back() != '\n') {
                std::cout << "\n";
            }
        } else {
            TreeExporter::write_export(cli.output_path, content);
            std::cerr << "Tree exported to " << cli.output_path << "\n";
        }
    } catch (const ErrorCodes::AppException& ex) {
        report_error(ex);
        return kExitFailure;
    }

    if (cli.save_settings) {
        persist_settings(settings, cli);
    }
    return kExitSuccess;
}
