// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/cli/commands.hpp>
#include <xfer/cli/report_printer.hpp>
#include <xfer/analysis/chunk_log_analyzer.hpp>
#include <xfer/analysis/chunk_log_reader.hpp>
#include <xfer/version.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <chrono>
#include <iostream>

namespace xfer::cli {

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-l" || arg == "--list-chunks") {
            args.list_chunks = true;
        } else if (arg == "-t" || arg == "--long-body-secs") {
            if (i + 1 >= argc) {
                args.error = "missing value for " + std::string(arg);
                return args;
            }
            std::string_view value = argv[++i];
            std::uint32_t secs = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), secs);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                args.error = "invalid number of seconds: " + std::string(value);
                return args;
            }
            args.long_body_secs = secs;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            args.error = "unknown option: " + std::string(arg);
            return args;
        } else {
            args.files.emplace_back(arg);
        }
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult analyze(const std::string& path, const CliArgs& args, std::ostream& out) noexcept {
    spdlog::debug("reading chunk log {}", path);

    auto records = analysis::ChunkLogReader::read(path);
    if (!records) {
        spdlog::error("{}: {}", path, records.error().message());
        return std::unexpected(records.error());
    }

    try {
        analysis::AnalyzerConfig config;
        config.long_body_read = std::chrono::seconds{args.long_body_secs};

        auto report = analysis::analyze(*records, config);
        spdlog::debug("{}: {} records, {} chunks", path, report.record_count, report.chunks.size());

        ReportPrinter printer(out);
        printer.print(path, report, args.list_chunks);
    } catch (const std::exception& e) {
        spdlog::error("{}: {}", path, e.what());
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "xfer chunk log analyzer " << program_name << " - where did the chunks wait?\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <CHUNK-LOG>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -V, --verbose              Enable debug logging\n";
    std::cout << "  -q, --quiet                Only log errors\n";
    std::cout << "  -l, --list-chunks          Print every chunk's states\n";
    std::cout << "  -t, --long-body-secs <N>   Body time counted as slow (default: 30)\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " logs/4f1c2a-chunks.log\n";
    std::cout << "  " << program_name << " -t 10 -l logs/4f1c2a-chunks.log\n";
}

void print_version() noexcept {
    std::cout << "xfer-chunklog " << xfer::version.to_string() << std::endl;
    std::cout << "\n";
    std::cout << "Built with C++23, spdlog\n";
}

} // namespace xfer::cli
