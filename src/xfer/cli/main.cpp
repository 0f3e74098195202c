// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/cli/commands.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace xfer::cli;

// Terminate handler to catch exceptions in noexcept functions
static void xfer_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto ex = std::current_exception()) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(xfer_terminate_handler);
    CliArgs args = parse_args(argc, argv);

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::err);
    }

    if (args.files.empty()) {
        std::cerr << "Error: No chunk log specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    int exit_code = 0;
    for (const auto& file : args.files) {
        auto result = analyze(file, args, std::cout);
        if (!result) {
            exit_code = 1;
        }
    }

    return exit_code;
}
