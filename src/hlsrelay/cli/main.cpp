// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsrelay/cli/commands.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace hlsrelay::cli;

// Terminate handler to log exceptions escaping noexcept functions
static void hlsrelay_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    spdlog::critical("std::terminate called");
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            spdlog::critical("Exception: {}", e.what());
        } catch (...) {
            spdlog::critical("Unknown exception in noexcept context");
        }
    }
    spdlog::shutdown();
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(hlsrelay_terminate_handler);
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

    auto result = serve(args);
    if (!result) {
        std::cerr << "Error: " << result.error().message() << std::endl;
        return 1;
    }
    return *result;
}
