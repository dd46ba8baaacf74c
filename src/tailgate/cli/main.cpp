// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tailgate/cli/commands.hpp>
#include <tailgate/core/log.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace tailgate::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void tailgate_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
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
    std::set_terminate(tailgate_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.usage_error.empty()) {
        std::cerr << "Error: " << args.usage_error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    if (!args.log_level.empty()) {
        if (!tailgate::log::set_level(args.log_level)) {
            std::cerr << "Error: unknown log level " << args.log_level << std::endl;
            return 2;
        }
    } else if (args.verbose) {
        tailgate::log::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        tailgate::log::set_level(spdlog::level::err);
    }

    CliResult result = args.command == Command::fetch ? fetch(args) : inspect(args);
    return result ? *result : 1;
}
