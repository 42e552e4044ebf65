// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/cli/commands.hpp>
#include <tubeq/core/logging.hpp>
#include <tubeq/version.hpp>
#include <QCoreApplication>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace tubeq::cli;

// Terminate handler to catch exceptions in noexcept functions
static void tubeq_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

static void on_sigint(int) {
    request_interrupt();
}

int main(int argc, char* argv[]) {
    std::set_terminate(tubeq_terminate_handler);
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    // Handle help
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    // Handle version
    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }
    if (args.command == Command::none) {
        std::cerr << "Error: No command specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QString::fromUtf8(tubeq::APP_NAME.data(),
                                                           static_cast<qsizetype>(tubeq::APP_NAME.size())));
    QCoreApplication::setApplicationVersion(QString::fromStdString(tubeq::version.to_string()));

    auto config = load_config(args);
    std::string level = config.log_level;
    if (args.verbose) level = "debug";
    if (args.quiet) level = "warn";
    tubeq::core::init_logging(level, config.log_file);

    std::signal(SIGINT, on_sigint);

    CliResult result;
    switch (args.command) {
        case Command::formats:  result = formats(args, config); break;
        case Command::download: result = download(args, config); break;
        case Command::queue:    result = queue(args, config); break;
        case Command::none:     break;
    }

    if (!result) {
        return 1;
    }
    return *result;
}
