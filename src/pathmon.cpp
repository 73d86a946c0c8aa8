/**
 * @file pathmon.cpp
 * @brief CLI entry point for the link-aware path monitor.
 *
 * Parses options, configures logging and either prints the resolved paths
 * once or keeps watching them until interrupted.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

#ifndef PATHMON_NO_MAIN
int main(int argc, char* argv[]) {
    try {
        pathmon::Options opts = pathmon::parse_options(argc, argv);
        if (opts.show_help) {
            pathmon::print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << PATHMON_VERSION << "\n";
            return 0;
        }
        pathmon::cli::setup_logging(opts);
        int rc = 0;
        if (auto resolved = pathmon::cli::handle_resolve_only(opts); resolved)
            rc = *resolved;
        else
            rc = pathmon::cli::handle_monitoring_run(opts);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
#endif // PATHMON_NO_MAIN
