/**
 * @file autosubsync.cpp
 * @brief CLI entry point for one submodule synchronization pass.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return `0` on success or when printing help/version, `1` on invalid
 *         configuration or any fatal synchronization step.
 */
#ifndef AUTOSUBSYNC_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    Options opts;
    try {
        opts = parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
        return 1;
    }
    if (opts.show_help) {
        print_help(argv[0]);
        return 0;
    }
    if (opts.print_version) {
        std::cout << AUTOSUBSYNC_VERSION << "\n";
        return 0;
    }
    cli::setup_logging(opts);
    int rc = cli::handle_sync_run(opts);
    shutdown_logger();
    return rc;
}
#endif // AUTOSUBSYNC_NO_MAIN
