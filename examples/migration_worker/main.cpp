/**
 * @file main.cpp
 * @brief Entry point for the docmig migration worker
 *
 * Runs a pool of migration workers against a shared SQLite database.
 * Several instances may point at the same database; claims are exclusive.
 *
 * Usage:
 *   docmig_worker [OPTIONS]
 *
 * Options:
 *   --db-path <path>        Database path (default: ./docmig.db)
 *   --providers <file>      Provider registrations (JSON)
 *   --workers <n>           Worker loops (default: 5)
 *   --migrate-only          Apply the schema and exit
 *   --status                Print job progress and exit
 *   --create-job <name>     Create and start a job
 *   --exit-when-idle        Exit once no job is running
 *   --help                  Show help message
 */

#include "config.hpp"
#include "worker_app.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

/// Global pointer to the app for signal handling
std::atomic<docmig::example::worker_app*> g_app{nullptr};

/// Signal handler for graceful shutdown
void signal_handler(int /*signal*/) {
    auto* app = g_app.load();
    if (app) {
        app->request_shutdown();
    }
}

/// Install signal handlers
void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifndef _WIN32
    std::signal(SIGHUP, signal_handler);
#endif
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config = docmig::example::migration_worker_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    install_signal_handlers();

    docmig::example::worker_app app(config.value());
    g_app = &app;

    if (!app.initialize()) {
        std::cerr << "Failed to initialize migration worker\n";
        g_app = nullptr;
        return 1;
    }

    const int exit_code = app.run();

    app.print_statistics();

    g_app = nullptr;
    return exit_code;
}
