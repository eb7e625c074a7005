/**
 * @file config.hpp
 * @brief Configuration management for the migration worker
 *
 * Provides configuration structures and parsing utilities for the
 * docmig_worker command line application.
 */

#ifndef DOCMIG_EXAMPLE_MIGRATION_WORKER_CONFIG_HPP
#define DOCMIG_EXAMPLE_MIGRATION_WORKER_CONFIG_HPP

#include <docmig/integration/logger_adapter.hpp>
#include <docmig/migration/migration_types.hpp>
#include <docmig/storage/provider_registration.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace docmig::example {

/**
 * @brief What the worker does after start-up
 */
enum class run_mode {
    work,          ///< Run the worker pool
    migrate_only,  ///< Apply the schema and exit
    status         ///< Print jobs with progress and exit
};

/**
 * @brief Database configuration
 */
struct database_settings {
    /// Path to the SQLite database file shared by all workers
    std::filesystem::path path{"./docmig.db"};

    /// Lock wait before a write gives up
    std::chrono::milliseconds busy_timeout{5000};
};

/**
 * @brief Worker pool configuration
 */
struct worker_settings {
    /// Number of concurrent worker loops
    std::size_t count{5};

    /// Idle poll interval
    std::chrono::milliseconds poll_interval{5000};

    /// Age at which an abandoned claim is recovered
    std::chrono::seconds lease_timeout{600};

    /// Worker ids are "<prefix>-<n>"
    std::string id_prefix{"docmig-worker"};

    /// Exit once no job is running
    bool exit_when_idle{false};
};

/**
 * @brief Logging configuration
 */
struct logging_settings {
    /// Log level: "trace", "debug", "info", "warn", "error", "fatal"
    std::string level{"info"};

    /// Directory for rotating log files and audit.json
    std::filesystem::path directory{"./logs"};

    /// Write log files in addition to the console
    bool file_output{true};
};

/**
 * @brief Job to create at start-up (--create-job)
 */
struct job_settings {
    std::string name;
    std::string source_provider;
    std::string dest_provider;
    migration::migration_strategy strategy{migration::migration_strategy::copy};
    std::optional<std::string> filter_prefix;
    std::vector<std::string> document_ids;
    std::optional<int> concurrency;
    std::optional<int> batch_size;
    std::optional<int> max_attempts;
    bool dry_run{false};
};

/**
 * @brief Complete migration worker configuration
 */
struct migration_worker_config {
    run_mode mode{run_mode::work};

    database_settings database;
    worker_settings workers;
    logging_settings logging;

    /// JSON file with provider registrations (optional)
    std::optional<std::filesystem::path> providers_file;

    /// Job to create and start before the workers run
    std::optional<job_settings> create_job;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Supported options:
     *   --db-path <path>          Database path (default: ./docmig.db)
     *   --providers <file>        Provider registrations (JSON)
     *   --workers <n>             Worker loops (default: 5)
     *   --poll-interval-ms <ms>   Idle poll interval (default: 5000)
     *   --lease-timeout <sec>     Claim lease (default: 600)
     *   --log-level <level>       Log level (default: info)
     *   --log-dir <path>          Log directory (default: ./logs)
     *   --migrate-only            Apply the schema and exit
     *   --status                  Print job progress and exit
     *   --exit-when-idle          Stop once no job is running
     *   --create-job <name>       Create and start a job (see --help)
     *   --help                    Show help message
     *
     * @param argc Argument count
     * @param argv Argument vector
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[])
        -> std::optional<migration_worker_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();

    [[nodiscard]] auto min_log_level() const -> integration::log_level;
};

/**
 * @brief Provider registrations read from a JSON file
 *
 * Expected layout:
 * @code
 * {
 *   "providers": [
 *     {"name": "workspace", "type": "local", "config": {"root_path": "./ws"},
 *      "primary": true, "writable": true, "status": "active"}
 *   ]
 * }
 * @endcode
 *
 * @return Registrations, or nullopt after printing the error
 */
auto load_providers_file(const std::filesystem::path& path)
    -> std::optional<std::vector<storage::provider_registration>>;

}  // namespace docmig::example

#endif  // DOCMIG_EXAMPLE_MIGRATION_WORKER_CONFIG_HPP
