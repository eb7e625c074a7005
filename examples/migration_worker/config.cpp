/**
 * @file config.cpp
 * @brief Configuration management implementation for the migration worker
 */

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string_view>

namespace docmig::example {

namespace {

/// Fetch the value following a flag, reporting a missing one
auto next_value(int argc, char* argv[], int& i, std::string_view flag)
    -> std::optional<std::string> {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << flag << " requires a value\n";
        return std::nullopt;
    }
    return std::string{argv[++i]};
}

auto parse_positive(const std::string& value, std::string_view flag) -> std::optional<int> {
    try {
        const int parsed = std::stoi(value);
        if (parsed <= 0) {
            std::cerr << "Error: " << flag << " must be positive\n";
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid " << flag << " value: " << value << "\n";
        return std::nullopt;
    }
}

auto job(migration_worker_config& config) -> job_settings& {
    if (!config.create_job) {
        config.create_job.emplace();
    }
    return *config.create_job;
}

}  // namespace

void migration_worker_config::print_help() {
    std::cout << R"(
docmig_worker - Document Migration Worker

Usage: docmig_worker [OPTIONS]

General Options:
  --db-path <path>          SQLite database path (default: ./docmig.db)
  --providers <file>        Provider registrations to persist (JSON)
  --log-level <level>       Log level: trace, debug, info, warn, error, fatal
                            (default: info)
  --log-dir <path>          Directory for log files and audit.json (default: ./logs)
  --no-log-file             Log to the console only
  --help, -h                Show this help message

Modes:
  --migrate-only            Apply the database schema and exit
  --status                  Print every job with its progress and exit
  (default)                 Run the worker pool until SIGINT/SIGTERM

Worker Options:
  --workers <n>             Concurrent worker loops (default: 5)
  --poll-interval-ms <ms>   Idle poll interval (default: 5000)
  --lease-timeout <sec>     Age at which abandoned claims are recovered (default: 600)
  --worker-id <prefix>      Worker id prefix (default: docmig-worker)
  --exit-when-idle          Exit once no job is running

Job Options:
  --create-job <name>       Create and start a job before the workers run
  --source <provider>       Source provider
  --dest <provider>         Destination provider
  --strategy <s>            copy, move or mirror (default: copy)
  --prefix <prefix>         Migrate every source document under the prefix
  --document <id>           Migrate one document (repeatable)
  --concurrency <n>         Workers allowed on the job at once
  --batch-size <n>          Entries claimed per cycle
  --max-attempts <n>        Attempts per document
  --dry-run                 Verify sources without writing

Examples:
  # Prepare the database
  docmig_worker --db-path /data/docmig.db --migrate-only

  # Register providers and move a folder, exiting when done
  docmig_worker --providers providers.json --create-job reports \
      --source workspace --dest archive --strategy move --prefix reports/ \
      --exit-when-idle

  # Show progress
  docmig_worker --status

Exit Codes:
  0  Success
  1  Invalid arguments or configuration
  2  Database or job error
)";
}

auto migration_worker_config::parse_args(int argc, char* argv[])
    -> std::optional<migration_worker_config> {

    migration_worker_config config;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg == "--migrate-only") {
            config.mode = run_mode::migrate_only;
            continue;
        }
        if (arg == "--status") {
            config.mode = run_mode::status;
            continue;
        }
        if (arg == "--exit-when-idle") {
            config.workers.exit_when_idle = true;
            continue;
        }
        if (arg == "--no-log-file") {
            config.logging.file_output = false;
            continue;
        }
        if (arg == "--dry-run") {
            job(config).dry_run = true;
            continue;
        }

        auto value = next_value(argc, argv, i, arg);
        if (!value) {
            return std::nullopt;
        }

        if (arg == "--db-path") {
            config.database.path = *value;
        } else if (arg == "--providers") {
            config.providers_file = *value;
        } else if (arg == "--log-dir") {
            config.logging.directory = *value;
        } else if (arg == "--worker-id") {
            config.workers.id_prefix = *value;
        } else if (arg == "--log-level") {
            if (!integration::log_level_from_string(*value)) {
                std::cerr << "Error: Invalid log level: " << *value << "\n";
                std::cerr << "Valid levels: trace, debug, info, warn, error, fatal\n";
                return std::nullopt;
            }
            config.logging.level = *value;
        } else if (arg == "--workers") {
            auto n = parse_positive(*value, arg);
            if (!n) return std::nullopt;
            config.workers.count = static_cast<std::size_t>(*n);
        } else if (arg == "--poll-interval-ms") {
            auto n = parse_positive(*value, arg);
            if (!n) return std::nullopt;
            config.workers.poll_interval = std::chrono::milliseconds{*n};
        } else if (arg == "--lease-timeout") {
            auto n = parse_positive(*value, arg);
            if (!n) return std::nullopt;
            config.workers.lease_timeout = std::chrono::seconds{*n};
        } else if (arg == "--create-job") {
            job(config).name = *value;
        } else if (arg == "--source") {
            job(config).source_provider = *value;
        } else if (arg == "--dest") {
            job(config).dest_provider = *value;
        } else if (arg == "--strategy") {
            auto strategy = migration::migration_strategy_from_string(*value);
            if (!strategy) {
                std::cerr << "Error: Invalid strategy: " << *value << "\n";
                return std::nullopt;
            }
            job(config).strategy = *strategy;
        } else if (arg == "--prefix") {
            job(config).filter_prefix = *value;
        } else if (arg == "--document") {
            job(config).document_ids.push_back(*value);
        } else if (arg == "--concurrency") {
            auto n = parse_positive(*value, arg);
            if (!n) return std::nullopt;
            job(config).concurrency = *n;
        } else if (arg == "--batch-size") {
            auto n = parse_positive(*value, arg);
            if (!n) return std::nullopt;
            job(config).batch_size = *n;
        } else if (arg == "--max-attempts") {
            auto n = parse_positive(*value, arg);
            if (!n) return std::nullopt;
            job(config).max_attempts = *n;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return std::nullopt;
        }
    }

    if (config.create_job && config.create_job->name.empty()) {
        std::cerr << "Error: job options require --create-job <name>\n";
        return std::nullopt;
    }

    return config;
}

auto migration_worker_config::min_log_level() const -> integration::log_level {
    return integration::log_level_from_string(logging.level)
        .value_or(integration::log_level::info);
}

auto load_providers_file(const std::filesystem::path& path)
    -> std::optional<std::vector<storage::provider_registration>> {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Error: Cannot open providers file: " << path << "\n";
        return std::nullopt;
    }

    std::vector<storage::provider_registration> registrations;
    try {
        const auto doc = nlohmann::json::parse(in);
        for (const auto& entry : doc.at("providers")) {
            storage::provider_registration reg;
            reg.provider_name = entry.at("name").get<std::string>();
            reg.provider_type = entry.at("type").get<std::string>();
            reg.config_json = entry.value("config", nlohmann::json::object()).dump();
            reg.is_primary = entry.value("primary", false);
            reg.is_writable = entry.value("writable", true);
            reg.status = storage::provider_status_from_string(
                entry.value("status", std::string{"active"}));
            registrations.push_back(std::move(reg));
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: Invalid providers file " << path << ": " << e.what() << "\n";
        return std::nullopt;
    }

    return registrations;
}

}  // namespace docmig::example
