/**
 * @file worker_app.cpp
 * @brief Migration worker application implementation
 */

#include "worker_app.hpp"

#include <docmig/di/ilogger.hpp>
#include <docmig/integration/logger_adapter.hpp>
#include <docmig/storage/migration_database.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace docmig::example {

using integration::logger_adapter;

namespace {

/// Exit codes
constexpr int exit_ok = 0;
constexpr int exit_runtime_error = 2;

auto format_time(const migration::time_point& tp) -> std::string {
    const auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

worker_app::worker_app(const migration_worker_config& config) : config_(config) {}

worker_app::~worker_app() {
    if (workers_) {
        workers_->stop();
    }
    workers_.reset();
    manager_.reset();
    logger_adapter::shutdown();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool worker_app::initialize() {
    integration::logger_config log_config;
    log_config.log_directory = config_.logging.directory;
    log_config.min_level = config_.min_log_level();
    log_config.enable_file = config_.logging.file_output;
    log_config.enable_audit_log = config_.logging.file_output;
    logger_adapter::initialize(log_config);

    storage::database_config db_config;
    db_config.busy_timeout = config_.database.busy_timeout;

    auto db = storage::migration_database::open(config_.database.path.string(), db_config);
    if (db.is_err()) {
        logger_adapter::error("Cannot open database {}: {}", config_.database.path.string(),
                              db.error().message);
        return false;
    }
    logger_adapter::info("Database {} at schema version {}", config_.database.path.string(),
                         db.value()->schema_version());

    if (config_.mode == run_mode::migrate_only) {
        return true;
    }

    auto logger = std::make_shared<di::LoggerService>();
    registry_ = std::make_shared<storage::provider_registry>(logger);
    registry_->register_builtin_factories();

    manager_ = std::make_unique<migration::migration_manager>(
        std::move(db.value()), registry_, migration::migration_manager_config{}, logger);

    return setup_providers();
}

int worker_app::run() {
    switch (config_.mode) {
        case run_mode::migrate_only:
            std::cout << "Schema is up to date\n";
            return exit_ok;
        case run_mode::status:
            return print_status();
        case run_mode::work:
            break;
    }

    if (config_.create_job && !create_configured_job()) {
        return exit_runtime_error;
    }
    return run_workers();
}

void worker_app::request_shutdown() noexcept {
    shutdown_requested_ = true;
}

void worker_app::print_statistics() const {
    if (!workers_) {
        return;
    }

    auto stats = workers_->stats();

    std::cout << "\n";
    std::cout << "=== Migration Worker Statistics ===\n";
    std::cout << "Claimed:    " << stats.claimed << "\n";
    std::cout << "Completed:  " << stats.completed << "\n";
    std::cout << "Skipped:    " << stats.skipped << "\n";
    std::cout << "Retried:    " << stats.retried << "\n";
    std::cout << "Failed:     " << stats.failed << "\n";
    std::cout << "Stale:      " << stats.stale << "\n";
    std::cout << "Conflicts:  " << stats.conflicts << "\n";
    std::cout << "Recovered:  " << stats.recovered << "\n";
    std::cout << "Errors:     " << stats.errors << "\n";
    std::cout << "===================================\n";
    std::cout << "\n";
}

// =============================================================================
// Private Setup Methods
// =============================================================================

bool worker_app::setup_providers() {
    if (config_.providers_file) {
        auto registrations = load_providers_file(*config_.providers_file);
        if (!registrations) {
            return false;
        }
        for (const auto& reg : *registrations) {
            auto saved = manager_->register_provider(reg);
            if (saved.is_err()) {
                logger_adapter::warn("Provider {} not usable: {}", reg.provider_name,
                                     saved.error().message);
            }
        }
    }

    auto failures = manager_->refresh_providers();
    if (failures.is_err()) {
        logger_adapter::error("Cannot load providers: {}", failures.error().message);
        return false;
    }
    if (failures.value() > 0) {
        logger_adapter::warn("{} provider(s) could not be built", failures.value());
    }

    logger_adapter::info("{} provider(s) available", registry_->list().size());
    return true;
}

bool worker_app::create_configured_job() {
    const auto& settings = *config_.create_job;

    migration::create_job_request request;
    request.job_name = settings.name;
    request.source_provider = settings.source_provider;
    request.dest_provider = settings.dest_provider;
    request.strategy = settings.strategy;
    request.filter_prefix = settings.filter_prefix;
    request.document_ids = settings.document_ids;
    request.concurrency = settings.concurrency;
    request.batch_size = settings.batch_size;
    request.max_attempts = settings.max_attempts;
    request.dry_run = settings.dry_run;
    request.created_by = config_.workers.id_prefix;

    auto job = manager_->create_job(request);
    if (job.is_err()) {
        std::cerr << "Failed to create job: " << job.error().message << "\n";
        return false;
    }

    auto started = manager_->start_job(job.value().job_id);
    if (started.is_err()) {
        std::cerr << "Failed to start job: " << started.error().message << "\n";
        return false;
    }

    std::cout << "Created job " << job.value().job_id << " with "
              << job.value().total_documents << " document(s)\n";
    return true;
}

int worker_app::print_status() const {
    auto jobs = manager_->list_jobs();
    if (jobs.is_err()) {
        std::cerr << "Failed to list jobs: " << jobs.error().message << "\n";
        return exit_runtime_error;
    }

    if (jobs.value().empty()) {
        std::cout << "No jobs\n";
        return exit_ok;
    }

    std::cout << std::left << std::setw(38) << "JOB ID" << std::setw(20) << "NAME"
              << std::setw(11) << "STATUS" << std::right << std::setw(8) << "TOTAL"
              << std::setw(9) << "MIGRATED" << std::setw(8) << "FAILED" << std::setw(8)
              << "SKIPPED" << std::setw(8) << "PCT" << "  CREATED\n";

    for (const auto& job : jobs.value()) {
        auto progress = manager_->get_progress(job.job_id);
        const double percent = progress.is_ok() ? progress.value().percent : 0.0;

        std::cout << std::left << std::setw(38) << job.job_id << std::setw(20)
                  << job.job_name.substr(0, 19) << std::setw(11) << to_string(job.status)
                  << std::right << std::setw(8) << job.total_documents << std::setw(9)
                  << job.migrated_documents << std::setw(8) << job.failed_documents
                  << std::setw(8) << job.skipped_documents << std::setw(7) << std::fixed
                  << std::setprecision(1) << percent << "%  " << format_time(job.created_at)
                  << "\n";
        if (!job.error_message.empty()) {
            std::cout << "    " << job.error_message << "\n";
        }
    }
    return exit_ok;
}

int worker_app::run_workers() {
    migration::worker_pool_config pool_config;
    pool_config.database_path = config_.database.path.string();
    pool_config.database.busy_timeout = config_.database.busy_timeout;
    pool_config.worker_count = config_.workers.count;
    pool_config.poll_interval = config_.workers.poll_interval;
    pool_config.lease_timeout = config_.workers.lease_timeout;
    pool_config.worker_id_prefix = config_.workers.id_prefix;

    workers_ = std::make_unique<migration::worker_pool>(
        pool_config, registry_, nullptr, std::make_shared<di::LoggerService>());

    auto started = workers_->start();
    if (started.is_err()) {
        std::cerr << "Failed to start workers: " << started.error().message << "\n";
        return exit_runtime_error;
    }

    logger_adapter::info("{} worker(s) running on {}", pool_config.worker_count,
                         pool_config.database_path);

    while (!shutdown_requested_) {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
        if (config_.workers.exit_when_idle && is_idle()) {
            logger_adapter::info("No running jobs left, exiting");
            break;
        }
    }

    workers_->stop();
    return exit_ok;
}

bool worker_app::is_idle() const {
    migration::job_query query;
    query.status = migration::migration_job_status::running;
    query.limit = 1;

    auto running = manager_->list_jobs(query);
    if (running.is_err()) {
        logger_adapter::warn("Cannot check running jobs: {}", running.error().message);
        return false;
    }
    return running.value().empty();
}

}  // namespace docmig::example
