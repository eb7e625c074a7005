/**
 * @file worker_pool.cpp
 * @brief Implementation of worker_pool
 */

#include <docmig/migration/worker_pool.hpp>

#include <docmig/integration/thread_pool_adapter.hpp>
#include <docmig/migration/task_executor.hpp>
#include <docmig/storage/provider_registry.hpp>

#include <exception>

namespace docmig::migration {

worker_pool::worker_pool(const worker_pool_config& config,
                         std::shared_ptr<storage::provider_registry> registry,
                         std::shared_ptr<integration::thread_pool_interface> thread_pool,
                         std::shared_ptr<di::ILogger> logger)
    : config_(config),
      registry_(std::move(registry)),
      thread_pool_(std::move(thread_pool)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

worker_pool::~worker_pool() {
    stop(true);
    join_workers();
}

// =============================================================================
// Lifecycle Management
// =============================================================================

auto worker_pool::start() -> VoidResult {
    // Loops left behind by stop(false) must exit before new ones start
    join_workers();

    std::lock_guard lock(mutex_);

    if (running_.load()) {
        return docmig_void_error(error_codes::worker_already_running,
                                 "Worker pool is already running");
    }
    if (config_.worker_count == 0) {
        return docmig_void_error(error_codes::invalid_configuration,
                                 "worker_count must be at least 1");
    }

    std::vector<std::shared_ptr<task_executor>> executors;
    executors.reserve(config_.worker_count);
    for (std::size_t i = 1; i <= config_.worker_count; ++i) {
        auto executor = make_executor(config_.worker_id_prefix + "-" + std::to_string(i));
        if (executor.is_err()) {
            return docmig_void_error(error_codes::worker_start_failed,
                                     "Failed to open worker connection",
                                     executor.error().message);
        }
        executors.push_back(executor.value());
    }

    if (!thread_pool_) {
        integration::thread_pool_config pool_config;
        pool_config.min_threads = config_.worker_count;
        pool_config.max_threads = config_.worker_count;
        pool_config.pool_name = config_.worker_id_prefix + "_pool";
        thread_pool_ = std::make_shared<integration::thread_pool_adapter>(pool_config);
        owns_thread_pool_ = true;
    }
    if (!thread_pool_->start()) {
        return docmig_void_error(error_codes::worker_start_failed,
                                 "Thread pool failed to start");
    }

    stop_requested_.store(false);
    executors_ = std::move(executors);

    try {
        for (const auto& executor : executors_) {
            futures_.push_back(thread_pool_->submit([this, executor]() { run_loop(executor); }));
        }
    } catch (const std::exception& e) {
        stop_requested_.store(true);
        cv_.notify_all();
        logger_->error_fmt("Failed to submit worker loop: {}", e.what());
        return docmig_void_error(error_codes::worker_start_failed,
                                 "Failed to submit worker loop", e.what());
    }

    running_.store(true);
    logger_->info_fmt("Started {} migration workers (poll {}ms, lease {}ms)",
                      executors_.size(), config_.poll_interval.count(),
                      config_.lease_timeout.count());
    return ok();
}

void worker_pool::stop(bool wait_for_completion) {
    {
        std::lock_guard lock(mutex_);

        if (!running_.load()) {
            return;
        }

        stop_requested_.store(true);
        ++wake_generation_;
    }

    cv_.notify_all();

    if (wait_for_completion) {
        join_workers();
    }

    running_.store(false);
    logger_->info("Migration workers stopped");
}

auto worker_pool::is_running() const noexcept -> bool {
    return running_.load();
}

void worker_pool::wake() {
    {
        std::lock_guard lock(mutex_);
        ++wake_generation_;
    }
    cv_.notify_all();
}

void worker_pool::join_workers() {
    std::vector<std::future<void>> futures;
    {
        std::lock_guard lock(mutex_);
        futures.swap(futures_);
    }

    for (auto& future : futures) {
        if (!future.valid()) {
            continue;
        }
        try {
            future.get();
        } catch (const std::exception& e) {
            errors_.fetch_add(1);
            logger_->error_fmt("Worker loop terminated with exception: {}", e.what());
        }
    }

    std::lock_guard lock(mutex_);
    executors_.clear();
    if (owns_thread_pool_ && thread_pool_ && futures_.empty()) {
        thread_pool_->shutdown(true);
        thread_pool_.reset();
        owns_thread_pool_ = false;
    }
}

// =============================================================================
// Manual Operations
// =============================================================================

auto worker_pool::run_once() -> Result<std::size_t> {
    std::lock_guard lock(sync_mutex_);

    if (!sync_executor_) {
        auto executor = make_executor(config_.worker_id_prefix + "-sync");
        if (executor.is_err()) {
            return forward_error<std::size_t>(executor.error());
        }
        sync_executor_ = executor.value();
    }
    return run_cycle(*sync_executor_, false);
}

auto worker_pool::stats() const -> worker_pool_stats {
    worker_pool_stats s;
    s.claimed = claimed_.load();
    s.completed = completed_.load();
    s.skipped = skipped_.load();
    s.retried = retried_.load();
    s.failed = failed_.load();
    s.stale = stale_.load();
    s.conflicts = conflicts_.load();
    s.released = released_.load();
    s.recovered = recovered_.load();
    s.errors = errors_.load();
    return s;
}

auto worker_pool::config() const noexcept -> const worker_pool_config& {
    return config_;
}

// =============================================================================
// Internal Methods
// =============================================================================

auto worker_pool::make_executor(const std::string& worker_id)
    -> Result<std::shared_ptr<task_executor>> {
    auto db = storage::migration_database::open(config_.database_path, config_.database);
    if (db.is_err()) {
        return forward_error<std::shared_ptr<task_executor>>(db.error());
    }

    task_executor_config executor_config;
    executor_config.retry = config_.retry;
    executor_config.lease_timeout = config_.lease_timeout;

    return std::make_shared<task_executor>(worker_id, std::move(db.value()), registry_,
                                           executor_config, logger_);
}

void worker_pool::run_loop(const std::shared_ptr<task_executor>& executor) {
    logger_->debug_fmt("Worker {} started", executor->worker_id());

    while (!stop_requested_.load()) {
        std::uint64_t seen = 0;
        {
            std::lock_guard lock(mutex_);
            seen = wake_generation_;
        }

        auto executed = run_cycle(*executor, true);
        if (executed.is_err()) {
            errors_.fetch_add(1);
            logger_->warn_fmt("Worker {} cycle failed: {}", executor->worker_id(),
                              executed.error().message);
        } else if (executed.value() > 0) {
            continue;
        }

        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, config_.poll_interval, [this, seen]() {
            return stop_requested_.load() || wake_generation_ != seen;
        });
    }

    logger_->debug_fmt("Worker {} stopped", executor->worker_id());
}

auto worker_pool::run_cycle(task_executor& executor, bool honour_stop)
    -> Result<std::size_t> {
    auto recovered = executor.recover_expired_claims();
    if (recovered.is_err()) {
        logger_->warn_fmt("Worker {} could not scan expired claims: {}",
                          executor.worker_id(), recovered.error().message);
    } else {
        recovered_.fetch_add(recovered.value());
    }

    auto claimed = executor.claim();
    if (claimed.is_err()) {
        if (claimed.error().code == error_codes::claim_conflict) {
            conflicts_.fetch_add(1);
            return std::size_t{0};
        }
        return forward_error<std::size_t>(claimed.error());
    }

    auto& entries = claimed.value();
    claimed_.fetch_add(entries.size());

    std::size_t executed = 0;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (honour_stop && stop_requested_.load()) {
            std::vector<outbox_entry> unstarted(entries.begin() + static_cast<std::ptrdiff_t>(i),
                                                entries.end());
            auto released = executor.release(unstarted);
            if (released.is_err()) {
                errors_.fetch_add(1);
                logger_->warn_fmt("Worker {} failed to release {} claims: {}",
                                  executor.worker_id(), unstarted.size(),
                                  released.error().message);
            } else {
                released_.fetch_add(released.value());
            }
            break;
        }

        auto outcome = executor.execute(entries[i]);
        ++executed;
        if (outcome.is_err()) {
            errors_.fetch_add(1);
            logger_->error_fmt("Worker {} could not record outbox entry {}: {}",
                               executor.worker_id(), entries[i].outbox_id,
                               outcome.error().message);
            continue;
        }

        switch (outcome.value()) {
            case task_outcome::completed: completed_.fetch_add(1); break;
            case task_outcome::skipped: skipped_.fetch_add(1); break;
            case task_outcome::retry_scheduled: retried_.fetch_add(1); break;
            case task_outcome::failed: failed_.fetch_add(1); break;
            case task_outcome::stale: stale_.fetch_add(1); break;
        }
    }
    return executed;
}

}  // namespace docmig::migration
