/**
 * @file worker_pool.hpp
 * @brief Pool of migration workers draining the outbox
 *
 * Each worker runs a claim/execute loop on the thread pool with its own
 * task_executor and database connection. Idle workers sleep for the poll
 * interval or until wake() is called.
 */

#pragma once

#include <docmig/core/result.hpp>
#include <docmig/di/ilogger.hpp>
#include <docmig/migration/retry_policy.hpp>
#include <docmig/storage/migration_database.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace docmig::integration {
class thread_pool_interface;
}  // namespace docmig::integration

namespace docmig::storage {
class provider_registry;
}  // namespace docmig::storage

namespace docmig::migration {

class task_executor;

// =============================================================================
// Configuration
// =============================================================================

struct worker_pool_config {
    /// SQLite file shared with the migration_manager
    std::string database_path;

    storage::database_config database;

    /// Number of concurrent worker loops
    std::size_t worker_count{5};

    /// Sleep between claim attempts when no work was found
    std::chrono::milliseconds poll_interval{std::chrono::seconds{5}};

    /// Age at which an in-flight claim is considered abandoned
    std::chrono::milliseconds lease_timeout{std::chrono::minutes{10}};

    retry_policy retry;

    /// Worker ids are "<prefix>-<n>"
    std::string worker_id_prefix{"docmig-worker"};
};

/**
 * @brief Counters accumulated since construction
 */
struct worker_pool_stats {
    std::uint64_t claimed{0};
    std::uint64_t completed{0};
    std::uint64_t skipped{0};
    std::uint64_t retried{0};
    std::uint64_t failed{0};
    std::uint64_t stale{0};
    std::uint64_t conflicts{0};    ///< Claim attempts that lost the write lock
    std::uint64_t released{0};     ///< Unstarted claims handed back on stop
    std::uint64_t recovered{0};    ///< Expired leases turned into failed attempts
    std::uint64_t errors{0};
};

// =============================================================================
// Worker Pool
// =============================================================================

/**
 * @brief Runs migration workers until stopped
 *
 * Thread Safety: All public methods are thread-safe.
 *
 * @example
 * @code
 * worker_pool_config config;
 * config.database_path = "docmig.db";
 * config.worker_count = 4;
 *
 * worker_pool workers(config, registry);
 * (void)workers.start();
 * // ...
 * workers.stop();
 * @endcode
 */
class worker_pool {
public:
    /**
     * @param thread_pool Pool for the worker loops; a thread_pool_adapter
     *        with worker_count threads is created when null
     */
    worker_pool(const worker_pool_config& config,
                std::shared_ptr<storage::provider_registry> registry,
                std::shared_ptr<integration::thread_pool_interface> thread_pool = nullptr,
                std::shared_ptr<di::ILogger> logger = nullptr);

    /// Stops and waits for the workers
    ~worker_pool();

    worker_pool(const worker_pool&) = delete;
    auto operator=(const worker_pool&) -> worker_pool& = delete;

    /**
     * @brief Open one connection per worker and start the loops
     * @return worker_already_running, or worker_start_failed when a
     *         connection cannot be opened
     */
    [[nodiscard]] auto start() -> VoidResult;

    /**
     * @brief Stop the workers
     *
     * Each worker finishes the entry it is executing and hands its other
     * claims back.
     *
     * @param wait_for_completion Block until every loop has exited
     */
    void stop(bool wait_for_completion = true);

    [[nodiscard]] auto is_running() const noexcept -> bool;

    /// Wake idle workers without waiting for the poll interval
    void wake();

    /**
     * @brief Run one claim/execute cycle on the calling thread
     *
     * Uses a dedicated executor; works whether or not the pool is running.
     *
     * @return Number of entries executed
     */
    [[nodiscard]] auto run_once() -> Result<std::size_t>;

    [[nodiscard]] auto stats() const -> worker_pool_stats;

    [[nodiscard]] auto config() const noexcept -> const worker_pool_config&;

private:
    [[nodiscard]] auto make_executor(const std::string& worker_id)
        -> Result<std::shared_ptr<task_executor>>;

    void run_loop(const std::shared_ptr<task_executor>& executor);

    /**
     * @brief One recovery, claim and execute pass
     * @param honour_stop Release the remaining claims once stop is requested
     */
    [[nodiscard]] auto run_cycle(task_executor& executor, bool honour_stop)
        -> Result<std::size_t>;

    void join_workers();

    worker_pool_config config_;
    std::shared_ptr<storage::provider_registry> registry_;
    std::shared_ptr<integration::thread_pool_interface> thread_pool_;
    bool owns_thread_pool_{false};
    std::shared_ptr<di::ILogger> logger_;

    /// Guards executors_, futures_ and wake_generation_
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::uint64_t wake_generation_{0};

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};

    std::vector<std::shared_ptr<task_executor>> executors_;
    std::vector<std::future<void>> futures_;

    std::mutex sync_mutex_;
    std::shared_ptr<task_executor> sync_executor_;

    std::atomic<std::uint64_t> claimed_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> skipped_{0};
    std::atomic<std::uint64_t> retried_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> stale_{0};
    std::atomic<std::uint64_t> conflicts_{0};
    std::atomic<std::uint64_t> released_{0};
    std::atomic<std::uint64_t> recovered_{0};
    std::atomic<std::uint64_t> errors_{0};
};

}  // namespace docmig::migration
