/**
 * @file worker_app.hpp
 * @brief Migration worker application class
 *
 * Wires the provider registry, migration_manager and worker_pool together
 * on one SQLite database.
 */

#ifndef DOCMIG_EXAMPLE_MIGRATION_WORKER_WORKER_APP_HPP
#define DOCMIG_EXAMPLE_MIGRATION_WORKER_WORKER_APP_HPP

#include "config.hpp"

#include <docmig/migration/migration_manager.hpp>
#include <docmig/migration/worker_pool.hpp>
#include <docmig/storage/provider_registry.hpp>

#include <atomic>
#include <memory>

namespace docmig::example {

/**
 * @brief Migration worker application
 *
 * ```
 * +------------------------------------------+
 * |               worker_app                 |
 * +------------------------------------------+
 * |  migration_manager      worker_pool      |
 * |        |                 |  |  |         |
 * |        +----- SQLite ----+--+--+         |
 * |        |                                 |
 * |  provider_registry (local, object, ...)  |
 * +------------------------------------------+
 * ```
 *
 * @example Usage
 * @code
 * worker_app app{config};
 * if (!app.initialize()) {
 *     return 1;
 * }
 * return app.run();
 * @endcode
 */
class worker_app {
public:
    explicit worker_app(const migration_worker_config& config);

    /**
     * @brief Destructor - stops the workers and the logger
     */
    ~worker_app();

    worker_app(const worker_app&) = delete;
    worker_app& operator=(const worker_app&) = delete;
    worker_app(worker_app&&) = delete;
    worker_app& operator=(worker_app&&) = delete;

    /**
     * @brief Start logging, open the database and load providers
     * @return true on success
     */
    bool initialize();

    /**
     * @brief Execute the configured mode
     * @return Process exit code
     */
    int run();

    /**
     * @brief Ask run() to return; safe to call from a signal handler
     */
    void request_shutdown() noexcept;

    void print_statistics() const;

private:
    bool setup_providers();
    bool create_configured_job();
    int print_status() const;
    int run_workers();

    /// No job is running
    bool is_idle() const;

    migration_worker_config config_;
    std::shared_ptr<storage::provider_registry> registry_;
    std::unique_ptr<migration::migration_manager> manager_;
    std::unique_ptr<migration::worker_pool> workers_;
    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace docmig::example

#endif  // DOCMIG_EXAMPLE_MIGRATION_WORKER_WORKER_APP_HPP
