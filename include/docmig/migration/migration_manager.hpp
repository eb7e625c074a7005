/**
 * @file migration_manager.hpp
 * @brief Job lifecycle management for document migrations
 *
 * This file provides the migration_manager class, the single writer of
 * job-level lifecycle state. Job, item and outbox rows are written in one
 * transaction so that work recorded in the outbox always matches the items
 * it describes.
 */

#pragma once

#include <docmig/core/result.hpp>
#include <docmig/di/ilogger.hpp>
#include <docmig/migration/migration_types.hpp>
#include <docmig/storage/provider_registration.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docmig::storage {
class migration_database;
class provider_registry;
}  // namespace docmig::storage

namespace docmig::migration {

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Defaults and limits applied to create_job requests
 */
struct migration_manager_config {
    int default_concurrency{5};      ///< Used when the request leaves it unset
    int default_batch_size{100};
    int default_max_attempts{3};
    int max_concurrency{100};        ///< Upper bound accepted from requests
    int max_batch_size{1000};
};

// =============================================================================
// Migration Manager
// =============================================================================

/**
 * @brief Creates jobs, enqueues documents and drives job lifecycle
 *
 * Lifecycle:
 * @code
 *   pending --start--> running --(drained)--> completed | failed | partial
 *                       |   ^
 *                 pause |   | resume
 *                       v   |
 *                      paused
 *
 *   pending | running | paused --cancel--> cancelled (once drained)
 *   partial | failed --retry_failed_items--> running
 * @endcode
 *
 * Thread Safety: All public methods are thread-safe; calls are serialized
 * on the manager's own database connection.
 *
 * @example
 * @code
 * auto db = storage::migration_database::open("docmig.db");
 * migration_manager manager(std::move(db.value()), registry);
 *
 * create_job_request request;
 * request.job_name = "archive reports";
 * request.source_provider = "workspace";
 * request.dest_provider = "archive";
 * request.filter_prefix = "reports/";
 *
 * auto job = manager.create_job(request);
 * (void)manager.start_job(job.value().job_id);
 * @endcode
 */
class migration_manager {
public:
    migration_manager(std::unique_ptr<storage::migration_database> db,
                      std::shared_ptr<storage::provider_registry> registry,
                      const migration_manager_config& config = {},
                      std::shared_ptr<di::ILogger> logger = nullptr);

    ~migration_manager();

    migration_manager(const migration_manager&) = delete;
    auto operator=(const migration_manager&) -> migration_manager& = delete;
    migration_manager(migration_manager&&) = delete;
    auto operator=(migration_manager&&) -> migration_manager& = delete;

    // =========================================================================
    // Job Creation
    // =========================================================================

    /**
     * @brief Validate a request and create a pending job
     *
     * With a filter prefix or explicit ids the documents are read and
     * hashed first; job, items and outbox entries are then written in one
     * transaction.
     *
     * @return The created job, or invalid_configuration, provider_not_found,
     *         provider_disabled, provider_unwritable, transfer_error
     */
    [[nodiscard]] auto create_job(const create_job_request& request)
        -> Result<migration_job>;

    /**
     * @brief Enqueue documents into an existing job
     *
     * Re-enqueueing identical content is a no-op. Changed content supersedes
     * a still-pending item for the same document.
     *
     * @return Number of newly queued documents
     */
    [[nodiscard]] auto queue_documents(std::string_view job_id,
                                       const std::vector<std::string>& document_ids)
        -> Result<std::size_t>;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// pending -> running
    [[nodiscard]] auto start_job(std::string_view job_id) -> VoidResult;

    /// running -> paused; in-flight claims still finish
    [[nodiscard]] auto pause_job(std::string_view job_id) -> VoidResult;

    /// paused -> running
    [[nodiscard]] auto resume_job(std::string_view job_id) -> VoidResult;

    /**
     * @brief Cancel a pending, running or paused job
     *
     * Pending items become skipped. The job settles to cancelled once the
     * last in-flight claim finishes.
     */
    [[nodiscard]] auto cancel_job(std::string_view job_id) -> VoidResult;

    /**
     * @brief Re-queue the failed items of a failed or partial job
     * @return Number of items re-queued
     */
    [[nodiscard]] auto retry_failed_items(std::string_view job_id)
        -> Result<std::size_t>;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] auto get_job(std::string_view job_id) const -> Result<migration_job>;

    [[nodiscard]] auto get_progress(std::string_view job_id) const
        -> Result<migration_progress>;

    [[nodiscard]] auto list_jobs(const job_query& query = {}) const
        -> Result<std::vector<migration_job>>;

    [[nodiscard]] auto list_items(std::string_view job_id,
                                  const item_query& query = {}) const
        -> Result<std::vector<migration_item>>;

    [[nodiscard]] auto list_outbox(std::string_view job_id) const
        -> Result<std::vector<outbox_entry>>;

    /**
     * @brief Verify counters against item states
     * @return invariant_violation on the first inconsistency
     */
    [[nodiscard]] auto check_invariants(std::string_view job_id) const -> VoidResult;

    // =========================================================================
    // Providers
    // =========================================================================

    [[nodiscard]] auto list_providers() const
        -> std::vector<storage::provider_registration>;

    /**
     * @brief Persist a registration and build its adapter
     */
    [[nodiscard]] auto register_provider(const storage::provider_registration& registration)
        -> VoidResult;

    /**
     * @brief Change a provider's status and update the registry
     */
    [[nodiscard]] auto update_provider_status(std::string_view name,
                                              storage::provider_status status)
        -> VoidResult;

    /**
     * @brief Rebuild the registry from every persisted registration
     * @return Number of registrations that could not be built
     */
    [[nodiscard]] auto refresh_providers() -> Result<std::size_t>;

    [[nodiscard]] auto config() const noexcept -> const migration_manager_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace docmig::migration
