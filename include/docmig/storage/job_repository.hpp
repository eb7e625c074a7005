/**
 * @file job_repository.hpp
 * @brief Persistence of migration jobs
 *
 * Counter changes are single-row "counter = counter + delta" updates so that
 * concurrent executors never lose increments.
 */

#pragma once

#include <docmig/core/result.hpp>
#include <docmig/migration/migration_types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace docmig::storage {

/**
 * @brief Counter deltas applied to one job row
 */
struct job_counter_delta {
    std::int64_t total{0};
    std::int64_t migrated{0};
    std::int64_t failed{0};
    std::int64_t skipped{0};
};

/**
 * @brief Repository for migration_jobs
 *
 * Thread Safety: NOT thread-safe; bound to one connection.
 */
class job_repository {
public:
    explicit job_repository(sqlite3* db);
    ~job_repository() = default;

    job_repository(const job_repository&) = delete;
    auto operator=(const job_repository&) -> job_repository& = delete;
    job_repository(job_repository&&) noexcept = default;
    auto operator=(job_repository&&) noexcept -> job_repository& = default;

    [[nodiscard]] auto insert(const migration::migration_job& job) -> VoidResult;

    /**
     * @brief Find a job by id
     * @return job_not_found when absent
     */
    [[nodiscard]] auto find_by_id(std::string_view job_id) const
        -> Result<migration::migration_job>;

    /**
     * @brief List jobs, newest first
     */
    [[nodiscard]] auto find_jobs(const migration::job_query& query) const
        -> Result<std::vector<migration::migration_job>>;

    /**
     * @brief Conditionally change the status
     *
     * Moving to running stamps started_at (first time only) and clears
     * completed_at; moving to a terminal status stamps completed_at.
     *
     * @param from Statuses the job must currently have
     * @return true if the row changed
     */
    [[nodiscard]] auto transition(std::string_view job_id,
                                  const std::vector<migration::migration_job_status>& from,
                                  migration::migration_job_status to,
                                  const std::optional<std::string>& error_message = std::nullopt)
        -> Result<bool>;

    /**
     * @brief Atomically add deltas to the counters
     */
    [[nodiscard]] auto add_counts(std::string_view job_id,
                                  const job_counter_delta& delta) -> VoidResult;

    /**
     * @brief Raise cancel_requested on a non-terminal job
     * @return true if the flag was raised by this call
     */
    [[nodiscard]] auto set_cancel_requested(std::string_view job_id) -> Result<bool>;

    /**
     * @brief Settle the job when it has no outstanding items
     *
     * @param counts Item counts read in the same transaction
     * @return The new status, or std::nullopt if the job stays as it is
     */
    [[nodiscard]] auto settle_if_drained(std::string_view job_id,
                                         const migration::item_status_counts& counts)
        -> Result<std::optional<migration::migration_job_status>>;

private:
    [[nodiscard]] static auto parse_row(sqlite3_stmt* stmt) -> migration::migration_job;

    sqlite3* db_{nullptr};
};

}  // namespace docmig::storage
