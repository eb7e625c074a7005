/**
 * @file progress_tracker.hpp
 * @brief Progress computation, settlement rule and invariant checks
 *
 * All functions are pure: they look only at a job row and the per-status
 * item counts, so the repositories, the manager and tests share one
 * definition of "settled" and "consistent".
 */

#pragma once

#include <docmig/core/result.hpp>
#include <docmig/migration/migration_types.hpp>

#include <optional>

namespace docmig::migration {

class progress_tracker {
public:
    /**
     * @brief Build the progress view of a job
     *
     * Counts come from the items, not from the job counters. Rate is
     * processed documents per elapsed second since started_at (until
     * completed_at for terminal jobs).
     */
    [[nodiscard]] static auto compute(const migration_job& job,
                                      const item_status_counts& counts,
                                      time_point now) -> migration_progress;

    /**
     * @brief Status a job should settle to, if any
     *
     * Returns std::nullopt while items are outstanding or when the job is
     * not in a settleable state. A job with cancel_requested settles to
     * cancelled; a running job settles to completed, failed or partial.
     */
    [[nodiscard]] static auto settled_status(const migration_job& job,
                                             const item_status_counts& counts)
        -> std::optional<migration_job_status>;

    /**
     * @brief Verify counter and status invariants
     *
     * - total_documents equals the sum of item states
     * - migrated_documents equals the completed count
     * - failed and skipped counters match their item counts
     * - a terminal job has no pending or in_progress item
     *
     * @return invariant_violation describing the first broken rule
     */
    [[nodiscard]] static auto check_invariants(const migration_job& job,
                                               const item_status_counts& counts)
        -> VoidResult;
};

}  // namespace docmig::migration
