/**
 * @file progress_tracker.cpp
 * @brief Implementation of progress_tracker
 */

#include <docmig/migration/progress_tracker.hpp>

#include <docmig/compat/format.hpp>

namespace docmig::migration {

auto progress_tracker::compute(const migration_job& job,
                               const item_status_counts& counts,
                               time_point now) -> migration_progress {
    migration_progress progress;
    progress.job_id = job.job_id;
    progress.status = job.status;
    progress.total = counts.total();
    progress.migrated = counts.completed;
    progress.failed = counts.failed;
    progress.skipped = counts.skipped;
    progress.pending = counts.pending;
    progress.in_progress = counts.in_progress;

    const auto processed = counts.completed + counts.failed + counts.skipped;
    if (progress.total > 0) {
        progress.percent = static_cast<double>(processed) * 100.0 /
                           static_cast<double>(progress.total);
    }

    if (job.started_at) {
        auto end = job.completed_at.value_or(now);
        if (end > *job.started_at) {
            progress.elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                end - *job.started_at);
        }
    }

    auto elapsed_seconds = progress.elapsed.count();
    if (elapsed_seconds > 0) {
        progress.rate = static_cast<double>(processed) /
                        static_cast<double>(elapsed_seconds);
    }

    const auto remaining = counts.outstanding();
    if (remaining == 0) {
        progress.eta_seconds = 0.0;
    } else if (progress.rate > 0.0) {
        progress.eta_seconds = static_cast<double>(remaining) / progress.rate;
    }

    return progress;
}

auto progress_tracker::settled_status(const migration_job& job,
                                      const item_status_counts& counts)
    -> std::optional<migration_job_status> {
    if (counts.outstanding() > 0) {
        return std::nullopt;
    }

    if (job.cancel_requested) {
        if (job.status == migration_job_status::cancelled) {
            return std::nullopt;
        }
        return migration_job_status::cancelled;
    }

    if (job.status != migration_job_status::running) {
        return std::nullopt;
    }

    if (job.failed_documents == 0) {
        return migration_job_status::completed;
    }
    if (job.migrated_documents + job.skipped_documents == 0) {
        return migration_job_status::failed;
    }
    return migration_job_status::partial;
}

auto progress_tracker::check_invariants(const migration_job& job,
                                        const item_status_counts& counts)
    -> VoidResult {
    if (job.total_documents != counts.total()) {
        return docmig_void_error(
            error_codes::invariant_violation,
            docmig::compat::format("Job {}: total {} != sum of item states {}",
                                   job.job_id, job.total_documents, counts.total()));
    }

    if (job.migrated_documents != counts.completed) {
        return docmig_void_error(
            error_codes::invariant_violation,
            docmig::compat::format("Job {}: migrated {} != completed items {}",
                                   job.job_id, job.migrated_documents,
                                   counts.completed));
    }

    if (job.failed_documents != counts.failed) {
        return docmig_void_error(
            error_codes::invariant_violation,
            docmig::compat::format("Job {}: failed {} != failed items {}",
                                   job.job_id, job.failed_documents, counts.failed));
    }

    if (job.skipped_documents != counts.skipped) {
        return docmig_void_error(
            error_codes::invariant_violation,
            docmig::compat::format("Job {}: skipped {} != skipped items {}",
                                   job.job_id, job.skipped_documents, counts.skipped));
    }

    if (is_terminal_status(job.status) && counts.outstanding() > 0) {
        return docmig_void_error(
            error_codes::invariant_violation,
            docmig::compat::format("Job {} is {} with {} outstanding items",
                                   job.job_id, to_string(job.status),
                                   counts.outstanding()));
    }

    return ok();
}

}  // namespace docmig::migration
