/**
 * @file job_repository.cpp
 * @brief Implementation of the migration job repository
 */

#include <docmig/storage/job_repository.hpp>

#include <docmig/migration/progress_tracker.hpp>

#include "sqlite_helpers.hpp"

#include <sstream>

namespace docmig::storage {

using namespace detail;
using migration::migration_job;
using migration::migration_job_status;

namespace {

constexpr const char* kSelectColumns = R"(
    SELECT job_id, job_name, source_provider, dest_provider, strategy, status,
           filter_prefix, total_documents, migrated_documents, failed_documents,
           skipped_documents, concurrency, batch_size, max_attempts, dry_run,
           cancel_requested, created_by, error_message,
           created_at, started_at, completed_at, updated_at
    FROM migration_jobs
)";

}  // namespace

// =============================================================================
// Construction
// =============================================================================

job_repository::job_repository(sqlite3* db) : db_(db) {}

// =============================================================================
// CRUD Operations
// =============================================================================

auto job_repository::insert(const migration_job& job) -> VoidResult {
    static constexpr const char* sql = R"(
        INSERT INTO migration_jobs (
            job_id, job_name, source_provider, dest_provider, strategy, status,
            filter_prefix, total_documents, migrated_documents, failed_documents,
            skipped_documents, concurrency, batch_size, max_attempts, dry_run,
            cancel_requested, created_by, error_message, created_at, updated_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return VoidResult(prepared.error());
    }
    auto* stmt = prepared.value().get();

    auto created_str = to_timestamp_string(job.created_at);

    int idx = 1;
    bind_text(stmt, idx++, job.job_id);
    bind_text(stmt, idx++, job.job_name);
    bind_text(stmt, idx++, job.source_provider);
    bind_text(stmt, idx++, job.dest_provider);
    sqlite3_bind_text(stmt, idx++, migration::to_string(job.strategy), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, idx++, migration::to_string(job.status), -1, SQLITE_STATIC);
    bind_optional_text(stmt, idx++, job.filter_prefix);
    sqlite3_bind_int64(stmt, idx++, job.total_documents);
    sqlite3_bind_int64(stmt, idx++, job.migrated_documents);
    sqlite3_bind_int64(stmt, idx++, job.failed_documents);
    sqlite3_bind_int64(stmt, idx++, job.skipped_documents);
    sqlite3_bind_int(stmt, idx++, job.concurrency);
    sqlite3_bind_int(stmt, idx++, job.batch_size);
    sqlite3_bind_int(stmt, idx++, job.max_attempts);
    sqlite3_bind_int(stmt, idx++, job.dry_run ? 1 : 0);
    sqlite3_bind_int(stmt, idx++, job.cancel_requested ? 1 : 0);
    bind_text(stmt, idx++, job.created_by);
    bind_text(stmt, idx++, job.error_message);
    bind_text(stmt, idx++, created_str);
    bind_text(stmt, idx++, created_str);

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        return VoidResult(step_error(db_, rc, "Failed to insert job"));
    }
    return ok();
}

auto job_repository::find_by_id(std::string_view job_id) const
    -> Result<migration_job> {
    std::string sql = std::string(kSelectColumns) + " WHERE job_id = ?";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<migration_job>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    bind_text(stmt, 1, job_id);

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return parse_row(stmt);
    }
    if (rc != SQLITE_DONE) {
        return Result<migration_job>(step_error(db_, rc, "Failed to read job"));
    }
    return docmig_error<migration_job>(error_codes::job_not_found,
                                       "Job not found: " + std::string(job_id));
}

auto job_repository::find_jobs(const migration::job_query& query) const
    -> Result<std::vector<migration_job>> {
    std::ostringstream sql;
    sql << kSelectColumns << " WHERE 1=1";

    if (query.status.has_value()) {
        sql << " AND status = ?";
    }
    if (query.created_by.has_value()) {
        sql << " AND created_by = ?";
    }
    sql << " ORDER BY created_at DESC, rowid DESC";
    sql << " LIMIT " << query.limit << " OFFSET " << query.offset;

    auto prepared = prepare(db_, sql.str());
    if (prepared.is_err()) {
        return forward_error<std::vector<migration_job>>(prepared.error());
    }
    auto* stmt = prepared.value().get();

    int idx = 1;
    if (query.status.has_value()) {
        sqlite3_bind_text(stmt, idx++, migration::to_string(*query.status), -1,
                          SQLITE_STATIC);
    }
    if (query.created_by.has_value()) {
        bind_text(stmt, idx++, *query.created_by);
    }

    std::vector<migration_job> result;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        result.push_back(parse_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<migration_job>>(
            step_error(db_, rc, "Failed to list jobs"));
    }
    return result;
}

// =============================================================================
// State Changes
// =============================================================================

auto job_repository::transition(std::string_view job_id,
                                const std::vector<migration_job_status>& from,
                                migration_job_status to,
                                const std::optional<std::string>& error_message)
    -> Result<bool> {
    if (from.empty()) {
        return false;
    }

    std::ostringstream sql;
    sql << "UPDATE migration_jobs SET status = ?, updated_at = ?";
    if (to == migration_job_status::running) {
        sql << ", started_at = COALESCE(started_at, ?), completed_at = NULL";
    } else if (migration::is_terminal_status(to)) {
        sql << ", completed_at = ?";
    }
    if (error_message.has_value()) {
        sql << ", error_message = ?";
    }
    sql << " WHERE job_id = ? AND status IN (";
    for (std::size_t i = 0; i < from.size(); ++i) {
        sql << (i == 0 ? "?" : ", ?");
    }
    sql << ")";

    auto prepared = prepare(db_, sql.str());
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();

    auto now_str = to_timestamp_string(std::chrono::system_clock::now());

    int idx = 1;
    sqlite3_bind_text(stmt, idx++, migration::to_string(to), -1, SQLITE_STATIC);
    bind_text(stmt, idx++, now_str);
    if (to == migration_job_status::running || migration::is_terminal_status(to)) {
        bind_text(stmt, idx++, now_str);
    }
    if (error_message.has_value()) {
        bind_text(stmt, idx++, *error_message);
    }
    bind_text(stmt, idx++, job_id);
    for (auto status : from) {
        sqlite3_bind_text(stmt, idx++, migration::to_string(status), -1, SQLITE_STATIC);
    }

    auto changed = execute_update(db_, stmt, "Failed to update job status");
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto job_repository::add_counts(std::string_view job_id,
                                const job_counter_delta& delta) -> VoidResult {
    static constexpr const char* sql = R"(
        UPDATE migration_jobs SET
            total_documents = total_documents + ?,
            migrated_documents = migrated_documents + ?,
            failed_documents = failed_documents + ?,
            skipped_documents = skipped_documents + ?,
            updated_at = ?
        WHERE job_id = ?
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return VoidResult(prepared.error());
    }
    auto* stmt = prepared.value().get();

    auto now_str = to_timestamp_string(std::chrono::system_clock::now());

    int idx = 1;
    sqlite3_bind_int64(stmt, idx++, delta.total);
    sqlite3_bind_int64(stmt, idx++, delta.migrated);
    sqlite3_bind_int64(stmt, idx++, delta.failed);
    sqlite3_bind_int64(stmt, idx++, delta.skipped);
    bind_text(stmt, idx++, now_str);
    bind_text(stmt, idx++, job_id);

    auto changed = execute_update(db_, stmt, "Failed to update job counters");
    if (changed.is_err()) {
        return VoidResult(changed.error());
    }
    if (changed.value() == 0) {
        return docmig_void_error(error_codes::job_not_found,
                                 "Job not found: " + std::string(job_id));
    }
    return ok();
}

auto job_repository::set_cancel_requested(std::string_view job_id) -> Result<bool> {
    static constexpr const char* sql = R"(
        UPDATE migration_jobs SET cancel_requested = 1, updated_at = ?
        WHERE job_id = ? AND cancel_requested = 0
          AND status IN ('pending', 'running', 'paused')
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();

    auto now_str = to_timestamp_string(std::chrono::system_clock::now());
    bind_text(stmt, 1, now_str);
    bind_text(stmt, 2, job_id);

    auto changed = execute_update(db_, stmt, "Failed to request cancellation");
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto job_repository::settle_if_drained(std::string_view job_id,
                                       const migration::item_status_counts& counts)
    -> Result<std::optional<migration_job_status>> {
    using settle_result = std::optional<migration_job_status>;

    auto job = find_by_id(job_id);
    if (job.is_err()) {
        return forward_error<settle_result>(job.error());
    }

    auto target = migration::progress_tracker::settled_status(job.value(), counts);
    if (!target.has_value()) {
        return settle_result{};
    }

    auto changed = transition(job_id, {job.value().status}, *target);
    if (changed.is_err()) {
        return forward_error<settle_result>(changed.error());
    }
    if (!changed.value()) {
        return settle_result{};
    }
    return target;
}

// =============================================================================
// Row Mapping
// =============================================================================

auto job_repository::parse_row(sqlite3_stmt* stmt) -> migration_job {
    migration_job job;

    int col = 0;
    job.job_id = get_text_column(stmt, col++);
    job.job_name = get_text_column(stmt, col++);
    job.source_provider = get_text_column(stmt, col++);
    job.dest_provider = get_text_column(stmt, col++);
    job.strategy = migration::migration_strategy_from_string(get_text_column(stmt, col++))
                       .value_or(migration::migration_strategy::copy);
    job.status = migration::job_status_from_string(get_text_column(stmt, col++));
    job.filter_prefix = get_optional_text(stmt, col++);
    job.total_documents = get_int64_column(stmt, col++);
    job.migrated_documents = get_int64_column(stmt, col++);
    job.failed_documents = get_int64_column(stmt, col++);
    job.skipped_documents = get_int64_column(stmt, col++);
    job.concurrency = get_int_column(stmt, col++, 5);
    job.batch_size = get_int_column(stmt, col++, 100);
    job.max_attempts = get_int_column(stmt, col++, 3);
    job.dry_run = get_int_column(stmt, col++) != 0;
    job.cancel_requested = get_int_column(stmt, col++) != 0;
    job.created_by = get_text_column(stmt, col++);
    job.error_message = get_text_column(stmt, col++);

    auto created_str = get_text_column(stmt, col++);
    job.created_at = from_timestamp_string(created_str.c_str());
    job.started_at = get_optional_timestamp(stmt, col++);
    job.completed_at = get_optional_timestamp(stmt, col++);
    auto updated_str = get_text_column(stmt, col++);
    job.updated_at = from_timestamp_string(updated_str.c_str());

    return job;
}

}  // namespace docmig::storage
