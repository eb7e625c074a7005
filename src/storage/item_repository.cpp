/**
 * @file item_repository.cpp
 * @brief Implementation of the migration item repository
 */

#include <docmig/storage/item_repository.hpp>

#include "sqlite_helpers.hpp"

#include <sstream>

namespace docmig::storage {

using namespace detail;
using migration::item_status;
using migration::migration_item;

namespace {

constexpr const char* kSelectColumns = R"(
    SELECT item_id, job_id, document_id, dest_document_id, source_provider,
           dest_provider, status, attempt_count, max_attempts, source_digest,
           dest_digest, content_match, content_size, error_message, duration_ms,
           created_at, started_at, completed_at
    FROM migration_items
)";

auto now_string() -> std::string {
    return to_timestamp_string(std::chrono::system_clock::now());
}

}  // namespace

item_repository::item_repository(sqlite3* db) : db_(db) {}

// =============================================================================
// Insert / Query
// =============================================================================

auto item_repository::insert(const migration_item& item) -> Result<std::int64_t> {
    static constexpr const char* sql = R"(
        INSERT INTO migration_items (
            job_id, document_id, dest_document_id, source_provider, dest_provider,
            status, attempt_count, max_attempts, source_digest, content_size,
            created_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<std::int64_t>(prepared.error());
    }
    auto* stmt = prepared.value().get();

    auto created_str = item.created_at == migration::time_point{}
                           ? now_string()
                           : to_timestamp_string(item.created_at);

    int idx = 1;
    bind_text(stmt, idx++, item.job_id);
    bind_text(stmt, idx++, item.document_id);
    bind_text(stmt, idx++, item.dest_document_id.empty() ? item.document_id
                                                         : item.dest_document_id);
    bind_text(stmt, idx++, item.source_provider);
    bind_text(stmt, idx++, item.dest_provider);
    sqlite3_bind_text(stmt, idx++, migration::to_string(item.status), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, idx++, item.attempt_count);
    sqlite3_bind_int(stmt, idx++, item.max_attempts);
    bind_text(stmt, idx++, item.source_digest);
    sqlite3_bind_int64(stmt, idx++, item.content_size);
    bind_text(stmt, idx++, created_str);

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        return Result<std::int64_t>(step_error(db_, rc, "Failed to insert item"));
    }
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

auto item_repository::find_by_id(std::int64_t item_id) const
    -> Result<migration_item> {
    std::string sql = std::string(kSelectColumns) + " WHERE item_id = ?";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<migration_item>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    sqlite3_bind_int64(stmt, 1, item_id);

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return parse_row(stmt);
    }
    if (rc != SQLITE_DONE) {
        return Result<migration_item>(step_error(db_, rc, "Failed to read item"));
    }
    return docmig_error<migration_item>(
        error_codes::item_not_found,
        "Migration item not found: " + std::to_string(item_id));
}

auto item_repository::find_by_job(std::string_view job_id,
                                  const migration::item_query& query) const
    -> Result<std::vector<migration_item>> {
    std::ostringstream sql;
    sql << kSelectColumns << " WHERE job_id = ?";
    if (query.status.has_value()) {
        sql << " AND status = ?";
    }
    sql << " ORDER BY item_id LIMIT " << query.limit << " OFFSET " << query.offset;

    auto prepared = prepare(db_, sql.str());
    if (prepared.is_err()) {
        return forward_error<std::vector<migration_item>>(prepared.error());
    }
    auto* stmt = prepared.value().get();

    bind_text(stmt, 1, job_id);
    if (query.status.has_value()) {
        sqlite3_bind_text(stmt, 2, migration::to_string(*query.status), -1, SQLITE_STATIC);
    }

    std::vector<migration_item> items;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        items.push_back(parse_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<migration_item>>(
            step_error(db_, rc, "Failed to list items"));
    }
    return items;
}

auto item_repository::find_pending_by_document(std::string_view job_id,
                                               std::string_view document_id) const
    -> Result<std::vector<migration_item>> {
    std::string sql = std::string(kSelectColumns) +
                      " WHERE job_id = ? AND document_id = ? AND status = 'pending'"
                      " ORDER BY item_id";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<std::vector<migration_item>>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    bind_text(stmt, 1, job_id);
    bind_text(stmt, 2, document_id);

    std::vector<migration_item> items;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        items.push_back(parse_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<migration_item>>(
            step_error(db_, rc, "Failed to find pending items"));
    }
    return items;
}

auto item_repository::count_by_status(std::string_view job_id) const
    -> Result<migration::item_status_counts> {
    static constexpr const char* sql = R"(
        SELECT status, COUNT(*) FROM migration_items
        WHERE job_id = ? GROUP BY status
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<migration::item_status_counts>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    bind_text(stmt, 1, job_id);

    migration::item_status_counts counts;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto status = migration::item_status_from_string(get_text_column(stmt, 0));
        auto count = get_int64_column(stmt, 1);
        switch (status) {
            case item_status::pending: counts.pending = count; break;
            case item_status::in_progress: counts.in_progress = count; break;
            case item_status::completed: counts.completed = count; break;
            case item_status::failed: counts.failed = count; break;
            case item_status::skipped: counts.skipped = count; break;
        }
    }
    if (rc != SQLITE_DONE) {
        return Result<migration::item_status_counts>(
            step_error(db_, rc, "Failed to count items"));
    }
    return counts;
}

// =============================================================================
// Worker Transitions
// =============================================================================

auto item_repository::update_one(std::string_view sql,
                                 std::int64_t item_id,
                                 std::string_view what) -> Result<bool> {
    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    sqlite3_bind_int64(stmt, 1, item_id);

    auto changed = execute_update(db_, stmt, what);
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto item_repository::mark_in_progress(std::int64_t item_id) -> Result<bool> {
    static constexpr const char* sql = R"(
        UPDATE migration_items
        SET status = 'in_progress', attempt_count = attempt_count + 1,
            started_at = ?, error_message = NULL
        WHERE item_id = ? AND status = 'pending'
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    auto now_str = now_string();
    bind_text(stmt, 1, now_str);
    sqlite3_bind_int64(stmt, 2, item_id);

    auto changed = execute_update(db_, stmt, "Failed to claim item");
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto item_repository::mark_completed(std::int64_t item_id,
                                     std::string_view dest_digest,
                                     std::int64_t content_size,
                                     std::int64_t duration_ms) -> Result<bool> {
    static constexpr const char* sql = R"(
        UPDATE migration_items
        SET status = 'completed', dest_digest = ?, content_match = 1,
            content_size = ?, duration_ms = ?, error_message = NULL,
            completed_at = ?
        WHERE item_id = ? AND status = 'in_progress'
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    auto now_str = now_string();

    int idx = 1;
    bind_text(stmt, idx++, dest_digest);
    sqlite3_bind_int64(stmt, idx++, content_size);
    sqlite3_bind_int64(stmt, idx++, duration_ms);
    bind_text(stmt, idx++, now_str);
    sqlite3_bind_int64(stmt, idx++, item_id);

    auto changed = execute_update(db_, stmt, "Failed to complete item");
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto item_repository::mark_pending_retry(std::int64_t item_id,
                                         std::string_view error,
                                         const std::optional<std::string>& dest_digest)
    -> Result<bool> {
    static constexpr const char* sql = R"(
        UPDATE migration_items
        SET status = 'pending', error_message = ?, dest_digest = ?,
            content_match = CASE WHEN ? IS NULL THEN NULL ELSE 0 END
        WHERE item_id = ? AND status = 'in_progress'
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();

    int idx = 1;
    bind_text(stmt, idx++, error);
    bind_optional_text(stmt, idx++, dest_digest);
    bind_optional_text(stmt, idx++, dest_digest);
    sqlite3_bind_int64(stmt, idx++, item_id);

    auto changed = execute_update(db_, stmt, "Failed to reschedule item");
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto item_repository::mark_failed(std::int64_t item_id,
                                  std::string_view error,
                                  const std::optional<std::string>& dest_digest,
                                  std::int64_t duration_ms) -> Result<bool> {
    static constexpr const char* sql = R"(
        UPDATE migration_items
        SET status = 'failed', error_message = ?, dest_digest = ?,
            content_match = CASE WHEN ? IS NULL THEN NULL ELSE 0 END,
            duration_ms = ?, completed_at = ?
        WHERE item_id = ? AND status = 'in_progress'
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    auto now_str = now_string();

    int idx = 1;
    bind_text(stmt, idx++, error);
    bind_optional_text(stmt, idx++, dest_digest);
    bind_optional_text(stmt, idx++, dest_digest);
    sqlite3_bind_int64(stmt, idx++, duration_ms);
    bind_text(stmt, idx++, now_str);
    sqlite3_bind_int64(stmt, idx++, item_id);

    auto changed = execute_update(db_, stmt, "Failed to fail item");
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto item_repository::mark_skipped(std::int64_t item_id,
                                   std::string_view reason,
                                   std::int64_t duration_ms) -> Result<bool> {
    static constexpr const char* sql = R"(
        UPDATE migration_items
        SET status = 'skipped', error_message = ?, duration_ms = ?, completed_at = ?
        WHERE item_id = ? AND status IN ('pending', 'in_progress')
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    auto now_str = now_string();

    int idx = 1;
    bind_text(stmt, idx++, reason);
    sqlite3_bind_int64(stmt, idx++, duration_ms);
    bind_text(stmt, idx++, now_str);
    sqlite3_bind_int64(stmt, idx++, item_id);

    auto changed = execute_update(db_, stmt, "Failed to skip item");
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto item_repository::undo_claim(std::int64_t item_id) -> Result<bool> {
    return update_one(R"(
        UPDATE migration_items
        SET status = 'pending',
            attempt_count = CASE WHEN attempt_count > 0 THEN attempt_count - 1 ELSE 0 END,
            started_at = NULL
        WHERE item_id = ? AND status = 'in_progress'
    )", item_id, "Failed to release item");
}

// =============================================================================
// Job-wide Transitions
// =============================================================================

auto item_repository::skip_pending_for_job(std::string_view job_id,
                                           std::string_view reason)
    -> Result<std::size_t> {
    static constexpr const char* sql = R"(
        UPDATE migration_items
        SET status = 'skipped', error_message = ?, completed_at = ?
        WHERE job_id = ? AND status = 'pending'
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<std::size_t>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    auto now_str = now_string();

    bind_text(stmt, 1, reason);
    bind_text(stmt, 2, now_str);
    bind_text(stmt, 3, job_id);

    return execute_update(db_, stmt, "Failed to skip pending items");
}

auto item_repository::reset_failed_for_job(std::string_view job_id,
                                           int extra_attempts)
    -> Result<std::size_t> {
    static constexpr const char* sql = R"(
        UPDATE migration_items
        SET status = 'pending', max_attempts = max_attempts + ?,
            error_message = NULL, completed_at = NULL, content_match = NULL,
            dest_digest = NULL
        WHERE job_id = ? AND status = 'failed'
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<std::size_t>(prepared.error());
    }
    auto* stmt = prepared.value().get();

    sqlite3_bind_int(stmt, 1, extra_attempts);
    bind_text(stmt, 2, job_id);

    return execute_update(db_, stmt, "Failed to reset failed items");
}

// =============================================================================
// Row Mapping
// =============================================================================

auto item_repository::parse_row(sqlite3_stmt* stmt) -> migration_item {
    migration_item item;

    int col = 0;
    item.item_id = get_int64_column(stmt, col++);
    item.job_id = get_text_column(stmt, col++);
    item.document_id = get_text_column(stmt, col++);
    item.dest_document_id = get_text_column(stmt, col++);
    item.source_provider = get_text_column(stmt, col++);
    item.dest_provider = get_text_column(stmt, col++);
    item.status = migration::item_status_from_string(get_text_column(stmt, col++));
    item.attempt_count = get_int_column(stmt, col++);
    item.max_attempts = get_int_column(stmt, col++, 3);
    item.source_digest = get_text_column(stmt, col++);
    item.dest_digest = get_optional_text(stmt, col++);
    if (sqlite3_column_type(stmt, col) != SQLITE_NULL) {
        item.content_match = sqlite3_column_int(stmt, col) != 0;
    }
    ++col;
    item.content_size = get_int64_column(stmt, col++);
    item.error_message = get_optional_text(stmt, col++);
    if (sqlite3_column_type(stmt, col) != SQLITE_NULL) {
        item.duration_ms = sqlite3_column_int64(stmt, col);
    }
    ++col;
    auto created_str = get_text_column(stmt, col++);
    item.created_at = from_timestamp_string(created_str.c_str());
    item.started_at = get_optional_timestamp(stmt, col++);
    item.completed_at = get_optional_timestamp(stmt, col++);

    return item;
}

}  // namespace docmig::storage
