/**
 * @file outbox_repository.cpp
 * @brief Implementation of the migration outbox repository
 */

#include <docmig/storage/outbox_repository.hpp>

#include "sqlite_helpers.hpp"

#include <algorithm>

namespace docmig::storage {

using namespace detail;
using migration::outbox_entry;

namespace {

constexpr const char* kColumns = R"(
    outbox_id, idempotent_key, job_id, item_id, event_type, status, payload,
    publish_attempts, last_error, claimed_by, claimed_at_ms, available_at_ms,
    created_at, published_at
)";

auto select_sql(std::string_view where) -> std::string {
    return std::string("SELECT ") + kColumns + " FROM migration_outbox " +
           std::string(where);
}

}  // namespace

outbox_repository::outbox_repository(sqlite3* db) : db_(db) {}

// =============================================================================
// Insert / Query
// =============================================================================

auto outbox_repository::insert(const outbox_entry& entry) -> Result<std::int64_t> {
    static constexpr const char* sql = R"(
        INSERT INTO migration_outbox (
            idempotent_key, job_id, item_id, event_type, status, payload,
            available_at_ms, created_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<std::int64_t>(prepared.error());
    }
    auto* stmt = prepared.value().get();

    auto created_str = to_timestamp_string(std::chrono::system_clock::now());

    int idx = 1;
    bind_text(stmt, idx++, entry.idempotent_key);
    bind_text(stmt, idx++, entry.job_id);
    sqlite3_bind_int64(stmt, idx++, entry.item_id);
    bind_text(stmt, idx++, entry.event_type);
    sqlite3_bind_text(stmt, idx++, migration::to_string(entry.status), -1, SQLITE_STATIC);
    bind_text(stmt, idx++, entry.payload);
    sqlite3_bind_int64(stmt, idx++, entry.available_at_ms);
    bind_text(stmt, idx++, created_str);

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        return Result<std::int64_t>(step_error(db_, rc, "Failed to insert outbox entry"));
    }
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

auto outbox_repository::exists(std::string_view idempotent_key) const -> Result<bool> {
    auto prepared = prepare(
        db_, "SELECT 1 FROM migration_outbox WHERE idempotent_key = ? LIMIT 1");
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    bind_text(stmt, 1, idempotent_key);

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc != SQLITE_DONE) {
        return Result<bool>(step_error(db_, rc, "Failed to check idempotency key"));
    }
    return false;
}

auto outbox_repository::find_by_key(std::string_view idempotent_key) const
    -> Result<std::optional<outbox_entry>> {
    auto entries = query_entries(select_sql("WHERE idempotent_key = ?"),
                                 idempotent_key, "Failed to find outbox entry");
    if (entries.is_err()) {
        return forward_error<std::optional<outbox_entry>>(entries.error());
    }
    if (entries.value().empty()) {
        return std::optional<outbox_entry>{};
    }
    return std::optional<outbox_entry>{entries.value().front()};
}

auto outbox_repository::find_by_item(std::int64_t item_id) const
    -> Result<std::optional<outbox_entry>> {
    auto prepared = prepare(db_, select_sql("WHERE item_id = ?"));
    if (prepared.is_err()) {
        return forward_error<std::optional<outbox_entry>>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    sqlite3_bind_int64(stmt, 1, item_id);

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return std::optional<outbox_entry>{parse_row(stmt)};
    }
    if (rc != SQLITE_DONE) {
        return Result<std::optional<outbox_entry>>(
            step_error(db_, rc, "Failed to find outbox entry"));
    }
    return std::optional<outbox_entry>{};
}

auto outbox_repository::find_by_job(std::string_view job_id) const
    -> Result<std::vector<outbox_entry>> {
    return query_entries(select_sql("WHERE job_id = ? ORDER BY outbox_id"),
                         job_id, "Failed to list outbox entries");
}

auto outbox_repository::count_by_status(std::string_view job_id,
                                        migration::outbox_status status) const
    -> Result<std::int64_t> {
    auto prepared = prepare(
        db_, "SELECT COUNT(*) FROM migration_outbox WHERE job_id = ? AND status = ?");
    if (prepared.is_err()) {
        return forward_error<std::int64_t>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    bind_text(stmt, 1, job_id);
    sqlite3_bind_text(stmt, 2, migration::to_string(status), -1, SQLITE_STATIC);

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        return Result<std::int64_t>(step_error(db_, rc, "Failed to count outbox entries"));
    }
    return get_int64_column(stmt, 0);
}

// =============================================================================
// Claiming
// =============================================================================

auto outbox_repository::select_claimable_job(std::string_view worker_id,
                                             std::int64_t now_ms) const
    -> Result<std::optional<std::string>> {
    static constexpr const char* sql = R"(
        SELECT j.job_id FROM migration_jobs j
        WHERE j.status = 'running' AND j.cancel_requested = 0
          AND EXISTS (
              SELECT 1 FROM migration_outbox o
              WHERE o.job_id = j.job_id AND o.status = 'pending'
                AND o.available_at_ms <= ?)
          AND (
              SELECT COUNT(DISTINCT f.claimed_by) FROM migration_outbox f
              WHERE f.job_id = j.job_id AND f.status = 'in_flight'
                AND f.claimed_by <> ?) < j.concurrency
        ORDER BY j.started_at, j.created_at, j.job_id
        LIMIT 1
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<std::optional<std::string>>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    sqlite3_bind_int64(stmt, 1, now_ms);
    bind_text(stmt, 2, worker_id);

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return std::optional<std::string>{get_text_column(stmt, 0)};
    }
    if (rc != SQLITE_DONE) {
        return Result<std::optional<std::string>>(
            step_error(db_, rc, "Failed to select claimable job"));
    }
    return std::optional<std::string>{};
}

auto outbox_repository::claim_batch(std::string_view job_id,
                                    std::string_view worker_id,
                                    std::int64_t now_ms,
                                    int limit)
    -> Result<std::vector<outbox_entry>> {
    std::string sql = std::string(R"(
        UPDATE migration_outbox
        SET status = 'in_flight', claimed_by = ?, claimed_at_ms = ?,
            publish_attempts = publish_attempts + 1
        WHERE outbox_id IN (
            SELECT outbox_id FROM migration_outbox
            WHERE job_id = ? AND status = 'pending' AND available_at_ms <= ?
            ORDER BY outbox_id
            LIMIT ?)
          AND status = 'pending'
        RETURNING )") + kColumns;

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<std::vector<outbox_entry>>(prepared.error());
    }
    auto* stmt = prepared.value().get();

    int idx = 1;
    bind_text(stmt, idx++, worker_id);
    sqlite3_bind_int64(stmt, idx++, now_ms);
    bind_text(stmt, idx++, job_id);
    sqlite3_bind_int64(stmt, idx++, now_ms);
    sqlite3_bind_int(stmt, idx++, limit);

    std::vector<outbox_entry> claimed;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        claimed.push_back(parse_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<outbox_entry>>(
            step_error(db_, rc, "Failed to claim outbox entries"));
    }

    // RETURNING order is unspecified
    std::sort(claimed.begin(), claimed.end(),
              [](const outbox_entry& a, const outbox_entry& b) {
                  return a.outbox_id < b.outbox_id;
              });
    return claimed;
}

auto outbox_repository::find_expired_claims(std::int64_t cutoff_ms) const
    -> Result<std::vector<outbox_entry>> {
    auto prepared = prepare(
        db_, select_sql("WHERE status = 'in_flight' AND claimed_at_ms < ? ORDER BY outbox_id"));
    if (prepared.is_err()) {
        return forward_error<std::vector<outbox_entry>>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    sqlite3_bind_int64(stmt, 1, cutoff_ms);

    std::vector<outbox_entry> entries;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.push_back(parse_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<outbox_entry>>(
            step_error(db_, rc, "Failed to find expired claims"));
    }
    return entries;
}

// =============================================================================
// Completion
// =============================================================================

auto outbox_repository::mark_published(std::int64_t outbox_id) -> Result<bool> {
    static constexpr const char* sql = R"(
        UPDATE migration_outbox
        SET status = 'published', published_at = ?, last_error = NULL
        WHERE outbox_id = ? AND status = 'in_flight'
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    auto now_str = to_timestamp_string(std::chrono::system_clock::now());
    bind_text(stmt, 1, now_str);
    sqlite3_bind_int64(stmt, 2, outbox_id);

    auto changed = execute_update(db_, stmt, "Failed to publish outbox entry");
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto outbox_repository::mark_failed(std::int64_t outbox_id, std::string_view error)
    -> Result<bool> {
    static constexpr const char* sql = R"(
        UPDATE migration_outbox
        SET status = 'failed', last_error = ?, claimed_by = NULL, claimed_at_ms = NULL
        WHERE outbox_id = ? AND status IN ('pending', 'in_flight')
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    bind_text(stmt, 1, error);
    sqlite3_bind_int64(stmt, 2, outbox_id);

    auto changed = execute_update(db_, stmt, "Failed to fail outbox entry");
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto outbox_repository::reschedule(std::int64_t outbox_id,
                                   std::int64_t available_at_ms,
                                   std::string_view error) -> Result<bool> {
    static constexpr const char* sql = R"(
        UPDATE migration_outbox
        SET status = 'pending', available_at_ms = ?, last_error = ?,
            claimed_by = NULL, claimed_at_ms = NULL
        WHERE outbox_id = ? AND status = 'in_flight'
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    sqlite3_bind_int64(stmt, 1, available_at_ms);
    bind_text(stmt, 2, error);
    sqlite3_bind_int64(stmt, 3, outbox_id);

    auto changed = execute_update(db_, stmt, "Failed to reschedule outbox entry");
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto outbox_repository::release_claim(std::int64_t outbox_id) -> Result<bool> {
    static constexpr const char* sql = R"(
        UPDATE migration_outbox
        SET status = 'pending', claimed_by = NULL, claimed_at_ms = NULL,
            publish_attempts = CASE WHEN publish_attempts > 0
                                    THEN publish_attempts - 1 ELSE 0 END
        WHERE outbox_id = ? AND status = 'in_flight'
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<bool>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    sqlite3_bind_int64(stmt, 1, outbox_id);

    auto changed = execute_update(db_, stmt, "Failed to release outbox claim");
    if (changed.is_err()) {
        return forward_error<bool>(changed.error());
    }
    return changed.value() > 0;
}

auto outbox_repository::fail_pending_for_job(std::string_view job_id,
                                             std::string_view reason)
    -> Result<std::size_t> {
    static constexpr const char* sql = R"(
        UPDATE migration_outbox SET status = 'failed', last_error = ?
        WHERE job_id = ? AND status = 'pending'
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<std::size_t>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    bind_text(stmt, 1, reason);
    bind_text(stmt, 2, job_id);

    return execute_update(db_, stmt, "Failed to fail pending outbox entries");
}

auto outbox_repository::reopen_failed_for_job(std::string_view job_id)
    -> Result<std::size_t> {
    static constexpr const char* sql = R"(
        UPDATE migration_outbox
        SET status = 'pending', available_at_ms = 0, last_error = NULL,
            claimed_by = NULL, claimed_at_ms = NULL
        WHERE job_id = ? AND status = 'failed'
          AND item_id IN (
              SELECT item_id FROM migration_items
              WHERE job_id = ? AND status = 'failed')
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<std::size_t>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    bind_text(stmt, 1, job_id);
    bind_text(stmt, 2, job_id);

    return execute_update(db_, stmt, "Failed to reopen outbox entries");
}

// =============================================================================
// Internal Helpers
// =============================================================================

auto outbox_repository::query_entries(std::string_view sql,
                                      std::string_view text_param,
                                      std::string_view what) const
    -> Result<std::vector<outbox_entry>> {
    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return forward_error<std::vector<outbox_entry>>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    bind_text(stmt, 1, text_param);

    std::vector<outbox_entry> entries;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.push_back(parse_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<outbox_entry>>(step_error(db_, rc, what));
    }
    return entries;
}

auto outbox_repository::parse_row(sqlite3_stmt* stmt) -> outbox_entry {
    outbox_entry entry;

    int col = 0;
    entry.outbox_id = get_int64_column(stmt, col++);
    entry.idempotent_key = get_text_column(stmt, col++);
    entry.job_id = get_text_column(stmt, col++);
    entry.item_id = get_int64_column(stmt, col++);
    entry.event_type = get_text_column(stmt, col++);
    entry.status = migration::outbox_status_from_string(get_text_column(stmt, col++));
    entry.payload = get_text_column(stmt, col++);
    entry.publish_attempts = get_int_column(stmt, col++);
    entry.last_error = get_optional_text(stmt, col++);
    entry.claimed_by = get_optional_text(stmt, col++);
    if (sqlite3_column_type(stmt, col) != SQLITE_NULL) {
        entry.claimed_at_ms = sqlite3_column_int64(stmt, col);
    }
    ++col;
    entry.available_at_ms = get_int64_column(stmt, col++);
    auto created_str = get_text_column(stmt, col++);
    entry.created_at = from_timestamp_string(created_str.c_str());
    entry.published_at = get_optional_timestamp(stmt, col++);

    return entry;
}

}  // namespace docmig::storage
