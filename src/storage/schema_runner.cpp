/**
 * @file schema_runner.cpp
 * @brief Implementation of the migration database schema runner
 */

#include <docmig/storage/schema_runner.hpp>

#include <docmig/compat/format.hpp>

#include <sqlite3.h>

namespace docmig::storage {

// ============================================================================
// Construction
// ============================================================================

schema_runner::schema_runner() {
    // Register all migrations
    migrations_.push_back({1, [this](sqlite3* db) { return migrate_v1(db); }});
}

// ============================================================================
// Migration Operations
// ============================================================================

auto schema_runner::run_migrations(sqlite3* db) -> VoidResult {
    return run_migrations_to(db, LATEST_VERSION);
}

auto schema_runner::run_migrations_to(sqlite3* db, int target_version)
    -> VoidResult {
    if (target_version > LATEST_VERSION) {
        return docmig_void_error(
            error_codes::database_migration_error,
            docmig::compat::format("Target version {} exceeds latest version {}",
                                   target_version, LATEST_VERSION));
    }

    auto ensure_result = ensure_schema_version_table(db);
    if (ensure_result.is_err()) {
        return ensure_result;
    }

    if (get_current_version(db) >= target_version) {
        return ok();
    }

    while (true) {
        auto begin_result = execute_sql(db, "BEGIN IMMEDIATE;");
        if (begin_result.is_err()) {
            return begin_result;
        }

        // Another connection may have migrated while we waited for the lock
        auto current_version = get_current_version(db);
        if (current_version >= target_version) {
            return execute_sql(db, "COMMIT;");
        }

        auto next_version = current_version + 1;
        auto migration_result = apply_migration(db, next_version);
        if (migration_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return migration_result;
        }

        auto commit_result = execute_sql(db, "COMMIT;");
        if (commit_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return commit_result;
        }
    }
}

// ============================================================================
// Version Information
// ============================================================================

auto schema_runner::get_current_version(sqlite3* db) const -> int {
    const char* check_sql =
        "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version';";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, check_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return 0;
    }

    const char* version_sql = "SELECT MAX(version) FROM schema_version;";
    rc = sqlite3_prepare_v2(db, version_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        // sqlite3_column_int returns 0 for NULL
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    return version;
}

auto schema_runner::get_latest_version() const noexcept -> int {
    return LATEST_VERSION;
}

auto schema_runner::needs_migration(sqlite3* db) const -> bool {
    return get_current_version(db) < LATEST_VERSION;
}

auto schema_runner::get_history(sqlite3* db) const
    -> std::vector<schema_version_record> {
    std::vector<schema_version_record> history;

    const char* sql =
        "SELECT version, description, applied_at FROM schema_version ORDER BY version;";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return history;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        schema_version_record record;
        record.version = sqlite3_column_int(stmt, 0);

        const auto* desc = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        record.description = desc ? desc : "";

        const auto* applied = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        record.applied_at = applied ? applied : "";

        history.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return history;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto schema_runner::ensure_schema_version_table(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )";

    return execute_sql(db, sql);
}

auto schema_runner::apply_migration(sqlite3* db, int version) -> VoidResult {
    for (const auto& [ver, func] : migrations_) {
        if (ver == version) {
            return func(db);
        }
    }

    return docmig_void_error(
        error_codes::database_migration_error,
        docmig::compat::format("Migration for version {} not found", version));
}

auto schema_runner::record_migration(sqlite3* db, int version,
                                     std::string_view description)
    -> VoidResult {
    const char* sql =
        "INSERT INTO schema_version (version, description) VALUES (?, ?);";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return docmig_void_error(
            error_codes::database_migration_error,
            docmig::compat::format("Failed to prepare statement: {}",
                                   sqlite3_errmsg(db)));
    }

    sqlite3_bind_int(stmt, 1, version);
    sqlite3_bind_text(stmt, 2, description.data(),
                      static_cast<int>(description.size()), SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return docmig_void_error(
            error_codes::database_migration_error,
            docmig::compat::format("Failed to record migration: {}",
                                   sqlite3_errmsg(db)));
    }

    return ok();
}

auto schema_runner::execute_sql(sqlite3* db, std::string_view sql)
    -> VoidResult {
    char* errmsg = nullptr;
    std::string statement(sql);
    auto rc = sqlite3_exec(db, statement.c_str(), nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);

        return docmig_void_error(
            rc == SQLITE_BUSY ? error_codes::database_busy
                              : error_codes::database_migration_error,
            docmig::compat::format("SQL execution failed: {}", error_str));
    }

    return ok();
}

// ============================================================================
// Migration Implementations
// ============================================================================

auto schema_runner::migrate_v1(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        -- =====================================================================
        -- PROVIDER REGISTRATIONS
        -- =====================================================================
        CREATE TABLE provider_storage (
            pk              INTEGER PRIMARY KEY AUTOINCREMENT,
            provider_name   TEXT NOT NULL UNIQUE,
            provider_type   TEXT NOT NULL,
            config_json     TEXT NOT NULL DEFAULT '{}',
            is_primary      INTEGER NOT NULL DEFAULT 0,
            is_writable     INTEGER NOT NULL DEFAULT 1,
            status          TEXT NOT NULL DEFAULT 'active'
                            CHECK (status IN ('active', 'readonly', 'disabled', 'migrating')),
            created_at      TEXT NOT NULL DEFAULT (datetime('now')),
            updated_at      TEXT NOT NULL DEFAULT (datetime('now'))
        );

        -- =====================================================================
        -- MIGRATION JOBS
        -- =====================================================================
        CREATE TABLE migration_jobs (
            job_id              TEXT PRIMARY KEY,
            job_name            TEXT NOT NULL,
            source_provider     TEXT NOT NULL,
            dest_provider       TEXT NOT NULL,
            strategy            TEXT NOT NULL
                                CHECK (strategy IN ('copy', 'move', 'mirror')),
            status              TEXT NOT NULL DEFAULT 'pending'
                                CHECK (status IN ('pending', 'running', 'paused',
                                                  'completed', 'failed', 'partial',
                                                  'cancelled')),
            filter_prefix       TEXT,
            total_documents     INTEGER NOT NULL DEFAULT 0,
            migrated_documents  INTEGER NOT NULL DEFAULT 0,
            failed_documents    INTEGER NOT NULL DEFAULT 0,
            skipped_documents   INTEGER NOT NULL DEFAULT 0,
            concurrency         INTEGER NOT NULL DEFAULT 5,
            batch_size          INTEGER NOT NULL DEFAULT 100,
            max_attempts        INTEGER NOT NULL DEFAULT 3,
            dry_run             INTEGER NOT NULL DEFAULT 0,
            cancel_requested    INTEGER NOT NULL DEFAULT 0,
            created_by          TEXT,
            error_message       TEXT,
            created_at          TEXT NOT NULL DEFAULT (datetime('now')),
            started_at          TEXT,
            completed_at        TEXT,
            updated_at          TEXT NOT NULL DEFAULT (datetime('now'))
        );

        CREATE INDEX idx_migration_jobs_status ON migration_jobs(status);
        CREATE INDEX idx_migration_jobs_created ON migration_jobs(created_at);

        -- =====================================================================
        -- MIGRATION ITEMS
        -- =====================================================================
        CREATE TABLE migration_items (
            item_id             INTEGER PRIMARY KEY AUTOINCREMENT,
            job_id              TEXT NOT NULL
                                REFERENCES migration_jobs(job_id) ON DELETE CASCADE,
            document_id         TEXT NOT NULL,
            dest_document_id    TEXT NOT NULL,
            source_provider     TEXT NOT NULL,
            dest_provider       TEXT NOT NULL,
            status              TEXT NOT NULL DEFAULT 'pending'
                                CHECK (status IN ('pending', 'in_progress', 'completed',
                                                  'failed', 'skipped')),
            attempt_count       INTEGER NOT NULL DEFAULT 0,
            max_attempts        INTEGER NOT NULL DEFAULT 3,
            source_digest       TEXT NOT NULL,
            dest_digest         TEXT,
            content_match       INTEGER,
            content_size        INTEGER NOT NULL DEFAULT 0,
            error_message       TEXT,
            duration_ms         INTEGER,
            created_at          TEXT NOT NULL DEFAULT (datetime('now')),
            started_at          TEXT,
            completed_at        TEXT
        );

        CREATE INDEX idx_migration_items_job_status ON migration_items(job_id, status);
        CREATE INDEX idx_migration_items_job_document ON migration_items(job_id, document_id);

        -- =====================================================================
        -- TRANSACTIONAL OUTBOX
        -- =====================================================================
        CREATE TABLE migration_outbox (
            outbox_id           INTEGER PRIMARY KEY AUTOINCREMENT,
            idempotent_key      TEXT NOT NULL UNIQUE,
            job_id              TEXT NOT NULL
                                REFERENCES migration_jobs(job_id) ON DELETE CASCADE,
            item_id             INTEGER NOT NULL UNIQUE
                                REFERENCES migration_items(item_id) ON DELETE CASCADE,
            event_type          TEXT NOT NULL DEFAULT 'migration.task.created',
            status              TEXT NOT NULL DEFAULT 'pending'
                                CHECK (status IN ('pending', 'in_flight', 'published', 'failed')),
            payload             TEXT NOT NULL,
            publish_attempts    INTEGER NOT NULL DEFAULT 0,
            last_error          TEXT,
            claimed_by          TEXT,
            claimed_at_ms       INTEGER,
            available_at_ms     INTEGER NOT NULL DEFAULT 0,
            created_at          TEXT NOT NULL DEFAULT (datetime('now')),
            published_at        TEXT
        );

        CREATE INDEX idx_migration_outbox_status ON migration_outbox(status, available_at_ms);
        CREATE INDEX idx_migration_outbox_job_status ON migration_outbox(job_id, status);
    )";

    auto result = execute_sql(db, sql);
    if (result.is_err()) {
        return result;
    }

    return record_migration(db, 1, "Initial migration schema: providers, jobs, items, outbox");
}

}  // namespace docmig::storage
