/**
 * @file migration_database.cpp
 * @brief Implementation of migration_database and scoped_transaction
 */

#include <docmig/storage/migration_database.hpp>

#include <docmig/compat/format.hpp>

#include <sqlite3.h>

namespace docmig::storage {

// ============================================================================
// Construction / Destruction
// ============================================================================

auto migration_database::open(std::string_view db_path,
                              const database_config& config)
    -> Result<std::unique_ptr<migration_database>> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return docmig_error<std::unique_ptr<migration_database>>(
            error_codes::database_open_error,
            docmig::compat::format("Failed to open database: {}", error_msg));
    }

    sqlite3_busy_timeout(db, static_cast<int>(config.busy_timeout.count()));

    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return docmig_error<std::unique_ptr<migration_database>>(
            error_codes::database_open_error, "Failed to enable foreign keys");
    }

    if (config.wal_mode && db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return docmig_error<std::unique_ptr<migration_database>>(
                error_codes::database_open_error, "Failed to enable WAL mode");
        }
    }

    rc = sqlite3_exec(db, "PRAGMA synchronous = NORMAL;", nullptr, nullptr,
                      nullptr);
    if (rc != SQLITE_OK) {
        // Not critical, continue
    }

    auto instance = std::unique_ptr<migration_database>(
        new migration_database(db, std::string(db_path)));

    auto migration_result = instance->schema_runner_.run_migrations(db);
    if (migration_result.is_err()) {
        return docmig_error<std::unique_ptr<migration_database>>(
            migration_result.error().code,
            docmig::compat::format("Migration failed: {}",
                                   migration_result.error().message));
    }

    return instance;
}

migration_database::migration_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

migration_database::~migration_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto migration_database::schema_version() const -> int {
    return schema_runner_.get_current_version(db_);
}

auto migration_database::execute(std::string_view sql) -> VoidResult {
    char* errmsg = nullptr;
    std::string statement(sql);
    auto rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);
        return docmig_void_error(error_codes::database_query_error,
                                 "SQL execution failed: " + error_str);
    }
    return ok();
}

// ============================================================================
// scoped_transaction
// ============================================================================

scoped_transaction::~scoped_transaction() {
    rollback();
}

auto scoped_transaction::begin(bool immediate) -> VoidResult {
    if (active_) {
        return docmig_void_error(error_codes::database_transaction_error,
                                 "Transaction already active");
    }

    const char* sql = immediate ? "BEGIN IMMEDIATE;" : "BEGIN;";
    auto rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
        return docmig_void_error(error_codes::database_busy,
                                 "Database is locked by another writer");
    }
    if (rc != SQLITE_OK) {
        return docmig_void_error(
            error_codes::database_transaction_error,
            docmig::compat::format("Failed to begin transaction: {}",
                                   sqlite3_errmsg(db_)));
    }

    active_ = true;
    return ok();
}

auto scoped_transaction::commit() -> VoidResult {
    if (!active_) {
        return docmig_void_error(error_codes::database_transaction_error,
                                 "No active transaction");
    }

    auto rc = sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        auto message = docmig::compat::format("Failed to commit transaction: {}",
                                              sqlite3_errmsg(db_));
        rollback();
        return docmig_void_error(rc == SQLITE_BUSY
                                     ? error_codes::database_busy
                                     : error_codes::database_transaction_error,
                                 message);
    }

    active_ = false;
    return ok();
}

void scoped_transaction::rollback() {
    if (active_) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        active_ = false;
    }
}

}  // namespace docmig::storage
