/**
 * @file migration_database.hpp
 * @brief SQLite connection owning the migration schema
 *
 * One migration_database is one SQLite connection. SQLite connections must
 * not run overlapping transactions, so the manager and every executor open
 * their own instance on the same database file.
 */

#pragma once

#include <docmig/core/result.hpp>
#include <docmig/storage/schema_runner.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

struct sqlite3;

namespace docmig::storage {

/**
 * @brief Connection options
 */
struct database_config {
    /// How long a writer waits for the database lock before SQLITE_BUSY
    std::chrono::milliseconds busy_timeout{5000};

    /// Enable write-ahead logging (ignored for ":memory:")
    bool wal_mode = true;
};

/**
 * @brief Owned SQLite connection with the schema applied
 *
 * Thread Safety: NOT thread-safe. Callers serialize access to one instance.
 */
class migration_database {
public:
    /**
     * @brief Open (or create) a database and apply pending migrations
     *
     * @param db_path Database file path, or ":memory:"
     * @param config Connection options
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   const database_config& config = {})
        -> Result<std::unique_ptr<migration_database>>;

    ~migration_database();

    migration_database(const migration_database&) = delete;
    auto operator=(const migration_database&) -> migration_database& = delete;
    migration_database(migration_database&&) = delete;
    auto operator=(migration_database&&) -> migration_database& = delete;

    /// Raw handle for repositories
    [[nodiscard]] auto handle() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }

    /// Current schema version
    [[nodiscard]] auto schema_version() const -> int;

    /// Execute SQL without results
    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;

private:
    migration_database(sqlite3* db, std::string path);

    sqlite3* db_{nullptr};
    std::string path_;
    schema_runner schema_runner_;
};

/**
 * @brief RAII transaction
 *
 * Rolls back on destruction unless commit() succeeded.
 *
 * @code
 * scoped_transaction tx(db.handle());
 * auto begun = tx.begin(true);
 * if (begun.is_err()) return begun;
 * ...
 * return tx.commit();
 * @endcode
 */
class scoped_transaction {
public:
    explicit scoped_transaction(sqlite3* db) : db_(db) {}
    ~scoped_transaction();

    scoped_transaction(const scoped_transaction&) = delete;
    auto operator=(const scoped_transaction&) -> scoped_transaction& = delete;

    /**
     * @brief Start the transaction
     *
     * @param immediate Take the write lock now (BEGIN IMMEDIATE)
     * @return database_busy when the lock could not be obtained in time
     */
    [[nodiscard]] auto begin(bool immediate = false) -> VoidResult;

    [[nodiscard]] auto commit() -> VoidResult;

    void rollback();

    [[nodiscard]] auto active() const noexcept -> bool { return active_; }

private:
    sqlite3* db_;
    bool active_{false};
};

}  // namespace docmig::storage
