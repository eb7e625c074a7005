/**
 * @file schema_runner.hpp
 * @brief Versioned schema migrations for the migration database
 *
 * This file provides the schema_runner class that creates and evolves the
 * provider, job, item and outbox tables.
 */

#pragma once

#include <docmig/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace docmig::storage {

/**
 * @brief One applied schema version
 */
struct schema_version_record {
    int version{0};            ///< Schema version number
    std::string description;   ///< Human-readable description
    std::string applied_at;    ///< UTC timestamp of application
};

/**
 * @brief Function type for migration implementations
 *
 * @param db The SQLite database handle
 * @return VoidResult Success or error information
 */
using schema_migration_function = std::function<VoidResult(sqlite3* db)>;

/**
 * @brief Manages database schema migrations
 *
 * The schema_runner is responsible for:
 * - Tracking the current schema version via the schema_version table
 * - Applying pending migrations in order
 * - Ensuring atomic migrations using transactions
 *
 * Each step runs under BEGIN IMMEDIATE and re-reads the version inside the
 * transaction, so several processes may open the same database file at once.
 *
 * Thread Safety: This class is NOT thread-safe. External synchronization
 * is required for concurrent access to the same connection.
 */
class schema_runner {
public:
    schema_runner();
    ~schema_runner() = default;

    schema_runner(const schema_runner&) = delete;
    auto operator=(const schema_runner&) -> schema_runner& = delete;
    schema_runner(schema_runner&&) = default;
    auto operator=(schema_runner&&) -> schema_runner& = default;

    /**
     * @brief Apply all pending migrations
     */
    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    /**
     * @brief Apply migrations up to target_version
     */
    [[nodiscard]] auto run_migrations_to(sqlite3* db, int target_version)
        -> VoidResult;

    /**
     * @brief Current schema version (0 for an empty database)
     */
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_latest_version() const noexcept -> int;

    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool;

    /**
     * @brief Applied versions in ascending order
     */
    [[nodiscard]] auto get_history(sqlite3* db) const
        -> std::vector<schema_version_record>;

    /// Latest schema version known to this build
    static constexpr int LATEST_VERSION = 1;

private:
    [[nodiscard]] auto ensure_schema_version_table(sqlite3* db) -> VoidResult;
    [[nodiscard]] auto apply_migration(sqlite3* db, int version) -> VoidResult;
    [[nodiscard]] auto record_migration(sqlite3* db, int version,
                                        std::string_view description)
        -> VoidResult;
    [[nodiscard]] static auto execute_sql(sqlite3* db, std::string_view sql)
        -> VoidResult;

    /// V1: providers, jobs, items, outbox
    [[nodiscard]] auto migrate_v1(sqlite3* db) -> VoidResult;

    std::vector<std::pair<int, schema_migration_function>> migrations_;
};

}  // namespace docmig::storage
