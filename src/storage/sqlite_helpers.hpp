/**
 * @file sqlite_helpers.hpp
 * @brief Column, binding and timestamp helpers shared by the repositories
 *
 * Internal header; not installed.
 */

#pragma once

#include <docmig/core/result.hpp>

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace docmig::storage::detail {

/**
 * @brief RAII wrapper for sqlite3_stmt
 */
struct stmt_deleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt) sqlite3_finalize(stmt);
    }
};
using stmt_ptr = std::unique_ptr<sqlite3_stmt, stmt_deleter>;

/// Prepare a statement, mapping failure to database_query_error
[[nodiscard]] inline auto prepare(sqlite3* db, std::string_view sql)
    -> Result<stmt_ptr> {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()),
                                 &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return docmig_error<stmt_ptr>(
            error_codes::database_query_error,
            "Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
    return stmt_ptr(stmt);
}

/// Map a failed step to a docmig error
[[nodiscard]] inline auto step_error(sqlite3* db, int rc, std::string_view what)
    -> error_info {
    int code = (rc == SQLITE_BUSY || rc == SQLITE_LOCKED)
                   ? error_codes::database_busy
                   : error_codes::database_query_error;
    return error_info{code,
                      std::string(what) + ": " + sqlite3_errmsg(db),
                      "docmig"};
}

/// Convert time_point to "YYYY-MM-DD HH:MM:SS" (UTC)
[[nodiscard]] inline std::string to_timestamp_string(
    std::chrono::system_clock::time_point tp) {
    if (tp == std::chrono::system_clock::time_point{}) {
        return "";
    }
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

/// Parse "YYYY-MM-DD HH:MM:SS" (UTC) to time_point
[[nodiscard]] inline std::chrono::system_clock::time_point from_timestamp_string(
    const char* str) {
    if (!str || str[0] == '\0') {
        return {};
    }
    std::tm tm{};
    if (std::sscanf(str, "%d-%d-%d %d:%d:%d",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        return {};
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
#ifdef _WIN32
    auto time = _mkgmtime(&tm);
#else
    auto time = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(time);
}

/// Current wall clock in epoch milliseconds
[[nodiscard]] inline std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Get text column safely (returns empty string if NULL)
[[nodiscard]] inline std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

/// Get int column with default
[[nodiscard]] inline int get_int_column(sqlite3_stmt* stmt, int col,
                                        int default_val = 0) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return default_val;
    }
    return sqlite3_column_int(stmt, col);
}

/// Get int64 column with default
[[nodiscard]] inline std::int64_t get_int64_column(sqlite3_stmt* stmt, int col,
                                                   std::int64_t default_val = 0) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return default_val;
    }
    return sqlite3_column_int64(stmt, col);
}

/// Get optional string column
[[nodiscard]] inline std::optional<std::string> get_optional_text(
    sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::optional<std::string>{text} : std::nullopt;
}

/// Parse a timestamp column to an optional time_point
[[nodiscard]] inline std::optional<std::chrono::system_clock::time_point>
get_optional_timestamp(sqlite3_stmt* stmt, int col) {
    auto text = get_optional_text(stmt, col);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    auto tp = from_timestamp_string(text->c_str());
    if (tp == std::chrono::system_clock::time_point{}) {
        return std::nullopt;
    }
    return tp;
}

/// Bind a string_view as text
inline void bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) {
    sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

/// Bind optional string
inline void bind_optional_text(sqlite3_stmt* stmt, int idx,
                               const std::optional<std::string>& value) {
    if (value.has_value()) {
        sqlite3_bind_text(stmt, idx, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

/// Bind optional timestamp
inline void bind_optional_timestamp(
    sqlite3_stmt* stmt,
    int idx,
    const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (tp.has_value()) {
        auto str = to_timestamp_string(tp.value());
        sqlite3_bind_text(stmt, idx, str.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

/// Run a statement that returns no rows; yields sqlite3_changes()
[[nodiscard]] inline auto execute_update(sqlite3* db, sqlite3_stmt* stmt,
                                         std::string_view what)
    -> Result<std::size_t> {
    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        return Result<std::size_t>(step_error(db, rc, what));
    }
    return static_cast<std::size_t>(sqlite3_changes(db));
}

}  // namespace docmig::storage::detail
