/**
 * @file migration_types.hpp
 * @brief Job, item and outbox records for document migration
 *
 * This file provides the enumerations and plain records shared by the
 * repositories, the job manager and the worker pool.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docmig::migration {

// =============================================================================
// Migration Strategy
// =============================================================================

/**
 * @brief How documents are moved between providers
 */
enum class migration_strategy {
    copy,    ///< Destination receives a copy, source untouched
    move,    ///< Source deleted after the destination is verified
    mirror   ///< Transferred like copy; no ongoing synchronisation
};

[[nodiscard]] constexpr const char* to_string(migration_strategy strategy) noexcept {
    switch (strategy) {
        case migration_strategy::copy: return "copy";
        case migration_strategy::move: return "move";
        case migration_strategy::mirror: return "mirror";
        default: return "unknown";
    }
}

/**
 * @brief Parse migration_strategy from string
 * @return Parsed strategy, or std::nullopt if unknown
 */
[[nodiscard]] inline std::optional<migration_strategy> migration_strategy_from_string(
    std::string_view str) noexcept {
    if (str == "copy") return migration_strategy::copy;
    if (str == "move") return migration_strategy::move;
    if (str == "mirror") return migration_strategy::mirror;
    return std::nullopt;
}

// =============================================================================
// Job Status
// =============================================================================

/**
 * @brief Lifecycle status of a migration job
 */
enum class migration_job_status {
    pending,    ///< Created, documents may still be queued
    running,    ///< Workers may claim its outbox entries
    paused,     ///< No new claims until resumed
    completed,  ///< Every item migrated or skipped
    failed,     ///< Nothing migrated, at least one failure
    partial,    ///< Some items migrated, some failed
    cancelled   ///< Cancelled by operator
};

[[nodiscard]] constexpr const char* to_string(migration_job_status status) noexcept {
    switch (status) {
        case migration_job_status::pending: return "pending";
        case migration_job_status::running: return "running";
        case migration_job_status::paused: return "paused";
        case migration_job_status::completed: return "completed";
        case migration_job_status::failed: return "failed";
        case migration_job_status::partial: return "partial";
        case migration_job_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Parse migration_job_status from string
 * @return Parsed status, or pending if invalid
 */
[[nodiscard]] inline migration_job_status job_status_from_string(
    std::string_view str) noexcept {
    if (str == "running") return migration_job_status::running;
    if (str == "paused") return migration_job_status::paused;
    if (str == "completed") return migration_job_status::completed;
    if (str == "failed") return migration_job_status::failed;
    if (str == "partial") return migration_job_status::partial;
    if (str == "cancelled") return migration_job_status::cancelled;
    return migration_job_status::pending;
}

/**
 * @brief Check if job status is a terminal state
 */
[[nodiscard]] constexpr bool is_terminal_status(migration_job_status status) noexcept {
    return status == migration_job_status::completed ||
           status == migration_job_status::failed ||
           status == migration_job_status::partial ||
           status == migration_job_status::cancelled;
}

// =============================================================================
// Item Status
// =============================================================================

enum class item_status {
    pending,      ///< Waiting for a worker
    in_progress,  ///< Claimed by a worker
    completed,    ///< Transferred and verified
    failed,       ///< Attempts exhausted
    skipped       ///< Dry run, superseded or cancelled
};

[[nodiscard]] constexpr const char* to_string(item_status status) noexcept {
    switch (status) {
        case item_status::pending: return "pending";
        case item_status::in_progress: return "in_progress";
        case item_status::completed: return "completed";
        case item_status::failed: return "failed";
        case item_status::skipped: return "skipped";
        default: return "unknown";
    }
}

[[nodiscard]] inline item_status item_status_from_string(std::string_view str) noexcept {
    if (str == "in_progress") return item_status::in_progress;
    if (str == "completed") return item_status::completed;
    if (str == "failed") return item_status::failed;
    if (str == "skipped") return item_status::skipped;
    return item_status::pending;
}

// =============================================================================
// Outbox Status
// =============================================================================

enum class outbox_status {
    pending,    ///< Claimable once available_at has passed
    in_flight,  ///< Claimed by a worker
    published,  ///< Work finished successfully
    failed      ///< Terminal failure
};

[[nodiscard]] constexpr const char* to_string(outbox_status status) noexcept {
    switch (status) {
        case outbox_status::pending: return "pending";
        case outbox_status::in_flight: return "in_flight";
        case outbox_status::published: return "published";
        case outbox_status::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] inline outbox_status outbox_status_from_string(std::string_view str) noexcept {
    if (str == "in_flight") return outbox_status::in_flight;
    if (str == "published") return outbox_status::published;
    if (str == "failed") return outbox_status::failed;
    return outbox_status::pending;
}

// =============================================================================
// Records
// =============================================================================

using time_point = std::chrono::system_clock::time_point;

/**
 * @brief Persisted migration job
 */
struct migration_job {
    std::string job_id;                    ///< UUID v4
    std::string job_name;
    std::string source_provider;
    std::string dest_provider;
    migration_strategy strategy{migration_strategy::copy};
    migration_job_status status{migration_job_status::pending};
    std::optional<std::string> filter_prefix;

    std::int64_t total_documents{0};
    std::int64_t migrated_documents{0};
    std::int64_t failed_documents{0};
    std::int64_t skipped_documents{0};

    int concurrency{5};
    int batch_size{100};
    int max_attempts{3};
    bool dry_run{false};
    bool cancel_requested{false};

    std::string created_by;
    std::string error_message;

    time_point created_at{};
    std::optional<time_point> started_at;
    std::optional<time_point> completed_at;
    time_point updated_at{};

    /// Documents that reached a terminal item state
    [[nodiscard]] auto processed_documents() const noexcept -> std::int64_t {
        return migrated_documents + failed_documents + skipped_documents;
    }
};

/**
 * @brief One document within a job
 */
struct migration_item {
    std::int64_t item_id{0};
    std::string job_id;
    std::string document_id;
    std::string dest_document_id;
    std::string source_provider;
    std::string dest_provider;
    item_status status{item_status::pending};
    int attempt_count{0};
    int max_attempts{3};
    std::string source_digest;             ///< Expected digest, captured at enqueue
    std::optional<std::string> dest_digest;  ///< Observed destination digest
    std::optional<bool> content_match;     ///< NULL until verified
    std::int64_t content_size{0};
    std::optional<std::string> error_message;
    std::optional<std::int64_t> duration_ms;
    time_point created_at{};
    std::optional<time_point> started_at;
    std::optional<time_point> completed_at;
};

/**
 * @brief Transactional outbox row describing one unit of work
 */
struct outbox_entry {
    std::int64_t outbox_id{0};
    std::string idempotent_key;
    std::string job_id;
    std::int64_t item_id{0};
    std::string event_type{"migration.task.created"};
    outbox_status status{outbox_status::pending};
    std::string payload;                   ///< task_payload as JSON
    int publish_attempts{0};
    std::optional<std::string> last_error;
    std::optional<std::string> claimed_by;
    std::optional<std::int64_t> claimed_at_ms;
    std::int64_t available_at_ms{0};
    time_point created_at{};
    std::optional<time_point> published_at;
};

/**
 * @brief Per-status item counts for one job
 */
struct item_status_counts {
    std::int64_t pending{0};
    std::int64_t in_progress{0};
    std::int64_t completed{0};
    std::int64_t failed{0};
    std::int64_t skipped{0};

    [[nodiscard]] auto total() const noexcept -> std::int64_t {
        return pending + in_progress + completed + failed + skipped;
    }

    [[nodiscard]] auto outstanding() const noexcept -> std::int64_t {
        return pending + in_progress;
    }
};

/**
 * @brief Progress view of one job
 */
struct migration_progress {
    std::string job_id;
    migration_job_status status{migration_job_status::pending};
    std::int64_t total{0};
    std::int64_t migrated{0};
    std::int64_t failed{0};
    std::int64_t skipped{0};
    std::int64_t pending{0};
    std::int64_t in_progress{0};
    double percent{0.0};                   ///< processed / total * 100
    double rate{0.0};                      ///< Processed documents per second
    std::optional<double> eta_seconds;     ///< Unknown while rate is zero
    std::chrono::seconds elapsed{0};
};

// =============================================================================
// Requests and Queries
// =============================================================================

/**
 * @brief Parameters of create_job
 *
 * filter_prefix and document_ids are mutually exclusive; with neither the
 * job starts empty and documents are added with queue_documents().
 */
struct create_job_request {
    std::string job_name;
    std::string source_provider;
    std::string dest_provider;
    migration_strategy strategy{migration_strategy::copy};
    std::optional<std::string> filter_prefix;
    std::vector<std::string> document_ids;
    std::optional<int> concurrency;        ///< Defaults from manager config
    std::optional<int> batch_size;
    std::optional<int> max_attempts;
    bool dry_run{false};
    std::string created_by;
};

struct job_query {
    std::optional<migration_job_status> status;
    std::optional<std::string> created_by;
    std::size_t limit{100};
    std::size_t offset{0};
};

struct item_query {
    std::optional<item_status> status;
    std::size_t limit{1000};
    std::size_t offset{0};
};

}  // namespace docmig::migration
