/**
 * @file outbox_repository.hpp
 * @brief Transactional outbox of migration tasks
 *
 * Outbox rows are written in the same transaction as the items they
 * describe. Workers claim them with a conditional UPDATE ... RETURNING
 * under BEGIN IMMEDIATE, which makes a claim exclusive across threads and
 * processes sharing the database file.
 */

#pragma once

#include <docmig/core/result.hpp>
#include <docmig/migration/migration_types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace docmig::storage {

/**
 * @brief Repository for migration_outbox
 *
 * Thread Safety: NOT thread-safe; bound to one connection.
 */
class outbox_repository {
public:
    explicit outbox_repository(sqlite3* db);
    ~outbox_repository() = default;

    outbox_repository(const outbox_repository&) = delete;
    auto operator=(const outbox_repository&) -> outbox_repository& = delete;
    outbox_repository(outbox_repository&&) noexcept = default;
    auto operator=(outbox_repository&&) noexcept -> outbox_repository& = default;

    /**
     * @brief Insert a pending entry
     * @return The new outbox_id
     */
    [[nodiscard]] auto insert(const migration::outbox_entry& entry)
        -> Result<std::int64_t>;

    /// Whether an entry with this idempotency key exists
    [[nodiscard]] auto exists(std::string_view idempotent_key) const -> Result<bool>;

    [[nodiscard]] auto find_by_key(std::string_view idempotent_key) const
        -> Result<std::optional<migration::outbox_entry>>;

    [[nodiscard]] auto find_by_item(std::int64_t item_id) const
        -> Result<std::optional<migration::outbox_entry>>;

    /// Entries of a job in enqueue order
    [[nodiscard]] auto find_by_job(std::string_view job_id) const
        -> Result<std::vector<migration::outbox_entry>>;

    [[nodiscard]] auto count_by_status(std::string_view job_id,
                                       migration::outbox_status status) const
        -> Result<std::int64_t>;

    // ---------------------------------------------------------------------
    // Claiming (call inside BEGIN IMMEDIATE)
    // ---------------------------------------------------------------------

    /**
     * @brief Pick the oldest running job with claimable work and capacity
     *
     * A job has capacity while fewer than its concurrency distinct workers
     * (other than worker_id) hold in-flight entries for it.
     */
    [[nodiscard]] auto select_claimable_job(std::string_view worker_id,
                                            std::int64_t now_ms) const
        -> Result<std::optional<std::string>>;

    /**
     * @brief Flip up to limit available pending entries of a job to in_flight
     * @return Claimed entries in enqueue order
     */
    [[nodiscard]] auto claim_batch(std::string_view job_id,
                                   std::string_view worker_id,
                                   std::int64_t now_ms,
                                   int limit)
        -> Result<std::vector<migration::outbox_entry>>;

    /**
     * @brief In-flight entries claimed before cutoff_ms
     */
    [[nodiscard]] auto find_expired_claims(std::int64_t cutoff_ms) const
        -> Result<std::vector<migration::outbox_entry>>;

    // ---------------------------------------------------------------------
    // Completion
    // ---------------------------------------------------------------------

    /// in_flight -> published
    [[nodiscard]] auto mark_published(std::int64_t outbox_id) -> Result<bool>;

    /// in_flight or pending -> failed
    [[nodiscard]] auto mark_failed(std::int64_t outbox_id, std::string_view error)
        -> Result<bool>;

    /// in_flight -> pending, claimable again at available_at_ms
    [[nodiscard]] auto reschedule(std::int64_t outbox_id,
                                  std::int64_t available_at_ms,
                                  std::string_view error) -> Result<bool>;

    /// in_flight -> pending without counting a publish attempt
    [[nodiscard]] auto release_claim(std::int64_t outbox_id) -> Result<bool>;

    /// Every pending entry of the job -> failed
    [[nodiscard]] auto fail_pending_for_job(std::string_view job_id,
                                            std::string_view reason)
        -> Result<std::size_t>;

    /// Failed entries whose item failed -> pending, available immediately
    [[nodiscard]] auto reopen_failed_for_job(std::string_view job_id)
        -> Result<std::size_t>;

private:
    [[nodiscard]] auto query_entries(std::string_view sql,
                                     std::string_view text_param,
                                     std::string_view what) const
        -> Result<std::vector<migration::outbox_entry>>;

    [[nodiscard]] static auto parse_row(sqlite3_stmt* stmt) -> migration::outbox_entry;

    sqlite3* db_{nullptr};
};

}  // namespace docmig::storage
