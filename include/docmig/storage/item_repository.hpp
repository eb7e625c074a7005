/**
 * @file item_repository.hpp
 * @brief Persistence of per-document migration items
 *
 * Every state change is guarded by the expected current status, so a
 * stale writer changes nothing and sees false instead of corrupting the
 * state machine.
 */

#pragma once

#include <docmig/core/result.hpp>
#include <docmig/migration/migration_types.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace docmig::storage {

/**
 * @brief Repository for migration_items
 *
 * Thread Safety: NOT thread-safe; bound to one connection.
 */
class item_repository {
public:
    explicit item_repository(sqlite3* db);
    ~item_repository() = default;

    item_repository(const item_repository&) = delete;
    auto operator=(const item_repository&) -> item_repository& = delete;
    item_repository(item_repository&&) noexcept = default;
    auto operator=(item_repository&&) noexcept -> item_repository& = default;

    /**
     * @brief Insert a pending item
     * @return The new item_id
     */
    [[nodiscard]] auto insert(const migration::migration_item& item)
        -> Result<std::int64_t>;

    [[nodiscard]] auto find_by_id(std::int64_t item_id) const
        -> Result<migration::migration_item>;

    /**
     * @brief Items of a job in enqueue order
     */
    [[nodiscard]] auto find_by_job(std::string_view job_id,
                                   const migration::item_query& query = {}) const
        -> Result<std::vector<migration::migration_item>>;

    /**
     * @brief Pending items of a job for one document
     */
    [[nodiscard]] auto find_pending_by_document(std::string_view job_id,
                                                std::string_view document_id) const
        -> Result<std::vector<migration::migration_item>>;

    [[nodiscard]] auto count_by_status(std::string_view job_id) const
        -> Result<migration::item_status_counts>;

    // ---------------------------------------------------------------------
    // Worker transitions
    // ---------------------------------------------------------------------

    /// pending -> in_progress, attempt_count + 1
    [[nodiscard]] auto mark_in_progress(std::int64_t item_id) -> Result<bool>;

    /// in_progress -> completed with a verified destination digest
    [[nodiscard]] auto mark_completed(std::int64_t item_id,
                                      std::string_view dest_digest,
                                      std::int64_t content_size,
                                      std::int64_t duration_ms) -> Result<bool>;

    /// in_progress -> pending for another attempt
    [[nodiscard]] auto mark_pending_retry(std::int64_t item_id,
                                          std::string_view error,
                                          const std::optional<std::string>& dest_digest)
        -> Result<bool>;

    /// in_progress -> failed, attempts exhausted
    [[nodiscard]] auto mark_failed(std::int64_t item_id,
                                   std::string_view error,
                                   const std::optional<std::string>& dest_digest,
                                   std::int64_t duration_ms) -> Result<bool>;

    /// pending or in_progress -> skipped
    [[nodiscard]] auto mark_skipped(std::int64_t item_id,
                                    std::string_view reason,
                                    std::int64_t duration_ms = 0) -> Result<bool>;

    /// in_progress -> pending without consuming an attempt
    [[nodiscard]] auto undo_claim(std::int64_t item_id) -> Result<bool>;

    // ---------------------------------------------------------------------
    // Job-wide transitions
    // ---------------------------------------------------------------------

    /// Every pending item of the job -> skipped
    [[nodiscard]] auto skip_pending_for_job(std::string_view job_id,
                                            std::string_view reason)
        -> Result<std::size_t>;

    /**
     * @brief Every failed item of the job -> pending
     *
     * max_attempts grows by extra_attempts so the item gets a fresh budget
     * while attempt_count keeps counting.
     */
    [[nodiscard]] auto reset_failed_for_job(std::string_view job_id,
                                            int extra_attempts)
        -> Result<std::size_t>;

private:
    [[nodiscard]] auto update_one(std::string_view sql,
                                  std::int64_t item_id,
                                  std::string_view what) -> Result<bool>;

    [[nodiscard]] static auto parse_row(sqlite3_stmt* stmt) -> migration::migration_item;

    sqlite3* db_{nullptr};
};

}  // namespace docmig::storage
