/**
 * @file task_executor.hpp
 * @brief Claims outbox entries and performs the document transfers
 *
 * A task_executor owns its own database connection. Claims run inside
 * BEGIN IMMEDIATE so that two executors never flip the same entry.
 */

#pragma once

#include <docmig/core/result.hpp>
#include <docmig/di/ilogger.hpp>
#include <docmig/migration/migration_types.hpp>
#include <docmig/migration/retry_policy.hpp>
#include <docmig/storage/item_repository.hpp>
#include <docmig/storage/job_repository.hpp>
#include <docmig/storage/outbox_repository.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docmig::storage {
class migration_database;
class provider_registry;
}  // namespace docmig::storage

namespace docmig::migration {

struct task_payload;

/**
 * @brief What happened to one claimed entry
 */
enum class task_outcome {
    completed,        ///< Transferred and verified
    skipped,          ///< Dry run, or job cancelled while in flight
    retry_scheduled,  ///< Failed, rescheduled with backoff
    failed,           ///< Failed, attempts exhausted
    stale             ///< Claim no longer owned; nothing recorded
};

[[nodiscard]] constexpr const char* to_string(task_outcome outcome) noexcept {
    switch (outcome) {
        case task_outcome::completed: return "completed";
        case task_outcome::skipped: return "skipped";
        case task_outcome::retry_scheduled: return "retry_scheduled";
        case task_outcome::failed: return "failed";
        case task_outcome::stale: return "stale";
        default: return "unknown";
    }
}

struct task_executor_config {
    retry_policy retry;

    /// In-flight claims older than this are recovered as failed attempts
    std::chrono::milliseconds lease_timeout{std::chrono::minutes{10}};
};

/**
 * @brief Executes claimed migration tasks for one worker
 *
 * Not thread-safe: each worker thread owns one executor.
 */
class task_executor {
public:
    task_executor(std::string worker_id,
                  std::unique_ptr<storage::migration_database> db,
                  std::shared_ptr<storage::provider_registry> registry,
                  const task_executor_config& config = {},
                  std::shared_ptr<di::ILogger> logger = nullptr);

    ~task_executor();

    task_executor(const task_executor&) = delete;
    auto operator=(const task_executor&) -> task_executor& = delete;

    /**
     * @brief Claim a batch from the oldest running job with capacity
     *
     * Items of the claimed entries move to in_progress in the same
     * transaction.
     *
     * @return Claimed entries (possibly empty), or claim_conflict when
     *         another worker holds the write lock
     */
    [[nodiscard]] auto claim() -> Result<std::vector<outbox_entry>>;

    /**
     * @brief Transfer, verify and record one claimed entry
     */
    [[nodiscard]] auto execute(const outbox_entry& entry) -> Result<task_outcome>;

    /**
     * @brief Hand unstarted claims back without consuming attempts
     */
    [[nodiscard]] auto release(const std::vector<outbox_entry>& entries)
        -> Result<std::size_t>;

    /**
     * @brief Turn claims older than the lease timeout into failed attempts
     * @return Number of claims recovered
     */
    [[nodiscard]] auto recover_expired_claims() -> Result<std::size_t>;

    [[nodiscard]] auto worker_id() const noexcept -> const std::string& {
        return worker_id_;
    }

private:
    /// Outcome of the storage work for one entry
    struct transfer_result {
        bool dry_run{false};
        bool content_match{false};
        std::optional<std::string> dest_digest;
        std::int64_t content_size{0};
    };

    [[nodiscard]] auto transfer(const task_payload& payload,
                                const migration_item& item) -> Result<transfer_result>;

    [[nodiscard]] auto record_success(const outbox_entry& entry,
                                      const transfer_result& result,
                                      std::int64_t duration_ms) -> Result<task_outcome>;

    [[nodiscard]] auto record_failure(const outbox_entry& entry,
                                      std::string_view error,
                                      const std::optional<std::string>& dest_digest,
                                      std::int64_t duration_ms,
                                      bool retryable) -> Result<task_outcome>;

    /// Whether this executor's claim on the entry is still the current one
    [[nodiscard]] auto still_owned(const outbox_entry& entry) const -> Result<bool>;

    /// Settle the job if drained; caller holds the transaction
    [[nodiscard]] auto settle(std::string_view job_id)
        -> Result<std::optional<migration_job_status>>;

    void log_settled(const std::string& job_id,
                     const std::optional<migration_job_status>& status);

    std::string worker_id_;
    std::unique_ptr<storage::migration_database> db_;
    std::shared_ptr<storage::provider_registry> registry_;
    task_executor_config config_;
    std::shared_ptr<di::ILogger> logger_;

    storage::job_repository jobs_;
    storage::item_repository items_;
    storage::outbox_repository outbox_;
};

}  // namespace docmig::migration
