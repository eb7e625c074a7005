/**
 * @file task_executor.cpp
 * @brief Implementation of task_executor
 */

#include <docmig/migration/task_executor.hpp>

#include <docmig/integration/logger_adapter.hpp>
#include <docmig/migration/task_payload.hpp>
#include <docmig/storage/content_hasher.hpp>
#include <docmig/storage/migration_database.hpp>
#include <docmig/storage/provider_registry.hpp>

namespace docmig::migration {

using integration::job_event;
using integration::logger_adapter;

namespace {

auto now_ms() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto elapsed_ms(std::chrono::steady_clock::time_point since) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - since)
        .count();
}

/// BEGIN IMMEDIATE that reports a held write lock as claim_conflict
auto begin_claim(storage::scoped_transaction& tx) -> VoidResult {
    auto begun = tx.begin(true);
    if (begun.is_err() && begun.error().code == error_codes::database_busy) {
        return docmig_void_error(error_codes::claim_conflict,
                                 "Another worker holds the claim lock");
    }
    return begun;
}

}  // namespace

task_executor::task_executor(std::string worker_id,
                             std::unique_ptr<storage::migration_database> db,
                             std::shared_ptr<storage::provider_registry> registry,
                             const task_executor_config& config,
                             std::shared_ptr<di::ILogger> logger)
    : worker_id_(std::move(worker_id)),
      db_(std::move(db)),
      registry_(std::move(registry)),
      config_(config),
      logger_(logger ? std::move(logger) : di::null_logger()),
      jobs_(db_->handle()),
      items_(db_->handle()),
      outbox_(db_->handle()) {}

task_executor::~task_executor() = default;

// =============================================================================
// Claiming
// =============================================================================

auto task_executor::claim() -> Result<std::vector<outbox_entry>> {
    storage::scoped_transaction tx(db_->handle());
    auto begun = begin_claim(tx);
    if (begun.is_err()) {
        return forward_error<std::vector<outbox_entry>>(begun.error());
    }

    auto now = now_ms();
    auto job_id = outbox_.select_claimable_job(worker_id_, now);
    if (job_id.is_err()) {
        return forward_error<std::vector<outbox_entry>>(job_id.error());
    }
    if (!job_id.value().has_value()) {
        tx.rollback();
        return std::vector<outbox_entry>{};
    }

    auto job = jobs_.find_by_id(*job_id.value());
    if (job.is_err()) {
        return forward_error<std::vector<outbox_entry>>(job.error());
    }

    auto entries = outbox_.claim_batch(job.value().job_id, worker_id_, now,
                                       job.value().batch_size);
    if (entries.is_err()) {
        return forward_error<std::vector<outbox_entry>>(entries.error());
    }

    std::vector<outbox_entry> claimed;
    claimed.reserve(entries.value().size());
    for (auto& entry : entries.value()) {
        auto started = items_.mark_in_progress(entry.item_id);
        if (started.is_err()) {
            return forward_error<std::vector<outbox_entry>>(started.error());
        }
        if (!started.value()) {
            logger_->warn_fmt("Outbox entry {} points at item {} which is not pending",
                              entry.outbox_id, entry.item_id);
            auto failed = outbox_.mark_failed(entry.outbox_id, "item not pending when claimed");
            if (failed.is_err()) {
                return forward_error<std::vector<outbox_entry>>(failed.error());
            }
            continue;
        }
        claimed.push_back(std::move(entry));
    }

    auto committed = tx.commit();
    if (committed.is_err()) {
        if (committed.error().code == error_codes::database_busy) {
            return docmig_error<std::vector<outbox_entry>>(
                error_codes::claim_conflict, "Claim commit lost to another worker");
        }
        return forward_error<std::vector<outbox_entry>>(committed.error());
    }

    if (!claimed.empty()) {
        logger_->debug_fmt("Worker {} claimed {} entries of job {}", worker_id_,
                           claimed.size(), job.value().job_id);
    }
    return claimed;
}

auto task_executor::release(const std::vector<outbox_entry>& entries)
    -> Result<std::size_t> {
    if (entries.empty()) {
        return std::size_t{0};
    }

    storage::scoped_transaction tx(db_->handle());
    auto begun = tx.begin(true);
    if (begun.is_err()) {
        return forward_error<std::size_t>(begun.error());
    }

    std::size_t released = 0;
    for (const auto& entry : entries) {
        auto owned = still_owned(entry);
        if (owned.is_err()) {
            return forward_error<std::size_t>(owned.error());
        }
        if (!owned.value()) {
            continue;
        }
        auto returned = outbox_.release_claim(entry.outbox_id);
        if (returned.is_err()) {
            return forward_error<std::size_t>(returned.error());
        }
        if (!returned.value()) {
            continue;
        }
        auto undone = items_.undo_claim(entry.item_id);
        if (undone.is_err()) {
            return forward_error<std::size_t>(undone.error());
        }
        ++released;
    }

    auto committed = tx.commit();
    if (committed.is_err()) {
        return forward_error<std::size_t>(committed.error());
    }

    logger_->debug_fmt("Worker {} released {} unstarted claims", worker_id_, released);
    return released;
}

auto task_executor::recover_expired_claims() -> Result<std::size_t> {
    auto cutoff = now_ms() - config_.lease_timeout.count();
    auto expired = outbox_.find_expired_claims(cutoff);
    if (expired.is_err()) {
        return forward_error<std::size_t>(expired.error());
    }

    std::size_t recovered = 0;
    for (const auto& entry : expired.value()) {
        auto outcome = record_failure(entry, "claim lease expired", std::nullopt, 0, true);
        if (outcome.is_err()) {
            logger_->warn_fmt("Failed to recover expired claim {}: {}", entry.outbox_id,
                              outcome.error().message);
            continue;
        }
        if (outcome.value() != task_outcome::stale) {
            logger_->warn_fmt("Recovered expired claim {} held by {}", entry.outbox_id,
                              entry.claimed_by.value_or("unknown"));
            ++recovered;
        }
    }
    return recovered;
}

// =============================================================================
// Execution
// =============================================================================

auto task_executor::execute(const outbox_entry& entry) -> Result<task_outcome> {
    auto started = std::chrono::steady_clock::now();

    auto payload = task_payload::from_json(entry.payload);
    if (payload.is_err()) {
        logger_->error_fmt("Outbox entry {} has an unreadable payload: {}",
                           entry.outbox_id, payload.error().message);
        return record_failure(entry, "invalid payload: " + payload.error().message,
                              std::nullopt, 0, false);
    }

    auto item = items_.find_by_id(entry.item_id);
    if (item.is_err()) {
        return forward_error<task_outcome>(item.error());
    }

    auto result = transfer(payload.value(), item.value());
    auto duration = elapsed_ms(started);

    if (result.is_err()) {
        logger_->warn_fmt("Transfer of {} (job {}) failed on attempt {}: {}",
                          item.value().document_id, entry.job_id,
                          item.value().attempt_count, result.error().message);
        return record_failure(entry, result.error().message, std::nullopt, duration, true);
    }

    if (!result.value().content_match) {
        auto message = "content mismatch for " + item.value().document_id + ": expected " +
                       item.value().source_digest + ", got " +
                       result.value().dest_digest.value_or("none");
        logger_->warn_fmt("Job {}: {}", entry.job_id, message);
        return record_failure(entry, message, result.value().dest_digest, duration, true);
    }

    return record_success(entry, result.value(), duration);
}

auto task_executor::transfer(const task_payload& payload, const migration_item& item)
    -> Result<transfer_result> {
    auto source = registry_->resolve(payload.source_provider);
    if (source.is_err()) {
        return forward_error<transfer_result>(source.error());
    }

    if (payload.dry_run) {
        auto checked = storage::content_hasher::verify(*source.value(), payload.document_id,
                                                       payload.source_digest);
        if (checked.is_err()) {
            return forward_error<transfer_result>(checked.error());
        }
        transfer_result result;
        result.dry_run = true;
        result.content_match = checked.value().content_match;
        result.dest_digest = checked.value().actual_digest;
        result.content_size = static_cast<std::int64_t>(checked.value().content_size);
        return result;
    }

    auto dest = registry_->resolve(payload.dest_provider);
    if (dest.is_err()) {
        return forward_error<transfer_result>(dest.error());
    }

    const auto& dest_id = item.dest_document_id.empty() ? payload.document_id
                                                        : item.dest_document_id;

    auto doc = source.value()->get(payload.document_id);
    if (doc.is_err()) {
        // A move interrupted after the delete: the destination already holds it
        if (payload.strategy == migration_strategy::move &&
            doc.error().code == error_codes::document_not_found) {
            auto landed = storage::content_hasher::verify(*dest.value(), dest_id,
                                                          payload.source_digest);
            if (landed.is_ok() && landed.value().content_match) {
                transfer_result result;
                result.content_match = true;
                result.dest_digest = landed.value().actual_digest;
                result.content_size = static_cast<std::int64_t>(landed.value().content_size);
                return result;
            }
        }
        return forward_error<transfer_result>(doc.error());
    }

    auto source_digest = storage::content_hasher::digest(doc.value().content);
    if (source_digest.is_err()) {
        return forward_error<transfer_result>(source_digest.error());
    }
    if (!storage::content_hasher::matches(source_digest.value(), payload.source_digest)) {
        return docmig_error<transfer_result>(
            error_codes::content_mismatch,
            "Source document " + payload.document_id + " changed since it was queued");
    }

    auto written = dest.value()->put(dest_id, doc.value().content, doc.value().metadata);
    if (written.is_err()) {
        return forward_error<transfer_result>(written.error());
    }

    auto verified = storage::content_hasher::verify(*dest.value(), dest_id,
                                                    payload.source_digest);
    if (verified.is_err()) {
        return forward_error<transfer_result>(verified.error());
    }

    transfer_result result;
    result.content_match = verified.value().content_match;
    result.dest_digest = verified.value().actual_digest;
    result.content_size = static_cast<std::int64_t>(verified.value().content_size);
    if (!result.content_match) {
        return result;
    }

    if (payload.strategy == migration_strategy::move) {
        auto removed = source.value()->remove(payload.document_id);
        if (removed.is_err()) {
            return forward_error<transfer_result>(removed.error());
        }
    }
    return result;
}

// =============================================================================
// Recording
// =============================================================================

auto task_executor::still_owned(const outbox_entry& entry) const -> Result<bool> {
    auto current = outbox_.find_by_item(entry.item_id);
    if (current.is_err()) {
        return forward_error<bool>(current.error());
    }
    if (!current.value().has_value()) {
        return false;
    }
    const auto& row = *current.value();
    return row.outbox_id == entry.outbox_id && row.status == outbox_status::in_flight &&
           row.claimed_by == entry.claimed_by && row.claimed_at_ms == entry.claimed_at_ms;
}

auto task_executor::record_success(const outbox_entry& entry,
                                   const transfer_result& result,
                                   std::int64_t duration_ms) -> Result<task_outcome> {
    storage::scoped_transaction tx(db_->handle());
    auto begun = tx.begin(true);
    if (begun.is_err()) {
        return forward_error<task_outcome>(begun.error());
    }

    auto owned = still_owned(entry);
    if (owned.is_err()) {
        return forward_error<task_outcome>(owned.error());
    }
    if (!owned.value()) {
        tx.rollback();
        logger_->warn_fmt("Worker {} lost its claim on outbox entry {}", worker_id_,
                          entry.outbox_id);
        return task_outcome::stale;
    }

    storage::job_counter_delta delta;
    if (result.dry_run) {
        delta.skipped = 1;
    } else {
        delta.migrated = 1;
    }

    auto apply = [&]() -> Result<bool> {
        auto item_changed =
            result.dry_run
                ? items_.mark_skipped(entry.item_id, "dry run", duration_ms)
                : items_.mark_completed(entry.item_id, result.dest_digest.value_or(""),
                                        result.content_size, duration_ms);
        if (item_changed.is_err() || !item_changed.value()) {
            return item_changed;
        }
        return outbox_.mark_published(entry.outbox_id);
    };

    auto applied = apply();
    if (applied.is_err()) {
        return forward_error<task_outcome>(applied.error());
    }
    if (!applied.value()) {
        tx.rollback();
        return task_outcome::stale;
    }

    auto counted = jobs_.add_counts(entry.job_id, delta);
    if (counted.is_err()) {
        return forward_error<task_outcome>(counted.error());
    }

    auto settled = settle(entry.job_id);
    if (settled.is_err()) {
        return forward_error<task_outcome>(settled.error());
    }

    auto committed = tx.commit();
    if (committed.is_err()) {
        return forward_error<task_outcome>(committed.error());
    }

    log_settled(entry.job_id, settled.value());
    return result.dry_run ? task_outcome::skipped : task_outcome::completed;
}

auto task_executor::record_failure(const outbox_entry& entry,
                                   std::string_view error,
                                   const std::optional<std::string>& dest_digest,
                                   std::int64_t duration_ms,
                                   bool retryable) -> Result<task_outcome> {
    storage::scoped_transaction tx(db_->handle());
    auto begun = tx.begin(true);
    if (begun.is_err()) {
        return forward_error<task_outcome>(begun.error());
    }

    auto owned = still_owned(entry);
    if (owned.is_err()) {
        return forward_error<task_outcome>(owned.error());
    }
    if (!owned.value()) {
        tx.rollback();
        return task_outcome::stale;
    }

    auto job = jobs_.find_by_id(entry.job_id);
    if (job.is_err()) {
        return forward_error<task_outcome>(job.error());
    }
    auto item = items_.find_by_id(entry.item_id);
    if (item.is_err()) {
        return forward_error<task_outcome>(item.error());
    }

    task_outcome outcome = task_outcome::failed;
    storage::job_counter_delta delta;
    if (job.value().cancel_requested) {
        outcome = task_outcome::skipped;
        delta.skipped = 1;
    } else if (retryable && item.value().attempt_count < item.value().max_attempts) {
        outcome = task_outcome::retry_scheduled;
    } else {
        delta.failed = 1;
    }

    auto apply = [&]() -> Result<bool> {
        if (outcome == task_outcome::retry_scheduled) {
            auto delay = config_.retry.delay_for_attempt(item.value().attempt_count);
            auto item_changed = items_.mark_pending_retry(entry.item_id, error, dest_digest);
            if (item_changed.is_err() || !item_changed.value()) {
                return item_changed;
            }
            return outbox_.reschedule(entry.outbox_id, now_ms() + delay.count(), error);
        }

        auto item_changed =
            outcome == task_outcome::skipped
                ? items_.mark_skipped(entry.item_id, "job cancelled: " + std::string(error),
                                      duration_ms)
                : items_.mark_failed(entry.item_id, error, dest_digest, duration_ms);
        if (item_changed.is_err() || !item_changed.value()) {
            return item_changed;
        }
        return outbox_.mark_failed(entry.outbox_id, error);
    };

    auto applied = apply();
    if (applied.is_err()) {
        return forward_error<task_outcome>(applied.error());
    }
    if (!applied.value()) {
        tx.rollback();
        return task_outcome::stale;
    }

    if (delta.skipped != 0 || delta.failed != 0) {
        auto counted = jobs_.add_counts(entry.job_id, delta);
        if (counted.is_err()) {
            return forward_error<task_outcome>(counted.error());
        }
    }

    auto settled = settle(entry.job_id);
    if (settled.is_err()) {
        return forward_error<task_outcome>(settled.error());
    }

    auto committed = tx.commit();
    if (committed.is_err()) {
        return forward_error<task_outcome>(committed.error());
    }

    if (outcome == task_outcome::failed) {
        logger_->error_fmt("Item {} of job {} failed after {} attempts: {}",
                           entry.item_id, entry.job_id, item.value().attempt_count, error);
    }
    log_settled(entry.job_id, settled.value());
    return outcome;
}

auto task_executor::settle(std::string_view job_id)
    -> Result<std::optional<migration_job_status>> {
    auto counts = items_.count_by_status(job_id);
    if (counts.is_err()) {
        return forward_error<std::optional<migration_job_status>>(counts.error());
    }
    return jobs_.settle_if_drained(job_id, counts.value());
}

void task_executor::log_settled(const std::string& job_id,
                                const std::optional<migration_job_status>& status) {
    if (!status.has_value()) {
        return;
    }
    logger_->info_fmt("Job {} settled as {}", job_id, to_string(*status));
    logger_adapter::log_job_event(
        *status == migration_job_status::cancelled ? job_event::cancelled
                                                   : job_event::settled,
        job_id, {{"status", to_string(*status)}});
}

}  // namespace docmig::migration
