/**
 * @file migration_manager.cpp
 * @brief Implementation of the migration job manager
 */

#include <docmig/migration/migration_manager.hpp>

#include <docmig/integration/logger_adapter.hpp>
#include <docmig/migration/progress_tracker.hpp>
#include <docmig/migration/task_payload.hpp>
#include <docmig/storage/content_hasher.hpp>
#include <docmig/storage/item_repository.hpp>
#include <docmig/storage/job_repository.hpp>
#include <docmig/storage/migration_database.hpp>
#include <docmig/storage/outbox_repository.hpp>
#include <docmig/storage/provider_registry.hpp>
#include <docmig/storage/provider_repository.hpp>

#include <nlohmann/json.hpp>

#include <iomanip>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <sstream>

namespace docmig::migration {

using integration::job_event;
using integration::logger_adapter;

namespace {

// =============================================================================
// Helper Functions
// =============================================================================

std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t ab = dis(gen);
    uint64_t cd = dis(gen);

    // Version 4, variant 10xx
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (ab >> 32);
    oss << '-';
    oss << std::setw(4) << ((ab >> 16) & 0xFFFF);
    oss << '-';
    oss << std::setw(4) << (ab & 0xFFFF);
    oss << '-';
    oss << std::setw(4) << (cd >> 48);
    oss << '-';
    oss << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);

    return oss.str();
}

/// Two registrations reach the same documents: same adapter type and an
/// equal configuration, compared as JSON so key order and spacing are ignored
bool same_storage(const storage::provider_registration& a,
                  const storage::provider_registration& b) {
    if (a.provider_type != b.provider_type) {
        return false;
    }
    auto lhs = nlohmann::json::parse(a.config_json, nullptr, false);
    auto rhs = nlohmann::json::parse(b.config_json, nullptr, false);
    if (lhs.is_discarded() || rhs.is_discarded()) {
        return a.config_json == b.config_json;
    }
    return lhs == rhs;
}

/// Source document captured before the enqueue transaction
struct document_snapshot {
    std::string document_id;
    std::string digest;
    std::int64_t size{0};
};

/// Result of one enqueue pass
struct enqueue_summary {
    std::size_t queued{0};
    std::size_t duplicates{0};
    std::size_t superseded{0};
};

auto unique_ids(const std::vector<std::string>& ids) -> std::vector<std::string> {
    std::vector<std::string> result;
    std::set<std::string> seen;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        if (id.empty() || !seen.insert(id).second) {
            continue;
        }
        result.push_back(id);
    }
    return result;
}

}  // namespace

// =============================================================================
// Implementation Structure
// =============================================================================

struct migration_manager::impl {
    std::unique_ptr<storage::migration_database> db;
    std::shared_ptr<storage::provider_registry> registry;
    migration_manager_config config;
    std::shared_ptr<di::ILogger> logger;

    storage::job_repository jobs;
    storage::item_repository items;
    storage::outbox_repository outbox;
    storage::provider_repository providers;

    /// Serializes use of the manager's connection
    mutable std::mutex mutex;

    impl(std::unique_ptr<storage::migration_database> database,
         std::shared_ptr<storage::provider_registry> reg,
         const migration_manager_config& cfg,
         std::shared_ptr<di::ILogger> log)
        : db(std::move(database)),
          registry(std::move(reg)),
          config(cfg),
          logger(log ? std::move(log) : di::null_logger()),
          jobs(db->handle()),
          items(db->handle()),
          outbox(db->handle()),
          providers(db->handle()) {}

    // =========================================================================
    // Validation
    // =========================================================================

    auto validate_request(const create_job_request& request) const -> VoidResult {
        if (request.job_name.empty()) {
            return docmig_void_error(error_codes::invalid_configuration,
                                     "Job name is empty");
        }
        if (request.source_provider.empty() || request.dest_provider.empty()) {
            return docmig_void_error(error_codes::invalid_configuration,
                                     "Source and destination providers are required");
        }
        if (request.source_provider == request.dest_provider) {
            return docmig_void_error(error_codes::invalid_configuration,
                                     "Source and destination must differ: " +
                                         request.source_provider);
        }
        if (request.filter_prefix.has_value() && !request.document_ids.empty()) {
            return docmig_void_error(error_codes::invalid_configuration,
                                     "filter_prefix and document_ids are mutually exclusive");
        }

        auto concurrency = request.concurrency.value_or(config.default_concurrency);
        if (concurrency < 1 || concurrency > config.max_concurrency) {
            return docmig_void_error(error_codes::invalid_configuration,
                                     "Concurrency out of range: " +
                                         std::to_string(concurrency));
        }
        auto batch_size = request.batch_size.value_or(config.default_batch_size);
        if (batch_size < 1 || batch_size > config.max_batch_size) {
            return docmig_void_error(error_codes::invalid_configuration,
                                     "Batch size out of range: " +
                                         std::to_string(batch_size));
        }
        auto max_attempts = request.max_attempts.value_or(config.default_max_attempts);
        if (max_attempts < 1) {
            return docmig_void_error(error_codes::invalid_configuration,
                                     "max_attempts must be at least 1");
        }
        return ok();
    }

    auto validate_providers(const create_job_request& request) const -> VoidResult {
        for (const auto& name : {request.source_provider, request.dest_provider}) {
            auto resolved = registry->resolve(name);
            if (resolved.is_err()) {
                return VoidResult(resolved.error());
            }
        }

        // Deleting the source after a move onto itself would lose the only copy
        if (request.strategy == migration_strategy::move) {
            auto source = registry->find(request.source_provider);
            auto dest = registry->find(request.dest_provider);
            if (source && dest && same_storage(*source, *dest)) {
                return docmig_void_error(error_codes::invalid_configuration,
                                         "Move source and destination share storage: " +
                                             request.source_provider + ", " +
                                             request.dest_provider);
            }
        }

        if (request.dry_run) {
            return ok();
        }

        if (!registry->is_writable(request.dest_provider)) {
            return docmig_void_error(error_codes::provider_unwritable,
                                     "Destination provider is not writable: " +
                                         request.dest_provider);
        }
        if (request.strategy == migration_strategy::move &&
            !registry->is_writable(request.source_provider)) {
            return docmig_void_error(error_codes::provider_unwritable,
                                     "Move requires a writable source: " +
                                         request.source_provider);
        }
        return ok();
    }

    // =========================================================================
    // Document Snapshots
    // =========================================================================

    /// Read and digest documents; runs outside any transaction
    auto snapshot_documents(std::string_view provider_name,
                            const std::vector<std::string>& document_ids) const
        -> Result<std::vector<document_snapshot>> {
        auto store = registry->resolve(provider_name);
        if (store.is_err()) {
            return forward_error<std::vector<document_snapshot>>(store.error());
        }

        std::vector<document_snapshot> snapshots;
        snapshots.reserve(document_ids.size());
        for (const auto& id : document_ids) {
            auto doc = store.value()->get(id);
            if (doc.is_err()) {
                return docmig_error<std::vector<document_snapshot>>(
                    error_codes::transfer_error,
                    "Failed to read source document " + id,
                    doc.error().message);
            }
            auto digest = storage::content_hasher::digest(doc.value().content);
            if (digest.is_err()) {
                return forward_error<std::vector<document_snapshot>>(digest.error());
            }
            snapshots.push_back(document_snapshot{
                id, digest.value(), static_cast<std::int64_t>(doc.value().content.size())});
        }
        return snapshots;
    }

    auto list_source_documents(std::string_view provider_name,
                               std::string_view prefix) const
        -> Result<std::vector<std::string>> {
        auto store = registry->resolve(provider_name);
        if (store.is_err()) {
            return forward_error<std::vector<std::string>>(store.error());
        }
        auto listed = store.value()->list(prefix);
        if (listed.is_err()) {
            return docmig_error<std::vector<std::string>>(
                error_codes::transfer_error,
                "Failed to list source documents with prefix " + std::string(prefix),
                listed.error().message);
        }
        return listed;
    }

    // =========================================================================
    // Enqueue (caller holds the transaction)
    // =========================================================================

    auto enqueue_locked(const migration_job& job,
                        const std::vector<document_snapshot>& snapshots)
        -> Result<enqueue_summary> {
        enqueue_summary summary;

        for (const auto& snapshot : snapshots) {
            auto key = make_idempotency_key(job.job_id, snapshot.document_id,
                                            snapshot.digest);
            auto exists = outbox.exists(key);
            if (exists.is_err()) {
                return forward_error<enqueue_summary>(exists.error());
            }
            if (exists.value()) {
                ++summary.duplicates;
                continue;
            }

            auto superseded = supersede_pending_locked(job.job_id, snapshot.document_id);
            if (superseded.is_err()) {
                return forward_error<enqueue_summary>(superseded.error());
            }
            summary.superseded += superseded.value();

            migration_item item;
            item.job_id = job.job_id;
            item.document_id = snapshot.document_id;
            item.dest_document_id = snapshot.document_id;
            item.source_provider = job.source_provider;
            item.dest_provider = job.dest_provider;
            item.max_attempts = job.max_attempts;
            item.source_digest = snapshot.digest;
            item.content_size = snapshot.size;

            auto item_id = items.insert(item);
            if (item_id.is_err()) {
                return forward_error<enqueue_summary>(item_id.error());
            }

            task_payload payload;
            payload.job_id = job.job_id;
            payload.item_id = item_id.value();
            payload.document_id = snapshot.document_id;
            payload.source_provider = job.source_provider;
            payload.dest_provider = job.dest_provider;
            payload.strategy = job.strategy;
            payload.dry_run = job.dry_run;
            payload.source_digest = snapshot.digest;
            payload.max_attempts = job.max_attempts;

            outbox_entry entry;
            entry.idempotent_key = std::move(key);
            entry.job_id = job.job_id;
            entry.item_id = item_id.value();
            entry.payload = payload.to_json();

            auto outbox_id = outbox.insert(entry);
            if (outbox_id.is_err()) {
                return forward_error<enqueue_summary>(outbox_id.error());
            }
            ++summary.queued;
        }

        storage::job_counter_delta delta;
        delta.total = static_cast<std::int64_t>(summary.queued);
        delta.skipped = static_cast<std::int64_t>(summary.superseded);
        if (delta.total != 0 || delta.skipped != 0) {
            auto counted = jobs.add_counts(job.job_id, delta);
            if (counted.is_err()) {
                return forward_error<enqueue_summary>(counted.error());
            }
        }
        return summary;
    }

    /// Skip still-pending items of the document whose content has changed
    auto supersede_pending_locked(std::string_view job_id, std::string_view document_id)
        -> Result<std::size_t> {
        auto pending = items.find_pending_by_document(job_id, document_id);
        if (pending.is_err()) {
            return forward_error<std::size_t>(pending.error());
        }

        std::size_t count = 0;
        for (const auto& old_item : pending.value()) {
            auto skipped = items.mark_skipped(old_item.item_id, "superseded by newer content");
            if (skipped.is_err()) {
                return forward_error<std::size_t>(skipped.error());
            }
            if (!skipped.value()) {
                continue;
            }
            auto entry = outbox.find_by_item(old_item.item_id);
            if (entry.is_err()) {
                return forward_error<std::size_t>(entry.error());
            }
            if (entry.value().has_value()) {
                auto failed = outbox.mark_failed(entry.value()->outbox_id, "superseded");
                if (failed.is_err()) {
                    return forward_error<std::size_t>(failed.error());
                }
            }
            ++count;
        }
        return count;
    }

    // =========================================================================
    // Settling (caller holds the transaction)
    // =========================================================================

    auto settle_locked(std::string_view job_id)
        -> Result<std::optional<migration_job_status>> {
        using settle_result = std::optional<migration_job_status>;

        auto counts = items.count_by_status(job_id);
        if (counts.is_err()) {
            return forward_error<settle_result>(counts.error());
        }
        return jobs.settle_if_drained(job_id, counts.value());
    }

    void log_settled(std::string_view job_id, const std::optional<migration_job_status>& status) {
        if (!status.has_value()) {
            return;
        }
        logger->info_fmt("Job {} settled as {}", job_id, to_string(*status));
        logger_adapter::log_job_event(
            *status == migration_job_status::cancelled ? job_event::cancelled
                                                       : job_event::settled,
            std::string(job_id), {{"status", to_string(*status)}});
    }

    /// Error for a failed conditional transition
    auto transition_error(std::string_view job_id, std::string_view action) const
        -> VoidResult {
        auto job = jobs.find_by_id(job_id);
        if (job.is_err()) {
            return VoidResult(job.error());
        }
        return docmig_void_error(error_codes::invalid_state,
                                 "Cannot " + std::string(action) + " job " +
                                     std::string(job_id) + " in status " +
                                     to_string(job.value().status));
    }

    /**
     * @brief Run a status transition plus settle check in one transaction
     */
    auto run_transition(std::string_view job_id,
                        const std::vector<migration_job_status>& from,
                        migration_job_status to,
                        std::string_view action) -> VoidResult {
        storage::scoped_transaction tx(db->handle());
        auto begun = tx.begin(true);
        if (begun.is_err()) {
            return begun;
        }

        auto changed = jobs.transition(job_id, from, to);
        if (changed.is_err()) {
            return VoidResult(changed.error());
        }
        if (!changed.value()) {
            return transition_error(job_id, action);
        }

        auto settled = settle_locked(job_id);
        if (settled.is_err()) {
            return VoidResult(settled.error());
        }

        auto committed = tx.commit();
        if (committed.is_err()) {
            return committed;
        }
        log_settled(job_id, settled.value());
        return ok();
    }
};

// =============================================================================
// Construction
// =============================================================================

migration_manager::migration_manager(std::unique_ptr<storage::migration_database> db,
                                     std::shared_ptr<storage::provider_registry> registry,
                                     const migration_manager_config& config,
                                     std::shared_ptr<di::ILogger> logger)
    : impl_(std::make_unique<impl>(std::move(db), std::move(registry), config,
                                   std::move(logger))) {}

migration_manager::~migration_manager() = default;

// =============================================================================
// Job Creation
// =============================================================================

auto migration_manager::create_job(const create_job_request& request)
    -> Result<migration_job> {
    auto valid = impl_->validate_request(request);
    if (valid.is_err()) {
        return forward_error<migration_job>(valid.error());
    }
    auto providers_ok = impl_->validate_providers(request);
    if (providers_ok.is_err()) {
        return forward_error<migration_job>(providers_ok.error());
    }

    std::vector<std::string> document_ids;
    if (request.filter_prefix.has_value()) {
        auto listed = impl_->list_source_documents(request.source_provider,
                                                   *request.filter_prefix);
        if (listed.is_err()) {
            return forward_error<migration_job>(listed.error());
        }
        document_ids = std::move(listed.value());
    } else {
        document_ids = unique_ids(request.document_ids);
    }

    auto snapshots = impl_->snapshot_documents(request.source_provider, document_ids);
    if (snapshots.is_err()) {
        return forward_error<migration_job>(snapshots.error());
    }

    migration_job job;
    job.job_id = generate_uuid();
    job.job_name = request.job_name;
    job.source_provider = request.source_provider;
    job.dest_provider = request.dest_provider;
    job.strategy = request.strategy;
    job.status = migration_job_status::pending;
    job.filter_prefix = request.filter_prefix;
    job.concurrency = request.concurrency.value_or(impl_->config.default_concurrency);
    job.batch_size = request.batch_size.value_or(impl_->config.default_batch_size);
    job.max_attempts = request.max_attempts.value_or(impl_->config.default_max_attempts);
    job.dry_run = request.dry_run;
    job.created_by = request.created_by;
    job.created_at = std::chrono::system_clock::now();

    std::lock_guard lock(impl_->mutex);

    storage::scoped_transaction tx(impl_->db->handle());
    auto begun = tx.begin(true);
    if (begun.is_err()) {
        return forward_error<migration_job>(begun.error());
    }

    auto inserted = impl_->jobs.insert(job);
    if (inserted.is_err()) {
        return forward_error<migration_job>(inserted.error());
    }

    auto summary = impl_->enqueue_locked(job, snapshots.value());
    if (summary.is_err()) {
        return forward_error<migration_job>(summary.error());
    }

    auto committed = tx.commit();
    if (committed.is_err()) {
        return forward_error<migration_job>(committed.error());
    }

    impl_->logger->info_fmt("Created migration job {} ({} -> {}, {}): {} documents",
                            job.job_id, job.source_provider, job.dest_provider,
                            to_string(job.strategy), summary.value().queued);
    logger_adapter::log_job_event(job_event::created, job.job_id,
                                  {{"name", job.job_name},
                                   {"source", job.source_provider},
                                   {"destination", job.dest_provider},
                                   {"strategy", to_string(job.strategy)},
                                   {"dry_run", job.dry_run ? "true" : "false"}});
    if (summary.value().queued > 0) {
        logger_adapter::log_job_event(
            job_event::documents_queued, job.job_id,
            {{"count", std::to_string(summary.value().queued)}});
    }

    return impl_->jobs.find_by_id(job.job_id);
}

auto migration_manager::queue_documents(std::string_view job_id,
                                        const std::vector<std::string>& document_ids)
    -> Result<std::size_t> {
    migration_job job;
    {
        std::lock_guard lock(impl_->mutex);
        auto found = impl_->jobs.find_by_id(job_id);
        if (found.is_err()) {
            return forward_error<std::size_t>(found.error());
        }
        job = std::move(found.value());
    }
    if (is_terminal_status(job.status) || job.cancel_requested) {
        return docmig_error<std::size_t>(error_codes::invalid_state,
                                         "Cannot queue documents into job " +
                                             job.job_id + " in status " +
                                             to_string(job.status));
    }

    auto ids = unique_ids(document_ids);
    if (ids.empty()) {
        return std::size_t{0};
    }

    auto snapshots = impl_->snapshot_documents(job.source_provider, ids);
    if (snapshots.is_err()) {
        return forward_error<std::size_t>(snapshots.error());
    }

    std::lock_guard lock(impl_->mutex);

    storage::scoped_transaction tx(impl_->db->handle());
    auto begun = tx.begin(true);
    if (begun.is_err()) {
        return forward_error<std::size_t>(begun.error());
    }

    // The job may have moved on while documents were being read
    auto current = impl_->jobs.find_by_id(job_id);
    if (current.is_err()) {
        return forward_error<std::size_t>(current.error());
    }
    if (is_terminal_status(current.value().status) || current.value().cancel_requested) {
        return docmig_error<std::size_t>(error_codes::invalid_state,
                                         "Cannot queue documents into job " +
                                             job.job_id + " in status " +
                                             to_string(current.value().status));
    }

    auto summary = impl_->enqueue_locked(current.value(), snapshots.value());
    if (summary.is_err()) {
        return forward_error<std::size_t>(summary.error());
    }

    auto committed = tx.commit();
    if (committed.is_err()) {
        return forward_error<std::size_t>(committed.error());
    }

    const auto& s = summary.value();
    impl_->logger->info_fmt("Job {}: queued {} documents ({} unchanged, {} superseded)",
                            job.job_id, s.queued, s.duplicates, s.superseded);
    if (s.queued > 0) {
        logger_adapter::log_job_event(job_event::documents_queued, job.job_id,
                                      {{"count", std::to_string(s.queued)},
                                       {"superseded", std::to_string(s.superseded)}});
    }
    return s.queued;
}

// =============================================================================
// Lifecycle
// =============================================================================

auto migration_manager::start_job(std::string_view job_id) -> VoidResult {
    std::lock_guard lock(impl_->mutex);

    auto result = impl_->run_transition(job_id, {migration_job_status::pending},
                                        migration_job_status::running, "start");
    if (result.is_ok()) {
        impl_->logger->info_fmt("Started job {}", job_id);
        logger_adapter::log_job_event(job_event::started, std::string(job_id));
    }
    return result;
}

auto migration_manager::pause_job(std::string_view job_id) -> VoidResult {
    std::lock_guard lock(impl_->mutex);

    auto result = impl_->run_transition(job_id, {migration_job_status::running},
                                        migration_job_status::paused, "pause");
    if (result.is_ok()) {
        impl_->logger->info_fmt("Paused job {}", job_id);
        logger_adapter::log_job_event(job_event::paused, std::string(job_id));
    }
    return result;
}

auto migration_manager::resume_job(std::string_view job_id) -> VoidResult {
    std::lock_guard lock(impl_->mutex);

    auto result = impl_->run_transition(job_id, {migration_job_status::paused},
                                        migration_job_status::running, "resume");
    if (result.is_ok()) {
        impl_->logger->info_fmt("Resumed job {}", job_id);
        logger_adapter::log_job_event(job_event::resumed, std::string(job_id));
    }
    return result;
}

auto migration_manager::cancel_job(std::string_view job_id) -> VoidResult {
    std::lock_guard lock(impl_->mutex);

    storage::scoped_transaction tx(impl_->db->handle());
    auto begun = tx.begin(true);
    if (begun.is_err()) {
        return begun;
    }

    auto job = impl_->jobs.find_by_id(job_id);
    if (job.is_err()) {
        return VoidResult(job.error());
    }
    if (is_terminal_status(job.value().status)) {
        return docmig_void_error(error_codes::invalid_state,
                                 "Cannot cancel job " + std::string(job_id) +
                                     " in status " + to_string(job.value().status));
    }

    auto raised = impl_->jobs.set_cancel_requested(job_id);
    if (raised.is_err()) {
        return VoidResult(raised.error());
    }

    auto skipped = impl_->items.skip_pending_for_job(job_id, "job cancelled");
    if (skipped.is_err()) {
        return VoidResult(skipped.error());
    }
    auto failed = impl_->outbox.fail_pending_for_job(job_id, "job cancelled");
    if (failed.is_err()) {
        return VoidResult(failed.error());
    }
    if (skipped.value() > 0) {
        storage::job_counter_delta delta;
        delta.skipped = static_cast<std::int64_t>(skipped.value());
        auto counted = impl_->jobs.add_counts(job_id, delta);
        if (counted.is_err()) {
            return counted;
        }
    }

    auto settled = impl_->settle_locked(job_id);
    if (settled.is_err()) {
        return VoidResult(settled.error());
    }

    auto committed = tx.commit();
    if (committed.is_err()) {
        return committed;
    }

    impl_->logger->info_fmt("Cancel requested for job {}: {} pending items skipped",
                            job_id, skipped.value());
    if (raised.value()) {
        logger_adapter::log_job_event(job_event::cancel_requested, std::string(job_id),
                                      {{"skipped", std::to_string(skipped.value())}});
    }
    impl_->log_settled(job_id, settled.value());
    return ok();
}

auto migration_manager::retry_failed_items(std::string_view job_id)
    -> Result<std::size_t> {
    std::lock_guard lock(impl_->mutex);

    storage::scoped_transaction tx(impl_->db->handle());
    auto begun = tx.begin(true);
    if (begun.is_err()) {
        return forward_error<std::size_t>(begun.error());
    }

    auto job = impl_->jobs.find_by_id(job_id);
    if (job.is_err()) {
        return forward_error<std::size_t>(job.error());
    }
    auto status = job.value().status;
    if (status != migration_job_status::failed && status != migration_job_status::partial) {
        return docmig_error<std::size_t>(error_codes::invalid_state,
                                         "Cannot retry job " + std::string(job_id) +
                                             " in status " + to_string(status));
    }

    // Outbox first: reopening keys off the item still being failed
    auto reopened = impl_->outbox.reopen_failed_for_job(job_id);
    if (reopened.is_err()) {
        return forward_error<std::size_t>(reopened.error());
    }
    auto reset = impl_->items.reset_failed_for_job(job_id, job.value().max_attempts);
    if (reset.is_err()) {
        return forward_error<std::size_t>(reset.error());
    }
    if (reset.value() != reopened.value()) {
        return docmig_error<std::size_t>(
            error_codes::invariant_violation,
            "Job " + std::string(job_id) + ": reopened " +
                std::to_string(reopened.value()) + " outbox entries for " +
                std::to_string(reset.value()) + " failed items");
    }

    storage::job_counter_delta delta;
    delta.failed = -static_cast<std::int64_t>(reset.value());
    auto counted = impl_->jobs.add_counts(job_id, delta);
    if (counted.is_err()) {
        return forward_error<std::size_t>(counted.error());
    }

    auto changed = impl_->jobs.transition(
        job_id, {migration_job_status::failed, migration_job_status::partial},
        migration_job_status::running, std::string{});
    if (changed.is_err()) {
        return forward_error<std::size_t>(changed.error());
    }

    auto settled = impl_->settle_locked(job_id);
    if (settled.is_err()) {
        return forward_error<std::size_t>(settled.error());
    }

    auto committed = tx.commit();
    if (committed.is_err()) {
        return forward_error<std::size_t>(committed.error());
    }

    impl_->logger->info_fmt("Job {}: re-queued {} failed items", job_id, reset.value());
    logger_adapter::log_job_event(job_event::retried, std::string(job_id),
                                  {{"count", std::to_string(reset.value())}});
    impl_->log_settled(job_id, settled.value());
    return reset.value();
}

// =============================================================================
// Queries
// =============================================================================

auto migration_manager::get_job(std::string_view job_id) const -> Result<migration_job> {
    std::lock_guard lock(impl_->mutex);
    return impl_->jobs.find_by_id(job_id);
}

auto migration_manager::get_progress(std::string_view job_id) const
    -> Result<migration_progress> {
    std::lock_guard lock(impl_->mutex);

    storage::scoped_transaction tx(impl_->db->handle());
    auto begun = tx.begin();
    if (begun.is_err()) {
        return forward_error<migration_progress>(begun.error());
    }

    auto job = impl_->jobs.find_by_id(job_id);
    if (job.is_err()) {
        return forward_error<migration_progress>(job.error());
    }
    auto counts = impl_->items.count_by_status(job_id);
    if (counts.is_err()) {
        return forward_error<migration_progress>(counts.error());
    }

    return progress_tracker::compute(job.value(), counts.value(),
                                     std::chrono::system_clock::now());
}

auto migration_manager::list_jobs(const job_query& query) const
    -> Result<std::vector<migration_job>> {
    std::lock_guard lock(impl_->mutex);
    return impl_->jobs.find_jobs(query);
}

auto migration_manager::list_items(std::string_view job_id, const item_query& query) const
    -> Result<std::vector<migration_item>> {
    std::lock_guard lock(impl_->mutex);
    return impl_->items.find_by_job(job_id, query);
}

auto migration_manager::list_outbox(std::string_view job_id) const
    -> Result<std::vector<outbox_entry>> {
    std::lock_guard lock(impl_->mutex);
    return impl_->outbox.find_by_job(job_id);
}

auto migration_manager::check_invariants(std::string_view job_id) const -> VoidResult {
    std::lock_guard lock(impl_->mutex);

    storage::scoped_transaction tx(impl_->db->handle());
    auto begun = tx.begin();
    if (begun.is_err()) {
        return begun;
    }

    auto job = impl_->jobs.find_by_id(job_id);
    if (job.is_err()) {
        return VoidResult(job.error());
    }
    auto counts = impl_->items.count_by_status(job_id);
    if (counts.is_err()) {
        return VoidResult(counts.error());
    }
    auto checked = progress_tracker::check_invariants(job.value(), counts.value());
    if (checked.is_err()) {
        return checked;
    }

    // Every item has exactly one outbox entry
    auto entries = impl_->outbox.find_by_job(job_id);
    if (entries.is_err()) {
        return VoidResult(entries.error());
    }
    if (static_cast<std::int64_t>(entries.value().size()) != counts.value().total()) {
        return docmig_void_error(error_codes::invariant_violation,
                                 "Job " + std::string(job_id) + " has " +
                                     std::to_string(entries.value().size()) +
                                     " outbox entries for " +
                                     std::to_string(counts.value().total()) + " items");
    }

    // Completed items were verified and their entries published
    std::map<std::int64_t, outbox_status> entry_status;
    for (const auto& entry : entries.value()) {
        entry_status[entry.item_id] = entry.status;
    }

    item_query completed_only;
    completed_only.status = item_status::completed;
    completed_only.limit = static_cast<std::size_t>(counts.value().completed);
    auto completed = impl_->items.find_by_job(job_id, completed_only);
    if (completed.is_err()) {
        return VoidResult(completed.error());
    }
    for (const auto& item : completed.value()) {
        if (item.content_match != true) {
            return docmig_void_error(error_codes::invariant_violation,
                                     "Job " + std::string(job_id) + ": completed item " +
                                         item.document_id + " has no content match");
        }
        auto it = entry_status.find(item.item_id);
        if (it == entry_status.end() || it->second != outbox_status::published) {
            return docmig_void_error(error_codes::invariant_violation,
                                     "Job " + std::string(job_id) + ": completed item " +
                                         item.document_id + " has no published outbox entry");
        }
    }
    return ok();
}

// =============================================================================
// Providers
// =============================================================================

auto migration_manager::list_providers() const
    -> std::vector<storage::provider_registration> {
    return impl_->registry->list();
}

auto migration_manager::register_provider(
    const storage::provider_registration& registration) -> VoidResult {
    if (registration.provider_name.empty()) {
        return docmig_void_error(error_codes::invalid_configuration,
                                 "Provider name is empty");
    }
    if (!impl_->registry->has_factory(registration.provider_type)) {
        return docmig_void_error(error_codes::provider_factory_missing,
                                 "Unknown provider type: " + registration.provider_type);
    }

    std::lock_guard lock(impl_->mutex);

    auto saved = impl_->providers.save(registration);
    if (saved.is_err()) {
        return saved;
    }
    auto stored = impl_->providers.find_by_name(registration.provider_name);
    if (stored.is_err()) {
        return VoidResult(stored.error());
    }
    if (!stored.value().has_value()) {
        return docmig_void_error(error_codes::provider_not_found,
                                 "Provider vanished after save: " +
                                     registration.provider_name);
    }

    auto refreshed = impl_->registry->refresh_provider(*stored.value());
    if (refreshed.is_err()) {
        return refreshed;
    }

    impl_->logger->info_fmt("Registered provider {} ({}, {})",
                            registration.provider_name, registration.provider_type,
                            storage::to_string(registration.status));
    return ok();
}

auto migration_manager::update_provider_status(std::string_view name,
                                               storage::provider_status status)
    -> VoidResult {
    std::lock_guard lock(impl_->mutex);

    auto updated = impl_->providers.update_status(name, status);
    if (updated.is_err()) {
        return updated;
    }
    auto stored = impl_->providers.find_by_name(name);
    if (stored.is_err()) {
        return VoidResult(stored.error());
    }
    if (!stored.value().has_value()) {
        return docmig_void_error(error_codes::provider_not_found,
                                 "Provider not found: " + std::string(name));
    }

    auto refreshed = impl_->registry->refresh_provider(*stored.value());
    if (refreshed.is_err()) {
        return refreshed;
    }

    impl_->logger->info_fmt("Provider {} is now {}", name, storage::to_string(status));
    return ok();
}

auto migration_manager::refresh_providers() -> Result<std::size_t> {
    std::lock_guard lock(impl_->mutex);

    auto registrations = impl_->providers.find_all();
    if (registrations.is_err()) {
        return forward_error<std::size_t>(registrations.error());
    }
    return impl_->registry->refresh(registrations.value());
}

auto migration_manager::config() const noexcept -> const migration_manager_config& {
    return impl_->config;
}

}  // namespace docmig::migration
