/**
 * @file migration_repository_test.cpp
 * @brief Unit tests for the job, item and outbox repositories
 */

#include <docmig/storage/item_repository.hpp>
#include <docmig/storage/job_repository.hpp>
#include <docmig/storage/migration_database.hpp>
#include <docmig/storage/outbox_repository.hpp>
#include <docmig/migration/task_payload.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stdexcept>
#include <string>

using namespace docmig;
using namespace docmig::storage;
using namespace docmig::migration;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/// In-memory database with the three repositories bound to it
class repository_set {
public:
    repository_set() {
        auto opened = migration_database::open(":memory:");
        if (opened.is_err()) {
            throw std::runtime_error(opened.error().message);
        }
        db_ = std::move(opened.value());
        jobs = std::make_unique<job_repository>(db_->handle());
        items = std::make_unique<item_repository>(db_->handle());
        outbox = std::make_unique<outbox_repository>(db_->handle());
    }

    auto add_job(const std::string& job_id,
                 migration_job_status status = migration_job_status::running,
                 int concurrency = 5) -> migration_job {
        migration_job job;
        job.job_id = job_id;
        job.job_name = "job " + job_id;
        job.source_provider = "source";
        job.dest_provider = "dest";
        job.status = status;
        job.concurrency = concurrency;
        job.created_at = std::chrono::system_clock::now();
        if (jobs->insert(job).is_err()) {
            throw std::runtime_error("failed to insert job");
        }
        return job;
    }

    /// Insert an item with its outbox entry, as the manager does
    auto add_item(const std::string& job_id, const std::string& document_id,
                  std::int64_t available_at_ms = 0) -> std::pair<std::int64_t, std::int64_t> {
        migration_item item;
        item.job_id = job_id;
        item.document_id = document_id;
        item.source_provider = "source";
        item.dest_provider = "dest";
        item.source_digest = "digest-" + document_id;
        auto item_id = items->insert(item);
        if (item_id.is_err()) {
            throw std::runtime_error("failed to insert item");
        }

        task_payload payload;
        payload.job_id = job_id;
        payload.item_id = item_id.value();
        payload.document_id = document_id;
        payload.source_provider = "source";
        payload.dest_provider = "dest";
        payload.source_digest = item.source_digest;

        outbox_entry entry;
        entry.idempotent_key = make_idempotency_key(job_id, document_id, item.source_digest);
        entry.job_id = job_id;
        entry.item_id = item_id.value();
        entry.payload = payload.to_json();
        entry.available_at_ms = available_at_ms;
        auto outbox_id = outbox->insert(entry);
        if (outbox_id.is_err()) {
            throw std::runtime_error("failed to insert outbox entry");
        }
        return {item_id.value(), outbox_id.value()};
    }

    std::unique_ptr<job_repository> jobs;
    std::unique_ptr<item_repository> items;
    std::unique_ptr<outbox_repository> outbox;

private:
    std::unique_ptr<migration_database> db_;
};

constexpr std::int64_t kNow = 1'000'000;

}  // namespace

// ============================================================================
// job_repository
// ============================================================================

TEST_CASE("job_repository: insert and find", "[storage][repository][job]") {
    repository_set repos;
    repos.add_job("job-1", migration_job_status::pending);

    auto found = repos.jobs->find_by_id("job-1");
    REQUIRE(found.is_ok());
    CHECK(found.value().job_name == "job job-1");
    CHECK(found.value().status == migration_job_status::pending);
    CHECK_FALSE(found.value().started_at.has_value());

    auto missing = repos.jobs->find_by_id("nope");
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::job_not_found);
}

TEST_CASE("job_repository: conditional transitions", "[storage][repository][job]") {
    repository_set repos;
    repos.add_job("job-1", migration_job_status::pending);

    auto started = repos.jobs->transition("job-1", {migration_job_status::pending},
                                          migration_job_status::running);
    REQUIRE(started.is_ok());
    CHECK(started.value());

    auto job = repos.jobs->find_by_id("job-1");
    REQUIRE(job.is_ok());
    CHECK(job.value().status == migration_job_status::running);
    CHECK(job.value().started_at.has_value());

    SECTION("wrong source status changes nothing") {
        auto again = repos.jobs->transition("job-1", {migration_job_status::pending},
                                            migration_job_status::running);
        REQUIRE(again.is_ok());
        CHECK_FALSE(again.value());
    }

    SECTION("terminal status stamps completed_at and error") {
        auto failed = repos.jobs->transition("job-1", {migration_job_status::running},
                                             migration_job_status::failed,
                                             std::string("boom"));
        REQUIRE(failed.is_ok());
        CHECK(failed.value());

        auto settled = repos.jobs->find_by_id("job-1");
        REQUIRE(settled.is_ok());
        CHECK(settled.value().completed_at.has_value());
        CHECK(settled.value().error_message == "boom");
    }
}

TEST_CASE("job_repository: counters and cancel flag", "[storage][repository][job]") {
    repository_set repos;
    repos.add_job("job-1");

    job_counter_delta delta;
    delta.total = 3;
    delta.migrated = 1;
    REQUIRE(repos.jobs->add_counts("job-1", delta).is_ok());
    REQUIRE(repos.jobs->add_counts("job-1", delta).is_ok());

    auto job = repos.jobs->find_by_id("job-1");
    REQUIRE(job.is_ok());
    CHECK(job.value().total_documents == 6);
    CHECK(job.value().migrated_documents == 2);

    auto unknown = repos.jobs->add_counts("nope", delta);
    REQUIRE(unknown.is_err());
    CHECK(unknown.error().code == error_codes::job_not_found);

    auto raised = repos.jobs->set_cancel_requested("job-1");
    REQUIRE(raised.is_ok());
    CHECK(raised.value());

    auto twice = repos.jobs->set_cancel_requested("job-1");
    REQUIRE(twice.is_ok());
    CHECK_FALSE(twice.value());
}

TEST_CASE("job_repository: find_jobs filters by status", "[storage][repository][job]") {
    repository_set repos;
    repos.add_job("a", migration_job_status::running);
    repos.add_job("b", migration_job_status::pending);
    repos.add_job("c", migration_job_status::running);

    job_query query;
    query.status = migration_job_status::running;
    auto running = repos.jobs->find_jobs(query);
    REQUIRE(running.is_ok());
    CHECK(running.value().size() == 2);

    auto all = repos.jobs->find_jobs({});
    REQUIRE(all.is_ok());
    CHECK(all.value().size() == 3);
}

TEST_CASE("job_repository: settle_if_drained", "[storage][repository][job]") {
    repository_set repos;
    repos.add_job("job-1");

    item_status_counts counts;
    counts.pending = 1;
    auto open = repos.jobs->settle_if_drained("job-1", counts);
    REQUIRE(open.is_ok());
    CHECK_FALSE(open.value().has_value());

    counts.pending = 0;
    counts.skipped = 1;
    auto settled = repos.jobs->settle_if_drained("job-1", counts);
    REQUIRE(settled.is_ok());
    REQUIRE(settled.value().has_value());
    CHECK(*settled.value() == migration_job_status::completed);
}

// ============================================================================
// item_repository
// ============================================================================

TEST_CASE("item_repository: worker transitions are guarded by status",
          "[storage][repository][item]") {
    repository_set repos;
    repos.add_job("job-1");
    auto [item_id, outbox_id] = repos.add_item("job-1", "a.txt");

    auto claimed = repos.items->mark_in_progress(item_id);
    REQUIRE(claimed.is_ok());
    CHECK(claimed.value());

    auto again = repos.items->mark_in_progress(item_id);
    REQUIRE(again.is_ok());
    CHECK_FALSE(again.value());

    SECTION("retry keeps the attempt count") {
        REQUIRE(repos.items->mark_pending_retry(item_id, "timeout", std::nullopt).value());
        auto item = repos.items->find_by_id(item_id);
        REQUIRE(item.is_ok());
        CHECK(item.value().status == item_status::pending);
        CHECK(item.value().attempt_count == 1);
        CHECK(item.value().error_message == "timeout");
    }

    SECTION("completion records the verified digest") {
        REQUIRE(repos.items->mark_completed(item_id, "digest-a.txt", 12, 5).value());
        auto item = repos.items->find_by_id(item_id);
        REQUIRE(item.is_ok());
        CHECK(item.value().status == item_status::completed);
        CHECK(item.value().dest_digest == "digest-a.txt");
        CHECK(item.value().content_match == true);
        CHECK(item.value().content_size == 12);

        auto late = repos.items->mark_failed(item_id, "late", std::nullopt, 1);
        REQUIRE(late.is_ok());
        CHECK_FALSE(late.value());
    }

    SECTION("undo_claim gives the attempt back") {
        REQUIRE(repos.items->undo_claim(item_id).value());
        auto item = repos.items->find_by_id(item_id);
        REQUIRE(item.is_ok());
        CHECK(item.value().status == item_status::pending);
        CHECK(item.value().attempt_count == 0);
    }
}

TEST_CASE("item_repository: missing item", "[storage][repository][item]") {
    repository_set repos;
    auto item = repos.items->find_by_id(999);
    REQUIRE(item.is_err());
    CHECK(item.error().code == error_codes::item_not_found);
}

TEST_CASE("item_repository: job-wide transitions", "[storage][repository][item]") {
    repository_set repos;
    repos.add_job("job-1");
    auto first = repos.add_item("job-1", "a.txt").first;
    repos.add_item("job-1", "b.txt");
    repos.add_item("job-1", "c.txt");

    REQUIRE(repos.items->mark_in_progress(first).value());
    REQUIRE(repos.items->mark_failed(first, "broken", std::nullopt, 3).value());

    auto skipped = repos.items->skip_pending_for_job("job-1", "cancelled");
    REQUIRE(skipped.is_ok());
    CHECK(skipped.value() == 2);

    auto counts = repos.items->count_by_status("job-1");
    REQUIRE(counts.is_ok());
    CHECK(counts.value().failed == 1);
    CHECK(counts.value().skipped == 2);
    CHECK(counts.value().total() == 3);

    auto reset = repos.items->reset_failed_for_job("job-1", 3);
    REQUIRE(reset.is_ok());
    CHECK(reset.value() == 1);

    auto item = repos.items->find_by_id(first);
    REQUIRE(item.is_ok());
    CHECK(item.value().status == item_status::pending);
    CHECK(item.value().attempt_count == 1);
    CHECK(item.value().max_attempts == 6);
    CHECK_FALSE(item.value().error_message.has_value());

    item_query pending_only;
    pending_only.status = item_status::pending;
    auto pending = repos.items->find_by_job("job-1", pending_only);
    REQUIRE(pending.is_ok());
    REQUIRE(pending.value().size() == 1);
    CHECK(pending.value()[0].document_id == "a.txt");
}

TEST_CASE("item_repository: find_pending_by_document", "[storage][repository][item]") {
    repository_set repos;
    repos.add_job("job-1");
    auto done = repos.add_item("job-1", "a.txt").first;
    repos.add_item("job-1", "a.txt");

    REQUIRE(repos.items->mark_in_progress(done).value());
    REQUIRE(repos.items->mark_completed(done, "d", 1, 1).value());

    auto pending = repos.items->find_pending_by_document("job-1", "a.txt");
    REQUIRE(pending.is_ok());
    REQUIRE(pending.value().size() == 1);
    CHECK(pending.value()[0].item_id != done);
}

// ============================================================================
// outbox_repository
// ============================================================================

TEST_CASE("outbox_repository: idempotency key is unique",
          "[storage][repository][outbox]") {
    repository_set repos;
    repos.add_job("job-1");
    repos.add_item("job-1", "a.txt");

    auto key = make_idempotency_key("job-1", "a.txt", "digest-a.txt");
    auto exists = repos.outbox->exists(key);
    REQUIRE(exists.is_ok());
    CHECK(exists.value());

    auto found = repos.outbox->find_by_key(key);
    REQUIRE(found.is_ok());
    REQUIRE(found.value().has_value());
    CHECK(found.value()->status == outbox_status::pending);

    CHECK_THROWS(repos.add_item("job-1", "a.txt"));
}

TEST_CASE("outbox_repository: claim_batch", "[storage][repository][outbox]") {
    repository_set repos;
    repos.add_job("job-1");
    repos.add_item("job-1", "a.txt");
    repos.add_item("job-1", "b.txt");
    repos.add_item("job-1", "c.txt");
    repos.add_item("job-1", "later.txt", kNow + 60'000);

    auto job = repos.outbox->select_claimable_job("worker-1", kNow);
    REQUIRE(job.is_ok());
    REQUIRE(job.value().has_value());
    CHECK(*job.value() == "job-1");

    auto batch = repos.outbox->claim_batch("job-1", "worker-1", kNow, 2);
    REQUIRE(batch.is_ok());
    REQUIRE(batch.value().size() == 2);
    CHECK(batch.value()[0].outbox_id < batch.value()[1].outbox_id);
    for (const auto& entry : batch.value()) {
        CHECK(entry.status == outbox_status::in_flight);
        CHECK(entry.claimed_by == "worker-1");
        CHECK(entry.claimed_at_ms == kNow);
        CHECK(entry.publish_attempts == 1);
    }

    SECTION("claimed entries are not claimed again") {
        auto rest = repos.outbox->claim_batch("job-1", "worker-2", kNow, 10);
        REQUIRE(rest.is_ok());
        REQUIRE(rest.value().size() == 1);
        auto payload = task_payload::from_json(rest.value()[0].payload);
        REQUIRE(payload.is_ok());
        CHECK(payload.value().document_id == "c.txt");
    }

    SECTION("delayed entries become claimable later") {
        auto rest = repos.outbox->claim_batch("job-1", "worker-2", kNow + 60'000, 10);
        REQUIRE(rest.is_ok());
        CHECK(rest.value().size() == 2);
    }

    SECTION("release returns the entry without consuming an attempt") {
        auto released = repos.outbox->release_claim(batch.value()[0].outbox_id);
        REQUIRE(released.is_ok());
        CHECK(released.value());

        auto entry = repos.outbox->find_by_item(batch.value()[0].item_id);
        REQUIRE(entry.is_ok());
        REQUIRE(entry.value().has_value());
        CHECK(entry.value()->status == outbox_status::pending);
        CHECK(entry.value()->publish_attempts == 0);
        CHECK_FALSE(entry.value()->claimed_by.has_value());
    }

    SECTION("expired claims are found by cutoff") {
        auto expired = repos.outbox->find_expired_claims(kNow + 1);
        REQUIRE(expired.is_ok());
        CHECK(expired.value().size() == 2);

        auto fresh = repos.outbox->find_expired_claims(kNow);
        REQUIRE(fresh.is_ok());
        CHECK(fresh.value().empty());
    }
}

TEST_CASE("outbox_repository: claimable job selection", "[storage][repository][outbox]") {
    repository_set repos;

    SECTION("non-running jobs are skipped") {
        repos.add_job("paused", migration_job_status::paused);
        repos.add_item("paused", "a.txt");

        auto job = repos.outbox->select_claimable_job("worker-1", kNow);
        REQUIRE(job.is_ok());
        CHECK_FALSE(job.value().has_value());
    }

    SECTION("cancel requested jobs are skipped") {
        repos.add_job("cancelling");
        repos.add_item("cancelling", "a.txt");
        REQUIRE(repos.jobs->set_cancel_requested("cancelling").value());

        auto job = repos.outbox->select_claimable_job("worker-1", kNow);
        REQUIRE(job.is_ok());
        CHECK_FALSE(job.value().has_value());
    }

    SECTION("concurrency limits distinct workers") {
        repos.add_job("narrow", migration_job_status::running, 1);
        repos.add_item("narrow", "a.txt");
        repos.add_item("narrow", "b.txt");
        REQUIRE(repos.outbox->claim_batch("narrow", "worker-1", kNow, 1).value().size() == 1);

        auto other = repos.outbox->select_claimable_job("worker-2", kNow);
        REQUIRE(other.is_ok());
        CHECK_FALSE(other.value().has_value());

        auto same = repos.outbox->select_claimable_job("worker-1", kNow);
        REQUIRE(same.is_ok());
        CHECK(same.value().has_value());
    }
}

TEST_CASE("outbox_repository: completion transitions", "[storage][repository][outbox]") {
    repository_set repos;
    repos.add_job("job-1");
    auto [item_id, outbox_id] = repos.add_item("job-1", "a.txt");
    repos.add_item("job-1", "b.txt");

    auto claimed = repos.outbox->claim_batch("job-1", "worker-1", kNow, 1);
    REQUIRE(claimed.is_ok());
    REQUIRE(claimed.value().size() == 1);
    CHECK(claimed.value()[0].outbox_id == outbox_id);

    SECTION("reschedule delays the next claim") {
        REQUIRE(repos.outbox->reschedule(outbox_id, kNow + 5'000, "timeout").value());
        auto entry = repos.outbox->find_by_item(item_id);
        REQUIRE(entry.is_ok());
        CHECK(entry.value()->status == outbox_status::pending);
        CHECK(entry.value()->available_at_ms == kNow + 5'000);
        CHECK(entry.value()->last_error == "timeout");
    }

    SECTION("publish only from in_flight") {
        REQUIRE(repos.outbox->mark_published(outbox_id).value());
        auto twice = repos.outbox->mark_published(outbox_id);
        REQUIRE(twice.is_ok());
        CHECK_FALSE(twice.value());

        auto published = repos.outbox->count_by_status("job-1", outbox_status::published);
        REQUIRE(published.is_ok());
        CHECK(published.value() == 1);
    }

    SECTION("fail pending entries of a job") {
        auto failed = repos.outbox->fail_pending_for_job("job-1", "cancelled");
        REQUIRE(failed.is_ok());
        CHECK(failed.value() == 1);
    }

    SECTION("reopen only entries whose item failed") {
        REQUIRE(repos.items->mark_in_progress(item_id).value());
        REQUIRE(repos.items->mark_failed(item_id, "broken", std::nullopt, 1).value());
        REQUIRE(repos.outbox->mark_failed(outbox_id, "broken").value());
        REQUIRE(repos.outbox->fail_pending_for_job("job-1", "cancelled").value() == 1);

        auto reopened = repos.outbox->reopen_failed_for_job("job-1");
        REQUIRE(reopened.is_ok());
        CHECK(reopened.value() == 1);

        auto entry = repos.outbox->find_by_item(item_id);
        REQUIRE(entry.is_ok());
        CHECK(entry.value()->status == outbox_status::pending);
        CHECK(entry.value()->available_at_ms == 0);
    }
}
