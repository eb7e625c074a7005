/**
 * @file migration_workflow_test.cpp
 * @brief End-to-end migration scenarios over a shared SQLite file
 *
 * Jobs are created through migration_manager and executed by worker_pool
 * instances, either on background workers or cycle by cycle via run_once().
 */

#include <docmig/migration/migration_manager.hpp>
#include <docmig/migration/task_executor.hpp>
#include <docmig/migration/worker_pool.hpp>

#include "../mocks/migration_fixture.hpp"
#include "../mocks/mock_thread_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <thread>

using namespace docmig;
using namespace docmig::migration;
using docmig::integration::testing::mock_thread_pool;
using docmig::testing::drain;
using docmig::testing::migration_fixture;
using docmig::testing::wait_for_terminal;
using namespace std::chrono_literals;

namespace {

auto seed_documents(migration_fixture& fixture, int count) -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (int i = 0; i < count; ++i) {
        ids.push_back("docs/" + std::to_string(i) + ".txt");
        fixture.source().seed(ids.back(), "content of document " + std::to_string(i));
    }
    return ids;
}

auto threaded_pool(migration_fixture& fixture, std::size_t workers)
    -> std::unique_ptr<worker_pool> {
    return std::make_unique<worker_pool>(fixture.pool_config(workers), fixture.registry(),
                                         std::make_shared<mock_thread_pool>());
}

}  // namespace

// ============================================================================
// Background Workers
// ============================================================================

TEST_CASE("workflow: five documents with three workers", "[integration][workflow]") {
    migration_fixture fixture;
    auto ids = seed_documents(fixture, 5);
    auto manager = fixture.make_manager();

    auto request = migration_fixture::copy_request(ids);
    request.concurrency = 3;
    request.batch_size = 1;
    auto job = manager->create_job(request);
    REQUIRE(job.is_ok());
    const auto job_id = job.value().job_id;

    auto workers = threaded_pool(fixture, 3);
    REQUIRE(workers->start().is_ok());
    REQUIRE(manager->start_job(job_id).is_ok());
    workers->wake();

    CHECK(wait_for_terminal(*manager, job_id) == migration_job_status::completed);
    workers->stop();

    for (const auto& id : ids) {
        CHECK(fixture.dest().body(id) == fixture.source().body(id));
    }
    CHECK(fixture.dest().put_calls() == 5);

    auto progress = manager->get_progress(job_id);
    REQUIRE(progress.is_ok());
    CHECK(progress.value().migrated == 5);
    CHECK(progress.value().percent == 100.0);
    CHECK(manager->check_invariants(job_id).is_ok());
}

TEST_CASE("workflow: two pools on one database never duplicate work",
          "[integration][workflow]") {
    migration_fixture fixture;
    auto ids = seed_documents(fixture, 20);
    auto manager = fixture.make_manager();

    auto request = migration_fixture::copy_request(ids);
    request.batch_size = 3;
    request.concurrency = 4;
    auto job = manager->create_job(request);
    REQUIRE(job.is_ok());
    const auto job_id = job.value().job_id;

    auto first_config = fixture.pool_config(2);
    first_config.worker_id_prefix = "node-a";
    auto second_config = fixture.pool_config(2);
    second_config.worker_id_prefix = "node-b";
    worker_pool first(first_config, fixture.registry(), std::make_shared<mock_thread_pool>());
    worker_pool second(second_config, fixture.registry(),
                       std::make_shared<mock_thread_pool>());

    REQUIRE(manager->start_job(job_id).is_ok());
    REQUIRE(first.start().is_ok());
    REQUIRE(second.start().is_ok());

    CHECK(wait_for_terminal(*manager, job_id) == migration_job_status::completed);
    first.stop();
    second.stop();

    CHECK(fixture.dest().put_calls() == 20);
    CHECK(first.stats().completed + second.stats().completed == 20);
    CHECK(manager->check_invariants(job_id).is_ok());
}

TEST_CASE("workflow: cancel while workers are busy", "[integration][workflow]") {
    migration_fixture fixture;
    auto ids = seed_documents(fixture, 10);
    fixture.dest().set_put_delay(50ms);
    auto manager = fixture.make_manager();

    auto request = migration_fixture::copy_request(ids);
    request.batch_size = 1;
    auto job = manager->create_job(request);
    REQUIRE(job.is_ok());
    const auto job_id = job.value().job_id;

    auto workers = threaded_pool(fixture, 1);
    REQUIRE(manager->start_job(job_id).is_ok());
    REQUIRE(workers->start().is_ok());

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (fixture.dest().put_calls() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(manager->cancel_job(job_id).is_ok());

    CHECK(wait_for_terminal(*manager, job_id) == migration_job_status::cancelled);
    workers->stop();

    auto final_job = manager->get_job(job_id);
    REQUIRE(final_job.is_ok());
    CHECK(final_job.value().skipped_documents > 0);
    CHECK(final_job.value().processed_documents() == 10);
    CHECK(final_job.value().failed_documents == 0);
    CHECK(manager->check_invariants(job_id).is_ok());
}

TEST_CASE("workflow: default thread pool adapter runs the workers",
          "[integration][workflow][thread_system]") {
    migration_fixture fixture;
    auto ids = seed_documents(fixture, 4);
    auto manager = fixture.make_manager();

    auto job = manager->create_job(migration_fixture::copy_request(ids));
    REQUIRE(job.is_ok());
    REQUIRE(manager->start_job(job.value().job_id).is_ok());

    auto workers = fixture.make_pool(2);
    REQUIRE(workers->start().is_ok());
    CHECK(wait_for_terminal(*manager, job.value().job_id) == migration_job_status::completed);
    workers->stop();
    CHECK_FALSE(workers->is_running());
}

// ============================================================================
// Cycle-by-cycle Scenarios
// ============================================================================

TEST_CASE("workflow: re-queueing the same documents is idempotent",
          "[integration][workflow]") {
    migration_fixture fixture;
    auto ids = seed_documents(fixture, 3);
    auto manager = fixture.make_manager();
    auto pool = fixture.make_pool();

    auto job = manager->create_job(migration_fixture::copy_request(ids));
    REQUIRE(job.is_ok());
    const auto job_id = job.value().job_id;
    REQUIRE(manager->start_job(job_id).is_ok());

    auto queued = manager->queue_documents(job_id, ids);
    REQUIRE(queued.is_ok());
    CHECK(queued.value() == 0);

    CHECK(drain(*pool, *manager, job_id) == migration_job_status::completed);
    CHECK(fixture.dest().put_calls() == 3);

    auto items = manager->list_items(job_id);
    REQUIRE(items.is_ok());
    CHECK(items.value().size() == 3);
}

TEST_CASE("workflow: transient failures succeed on the third attempt",
          "[integration][workflow]") {
    migration_fixture fixture;
    fixture.source().seed("report.pdf", "quarterly numbers");
    fixture.dest().fail_next_puts(2);
    auto manager = fixture.make_manager();
    auto pool = fixture.make_pool();

    auto request = migration_fixture::copy_request({"report.pdf"});
    request.max_attempts = 3;
    auto job = manager->create_job(request);
    REQUIRE(job.is_ok());
    const auto job_id = job.value().job_id;
    REQUIRE(manager->start_job(job_id).is_ok());

    CHECK(drain(*pool, *manager, job_id) == migration_job_status::completed);

    auto items = manager->list_items(job_id);
    REQUIRE(items.is_ok());
    REQUIRE(items.value().size() == 1);
    CHECK(items.value()[0].status == item_status::completed);
    CHECK(items.value()[0].attempt_count == 3);
    CHECK(pool->stats().retried == 2);
    CHECK(fixture.dest().body("report.pdf") == "quarterly numbers");
}

TEST_CASE("workflow: permanent failure leaves a partial job and can be retried",
          "[integration][workflow]") {
    migration_fixture fixture;
    auto ids = seed_documents(fixture, 3);
    fixture.dest().fail_puts_for(ids[1]);
    auto manager = fixture.make_manager();
    auto pool = fixture.make_pool();

    auto request = migration_fixture::copy_request(ids);
    request.max_attempts = 2;
    auto job = manager->create_job(request);
    REQUIRE(job.is_ok());
    const auto job_id = job.value().job_id;
    REQUIRE(manager->start_job(job_id).is_ok());

    CHECK(drain(*pool, *manager, job_id) == migration_job_status::partial);

    auto partial = manager->get_job(job_id);
    REQUIRE(partial.is_ok());
    CHECK(partial.value().migrated_documents == 2);
    CHECK(partial.value().failed_documents == 1);
    CHECK(manager->check_invariants(job_id).is_ok());

    fixture.dest().clear_failures();
    auto retried = manager->retry_failed_items(job_id);
    REQUIRE(retried.is_ok());
    CHECK(retried.value() == 1);

    auto reopened = manager->get_job(job_id);
    REQUIRE(reopened.is_ok());
    CHECK(reopened.value().status == migration_job_status::running);
    CHECK(reopened.value().failed_documents == 0);
    CHECK(reopened.value().error_message.empty());
    CHECK(manager->check_invariants(job_id).is_ok());

    CHECK(drain(*pool, *manager, job_id) == migration_job_status::completed);

    item_query failed_only;
    failed_only.status = item_status::failed;
    auto failed = manager->list_items(job_id, failed_only);
    REQUIRE(failed.is_ok());
    CHECK(failed.value().empty());

    auto items = manager->list_items(job_id);
    REQUIRE(items.is_ok());
    CHECK(items.value()[1].attempt_count == 3);
    CHECK(items.value()[1].max_attempts == 4);
    CHECK(manager->check_invariants(job_id).is_ok());
}

TEST_CASE("workflow: processed count never goes backwards while retrying",
          "[integration][workflow]") {
    migration_fixture fixture;
    auto ids = seed_documents(fixture, 12);
    fixture.dest().fail_next_puts(6);
    fixture.dest().fail_puts_for(ids[4]);
    fixture.dest().set_put_delay(2ms);
    auto manager = fixture.make_manager();

    // More attempts than injected write failures: only ids[4] can fail for good
    auto request = migration_fixture::copy_request(ids);
    request.max_attempts = 8;
    request.batch_size = 2;
    request.concurrency = 3;
    auto job = manager->create_job(request);
    REQUIRE(job.is_ok());
    const auto job_id = job.value().job_id;

    auto workers = threaded_pool(fixture, 3);
    REQUIRE(workers->start().is_ok());
    REQUIRE(manager->start_job(job_id).is_ok());
    workers->wake();

    auto processed_of = [](const migration_progress& p) {
        return p.migrated + p.failed + p.skipped;
    };

    std::int64_t last_processed = 0;
    std::size_t samples = 0;
    bool regressed = false;
    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (std::chrono::steady_clock::now() < deadline) {
        auto progress = manager->get_progress(job_id);
        REQUIRE(progress.is_ok());
        auto processed = processed_of(progress.value());
        if (processed < last_processed) {
            regressed = true;
        }
        last_processed = processed;
        ++samples;
        if (is_terminal_status(progress.value().status)) {
            break;
        }
        std::this_thread::sleep_for(1ms);
    }
    workers->stop();

    CHECK_FALSE(regressed);
    CHECK(samples > 1);
    CHECK(last_processed == 12);

    auto settled = manager->get_job(job_id);
    REQUIRE(settled.is_ok());
    CHECK(settled.value().status == migration_job_status::partial);
    CHECK(settled.value().migrated_documents == 11);
    CHECK(settled.value().failed_documents == 1);
    CHECK(manager->check_invariants(job_id).is_ok());

    SECTION("an explicit retry starts a new run") {
        fixture.dest().clear_failures();
        auto retried = manager->retry_failed_items(job_id);
        REQUIRE(retried.is_ok());
        CHECK(retried.value() == 1);

        auto reopened = manager->get_progress(job_id);
        REQUIRE(reopened.is_ok());
        CHECK(processed_of(reopened.value()) == 11);

        auto pool = fixture.make_pool();
        CHECK(drain(*pool, *manager, job_id) == migration_job_status::completed);

        auto finished = manager->get_progress(job_id);
        REQUIRE(finished.is_ok());
        CHECK(processed_of(finished.value()) == 12);
    }
}

TEST_CASE("workflow: completed items need a verified, published entry",
          "[integration][workflow]") {
    migration_fixture fixture;
    auto ids = seed_documents(fixture, 2);
    auto manager = fixture.make_manager();
    auto pool = fixture.make_pool();

    auto job = manager->create_job(migration_fixture::copy_request(ids));
    REQUIRE(job.is_ok());
    const auto job_id = job.value().job_id;
    REQUIRE(manager->start_job(job_id).is_ok());
    CHECK(drain(*pool, *manager, job_id) == migration_job_status::completed);
    REQUIRE(manager->check_invariants(job_id).is_ok());

    auto db = fixture.open_database();
    auto tamper = [&db, &job_id](const std::string& sql) {
        sqlite3_stmt* stmt = nullptr;
        REQUIRE(sqlite3_prepare_v2(db->handle(), sql.c_str(), -1, &stmt, nullptr) ==
                SQLITE_OK);
        sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
        CHECK(sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
    };

    SECTION("entry left in flight") {
        tamper("UPDATE migration_outbox SET status = 'in_flight' WHERE job_id = ?");
        auto checked = manager->check_invariants(job_id);
        REQUIRE(checked.is_err());
        CHECK(checked.error().code == error_codes::invariant_violation);
    }

    SECTION("content never matched") {
        tamper("UPDATE migration_items SET content_match = 0 WHERE job_id = ?");
        auto checked = manager->check_invariants(job_id);
        REQUIRE(checked.is_err());
        CHECK(checked.error().code == error_codes::invariant_violation);
    }
}

TEST_CASE("workflow: move empties the source", "[integration][workflow]") {
    migration_fixture fixture;
    auto ids = seed_documents(fixture, 3);
    auto manager = fixture.make_manager();
    auto pool = fixture.make_pool();

    auto request = migration_fixture::copy_request(ids);
    request.strategy = migration_strategy::move;
    auto job = manager->create_job(request);
    REQUIRE(job.is_ok());
    REQUIRE(manager->start_job(job.value().job_id).is_ok());

    CHECK(drain(*pool, *manager, job.value().job_id) == migration_job_status::completed);
    CHECK(fixture.source().size() == 0);
    CHECK(fixture.dest().size() == 3);
}

TEST_CASE("workflow: dry run touches nothing", "[integration][workflow]") {
    migration_fixture fixture;
    auto ids = seed_documents(fixture, 3);
    auto manager = fixture.make_manager();
    auto pool = fixture.make_pool();

    auto request = migration_fixture::copy_request(ids);
    request.strategy = migration_strategy::move;
    request.dry_run = true;
    auto job = manager->create_job(request);
    REQUIRE(job.is_ok());
    REQUIRE(manager->start_job(job.value().job_id).is_ok());

    CHECK(drain(*pool, *manager, job.value().job_id) == migration_job_status::completed);
    CHECK(fixture.source().size() == 3);
    CHECK(fixture.dest().size() == 0);
    CHECK(fixture.source().remove_calls() == 0);

    auto settled = manager->get_job(job.value().job_id);
    REQUIRE(settled.is_ok());
    CHECK(settled.value().skipped_documents == 3);
}

TEST_CASE("workflow: paused jobs are not claimed", "[integration][workflow]") {
    migration_fixture fixture;
    auto ids = seed_documents(fixture, 2);
    auto manager = fixture.make_manager();
    auto pool = fixture.make_pool();

    auto job = manager->create_job(migration_fixture::copy_request(ids));
    REQUIRE(job.is_ok());
    const auto job_id = job.value().job_id;
    REQUIRE(manager->start_job(job_id).is_ok());
    REQUIRE(manager->pause_job(job_id).is_ok());

    auto executed = pool->run_once();
    REQUIRE(executed.is_ok());
    CHECK(executed.value() == 0);
    CHECK(fixture.dest().put_calls() == 0);

    REQUIRE(manager->resume_job(job_id).is_ok());
    CHECK(drain(*pool, *manager, job_id) == migration_job_status::completed);
}

TEST_CASE("workflow: newer content supersedes a queued document",
          "[integration][workflow]") {
    migration_fixture fixture;
    fixture.source().seed("contract.docx", "draft");
    auto manager = fixture.make_manager();
    auto pool = fixture.make_pool();

    auto job = manager->create_job(migration_fixture::copy_request({"contract.docx"}));
    REQUIRE(job.is_ok());
    const auto job_id = job.value().job_id;

    fixture.source().seed("contract.docx", "signed");
    auto queued = manager->queue_documents(job_id, {"contract.docx"});
    REQUIRE(queued.is_ok());
    CHECK(queued.value() == 1);

    REQUIRE(manager->start_job(job_id).is_ok());
    CHECK(drain(*pool, *manager, job_id) == migration_job_status::completed);

    CHECK(fixture.dest().body("contract.docx") == "signed");
    CHECK(fixture.dest().put_calls() == 1);

    auto settled = manager->get_job(job_id);
    REQUIRE(settled.is_ok());
    CHECK(settled.value().migrated_documents == 1);
    CHECK(settled.value().skipped_documents == 1);
    CHECK(manager->check_invariants(job_id).is_ok());
}

TEST_CASE("workflow: abandoned claims are picked up after the lease",
          "[integration][workflow]") {
    migration_fixture fixture;
    fixture.source().seed("a.txt", "alpha");
    auto manager = fixture.make_manager();

    auto job = manager->create_job(migration_fixture::copy_request({"a.txt"}));
    REQUIRE(job.is_ok());
    const auto job_id = job.value().job_id;
    REQUIRE(manager->start_job(job_id).is_ok());

    {
        // A worker that claims and then disappears
        task_executor_config config;
        task_executor crashed("crashed-worker", fixture.open_database(), fixture.registry(),
                              config);
        auto claimed = crashed.claim();
        REQUIRE(claimed.is_ok());
        REQUIRE(claimed.value().size() == 1);
    }

    auto config = fixture.pool_config(1);
    config.lease_timeout = 0ms;
    worker_pool rescuer(config, fixture.registry(), std::make_shared<mock_thread_pool>());

    std::this_thread::sleep_for(5ms);
    CHECK(drain(rescuer, *manager, job_id) == migration_job_status::completed);
    CHECK(rescuer.stats().recovered == 1);

    auto items = manager->list_items(job_id);
    REQUIRE(items.is_ok());
    CHECK(items.value()[0].attempt_count == 2);
}
