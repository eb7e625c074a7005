/**
 * @file progress_tracker_test.cpp
 * @brief Unit tests for progress computation and settlement
 */

#include <docmig/migration/progress_tracker.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace docmig;
using namespace docmig::migration;
using namespace std::chrono_literals;

namespace {

auto running_job() -> migration_job {
    migration_job job;
    job.job_id = "job-1";
    job.status = migration_job_status::running;
    return job;
}

auto counts(std::int64_t pending, std::int64_t in_progress, std::int64_t completed,
            std::int64_t failed, std::int64_t skipped) -> item_status_counts {
    item_status_counts c;
    c.pending = pending;
    c.in_progress = in_progress;
    c.completed = completed;
    c.failed = failed;
    c.skipped = skipped;
    return c;
}

}  // namespace

// ============================================================================
// compute
// ============================================================================

TEST_CASE("progress_tracker: compute percent, rate and eta",
          "[migration][progress]") {
    auto job = running_job();
    auto now = std::chrono::system_clock::now();
    job.started_at = now - 10s;

    auto progress = progress_tracker::compute(job, counts(5, 0, 4, 1, 0), now);

    CHECK(progress.total == 10);
    CHECK(progress.migrated == 4);
    CHECK(progress.failed == 1);
    CHECK(progress.pending == 5);
    CHECK(progress.percent == Catch::Approx(50.0));
    CHECK(progress.elapsed == 10s);
    CHECK(progress.rate == Catch::Approx(0.5));
    REQUIRE(progress.eta_seconds.has_value());
    CHECK(*progress.eta_seconds == Catch::Approx(10.0));
}

TEST_CASE("progress_tracker: eta unknown before any progress",
          "[migration][progress]") {
    auto job = running_job();
    auto now = std::chrono::system_clock::now();
    job.started_at = now;

    auto progress = progress_tracker::compute(job, counts(3, 0, 0, 0, 0), now);
    CHECK(progress.percent == Catch::Approx(0.0));
    CHECK(progress.rate == Catch::Approx(0.0));
    CHECK_FALSE(progress.eta_seconds.has_value());
}

TEST_CASE("progress_tracker: empty job reports zero", "[migration][progress]") {
    migration_job job;
    job.job_id = "empty";

    auto progress = progress_tracker::compute(job, {}, std::chrono::system_clock::now());
    CHECK(progress.total == 0);
    CHECK(progress.percent == Catch::Approx(0.0));
    REQUIRE(progress.eta_seconds.has_value());
    CHECK(*progress.eta_seconds == Catch::Approx(0.0));
}

TEST_CASE("progress_tracker: elapsed stops at completion", "[migration][progress]") {
    auto job = running_job();
    auto now = std::chrono::system_clock::now();
    job.status = migration_job_status::completed;
    job.started_at = now - 100s;
    job.completed_at = now - 90s;

    auto progress = progress_tracker::compute(job, counts(0, 0, 20, 0, 0), now);
    CHECK(progress.elapsed == 10s);
    CHECK(progress.rate == Catch::Approx(2.0));
}

// ============================================================================
// settled_status
// ============================================================================

TEST_CASE("progress_tracker: settled_status", "[migration][progress]") {
    auto job = running_job();

    SECTION("outstanding items keep the job open") {
        CHECK_FALSE(progress_tracker::settled_status(job, counts(1, 0, 3, 0, 0)));
        CHECK_FALSE(progress_tracker::settled_status(job, counts(0, 1, 3, 0, 0)));
    }

    SECTION("all migrated or skipped completes") {
        job.migrated_documents = 3;
        job.skipped_documents = 1;
        CHECK(progress_tracker::settled_status(job, counts(0, 0, 3, 0, 1)) ==
              migration_job_status::completed);
    }

    SECTION("nothing migrated fails") {
        job.failed_documents = 2;
        CHECK(progress_tracker::settled_status(job, counts(0, 0, 0, 2, 0)) ==
              migration_job_status::failed);
    }

    SECTION("mixed outcome is partial") {
        job.migrated_documents = 1;
        job.failed_documents = 1;
        CHECK(progress_tracker::settled_status(job, counts(0, 0, 1, 1, 0)) ==
              migration_job_status::partial);
    }

    SECTION("cancel request wins") {
        job.cancel_requested = true;
        job.migrated_documents = 1;
        CHECK(progress_tracker::settled_status(job, counts(0, 0, 1, 0, 0)) ==
              migration_job_status::cancelled);

        job.status = migration_job_status::cancelled;
        CHECK_FALSE(progress_tracker::settled_status(job, counts(0, 0, 1, 0, 0)));
    }

    SECTION("paused and pending jobs do not settle") {
        job.status = migration_job_status::paused;
        CHECK_FALSE(progress_tracker::settled_status(job, {}));
        job.status = migration_job_status::pending;
        CHECK_FALSE(progress_tracker::settled_status(job, {}));
    }
}

// ============================================================================
// check_invariants
// ============================================================================

TEST_CASE("progress_tracker: check_invariants", "[migration][progress]") {
    auto job = running_job();
    job.total_documents = 4;
    job.migrated_documents = 2;
    job.failed_documents = 1;
    job.skipped_documents = 0;

    SECTION("consistent counters") {
        CHECK(progress_tracker::check_invariants(job, counts(1, 0, 2, 1, 0)).is_ok());
    }

    SECTION("total mismatch") {
        auto result = progress_tracker::check_invariants(job, counts(2, 0, 2, 1, 0));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invariant_violation);
    }

    SECTION("migrated mismatch") {
        auto result = progress_tracker::check_invariants(job, counts(2, 0, 1, 1, 0));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invariant_violation);
    }

    SECTION("terminal job with outstanding work") {
        job.status = migration_job_status::completed;
        auto result = progress_tracker::check_invariants(job, counts(1, 0, 2, 1, 0));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invariant_violation);
    }
}
