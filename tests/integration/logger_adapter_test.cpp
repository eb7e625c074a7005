/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <docmig/integration/logger_adapter.hpp>

#include "../mocks/migration_fixture.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace docmig::integration;
using docmig::testing::temp_directory;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Read file contents as string
 */
auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

auto read_audit_lines(const std::filesystem::path& path) -> std::vector<nlohmann::json> {
    std::vector<nlohmann::json> lines;
    std::istringstream in(read_file_contents(path));
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(nlohmann::json::parse(line));
        }
    }
    return lines;
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() { logger_adapter::shutdown(); }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;
};

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    temp_directory temp_dir;

    SECTION("Basic initialization") {
        logger_config config;
        config.log_directory = temp_dir.path();
        config.enable_console = false;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());
        CHECK(logger_adapter::audit_log_path() == temp_dir.path() / "audit.json");

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        logger_config config;
        config.log_directory = temp_dir.path();
        config.enable_console = false;

        logger_adapter::initialize(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
    }

    SECTION("Shutdown without initialization is safe") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Logging while uninitialized is dropped") {
        logger_adapter::info("nobody is listening: {}", 42);
        logger_adapter::log_job_event(job_event::created, "job-1");
        CHECK_FALSE(logger_adapter::is_initialized());
    }
}

// =============================================================================
// Standard Logging Tests
// =============================================================================

TEST_CASE("logger_adapter standard logging", "[logger_adapter][logging]") {
    temp_directory temp_dir;
    logger_config config;
    config.log_directory = temp_dir.path();
    config.enable_console = false;
    config.enable_file = true;
    config.enable_audit_log = false;
    config.async_mode = false;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    SECTION("Log at different levels") {
        logger_adapter::trace("Trace message: {}", 1);
        logger_adapter::debug("Debug message: {}", 2);
        logger_adapter::info("Info message: {}", 3);
        logger_adapter::warn("Warn message: {}", 4);
        logger_adapter::error("Error message: {}", 5);
        logger_adapter::flush();

        CHECK(std::filesystem::exists(temp_dir.path() / "docmig.log"));
    }

    SECTION("Log level filtering") {
        logger_adapter::set_min_level(log_level::warn);
        REQUIRE(logger_adapter::get_min_level() == log_level::warn);

        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::trace));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
        REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
        REQUIRE(logger_adapter::is_level_enabled(log_level::error));
        REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));
    }

    SECTION("Audit trail disabled") {
        CHECK(logger_adapter::audit_log_path().empty());
        logger_adapter::log_job_event(job_event::started, "job-1");
        CHECK_FALSE(std::filesystem::exists(temp_dir.path() / "audit.json"));
    }
}

TEST_CASE("log_level_from_string", "[logger_adapter][config]") {
    CHECK(log_level_from_string("trace") == log_level::trace);
    CHECK(log_level_from_string("info") == log_level::info);
    CHECK(log_level_from_string("warning") == log_level::warn);
    CHECK(log_level_from_string("critical") == log_level::fatal);
    CHECK(log_level_from_string("off") == log_level::off);
    CHECK_FALSE(log_level_from_string("loud").has_value());
}

// =============================================================================
// Job Audit Trail Tests
// =============================================================================

TEST_CASE("logger_adapter job audit trail", "[logger_adapter][audit]") {
    temp_directory temp_dir;
    logger_config config;
    config.log_directory = temp_dir.path();
    config.enable_console = false;
    config.enable_file = false;
    config.enable_audit_log = true;

    logger_test_fixture fixture(config);
    const auto audit_path = temp_dir.path() / "audit.json";

    SECTION("One JSON object per event") {
        logger_adapter::log_job_event(job_event::created, "job-42",
                                      {{"source", "workspace"}, {"dest", "archive"}});
        logger_adapter::log_job_event(job_event::started, "job-42");
        logger_adapter::log_job_event(job_event::settled, "job-42",
                                      {{"status", "completed"}, {"migrated", "5"}});

        auto lines = read_audit_lines(audit_path);
        REQUIRE(lines.size() == 3);

        CHECK(lines[0]["event_type"] == "JOB_CREATED");
        CHECK(lines[0]["job_id"] == "job-42");
        CHECK(lines[0]["source"] == "workspace");
        CHECK(lines[0]["dest"] == "archive");
        CHECK(lines[0].contains("timestamp"));

        CHECK(lines[1]["event_type"] == "JOB_STARTED");

        CHECK(lines[2]["event_type"] == "JOB_SETTLED");
        CHECK(lines[2]["status"] == "completed");
        CHECK(lines[2]["migrated"] == "5");

        CHECK(lines[0]["seq"] == 1);
        CHECK(lines[2]["seq"] == 3);
    }

    SECTION("Fields cannot replace the fixed keys") {
        logger_adapter::log_job_event(job_event::cancelled, "job-9",
                                      {{"job_id", "other"}, {"actor", "operator"}});

        auto lines = read_audit_lines(audit_path);
        REQUIRE(lines.size() == 1);
        CHECK(lines[0]["job_id"] == "job-9");
        CHECK(lines[0]["event_type"] == "JOB_CANCELLED");
        CHECK(lines[0]["actor"] == "operator");
    }

    SECTION("Every lifecycle event has a distinct name") {
        const std::vector<job_event> events{
            job_event::created,  job_event::documents_queued, job_event::started,
            job_event::paused,   job_event::resumed,          job_event::cancel_requested,
            job_event::cancelled, job_event::retried,         job_event::settled};
        for (auto event : events) {
            logger_adapter::log_job_event(event, "job-7");
        }

        auto lines = read_audit_lines(audit_path);
        REQUIRE(lines.size() == events.size());

        std::vector<std::string> names;
        for (const auto& line : lines) {
            names.push_back(line["event_type"].get<std::string>());
        }
        CHECK(names[1] == "DOCUMENTS_QUEUED");
        CHECK(names[5] == "JOB_CANCEL_REQUESTED");
        std::sort(names.begin(), names.end());
        CHECK(std::adjacent_find(names.begin(), names.end()) == names.end());
    }

    SECTION("Concurrent events are written whole") {
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([t] {
                for (int i = 0; i < 25; ++i) {
                    logger_adapter::log_job_event(job_event::documents_queued,
                                                  "job-" + std::to_string(t),
                                                  {{"count", std::to_string(i)}});
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        CHECK(read_audit_lines(audit_path).size() == 100);
    }
}
