/**
 * @file ilogger_test.cpp
 * @brief Unit tests for ILogger interface and implementations
 */

#include <docmig/di/ilogger.hpp>
#include <docmig/integration/logger_adapter.hpp>
#include <docmig/storage/provider_registry.hpp>

#include "../mocks/migration_fixture.hpp"
#include "../mocks/mock_logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <memory>
#include <string>

using namespace docmig::di;

// =============================================================================
// Level-filtering Logger for Testing
// =============================================================================

namespace {

/**
 * @brief Counts messages and honours a minimum level
 */
class LevelLogger final : public ILogger {
public:
    explicit LevelLogger(log_level min_level) : min_level_(min_level) {}

    void write(log_level /*level*/, std::string_view message) override {
        count_.fetch_add(1);
        last_ = std::string(message);
    }

    [[nodiscard]] bool is_enabled(log_level level) const noexcept override {
        return level >= min_level_;
    }

    [[nodiscard]] auto count() const noexcept -> std::size_t { return count_.load(); }
    [[nodiscard]] auto last_message() const -> const std::string& { return last_; }

private:
    log_level min_level_;
    std::atomic<std::size_t> count_{0};
    std::string last_;
};

}  // namespace

// =============================================================================
// Formatted Helpers
// =============================================================================

TEST_CASE("ILogger formatted helpers respect is_enabled", "[di][ilogger]") {
    LevelLogger logger(log_level::warn);

    logger.debug_fmt("claimed {} entries", 3);
    logger.info_fmt("job {} started", "job-1");
    CHECK(logger.count() == 0);

    logger.warn_fmt("provider {} not usable: {}", "archive", "no root_path");
    CHECK(logger.count() == 1);
    CHECK(logger.last_message() == "provider archive not usable: no root_path");

    logger.error_fmt("attempt {}/{} failed", 2, 3);
    CHECK(logger.count() == 2);
    CHECK(logger.last_message() == "attempt 2/3 failed");

    logger.info("skipped below the threshold");
    logger.error("written as is");
    CHECK(logger.count() == 3);
    CHECK(logger.last_message() == "written as is");
}

// =============================================================================
// NullLogger
// =============================================================================

TEST_CASE("NullLogger discards everything", "[di][ilogger]") {
    auto logger = null_logger();
    REQUIRE(logger != nullptr);
    CHECK(logger == null_logger());

    CHECK_FALSE(logger->is_enabled(log_level::error));
    logger->info("ignored");
    logger->error_fmt("ignored {}", 1);
}

// =============================================================================
// LoggerService
// =============================================================================

TEST_CASE("LoggerService follows the adapter level", "[di][ilogger]") {
    docmig::testing::temp_directory temp_dir;
    docmig::integration::logger_config config;
    config.log_directory = temp_dir.path();
    config.enable_console = false;
    config.enable_file = false;
    config.enable_audit_log = false;
    config.min_level = log_level::error;
    docmig::integration::logger_adapter::initialize(config);

    LoggerService service;
    CHECK_FALSE(service.is_enabled(log_level::info));
    CHECK(service.is_enabled(log_level::error));

    docmig::integration::logger_adapter::set_min_level(log_level::debug);
    CHECK(service.is_enabled(log_level::info));

    service.info("delegated to logger_adapter");
    service.warn_fmt("{} provider(s) could not be built", 2);

    docmig::integration::logger_adapter::shutdown();
}

// =============================================================================
// Injection
// =============================================================================

TEST_CASE("components accept an injected logger", "[di][ilogger]") {
    SECTION("null logger by default") {
        docmig::storage::provider_registry registry;
        CHECK(registry.refresh({docmig::testing::make_registration("ftp", "ftp")}) == 1);
    }

    SECTION("injected logger receives warnings") {
        auto logger = std::make_shared<docmig::testing::MockLogger>();
        docmig::storage::provider_registry registry(logger);
        CHECK(registry.refresh({docmig::testing::make_registration("ftp", "ftp")}) == 1);
        CHECK(logger->warn_count() == 1);
        CHECK(logger->contains("ftp"));
    }
}
