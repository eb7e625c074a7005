/**
 * @file provider_registry_test.cpp
 * @brief Unit tests for provider_registry and provider_repository
 */

#include <docmig/storage/local_document_store.hpp>
#include <docmig/storage/migration_database.hpp>
#include <docmig/storage/provider_registry.hpp>
#include <docmig/storage/provider_repository.hpp>

#include "../mocks/migration_fixture.hpp"
#include "../mocks/mock_document_store.hpp"
#include "../mocks/mock_logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>

using namespace docmig;
using namespace docmig::storage;
using docmig::testing::make_registration;
using docmig::testing::temp_directory;

// ============================================================================
// provider_registry
// ============================================================================

TEST_CASE("provider_registry: resolve", "[storage][registry]") {
    provider_registry registry;
    auto store = std::make_shared<storage::testing::mock_document_store>();

    REQUIRE(registry.register_provider(make_registration("archive"), store).is_ok());

    SECTION("registered provider") {
        auto resolved = registry.resolve("archive");
        REQUIRE(resolved.is_ok());
        CHECK(resolved.value() == store);
    }

    SECTION("unknown provider") {
        auto resolved = registry.resolve("nowhere");
        REQUIRE(resolved.is_err());
        CHECK(resolved.error().code == error_codes::provider_not_found);
    }

    SECTION("disabled provider") {
        REQUIRE(registry.register_provider(
                    make_registration("off", "mock", true, provider_status::disabled),
                    store).is_ok());
        auto resolved = registry.resolve("off");
        REQUIRE(resolved.is_err());
        CHECK(resolved.error().code == error_codes::provider_disabled);
    }

    SECTION("unregister") {
        CHECK(registry.unregister_provider("archive"));
        CHECK_FALSE(registry.unregister_provider("archive"));
        CHECK(registry.resolve("archive").is_err());
    }
}

TEST_CASE("provider_registry: register_provider validates input", "[storage][registry]") {
    provider_registry registry;

    auto store = std::make_shared<storage::testing::mock_document_store>();
    auto unnamed = registry.register_provider(make_registration(""), store);
    REQUIRE(unnamed.is_err());
    CHECK(unnamed.error().code == error_codes::invalid_configuration);

    auto no_adapter = registry.register_provider(make_registration("x"), nullptr);
    REQUIRE(no_adapter.is_err());
    CHECK(no_adapter.error().code == error_codes::invalid_configuration);
}

TEST_CASE("provider_registry: effective writability", "[storage][registry]") {
    provider_registry registry;
    auto store = std::make_shared<storage::testing::mock_document_store>();

    REQUIRE(registry.register_provider(make_registration("rw"), store).is_ok());
    REQUIRE(registry.register_provider(make_registration("flag-ro", "mock", false), store)
                .is_ok());
    REQUIRE(registry.register_provider(
                make_registration("status-ro", "mock", true, provider_status::readonly),
                store).is_ok());
    REQUIRE(registry.register_provider(
                make_registration("migrating", "mock", true, provider_status::migrating),
                store).is_ok());

    CHECK(registry.is_writable("rw"));
    CHECK_FALSE(registry.is_writable("flag-ro"));
    CHECK_FALSE(registry.is_writable("status-ro"));
    CHECK(registry.is_writable("migrating"));
    CHECK_FALSE(registry.is_writable("unknown"));
}

TEST_CASE("provider_registry: builtin factories", "[storage][registry]") {
    temp_directory temp_dir;
    provider_registry registry;
    registry.register_builtin_factories();

    CHECK(registry.has_factory("local"));
    CHECK(registry.has_factory("object"));
    CHECK(registry.has_factory("s3"));
    CHECK_FALSE(registry.has_factory("ftp"));

    auto local = make_registration("disk", "local");
    local.config_json = R"({"root_path": ")" + temp_dir.path().generic_string() + R"("})";
    auto bucket = make_registration("bucket", "object");
    bucket.config_json = R"({"bucket": "archive", "prefix": "docs/"})";

    auto failures = registry.refresh({local, bucket});
    CHECK(failures == 0);

    auto disk = registry.resolve("disk");
    REQUIRE(disk.is_ok());
    CHECK(disk.value()->type_name() == "local");

    auto object = registry.resolve("bucket");
    REQUIRE(object.is_ok());
    CHECK(object.value()->type_name() == "object");

    auto names = registry.list();
    REQUIRE(names.size() == 2);
    CHECK(names[0].provider_name == "bucket");
    CHECK(names[1].provider_name == "disk");
}

TEST_CASE("provider_registry: bad registrations are skipped and logged",
          "[storage][registry]") {
    auto logger = std::make_shared<docmig::testing::MockLogger>();
    provider_registry registry(logger);
    registry.register_builtin_factories();

    auto no_root = make_registration("disk", "local");
    auto no_bucket = make_registration("bucket", "object");
    auto bad_json = make_registration("broken", "object");
    bad_json.config_json = "{not json";
    auto unknown = make_registration("ftp", "ftp");

    auto failures = registry.refresh({no_root, no_bucket, bad_json, unknown});
    CHECK(failures == 4);
    CHECK(registry.list().empty());
    CHECK(logger->warn_count() == 4);

    auto single = registry.refresh_provider(unknown);
    REQUIRE(single.is_err());
    CHECK(single.error().code == error_codes::provider_factory_missing);

    auto config = registry.refresh_provider(no_root);
    REQUIRE(config.is_err());
    CHECK(config.error().code == error_codes::provider_config_error);
}

TEST_CASE("provider_registry: refresh keeps unchanged adapters", "[storage][registry]") {
    provider_registry registry;
    auto store = std::make_shared<storage::testing::mock_document_store>();
    REQUIRE(registry.register_provider(make_registration("source"), store).is_ok());
    REQUIRE(registry.register_provider(make_registration("gone"), store).is_ok());

    auto readonly = make_registration("source", "mock", true, provider_status::readonly);
    CHECK(registry.refresh({readonly}) == 0);

    auto resolved = registry.resolve("source");
    REQUIRE(resolved.is_ok());
    CHECK(resolved.value() == store);
    CHECK_FALSE(registry.is_writable("source"));
    CHECK_FALSE(registry.find("gone").has_value());

    SECTION("refresh_provider updates one entry only") {
        REQUIRE(registry.register_provider(make_registration("other"), store).is_ok());
        auto disabled = make_registration("source", "mock", true, provider_status::disabled);
        REQUIRE(registry.refresh_provider(disabled).is_ok());

        CHECK(registry.resolve("source").is_err());
        CHECK(registry.resolve("other").is_ok());
    }
}

// ============================================================================
// provider_repository
// ============================================================================

TEST_CASE("provider_repository: save upserts by name", "[storage][registry][repository]") {
    auto opened = migration_database::open(":memory:");
    REQUIRE(opened.is_ok());
    provider_repository repo(opened.value()->handle());

    auto reg = make_registration("archive", "local");
    reg.config_json = R"({"root_path":"/srv/archive"})";
    reg.is_primary = true;
    REQUIRE(repo.save(reg).is_ok());

    reg.config_json = R"({"root_path":"/srv/archive2"})";
    reg.is_writable = false;
    REQUIRE(repo.save(reg).is_ok());

    auto found = repo.find_by_name("archive");
    REQUIRE(found.is_ok());
    REQUIRE(found.value().has_value());
    CHECK(found.value()->config_json == R"({"root_path":"/srv/archive2"})");
    CHECK(found.value()->is_primary);
    CHECK_FALSE(found.value()->is_writable);
    CHECK(found.value()->pk > 0);

    auto all = repo.find_all();
    REQUIRE(all.is_ok());
    CHECK(all.value().size() == 1);

    SECTION("status update") {
        REQUIRE(repo.update_status("archive", provider_status::migrating).is_ok());
        auto updated = repo.find_by_name("archive");
        REQUIRE(updated.is_ok());
        CHECK(updated.value()->status == provider_status::migrating);

        auto unknown = repo.update_status("nowhere", provider_status::disabled);
        REQUIRE(unknown.is_err());
        CHECK(unknown.error().code == error_codes::provider_not_found);
    }

    SECTION("remove") {
        REQUIRE(repo.remove("archive").is_ok());
        auto gone = repo.find_by_name("archive");
        REQUIRE(gone.is_ok());
        CHECK_FALSE(gone.value().has_value());
    }

    SECTION("empty name rejected") {
        auto unnamed = repo.save(make_registration(""));
        REQUIRE(unnamed.is_err());
        CHECK(unnamed.error().code == error_codes::invalid_configuration);
    }
}
