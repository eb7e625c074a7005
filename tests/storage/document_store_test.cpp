/**
 * @file document_store_test.cpp
 * @brief Unit tests for the local and object document stores
 */

#include <docmig/storage/content_hasher.hpp>
#include <docmig/storage/local_document_store.hpp>
#include <docmig/storage/object_document_store.hpp>

#include "../mocks/migration_fixture.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>

using namespace docmig;
using namespace docmig::storage;
using docmig::testing::temp_directory;

namespace {

auto bytes(std::string_view text) -> std::vector<std::uint8_t> {
    return {text.begin(), text.end()};
}

auto text(const std::vector<std::uint8_t>& content) -> std::string {
    return {content.begin(), content.end()};
}

}  // namespace

// ============================================================================
// local_document_store
// ============================================================================

TEST_CASE("local_document_store: auto-creates root directory",
          "[storage][local_store]") {
    temp_directory temp_dir;
    auto root = temp_dir.path() / "docs";

    local_store_config config;
    config.root_path = root;
    local_document_store store{config};

    CHECK(std::filesystem::is_directory(root));
    CHECK(store.type_name() == "local");
}

TEST_CASE("local_document_store: put and get", "[storage][local_store]") {
    temp_directory temp_dir;
    local_store_config config;
    config.root_path = temp_dir.path();
    local_document_store store{config};

    document_metadata metadata{{"content-type", "text/markdown"}, {"owner", "ops"}};
    auto digest = store.put("reports/q1.md", bytes("# Q1"), metadata);
    REQUIRE(digest.is_ok());
    CHECK(digest.value() == content_hasher::digest(bytes("# Q1")).value());

    SECTION("body and metadata round-trip") {
        auto doc = store.get("reports/q1.md");
        REQUIRE(doc.is_ok());
        CHECK(doc.value().id == "reports/q1.md");
        CHECK(text(doc.value().content) == "# Q1");
        CHECK(doc.value().metadata == metadata);
    }

    SECTION("put overwrites") {
        REQUIRE(store.put("reports/q1.md", bytes("# Q1 v2"), {}).is_ok());
        auto doc = store.get("reports/q1.md");
        REQUIRE(doc.is_ok());
        CHECK(text(doc.value().content) == "# Q1 v2");
        CHECK(doc.value().metadata.empty());
    }

    SECTION("exists") {
        CHECK(store.exists("reports/q1.md"));
        CHECK_FALSE(store.exists("reports/q2.md"));
    }
}

TEST_CASE("local_document_store: missing document", "[storage][local_store]") {
    temp_directory temp_dir;
    local_store_config config;
    config.root_path = temp_dir.path();
    local_document_store store{config};

    auto doc = store.get("nope.txt");
    REQUIRE(doc.is_err());
    CHECK(doc.error().code == error_codes::document_not_found);
}

TEST_CASE("local_document_store: rejects unsafe ids", "[storage][local_store]") {
    temp_directory temp_dir;
    local_store_config config;
    config.root_path = temp_dir.path();
    local_document_store store{config};

    for (const auto* id : {"", "/etc/passwd", "../escape.txt", "a/../../b", "x.meta.json",
                            "dir/.docmig-tmp-a.txt.42"}) {
        auto result = store.put(id, bytes("data"), {});
        INFO("id: " << id);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_document_id);
    }
}

TEST_CASE("local_document_store: list filters by prefix and hides sidecars",
          "[storage][local_store]") {
    temp_directory temp_dir;
    local_store_config config;
    config.root_path = temp_dir.path();
    local_document_store store{config};

    REQUIRE(store.put("reports/b.md", bytes("b"), {{"k", "v"}}).is_ok());
    REQUIRE(store.put("reports/a.md", bytes("a"), {}).is_ok());
    REQUIRE(store.put("notes/c.md", bytes("c"), {}).is_ok());

    auto all = store.list("");
    REQUIRE(all.is_ok());
    CHECK(all.value() == std::vector<std::string>{"notes/c.md", "reports/a.md", "reports/b.md"});

    auto reports = store.list("reports/");
    REQUIRE(reports.is_ok());
    CHECK(reports.value() == std::vector<std::string>{"reports/a.md", "reports/b.md"});
}

TEST_CASE("local_document_store: ids that look like temp files are listed",
          "[storage][local_store]") {
    temp_directory temp_dir;
    local_store_config config;
    config.root_path = temp_dir.path();
    local_document_store store{config};

    REQUIRE(store.put("reports/q3.tmp.final", bytes("q3"), {}).is_ok());
    REQUIRE(store.put("a.tmp.1", bytes("a"), {}).is_ok());
    REQUIRE(store.get("reports/q3.tmp.final").is_ok());

    auto all = store.list("");
    REQUIRE(all.is_ok());
    CHECK(all.value() == std::vector<std::string>{"a.tmp.1", "reports/q3.tmp.final"});

    auto reports = store.list("reports/");
    REQUIRE(reports.is_ok());
    CHECK(reports.value() == std::vector<std::string>{"reports/q3.tmp.final"});
}

TEST_CASE("local_document_store: remove", "[storage][local_store]") {
    temp_directory temp_dir;
    local_store_config config;
    config.root_path = temp_dir.path();
    local_document_store store{config};

    REQUIRE(store.put("gone.txt", bytes("x"), {{"k", "v"}}).is_ok());
    REQUIRE(store.remove("gone.txt").is_ok());
    CHECK_FALSE(store.exists("gone.txt"));
    CHECK_FALSE(std::filesystem::exists(temp_dir.path() / "gone.txt.meta.json"));

    SECTION("removing again is not an error") {
        CHECK(store.remove("gone.txt").is_ok());
    }
}

// ============================================================================
// object_document_store
// ============================================================================

TEST_CASE("object_document_store: put, get and list with key prefix",
          "[storage][object_store]") {
    object_store_config config;
    config.bucket_name = "archive";
    config.key_prefix = "tenant-a/";
    object_document_store store{config};

    CHECK(store.type_name() == "object");
    CHECK(store.is_connected());

    REQUIRE(store.put("docs/1.txt", bytes("one"), {{"title", "One"}}).is_ok());
    REQUIRE(store.put("docs/2.txt", bytes("two"), {}).is_ok());
    CHECK(store.object_count() == 2);

    auto doc = store.get("docs/1.txt");
    REQUIRE(doc.is_ok());
    CHECK(text(doc.value().content) == "one");
    CHECK(doc.value().metadata.at("title") == "One");

    auto listed = store.list("docs/");
    REQUIRE(listed.is_ok());
    CHECK(listed.value() == std::vector<std::string>{"docs/1.txt", "docs/2.txt"});
}

TEST_CASE("object_document_store: errors", "[storage][object_store]") {
    object_store_config config;
    config.bucket_name = "archive";
    object_document_store store{config};

    SECTION("missing object") {
        auto doc = store.get("missing");
        REQUIRE(doc.is_err());
        CHECK(doc.error().code == error_codes::document_not_found);
    }

    SECTION("empty id") {
        auto put = store.put("", bytes("x"), {});
        REQUIRE(put.is_err());
        CHECK(put.error().code == error_codes::invalid_document_id);
    }

    SECTION("disconnected client") {
        store.set_connected(false);
        auto put = store.put("a", bytes("x"), {});
        REQUIRE(put.is_err());
        CHECK(put.error().code == error_codes::store_unavailable);
        CHECK_FALSE(store.exists("a"));
    }
}
