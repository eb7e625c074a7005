/**
 * @file migration_fixture.hpp
 * @brief Shared setup for migration tests
 *
 * Provides a temporary SQLite file, a registry with two in-memory
 * providers and helpers to build managers and worker pools on top.
 */

#pragma once

#include "mock_document_store.hpp"

#include <docmig/migration/migration_manager.hpp>
#include <docmig/migration/worker_pool.hpp>
#include <docmig/storage/migration_database.hpp>
#include <docmig/storage/provider_registry.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace docmig::testing {

/**
 * @brief RAII helper for creating temporary test directories
 */
class temp_directory {
public:
    temp_directory() {
        auto temp = std::filesystem::temp_directory_path();
        path_ = temp / ("docmig_test_" + std::to_string(
                            std::chrono::steady_clock::now()
                                .time_since_epoch()
                                .count()));
        std::filesystem::create_directories(path_);
    }

    ~temp_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_directory(const temp_directory&) = delete;
    auto operator=(const temp_directory&) -> temp_directory& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

private:
    std::filesystem::path path_;
};

inline auto make_registration(const std::string& name,
                              const std::string& type = "mock",
                              bool writable = true,
                              storage::provider_status status = storage::provider_status::active)
    -> storage::provider_registration {
    storage::provider_registration reg;
    reg.provider_name = name;
    reg.provider_type = type;
    reg.config_json = R"({"instance": ")" + name + R"("})";
    reg.is_writable = writable;
    reg.status = status;
    return reg;
}

/**
 * @brief Database file, registry and two providers: "source" and "dest"
 */
class migration_fixture {
public:
    migration_fixture()
        : db_path_((dir_.path() / "docmig.db").string()),
          registry_(std::make_shared<storage::provider_registry>()),
          source_(std::make_shared<storage::testing::mock_document_store>()),
          dest_(std::make_shared<storage::testing::mock_document_store>()) {
        if (registry_->register_provider(make_registration("source"), source_).is_err() ||
            registry_->register_provider(make_registration("dest"), dest_).is_err()) {
            throw std::runtime_error("failed to register test providers");
        }
    }

    [[nodiscard]] auto open_database() const -> std::unique_ptr<storage::migration_database> {
        auto db = storage::migration_database::open(db_path_);
        if (db.is_err()) {
            throw std::runtime_error("failed to open test database: " + db.error().message);
        }
        return std::move(db.value());
    }

    [[nodiscard]] auto make_manager(const migration::migration_manager_config& config = {})
        -> std::unique_ptr<migration::migration_manager> {
        return std::make_unique<migration::migration_manager>(open_database(), registry_,
                                                              config);
    }

    /// Pool config with no backoff and a short poll interval
    [[nodiscard]] auto pool_config(std::size_t workers = 1) const
        -> migration::worker_pool_config {
        migration::worker_pool_config config;
        config.database_path = db_path_;
        config.worker_count = workers;
        config.poll_interval = std::chrono::milliseconds{20};
        config.retry.base_delay = std::chrono::milliseconds{0};
        config.retry.max_delay = std::chrono::milliseconds{0};
        return config;
    }

    [[nodiscard]] auto make_pool(std::size_t workers = 1)
        -> std::unique_ptr<migration::worker_pool> {
        return std::make_unique<migration::worker_pool>(pool_config(workers), registry_);
    }

    /// Basic copy request from "source" to "dest"
    [[nodiscard]] static auto copy_request(std::vector<std::string> ids = {})
        -> migration::create_job_request {
        migration::create_job_request request;
        request.job_name = "test job";
        request.source_provider = "source";
        request.dest_provider = "dest";
        request.document_ids = std::move(ids);
        request.created_by = "tests";
        return request;
    }

    [[nodiscard]] auto db_path() const -> const std::string& { return db_path_; }
    [[nodiscard]] auto dir() const -> const std::filesystem::path& { return dir_.path(); }
    [[nodiscard]] auto registry() const -> const std::shared_ptr<storage::provider_registry>& {
        return registry_;
    }
    [[nodiscard]] auto source() const -> storage::testing::mock_document_store& { return *source_; }
    [[nodiscard]] auto dest() const -> storage::testing::mock_document_store& { return *dest_; }
    [[nodiscard]] auto source_ptr() const
        -> const std::shared_ptr<storage::testing::mock_document_store>& {
        return source_;
    }

private:
    temp_directory dir_;
    std::string db_path_;
    std::shared_ptr<storage::provider_registry> registry_;
    std::shared_ptr<storage::testing::mock_document_store> source_;
    std::shared_ptr<storage::testing::mock_document_store> dest_;
};

/**
 * @brief Run cycles on the calling thread until the job is terminal
 * @return Final job status
 */
inline auto drain(migration::worker_pool& pool,
                  migration::migration_manager& manager,
                  const std::string& job_id,
                  int max_cycles = 100) -> migration::migration_job_status {
    for (int i = 0; i < max_cycles; ++i) {
        auto job = manager.get_job(job_id);
        if (job.is_err()) {
            throw std::runtime_error("job vanished: " + job.error().message);
        }
        if (migration::is_terminal_status(job.value().status)) {
            return job.value().status;
        }
        auto executed = pool.run_once();
        if (executed.is_err()) {
            throw std::runtime_error("run_once failed: " + executed.error().message);
        }
    }
    return manager.get_job(job_id).value().status;
}

/**
 * @brief Poll until the job is terminal or the timeout passes
 */
inline auto wait_for_terminal(migration::migration_manager& manager,
                              const std::string& job_id,
                              std::chrono::milliseconds timeout = std::chrono::seconds{10})
    -> migration::migration_job_status {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto job = manager.get_job(job_id);
        if (job.is_ok() && migration::is_terminal_status(job.value().status)) {
            return job.value().status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return manager.get_job(job_id).value().status;
}

}  // namespace docmig::testing
