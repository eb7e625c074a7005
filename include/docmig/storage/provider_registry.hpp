/**
 * @file provider_registry.hpp
 * @brief Runtime lookup from provider name to document store adapter
 *
 * The registry is rebuilt from persisted provider registrations. Adapters
 * are created by factories keyed on provider_type; tests and embedders can
 * also register a ready-made adapter.
 */

#pragma once

#include <docmig/core/result.hpp>
#include <docmig/di/ilogger.hpp>
#include <docmig/storage/document_store.hpp>
#include <docmig/storage/provider_registration.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace docmig::storage {

/**
 * @brief Builds an adapter from a registration's config_json
 */
using provider_factory = std::function<Result<std::shared_ptr<document_store>>(
    const provider_registration& registration)>;

/**
 * @brief Registry of configured providers
 *
 * resolve() is a pure lookup: no retries, no validation of the adapter.
 *
 * Thread Safety: All methods are thread-safe (std::shared_mutex). Lookups
 * from many executors proceed concurrently.
 *
 * @example
 * @code
 * provider_registry registry(logger);
 * registry.register_builtin_factories();
 * auto refreshed = registry.refresh(repo.find_all().value());
 *
 * auto store = registry.resolve("archive");
 * if (store.is_ok()) {
 *     auto doc = store.value()->get("reports/q1.md");
 * }
 * @endcode
 */
class provider_registry {
public:
    explicit provider_registry(std::shared_ptr<di::ILogger> logger = nullptr);
    ~provider_registry() = default;

    provider_registry(const provider_registry&) = delete;
    auto operator=(const provider_registry&) -> provider_registry& = delete;

    // =========================================================================
    // Factories
    // =========================================================================

    void register_factory(std::string type, provider_factory factory);

    /**
     * @brief Register factories for "local", "object" and "s3"
     *
     * local: {"root_path": "..."}
     * object / s3: {"bucket": "...", "region": "...", "prefix": "...",
     *               "endpoint": "..."}
     */
    void register_builtin_factories();

    [[nodiscard]] auto has_factory(std::string_view type) const -> bool;

    // =========================================================================
    // Providers
    // =========================================================================

    /**
     * @brief Register a provider with an explicit adapter
     */
    [[nodiscard]] auto register_provider(const provider_registration& registration,
                                         std::shared_ptr<document_store> adapter)
        -> VoidResult;

    /**
     * @brief Rebuild the provider set from persisted registrations
     *
     * An existing adapter is kept when its type and config_json are
     * unchanged; providers missing from the list are dropped. A registration
     * whose factory is missing or fails is logged and skipped.
     *
     * @return Number of providers that could not be built
     */
    [[nodiscard]] auto refresh(const std::vector<provider_registration>& registrations)
        -> std::size_t;

    /**
     * @brief Rebuild a single provider, leaving the others untouched
     *
     * Same adapter reuse rule as refresh().
     *
     * @return provider_factory_missing or the factory's error
     */
    [[nodiscard]] auto refresh_provider(const provider_registration& registration)
        -> VoidResult;

    /**
     * @brief Remove a provider
     * @return true if it was registered
     */
    auto unregister_provider(std::string_view name) -> bool;

    /**
     * @brief Look up the adapter for a provider
     * @return provider_not_found, or provider_disabled for a disabled provider
     */
    [[nodiscard]] auto resolve(std::string_view name) const
        -> Result<std::shared_ptr<document_store>>;

    [[nodiscard]] auto find(std::string_view name) const
        -> std::optional<provider_registration>;

    /// Registrations ordered by name
    [[nodiscard]] auto list() const -> std::vector<provider_registration>;

    /**
     * @brief Registered and effectively writable
     */
    [[nodiscard]] auto is_writable(std::string_view name) const -> bool;

private:
    struct provider_entry {
        provider_registration registration;
        std::shared_ptr<document_store> adapter;
    };

    /// Requires mutex_ held
    [[nodiscard]] auto build_entry(const provider_registration& registration) const
        -> Result<std::shared_ptr<document_store>>;

    std::shared_ptr<di::ILogger> logger_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, provider_factory, std::less<>> factories_;
    std::map<std::string, provider_entry, std::less<>> providers_;
};

}  // namespace docmig::storage
