/**
 * @file provider_repository.hpp
 * @brief Persistence of provider registrations
 */

#pragma once

#include <docmig/core/result.hpp>
#include <docmig/storage/provider_registration.hpp>

#include <optional>
#include <string_view>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace docmig::storage {

/**
 * @brief Repository for provider_storage
 *
 * Thread Safety: NOT thread-safe; bound to one connection.
 */
class provider_repository {
public:
    explicit provider_repository(sqlite3* db);
    ~provider_repository() = default;

    provider_repository(const provider_repository&) = delete;
    auto operator=(const provider_repository&) -> provider_repository& = delete;
    provider_repository(provider_repository&&) noexcept = default;
    auto operator=(provider_repository&&) noexcept -> provider_repository& = default;

    /**
     * @brief Insert or update a registration keyed by provider_name
     */
    [[nodiscard]] auto save(const provider_registration& registration) -> VoidResult;

    [[nodiscard]] auto find_by_name(std::string_view name) const
        -> Result<std::optional<provider_registration>>;

    /// All registrations ordered by name
    [[nodiscard]] auto find_all() const -> Result<std::vector<provider_registration>>;

    /**
     * @brief Change a provider's status
     * @return provider_not_found if no row matched
     */
    [[nodiscard]] auto update_status(std::string_view name, provider_status status)
        -> VoidResult;

    [[nodiscard]] auto remove(std::string_view name) -> VoidResult;

private:
    [[nodiscard]] static auto parse_row(sqlite3_stmt* stmt) -> provider_registration;

    sqlite3* db_{nullptr};
};

}  // namespace docmig::storage
