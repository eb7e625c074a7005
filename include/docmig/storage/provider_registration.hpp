/**
 * @file provider_registration.hpp
 * @brief Persisted description of a storage provider
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace docmig::storage {

/**
 * @brief Operational status of a provider
 */
enum class provider_status {
    active,     ///< Readable and writable per is_writable
    readonly,   ///< Readable only
    disabled,   ///< Cannot be resolved
    migrating   ///< Being migrated; behaves like active
};

[[nodiscard]] constexpr const char* to_string(provider_status status) noexcept {
    switch (status) {
        case provider_status::active: return "active";
        case provider_status::readonly: return "readonly";
        case provider_status::disabled: return "disabled";
        case provider_status::migrating: return "migrating";
        default: return "unknown";
    }
}

/**
 * @brief Parse provider_status from string
 * @return Parsed status, or active if invalid
 */
[[nodiscard]] inline provider_status provider_status_from_string(
    std::string_view str) noexcept {
    if (str == "readonly") return provider_status::readonly;
    if (str == "disabled") return provider_status::disabled;
    if (str == "migrating") return provider_status::migrating;
    return provider_status::active;
}

/**
 * @brief Row of the provider_storage table
 */
struct provider_registration {
    std::int64_t pk{0};                 ///< Primary key (0 when not persisted)
    std::string provider_name;          ///< Logical, unique name
    std::string provider_type;          ///< Adapter factory key ("local", "object", ...)
    std::string config_json{"{}"};      ///< Adapter configuration
    bool is_primary{false};
    bool is_writable{true};
    provider_status status{provider_status::active};
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point updated_at{};

    /**
     * @brief Writable flag set and status neither readonly nor disabled
     */
    [[nodiscard]] auto is_effectively_writable() const noexcept -> bool {
        return is_writable && status != provider_status::readonly &&
               status != provider_status::disabled;
    }
};

}  // namespace docmig::storage
