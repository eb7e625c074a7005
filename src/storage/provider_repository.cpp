/**
 * @file provider_repository.cpp
 * @brief Implementation of the provider registration repository
 */

#include <docmig/storage/provider_repository.hpp>

#include "sqlite_helpers.hpp"

namespace docmig::storage {

using namespace detail;

namespace {

constexpr const char* kSelectColumns = R"(
    SELECT pk, provider_name, provider_type, config_json, is_primary,
           is_writable, status, created_at, updated_at
    FROM provider_storage
)";

}  // namespace

provider_repository::provider_repository(sqlite3* db) : db_(db) {}

auto provider_repository::save(const provider_registration& registration)
    -> VoidResult {
    if (registration.provider_name.empty()) {
        return docmig_void_error(error_codes::invalid_configuration,
                                 "Provider name is empty");
    }

    static constexpr const char* sql = R"(
        INSERT INTO provider_storage (
            provider_name, provider_type, config_json, is_primary, is_writable,
            status, created_at, updated_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(provider_name) DO UPDATE SET
            provider_type = excluded.provider_type,
            config_json = excluded.config_json,
            is_primary = excluded.is_primary,
            is_writable = excluded.is_writable,
            status = excluded.status,
            updated_at = excluded.updated_at
    )";

    auto prepared = prepare(db_, sql);
    if (prepared.is_err()) {
        return VoidResult(prepared.error());
    }
    auto* stmt = prepared.value().get();

    auto now_str = to_timestamp_string(std::chrono::system_clock::now());

    int idx = 1;
    bind_text(stmt, idx++, registration.provider_name);
    bind_text(stmt, idx++, registration.provider_type);
    bind_text(stmt, idx++, registration.config_json);
    sqlite3_bind_int(stmt, idx++, registration.is_primary ? 1 : 0);
    sqlite3_bind_int(stmt, idx++, registration.is_writable ? 1 : 0);
    sqlite3_bind_text(stmt, idx++, to_string(registration.status), -1, SQLITE_STATIC);
    bind_text(stmt, idx++, now_str);
    bind_text(stmt, idx++, now_str);

    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        return VoidResult(step_error(db_, rc, "Failed to save provider"));
    }
    return ok();
}

auto provider_repository::find_by_name(std::string_view name) const
    -> Result<std::optional<provider_registration>> {
    using find_result = std::optional<provider_registration>;

    auto prepared = prepare(db_, std::string(kSelectColumns) + " WHERE provider_name = ?");
    if (prepared.is_err()) {
        return forward_error<find_result>(prepared.error());
    }
    auto* stmt = prepared.value().get();
    bind_text(stmt, 1, name);

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return find_result{parse_row(stmt)};
    }
    if (rc != SQLITE_DONE) {
        return Result<find_result>(step_error(db_, rc, "Failed to read provider"));
    }
    return find_result{};
}

auto provider_repository::find_all() const -> Result<std::vector<provider_registration>> {
    auto prepared = prepare(db_, std::string(kSelectColumns) + " ORDER BY provider_name");
    if (prepared.is_err()) {
        return forward_error<std::vector<provider_registration>>(prepared.error());
    }
    auto* stmt = prepared.value().get();

    std::vector<provider_registration> result;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        result.push_back(parse_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<provider_registration>>(
            step_error(db_, rc, "Failed to list providers"));
    }
    return result;
}

auto provider_repository::update_status(std::string_view name, provider_status status)
    -> VoidResult {
    auto prepared = prepare(
        db_, "UPDATE provider_storage SET status = ?, updated_at = ? WHERE provider_name = ?");
    if (prepared.is_err()) {
        return VoidResult(prepared.error());
    }
    auto* stmt = prepared.value().get();

    auto now_str = to_timestamp_string(std::chrono::system_clock::now());
    sqlite3_bind_text(stmt, 1, to_string(status), -1, SQLITE_STATIC);
    bind_text(stmt, 2, now_str);
    bind_text(stmt, 3, name);

    auto changed = execute_update(db_, stmt, "Failed to update provider status");
    if (changed.is_err()) {
        return VoidResult(changed.error());
    }
    if (changed.value() == 0) {
        return docmig_void_error(error_codes::provider_not_found,
                                 "Provider not found: " + std::string(name));
    }
    return ok();
}

auto provider_repository::remove(std::string_view name) -> VoidResult {
    auto prepared = prepare(db_, "DELETE FROM provider_storage WHERE provider_name = ?");
    if (prepared.is_err()) {
        return VoidResult(prepared.error());
    }
    auto* stmt = prepared.value().get();
    bind_text(stmt, 1, name);

    auto changed = execute_update(db_, stmt, "Failed to delete provider");
    if (changed.is_err()) {
        return VoidResult(changed.error());
    }
    return ok();
}

auto provider_repository::parse_row(sqlite3_stmt* stmt) -> provider_registration {
    provider_registration reg;

    int col = 0;
    reg.pk = get_int64_column(stmt, col++);
    reg.provider_name = get_text_column(stmt, col++);
    reg.provider_type = get_text_column(stmt, col++);
    reg.config_json = get_text_column(stmt, col++);
    reg.is_primary = get_int_column(stmt, col++) != 0;
    reg.is_writable = get_int_column(stmt, col++, 1) != 0;
    reg.status = provider_status_from_string(get_text_column(stmt, col++));
    auto created_str = get_text_column(stmt, col++);
    reg.created_at = from_timestamp_string(created_str.c_str());
    auto updated_str = get_text_column(stmt, col++);
    reg.updated_at = from_timestamp_string(updated_str.c_str());

    return reg;
}

}  // namespace docmig::storage
