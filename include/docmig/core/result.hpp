/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the migration engine
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for docmig, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace docmig {

/**
 * @brief Result type alias for docmig operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief docmig-specific error codes
 *
 * Error code range: -900 to -999
 * Provides access to both common error codes and engine-specific codes.
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    // ========================================================================
    // docmig error codes (-900 to -999)
    // ========================================================================
    constexpr int docmig_base = -900;

    // Job configuration errors (-900 to -909)
    constexpr int invalid_configuration = docmig_base - 0;
    constexpr int job_not_found = docmig_base - 1;
    constexpr int invalid_state = docmig_base - 2;
    constexpr int item_not_found = docmig_base - 3;

    // Provider errors (-910 to -919)
    constexpr int provider_not_found = docmig_base - 10;
    constexpr int provider_unwritable = docmig_base - 11;
    constexpr int provider_disabled = docmig_base - 12;
    constexpr int provider_factory_missing = docmig_base - 13;
    constexpr int provider_config_error = docmig_base - 14;

    // Transfer errors (-920 to -929)
    constexpr int transfer_error = docmig_base - 20;
    constexpr int content_mismatch = docmig_base - 21;
    constexpr int digest_error = docmig_base - 22;
    constexpr int invalid_payload = docmig_base - 23;

    // Document store errors (-930 to -939)
    constexpr int document_not_found = docmig_base - 30;
    constexpr int document_read_error = docmig_base - 31;
    constexpr int document_write_error = docmig_base - 32;
    constexpr int document_delete_error = docmig_base - 33;
    constexpr int invalid_document_id = docmig_base - 34;
    constexpr int store_unavailable = docmig_base - 35;

    // Claim errors (-940 to -949)
    constexpr int claim_conflict = docmig_base - 40;

    // Database errors (-950 to -959)
    constexpr int database_open_error = docmig_base - 50;
    constexpr int database_query_error = docmig_base - 51;
    constexpr int database_transaction_error = docmig_base - 52;
    constexpr int database_migration_error = docmig_base - 53;
    constexpr int database_busy = docmig_base - 54;
    constexpr int invariant_violation = docmig_base - 55;

    // Worker errors (-960 to -969)
    constexpr int worker_start_failed = docmig_base - 60;
    constexpr int worker_already_running = docmig_base - 61;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a docmig error result with module context
 * @tparam T The result value type
 * @param code Error code from docmig::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> docmig_error(int code, const std::string& message,
                              const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "docmig");
    }
    return kcenon::common::make_error<T>(code, message, "docmig", details);
}

/**
 * @brief Create a docmig void error result
 * @param code Error code from docmig::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult docmig_void_error(int code, const std::string& message,
                                    const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "docmig"});
    }
    return VoidResult(error_info{code, message, "docmig", details});
}

/**
 * @brief Re-wrap an error from one result type into another
 * @tparam T The target result value type
 * @param error The error to forward
 */
template <typename T>
inline Result<T> forward_error(const error_info& error) {
    return Result<T>(error);
}

} // namespace docmig

