/**
 * @file task_payload.hpp
 * @brief JSON payload carried by outbox entries
 */

#pragma once

#include <docmig/core/result.hpp>
#include <docmig/migration/migration_types.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace docmig::migration {

/**
 * @brief Work description stored in migration_outbox.payload
 *
 * Serialized keys: jobId, itemId, documentId, sourceProvider, destProvider,
 * strategy, dryRun, sourceDigest, maxAttempts.
 */
struct task_payload {
    std::string job_id;
    std::int64_t item_id{0};
    std::string document_id;
    std::string source_provider;
    std::string dest_provider;
    migration_strategy strategy{migration_strategy::copy};
    bool dry_run{false};
    std::string source_digest;
    int max_attempts{3};

    [[nodiscard]] auto to_json() const -> std::string;

    /**
     * @brief Parse a payload
     * @return invalid_payload on malformed JSON or missing keys
     */
    [[nodiscard]] static auto from_json(std::string_view json) -> Result<task_payload>;
};

/**
 * @brief Idempotency key for (job, document, content digest)
 */
[[nodiscard]] auto make_idempotency_key(std::string_view job_id,
                                        std::string_view document_id,
                                        std::string_view digest) -> std::string;

}  // namespace docmig::migration
