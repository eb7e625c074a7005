/**
 * @file task_payload.cpp
 * @brief task_payload JSON conversion
 */

#include <docmig/migration/task_payload.hpp>

#include <nlohmann/json.hpp>

namespace docmig::migration {

auto task_payload::to_json() const -> std::string {
    nlohmann::json j;
    j["jobId"] = job_id;
    j["itemId"] = item_id;
    j["documentId"] = document_id;
    j["sourceProvider"] = source_provider;
    j["destProvider"] = dest_provider;
    j["strategy"] = to_string(strategy);
    j["dryRun"] = dry_run;
    j["sourceDigest"] = source_digest;
    j["maxAttempts"] = max_attempts;
    return j.dump();
}

auto task_payload::from_json(std::string_view json) -> Result<task_payload> {
    try {
        auto j = nlohmann::json::parse(json);

        task_payload payload;
        payload.job_id = j.at("jobId").get<std::string>();
        payload.item_id = j.at("itemId").get<std::int64_t>();
        payload.document_id = j.at("documentId").get<std::string>();
        payload.source_provider = j.at("sourceProvider").get<std::string>();
        payload.dest_provider = j.at("destProvider").get<std::string>();
        payload.dry_run = j.value("dryRun", false);
        payload.source_digest = j.at("sourceDigest").get<std::string>();
        payload.max_attempts = j.value("maxAttempts", 3);

        auto strategy = migration_strategy_from_string(
            j.at("strategy").get<std::string>());
        if (!strategy) {
            return docmig_error<task_payload>(error_codes::invalid_payload,
                                              "Unknown strategy in payload");
        }
        payload.strategy = *strategy;
        return payload;
    } catch (const nlohmann::json::exception& e) {
        return docmig_error<task_payload>(error_codes::invalid_payload,
                                          "Malformed task payload", e.what());
    }
}

auto make_idempotency_key(std::string_view job_id,
                          std::string_view document_id,
                          std::string_view digest) -> std::string {
    std::string key;
    key.reserve(job_id.size() + document_id.size() + digest.size() + 2);
    key.append(job_id).append(":").append(document_id).append(":").append(digest);
    return key;
}

}  // namespace docmig::migration
