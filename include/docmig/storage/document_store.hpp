/**
 * @file document_store.hpp
 * @brief Abstract document store contract consumed by the migration engine
 *
 * Every storage provider (filesystem workspace, object storage, hosted
 * document services) is reached through this uniform capability set.
 * Concrete adapters inherit from document_store and are selected at runtime
 * by provider_registry.
 */

#pragma once

#include <docmig/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docmig::storage {

/// Free-form document metadata (content type, title, owner, ...)
using document_metadata = std::map<std::string, std::string>;

/**
 * @brief A document body together with its metadata
 */
struct document {
    std::string id;                     ///< Provider-local document identifier
    std::vector<std::uint8_t> content;  ///< Raw document bytes
    document_metadata metadata;         ///< Metadata travelling with the body
};

/**
 * @brief Abstract document store interface
 *
 * Identifiers are provider-local strings; '/' separates hierarchy levels so
 * that list(prefix) can select a folder.
 *
 * Thread Safety:
 * - All methods must be thread-safe in concrete implementations; the worker
 *   pool shares one adapter instance between executors
 * - put() must be atomic: a concurrent get() sees either the old or the
 *   new body, never a partial one
 *
 * @example
 * @code
 * std::shared_ptr<document_store> store =
 *     std::make_shared<local_document_store>(local_store_config{"/srv/docs"});
 *
 * auto digest = store->put("reports/q1.md", bytes, {{"content-type", "text/markdown"}});
 * auto doc = store->get("reports/q1.md");
 * auto ids = store->list("reports/");
 * @endcode
 */
class document_store {
public:
    virtual ~document_store() = default;

    /**
     * @brief Read a document
     * @param id Document identifier
     * @return The document, or document_not_found / document_read_error
     */
    [[nodiscard]] virtual auto get(std::string_view id) -> Result<document> = 0;

    /**
     * @brief Create or replace a document
     *
     * @param id Document identifier
     * @param content Document bytes
     * @param metadata Metadata to store alongside the body
     * @return Content digest of the stored body as reported by the store
     */
    [[nodiscard]] virtual auto put(std::string_view id,
                                   const std::vector<std::uint8_t>& content,
                                   const document_metadata& metadata)
        -> Result<std::string> = 0;

    /**
     * @brief Delete a document (deleting a missing document succeeds)
     */
    [[nodiscard]] virtual auto remove(std::string_view id) -> VoidResult = 0;

    /**
     * @brief List identifiers starting with prefix, in lexical order
     */
    [[nodiscard]] virtual auto list(std::string_view prefix)
        -> Result<std::vector<std::string>> = 0;

    /**
     * @brief Check whether a document exists
     */
    [[nodiscard]] virtual auto exists(std::string_view id) -> bool = 0;

    /**
     * @brief Adapter type name ("local", "object", ...)
     */
    [[nodiscard]] virtual auto type_name() const -> std::string_view = 0;

protected:
    document_store() = default;

    document_store(const document_store&) = delete;
    auto operator=(const document_store&) -> document_store& = delete;
    document_store(document_store&&) = default;
    auto operator=(document_store&&) -> document_store& = default;
};

}  // namespace docmig::storage
