/**
 * @file local_document_store.hpp
 * @brief Filesystem-backed document store
 *
 * Each document is one file under the root directory. Metadata is kept in a
 * JSON sidecar next to the body ("<id>.meta.json").
 *
 * @see document_store
 */

#pragma once

#include <docmig/storage/document_store.hpp>

#include <filesystem>
#include <shared_mutex>
#include <string>

namespace docmig::storage {

/**
 * @brief Configuration for the filesystem document store
 */
struct local_store_config {
    /// Root directory holding the documents
    std::filesystem::path root_path;

    /// Create the root directory on construction when missing
    bool create_directories = true;
};

/**
 * @brief Filesystem document store
 *
 * Document ids map to relative paths below root_path. Ids that are empty,
 * absolute, or contain a ".." component are rejected with
 * invalid_document_id, as are file names ending in ".meta.json" or starting
 * with ".docmig-tmp-", which the store reserves for itself.
 *
 * Writes go to ".docmig-tmp-<file>.<random>" first and are moved into place
 * with std::filesystem::rename, so readers never observe a partial body.
 *
 * Thread Safety: All methods are thread-safe (std::shared_mutex).
 */
class local_document_store final : public document_store {
public:
    explicit local_document_store(const local_store_config& config);
    ~local_document_store() override = default;

    [[nodiscard]] auto get(std::string_view id) -> Result<document> override;

    [[nodiscard]] auto put(std::string_view id,
                           const std::vector<std::uint8_t>& content,
                           const document_metadata& metadata)
        -> Result<std::string> override;

    [[nodiscard]] auto remove(std::string_view id) -> VoidResult override;

    [[nodiscard]] auto list(std::string_view prefix)
        -> Result<std::vector<std::string>> override;

    [[nodiscard]] auto exists(std::string_view id) -> bool override;

    [[nodiscard]] auto type_name() const -> std::string_view override {
        return "local";
    }

    /// Root directory of this store
    [[nodiscard]] auto root_path() const -> const std::filesystem::path& {
        return config_.root_path;
    }

private:
    /// Map an id to its body path, rejecting unsafe ids
    [[nodiscard]] auto resolve_path(std::string_view id) const
        -> Result<std::filesystem::path>;

    [[nodiscard]] static auto sidecar_path(const std::filesystem::path& body)
        -> std::filesystem::path;

    local_store_config config_;
    mutable std::shared_mutex mutex_;
};

}  // namespace docmig::storage
