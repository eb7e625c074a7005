/**
 * @file object_document_store.hpp
 * @brief S3-compatible object storage document store
 *
 * Documents are objects in a bucket, keyed by "<key_prefix><document id>".
 * The store currently talks to an in-process mock client that keeps objects
 * in memory, which is enough for engine integration and tests.
 *
 * @see document_store
 */

#pragma once

#include <docmig/storage/document_store.hpp>

#include <memory>
#include <shared_mutex>
#include <string>

namespace docmig::storage {

/**
 * @brief Configuration for object storage
 */
struct object_store_config {
  /// Bucket name (required)
  std::string bucket_name;

  /// Region
  std::string region = "us-east-1";

  /// Prefix prepended to every object key
  std::string key_prefix;

  /// Optional custom endpoint (MinIO and similar)
  std::string endpoint_url;
};

/**
 * @brief Object storage document store
 *
 * Thread Safety: All methods are thread-safe (std::shared_mutex).
 *
 * @example
 * @code
 * object_store_config config;
 * config.bucket_name = "archive";
 * config.key_prefix = "tenant-a/";
 *
 * object_document_store store{config};
 * auto digest = store.put("reports/q1.md", bytes, {});
 * @endcode
 */
class object_document_store final : public document_store {
public:
  explicit object_document_store(const object_store_config &config);
  ~object_document_store() override;

  [[nodiscard]] auto get(std::string_view id) -> Result<document> override;

  [[nodiscard]] auto put(std::string_view id,
                         const std::vector<std::uint8_t> &content,
                         const document_metadata &metadata)
      -> Result<std::string> override;

  [[nodiscard]] auto remove(std::string_view id) -> VoidResult override;

  [[nodiscard]] auto list(std::string_view prefix)
      -> Result<std::vector<std::string>> override;

  [[nodiscard]] auto exists(std::string_view id) -> bool override;

  [[nodiscard]] auto type_name() const -> std::string_view override {
    return "object";
  }

  /**
   * @brief Simulate a connectivity change
   *
   * While disconnected every operation fails with store_unavailable.
   */
  void set_connected(bool connected);

  /// Current connectivity
  [[nodiscard]] auto is_connected() const -> bool;

  /// Number of stored objects
  [[nodiscard]] auto object_count() const -> std::size_t;

  [[nodiscard]] auto config() const -> const object_store_config & {
    return config_;
  }

private:
  class mock_object_client;

  [[nodiscard]] auto make_key(std::string_view id) const -> std::string;

  object_store_config config_;
  std::unique_ptr<mock_object_client> client_;
  mutable std::shared_mutex mutex_;
};

} // namespace docmig::storage
