/**
 * @file object_document_store.cpp
 * @brief Implementation of the object storage document store
 *
 * Uses an in-memory mock client with S3 semantics (put replaces, delete of a
 * missing key succeeds, ETag-like digest returned on put).
 */

#include <docmig/storage/object_document_store.hpp>
#include <docmig/storage/content_hasher.hpp>

#include <map>
#include <mutex>

namespace docmig::storage {

// ============================================================================
// Mock Object Client Implementation
// ============================================================================

/**
 * @brief In-memory object client
 */
class object_document_store::mock_object_client {
public:
  struct stored_object {
    std::vector<std::uint8_t> data;
    document_metadata metadata;
  };

  mock_object_client() : connected_(true) {}

  [[nodiscard]] auto put_object(const std::string &key,
                                const std::vector<std::uint8_t> &data,
                                const document_metadata &metadata)
      -> VoidResult {
    if (!connected_) {
      return docmig_void_error(error_codes::store_unavailable,
                               "Object client not connected");
    }
    objects_[key] = stored_object{data, metadata};
    return ok();
  }

  [[nodiscard]] auto get_object(const std::string &key)
      -> Result<stored_object> {
    if (!connected_) {
      return docmig_error<stored_object>(error_codes::store_unavailable,
                                         "Object client not connected");
    }
    auto it = objects_.find(key);
    if (it == objects_.end()) {
      return docmig_error<stored_object>(error_codes::document_not_found,
                                         "Object not found: " + key);
    }
    return it->second;
  }

  [[nodiscard]] auto delete_object(const std::string &key) -> VoidResult {
    if (!connected_) {
      return docmig_void_error(error_codes::store_unavailable,
                               "Object client not connected");
    }
    objects_.erase(key);
    return ok();
  }

  [[nodiscard]] auto head_object(const std::string &key) const -> bool {
    if (!connected_) {
      return false;
    }
    return objects_.contains(key);
  }

  [[nodiscard]] auto list_objects(const std::string &prefix) const
      -> Result<std::vector<std::string>> {
    if (!connected_) {
      return docmig_error<std::vector<std::string>>(
          error_codes::store_unavailable, "Object client not connected");
    }
    std::vector<std::string> keys;
    for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it) {
      if (it->first.compare(0, prefix.size(), prefix) != 0) {
        break;
      }
      keys.push_back(it->first);
    }
    return keys;
  }

  [[nodiscard]] auto size() const -> std::size_t { return objects_.size(); }

  void set_connected(bool connected) { connected_ = connected; }
  [[nodiscard]] auto is_connected() const -> bool { return connected_; }

private:
  bool connected_;
  std::map<std::string, stored_object> objects_;
};

// ============================================================================
// Construction / Destruction
// ============================================================================

object_document_store::object_document_store(const object_store_config &config)
    : config_(config), client_(std::make_unique<mock_object_client>()) {}

object_document_store::~object_document_store() = default;

// ============================================================================
// document_store Implementation
// ============================================================================

auto object_document_store::get(std::string_view id) -> Result<document> {
  if (id.empty()) {
    return docmig_error<document>(error_codes::invalid_document_id,
                                  "Document id is empty");
  }

  std::shared_lock lock(mutex_);
  auto object = client_->get_object(make_key(id));
  if (object.is_err()) {
    return forward_error<document>(object.error());
  }

  document doc;
  doc.id = std::string(id);
  doc.content = object.value().data;
  doc.metadata = object.value().metadata;
  return doc;
}

auto object_document_store::put(std::string_view id,
                                const std::vector<std::uint8_t> &content,
                                const document_metadata &metadata)
    -> Result<std::string> {
  if (id.empty()) {
    return docmig_error<std::string>(error_codes::invalid_document_id,
                                     "Document id is empty");
  }

  auto digest = content_hasher::digest(content);
  if (digest.is_err()) {
    return digest;
  }

  std::unique_lock lock(mutex_);
  auto result = client_->put_object(make_key(id), content, metadata);
  if (result.is_err()) {
    return forward_error<std::string>(result.error());
  }
  return digest;
}

auto object_document_store::remove(std::string_view id) -> VoidResult {
  std::unique_lock lock(mutex_);
  return client_->delete_object(make_key(id));
}

auto object_document_store::list(std::string_view prefix)
    -> Result<std::vector<std::string>> {
  std::shared_lock lock(mutex_);
  auto keys = client_->list_objects(make_key(prefix));
  if (keys.is_err()) {
    return keys;
  }

  std::vector<std::string> ids;
  ids.reserve(keys.value().size());
  for (const auto &key : keys.value()) {
    ids.push_back(key.substr(config_.key_prefix.size()));
  }
  return ids;
}

auto object_document_store::exists(std::string_view id) -> bool {
  std::shared_lock lock(mutex_);
  return client_->head_object(make_key(id));
}

// ============================================================================
// Connectivity
// ============================================================================

void object_document_store::set_connected(bool connected) {
  std::unique_lock lock(mutex_);
  client_->set_connected(connected);
}

auto object_document_store::is_connected() const -> bool {
  std::shared_lock lock(mutex_);
  return client_->is_connected();
}

auto object_document_store::object_count() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return client_->size();
}

auto object_document_store::make_key(std::string_view id) const -> std::string {
  return config_.key_prefix + std::string(id);
}

} // namespace docmig::storage
