/**
 * @file local_document_store.cpp
 * @brief Implementation of the filesystem document store
 */

#include <docmig/storage/local_document_store.hpp>
#include <docmig/storage/content_hasher.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>

namespace docmig::storage {

namespace {

constexpr std::string_view kSidecarSuffix = ".meta.json";
constexpr std::string_view kTempPrefix = ".docmig-tmp-";

/// Generate a unique temporary filename
auto generate_temp_filename(const std::filesystem::path& base)
    -> std::filesystem::path {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;

    auto temp_name = std::string(kTempPrefix) + base.filename().string() + "." +
                     std::to_string(dist(gen));
    return base.parent_path() / temp_name;
}

auto ends_with(std::string_view value, std::string_view suffix) -> bool {
    return value.size() >= suffix.size() &&
           value.substr(value.size() - suffix.size()) == suffix;
}

/// Write bytes to a temp file and rename it over the target
auto write_atomically(const std::filesystem::path& target,
                      const char* data, std::size_t size) -> VoidResult {
    auto temp_path = generate_temp_filename(target);
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return docmig_void_error(error_codes::document_write_error,
                                     "Failed to open temp file: " + temp_path.string());
        }
        file.write(data, static_cast<std::streamsize>(size));
        if (!file) {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            return docmig_void_error(error_codes::document_write_error,
                                     "Failed to write temp file: " + temp_path.string());
        }
    }

    // Atomic rename
    std::error_code ec;
    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return docmig_void_error(error_codes::document_write_error,
                                 "Failed to rename temp file: " + ec.message());
    }
    return ok();
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

local_document_store::local_document_store(const local_store_config& config)
    : config_(config) {
    if (config_.create_directories && !config_.root_path.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config_.root_path, ec);
        // Reported by the first put() if the directory is still missing
    }
}

// ============================================================================
// document_store Implementation
// ============================================================================

auto local_document_store::get(std::string_view id) -> Result<document> {
    auto path = resolve_path(id);
    if (path.is_err()) {
        return forward_error<document>(path.error());
    }

    std::shared_lock lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path.value(), ec)) {
        return docmig_error<document>(error_codes::document_not_found,
                                      "Document not found: " + std::string(id));
    }

    std::ifstream file(path.value(), std::ios::binary);
    if (!file) {
        return docmig_error<document>(error_codes::document_read_error,
                                      "Failed to open document: " + std::string(id));
    }

    document doc;
    doc.id = std::string(id);
    doc.content.assign(std::istreambuf_iterator<char>(file),
                       std::istreambuf_iterator<char>());
    if (file.bad()) {
        return docmig_error<document>(error_codes::document_read_error,
                                      "Failed to read document: " + std::string(id));
    }

    auto meta_path = sidecar_path(path.value());
    if (std::filesystem::exists(meta_path, ec)) {
        std::ifstream meta_file(meta_path);
        try {
            auto j = nlohmann::json::parse(meta_file);
            for (const auto& [key, value] : j.items()) {
                if (value.is_string()) {
                    doc.metadata[key] = value.get<std::string>();
                } else {
                    doc.metadata[key] = value.dump();
                }
            }
        } catch (const nlohmann::json::exception& e) {
            return docmig_error<document>(error_codes::document_read_error,
                                          "Corrupt metadata for " + std::string(id),
                                          e.what());
        }
    }

    return doc;
}

auto local_document_store::put(std::string_view id,
                               const std::vector<std::uint8_t>& content,
                               const document_metadata& metadata)
    -> Result<std::string> {
    auto path = resolve_path(id);
    if (path.is_err()) {
        return forward_error<std::string>(path.error());
    }

    auto digest = content_hasher::digest(content);
    if (digest.is_err()) {
        return digest;
    }

    std::unique_lock lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(path.value().parent_path(), ec);
    if (ec) {
        return docmig_error<std::string>(error_codes::document_write_error,
                                         "Failed to create directory: " + ec.message());
    }

    auto body = write_atomically(path.value(),
                                 reinterpret_cast<const char*>(content.data()),
                                 content.size());
    if (body.is_err()) {
        return forward_error<std::string>(body.error());
    }

    auto meta_path = sidecar_path(path.value());
    if (metadata.empty()) {
        std::filesystem::remove(meta_path, ec);
    } else {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [key, value] : metadata) {
            j[key] = value;
        }
        auto text = j.dump();
        auto meta = write_atomically(meta_path, text.data(), text.size());
        if (meta.is_err()) {
            return forward_error<std::string>(meta.error());
        }
    }

    return digest;
}

auto local_document_store::remove(std::string_view id) -> VoidResult {
    auto path = resolve_path(id);
    if (path.is_err()) {
        return VoidResult(path.error());
    }

    std::unique_lock lock(mutex_);

    std::error_code ec;
    std::filesystem::remove(path.value(), ec);
    if (ec) {
        return docmig_void_error(error_codes::document_delete_error,
                                 "Failed to delete " + std::string(id) + ": " +
                                     ec.message());
    }
    std::filesystem::remove(sidecar_path(path.value()), ec);
    return ok();
}

auto local_document_store::list(std::string_view prefix)
    -> Result<std::vector<std::string>> {
    std::shared_lock lock(mutex_);

    std::vector<std::string> ids;
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.root_path, ec)) {
        return ids;
    }

    std::filesystem::recursive_directory_iterator it(config_.root_path, ec);
    if (ec) {
        return docmig_error<std::vector<std::string>>(
            error_codes::document_read_error,
            "Failed to list " + config_.root_path.string() + ": " + ec.message());
    }

    const std::filesystem::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return docmig_error<std::vector<std::string>>(
                error_codes::document_read_error,
                "Failed to list " + config_.root_path.string() + ": " + ec.message());
        }
        const auto& entry = *it;
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (ends_with(name, kSidecarSuffix) || name.rfind(kTempPrefix, 0) == 0) {
            continue;
        }
        auto rel = std::filesystem::relative(entry.path(), config_.root_path, ec)
                       .generic_string();
        if (ec) {
            continue;
        }
        if (rel.compare(0, prefix.size(), prefix) == 0) {
            ids.push_back(std::move(rel));
        }
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

auto local_document_store::exists(std::string_view id) -> bool {
    auto path = resolve_path(id);
    if (path.is_err()) {
        return false;
    }
    std::shared_lock lock(mutex_);
    std::error_code ec;
    return std::filesystem::is_regular_file(path.value(), ec);
}

// ============================================================================
// Private Helpers
// ============================================================================

auto local_document_store::resolve_path(std::string_view id) const
    -> Result<std::filesystem::path> {
    if (id.empty()) {
        return docmig_error<std::filesystem::path>(error_codes::invalid_document_id,
                                                   "Document id is empty");
    }

    std::filesystem::path rel{std::string(id)};
    if (rel.is_absolute() || rel.has_root_name() || id.front() == '/') {
        return docmig_error<std::filesystem::path>(
            error_codes::invalid_document_id,
            "Absolute document id rejected: " + std::string(id));
    }
    for (const auto& part : rel) {
        if (part == "..") {
            return docmig_error<std::filesystem::path>(
                error_codes::invalid_document_id,
                "Document id escapes the store root: " + std::string(id));
        }
    }

    auto name = rel.filename().string();
    if (name.empty() || ends_with(name, kSidecarSuffix) || name.rfind(kTempPrefix, 0) == 0) {
        return docmig_error<std::filesystem::path>(
            error_codes::invalid_document_id,
            "Reserved document id: " + std::string(id));
    }

    return config_.root_path / rel;
}

auto local_document_store::sidecar_path(const std::filesystem::path& body)
    -> std::filesystem::path {
    auto meta = body;
    meta += std::string(kSidecarSuffix);
    return meta;
}

}  // namespace docmig::storage
