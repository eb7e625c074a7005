/**
 * @file provider_registry.cpp
 * @brief Implementation of provider_registry
 */

#include <docmig/storage/provider_registry.hpp>

#include <docmig/storage/local_document_store.hpp>
#include <docmig/storage/object_document_store.hpp>

#include <nlohmann/json.hpp>

#include <mutex>

namespace docmig::storage {

namespace {

auto parse_config(const provider_registration& registration)
    -> Result<nlohmann::json> {
    try {
        auto j = nlohmann::json::parse(
            registration.config_json.empty() ? "{}" : registration.config_json);
        if (!j.is_object()) {
            return docmig_error<nlohmann::json>(
                error_codes::provider_config_error,
                "Provider config is not a JSON object: " + registration.provider_name);
        }
        return j;
    } catch (const nlohmann::json::exception& e) {
        return docmig_error<nlohmann::json>(
            error_codes::provider_config_error,
            "Invalid provider config for " + registration.provider_name, e.what());
    }
}

auto make_local_store(const provider_registration& registration)
    -> Result<std::shared_ptr<document_store>> {
    auto config = parse_config(registration);
    if (config.is_err()) {
        return forward_error<std::shared_ptr<document_store>>(config.error());
    }

    auto root = config.value().value("root_path", std::string{});
    if (root.empty()) {
        return docmig_error<std::shared_ptr<document_store>>(
            error_codes::provider_config_error,
            "local provider requires root_path: " + registration.provider_name);
    }

    local_store_config store_config;
    store_config.root_path = root;
    return std::shared_ptr<document_store>(
        std::make_shared<local_document_store>(store_config));
}

auto make_object_store(const provider_registration& registration)
    -> Result<std::shared_ptr<document_store>> {
    auto config = parse_config(registration);
    if (config.is_err()) {
        return forward_error<std::shared_ptr<document_store>>(config.error());
    }

    object_store_config store_config;
    store_config.bucket_name = config.value().value("bucket", std::string{});
    if (store_config.bucket_name.empty()) {
        return docmig_error<std::shared_ptr<document_store>>(
            error_codes::provider_config_error,
            "object provider requires bucket: " + registration.provider_name);
    }
    store_config.region = config.value().value("region", std::string{"us-east-1"});
    store_config.key_prefix = config.value().value("prefix", std::string{});
    store_config.endpoint_url = config.value().value("endpoint", std::string{});

    return std::shared_ptr<document_store>(
        std::make_shared<object_document_store>(store_config));
}

}  // namespace

provider_registry::provider_registry(std::shared_ptr<di::ILogger> logger)
    : logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// Factories
// =============================================================================

void provider_registry::register_factory(std::string type, provider_factory factory) {
    std::unique_lock lock(mutex_);
    factories_[std::move(type)] = std::move(factory);
}

void provider_registry::register_builtin_factories() {
    register_factory("local", make_local_store);
    register_factory("object", make_object_store);
    register_factory("s3", make_object_store);
}

auto provider_registry::has_factory(std::string_view type) const -> bool {
    std::shared_lock lock(mutex_);
    return factories_.find(type) != factories_.end();
}

// =============================================================================
// Providers
// =============================================================================

auto provider_registry::register_provider(const provider_registration& registration,
                                          std::shared_ptr<document_store> adapter)
    -> VoidResult {
    if (registration.provider_name.empty()) {
        return docmig_void_error(error_codes::invalid_configuration,
                                 "Provider name is empty");
    }
    if (!adapter) {
        return docmig_void_error(error_codes::invalid_configuration,
                                 "Adapter is null for provider " +
                                     registration.provider_name);
    }

    {
        std::unique_lock lock(mutex_);
        providers_[registration.provider_name] =
            provider_entry{registration, std::move(adapter)};
    }

    logger_->debug_fmt("Registered provider {} ({})", registration.provider_name,
                       registration.provider_type);
    return ok();
}

auto provider_registry::build_entry(const provider_registration& registration) const
    -> Result<std::shared_ptr<document_store>> {
    auto existing = providers_.find(registration.provider_name);
    if (existing != providers_.end() && existing->second.adapter &&
        existing->second.registration.provider_type == registration.provider_type &&
        existing->second.registration.config_json == registration.config_json) {
        return existing->second.adapter;
    }

    auto factory = factories_.find(registration.provider_type);
    if (factory == factories_.end()) {
        return docmig_error<std::shared_ptr<document_store>>(
            error_codes::provider_factory_missing,
            "No factory for provider " + registration.provider_name + " of type " +
                registration.provider_type);
    }
    return factory->second(registration);
}

auto provider_registry::refresh(const std::vector<provider_registration>& registrations)
    -> std::size_t {
    std::unique_lock lock(mutex_);

    std::map<std::string, provider_entry, std::less<>> rebuilt;
    std::size_t failures = 0;

    for (const auto& registration : registrations) {
        auto adapter = build_entry(registration);
        if (adapter.is_err()) {
            logger_->warn_fmt("Failed to build provider {}: {}",
                              registration.provider_name, adapter.error().message);
            ++failures;
            continue;
        }
        rebuilt[registration.provider_name] =
            provider_entry{registration, adapter.value()};
    }

    providers_ = std::move(rebuilt);
    logger_->info_fmt("Provider registry refreshed: {} providers, {} failed",
                      providers_.size(), failures);
    return failures;
}

auto provider_registry::refresh_provider(const provider_registration& registration)
    -> VoidResult {
    std::unique_lock lock(mutex_);

    auto adapter = build_entry(registration);
    if (adapter.is_err()) {
        logger_->warn_fmt("Failed to build provider {}: {}",
                          registration.provider_name, adapter.error().message);
        return VoidResult(adapter.error());
    }
    providers_[registration.provider_name] =
        provider_entry{registration, adapter.value()};
    return ok();
}

auto provider_registry::unregister_provider(std::string_view name) -> bool {
    std::unique_lock lock(mutex_);
    auto it = providers_.find(name);
    if (it == providers_.end()) {
        return false;
    }
    providers_.erase(it);
    return true;
}

auto provider_registry::resolve(std::string_view name) const
    -> Result<std::shared_ptr<document_store>> {
    std::shared_lock lock(mutex_);

    auto it = providers_.find(name);
    if (it == providers_.end()) {
        return docmig_error<std::shared_ptr<document_store>>(
            error_codes::provider_not_found,
            "Provider not found: " + std::string(name));
    }
    if (it->second.registration.status == provider_status::disabled) {
        return docmig_error<std::shared_ptr<document_store>>(
            error_codes::provider_disabled,
            "Provider is disabled: " + std::string(name));
    }
    return it->second.adapter;
}

auto provider_registry::find(std::string_view name) const
    -> std::optional<provider_registration> {
    std::shared_lock lock(mutex_);
    auto it = providers_.find(name);
    if (it == providers_.end()) {
        return std::nullopt;
    }
    return it->second.registration;
}

auto provider_registry::list() const -> std::vector<provider_registration> {
    std::shared_lock lock(mutex_);
    std::vector<provider_registration> result;
    result.reserve(providers_.size());
    for (const auto& [name, entry] : providers_) {
        result.push_back(entry.registration);
    }
    return result;
}

auto provider_registry::is_writable(std::string_view name) const -> bool {
    std::shared_lock lock(mutex_);
    auto it = providers_.find(name);
    return it != providers_.end() && it->second.registration.is_effectively_writable();
}

}  // namespace docmig::storage
