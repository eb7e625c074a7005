/**
 * @file content_hasher.cpp
 * @brief SHA-256 digests through OpenSSL EVP
 */

#include <docmig/storage/content_hasher.hpp>
#include <docmig/storage/document_store.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>

namespace docmig::storage {

namespace {

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

constexpr std::string_view kDigestPrefix = "sha256:";

auto to_hex(const unsigned char* data, unsigned int length) -> std::string {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

}  // namespace

auto content_hasher::digest(std::span<const std::uint8_t> content)
    -> Result<std::string> {
    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return docmig_error<std::string>(error_codes::digest_error,
                                         "Failed to allocate digest context");
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return docmig_error<std::string>(error_codes::digest_error,
                                         "Failed to initialize SHA-256");
    }

    if (!content.empty() &&
        EVP_DigestUpdate(ctx.get(), content.data(), content.size()) != 1) {
        return docmig_error<std::string>(error_codes::digest_error,
                                         "Failed to hash document content");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md.data(), &md_len) != 1) {
        return docmig_error<std::string>(error_codes::digest_error,
                                         "Failed to finalize SHA-256");
    }

    return to_hex(md.data(), md_len);
}

auto content_hasher::normalize(std::string_view digest) -> std::string {
    if (digest.size() >= kDigestPrefix.size()) {
        std::string head(digest.substr(0, kDigestPrefix.size()));
        std::transform(head.begin(), head.end(), head.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (head == kDigestPrefix) {
            digest.remove_prefix(kDigestPrefix.size());
        }
    }

    std::string out(digest);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto content_hasher::matches(std::string_view lhs, std::string_view rhs) -> bool {
    auto a = normalize(lhs);
    auto b = normalize(rhs);
    return !a.empty() && a == b;
}

auto content_hasher::verify(document_store& store,
                            std::string_view id,
                            std::string_view expected_digest)
    -> Result<validation_result> {
    auto start = std::chrono::steady_clock::now();

    auto fetched = store.get(id);
    if (fetched.is_err()) {
        return forward_error<validation_result>(fetched.error());
    }

    const auto& doc = fetched.value();
    auto actual = digest(doc.content);
    if (actual.is_err()) {
        return forward_error<validation_result>(actual.error());
    }

    validation_result result;
    result.expected_digest = normalize(expected_digest);
    result.actual_digest = actual.value();
    result.content_size = doc.content.size();
    result.content_match = matches(result.expected_digest, result.actual_digest);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

}  // namespace docmig::storage
