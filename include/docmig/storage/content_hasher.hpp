/**
 * @file content_hasher.hpp
 * @brief Content digests and post-transfer verification
 *
 * The digest captured at enqueue time is the expected value for a transfer.
 * After writing, the destination is fetched again and digested
 * independently; only an equal digest lets an item complete.
 */

#pragma once

#include <docmig/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace docmig::storage {

class document_store;

/**
 * @brief Outcome of re-fetching and digesting a destination document
 */
struct validation_result {
    bool content_match{false};           ///< Digest equal to the expected one
    std::string expected_digest;         ///< Normalized expected digest
    std::string actual_digest;           ///< Normalized destination digest
    std::size_t content_size{0};         ///< Destination body size in bytes
    std::chrono::milliseconds elapsed{0};  ///< Time spent fetching and hashing
};

/**
 * @brief Stateless SHA-256 content hasher
 *
 * Digests are 64 lowercase hex characters. Digests produced by other
 * systems may carry a "sha256:" prefix; normalize() strips it before any
 * comparison.
 */
class content_hasher {
public:
    /// Length of a normalized digest
    static constexpr std::size_t digest_length = 64;

    /**
     * @brief Compute the digest of a document body
     * @return Hex digest, or digest_error if OpenSSL fails
     */
    [[nodiscard]] static auto digest(std::span<const std::uint8_t> content)
        -> Result<std::string>;

    /**
     * @brief Strip an optional "sha256:" prefix and lower-case
     */
    [[nodiscard]] static auto normalize(std::string_view digest) -> std::string;

    /**
     * @brief Compare two digests after normalization
     *
     * Empty digests never match.
     */
    [[nodiscard]] static auto matches(std::string_view lhs, std::string_view rhs)
        -> bool;

    /**
     * @brief Re-fetch a document and compare its digest with the expected one
     *
     * @param store Store holding the document
     * @param id Document identifier
     * @param expected_digest Digest captured when the work was enqueued
     * @return validation_result, or the store's read error
     */
    [[nodiscard]] static auto verify(document_store& store,
                                     std::string_view id,
                                     std::string_view expected_digest)
        -> Result<validation_result>;
};

}  // namespace docmig::storage
