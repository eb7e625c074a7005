/**
 * @file retry_policy.hpp
 * @brief Exponential backoff between item attempts
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace docmig::migration {

/**
 * @brief Exponential backoff with a ceiling
 *
 * delay(n) = min(base_delay * multiplier^(n-1), max_delay) for attempt n >= 1.
 * The delay is stored as the outbox entry's available_at, so it survives a
 * restart.
 */
struct retry_policy {
    /// Delay after the first failed attempt
    std::chrono::milliseconds base_delay{std::chrono::seconds{5}};

    /// Growth factor per further attempt
    double multiplier{2.0};

    /// Upper bound for any delay
    std::chrono::milliseconds max_delay{std::chrono::minutes{5}};

    /**
     * @brief Delay before retrying after the given failed attempt
     * @param attempt 1-based attempt number that just failed
     */
    [[nodiscard]] auto delay_for_attempt(int attempt) const noexcept
        -> std::chrono::milliseconds {
        if (attempt < 1) {
            attempt = 1;
        }
        double delay = static_cast<double>(base_delay.count());
        const double ceiling = static_cast<double>(max_delay.count());
        for (int i = 1; i < attempt && delay < ceiling; ++i) {
            delay *= multiplier;
        }
        return std::chrono::milliseconds{
            static_cast<std::int64_t>(std::min(delay, ceiling))};
    }
};

}  // namespace docmig::migration
