/**
 * @file mock_logger.hpp
 * @brief ILogger that records messages for verification
 */

#pragma once

#include <docmig/di/ilogger.hpp>

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace docmig::testing {

/**
 * @brief Mock logger that records all log calls
 *
 * Thread Safety: Safe to share between worker threads.
 */
class MockLogger final : public di::ILogger {
public:
    MockLogger() = default;
    ~MockLogger() override = default;

    void write(di::log_level level, std::string_view message) override {
        switch (level) {
            case di::log_level::info:
                info_count_.fetch_add(1, std::memory_order_relaxed);
                break;
            case di::log_level::warn:
                warn_count_.fetch_add(1, std::memory_order_relaxed);
                break;
            case di::log_level::error:
                error_count_.fetch_add(1, std::memory_order_relaxed);
                break;
            default:
                break;
        }
        std::lock_guard lock(mutex_);
        messages_.emplace_back(message);
    }

    [[nodiscard]] bool is_enabled(di::log_level) const noexcept override { return true; }

    [[nodiscard]] std::size_t info_count() const noexcept { return info_count_; }
    [[nodiscard]] std::size_t warn_count() const noexcept { return warn_count_; }
    [[nodiscard]] std::size_t error_count() const noexcept { return error_count_; }

    /// Whether any recorded message contains the fragment
    [[nodiscard]] bool contains(std::string_view fragment) const {
        std::lock_guard lock(mutex_);
        for (const auto& message : messages_) {
            if (message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] std::vector<std::string> messages() const {
        std::lock_guard lock(mutex_);
        return messages_;
    }

private:
    std::atomic<std::size_t> info_count_{0};
    std::atomic<std::size_t> warn_count_{0};
    std::atomic<std::size_t> error_count_{0};

    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

}  // namespace docmig::testing
