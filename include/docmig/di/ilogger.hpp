/**
 * @file ilogger.hpp
 * @brief Injectable logger used by the engine components
 *
 * The job manager, worker pool and provider registry take a
 * std::shared_ptr<ILogger>. Production code passes a LoggerService, which
 * forwards to logger_adapter; tests pass a recording logger; components
 * constructed without one fall back to null_logger().
 */

#pragma once

#include <docmig/integration/logger_adapter.hpp>
#include <docmig/compat/format.hpp>

#include <memory>
#include <string_view>
#include <utility>

namespace docmig::di {

using integration::log_level;

/**
 * @brief Logger seam for engine components
 *
 * Implementations provide write() and is_enabled(); the level helpers and
 * their *_fmt variants are built on top. Formatting is skipped entirely for
 * disabled levels. Executors log concurrently, so write() must be
 * thread-safe.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(log_level level, std::string_view message) = 0;

    [[nodiscard]] virtual bool is_enabled(log_level level) const noexcept = 0;

    void debug(std::string_view message) { write_if_enabled(log_level::debug, message); }
    void info(std::string_view message) { write_if_enabled(log_level::info, message); }
    void warn(std::string_view message) { write_if_enabled(log_level::warn, message); }
    void error(std::string_view message) { write_if_enabled(log_level::error, message); }

    template <typename... Args>
    void debug_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(log_level::error, fmt, std::forward<Args>(args)...);
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;

private:
    void write_if_enabled(log_level level, std::string_view message) {
        if (is_enabled(level)) {
            write(level, message);
        }
    }

    template <typename... Args>
    void write_fmt(log_level level, compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(level)) {
            write(level, compat::format(fmt, std::forward<Args>(args)...));
        }
    }
};

/// Discards everything; the default when no logger is injected
class NullLogger final : public ILogger {
public:
    void write(log_level /*level*/, std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(log_level /*level*/) const noexcept override {
        return false;
    }
};

/**
 * @brief Forwards to the process-wide logger_adapter
 *
 * The level filter is the adapter's, so set_min_level() on the adapter
 * takes effect for every LoggerService at once.
 */
class LoggerService final : public ILogger {
public:
    void write(log_level level, std::string_view message) override {
        integration::logger_adapter::log(level, std::string{message});
    }

    [[nodiscard]] bool is_enabled(log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }
};

[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace docmig::di
