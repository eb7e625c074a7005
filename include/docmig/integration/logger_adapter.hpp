/**
 * @file logger_adapter.hpp
 * @brief Process-wide application log and job audit trail
 *
 * Application messages go to logger_system writers (console and a rotating
 * docmig.log). Job lifecycle events are additionally appended to audit.json,
 * one JSON object per line, so operators can replay what happened to a job.
 */

#pragma once

#include <docmig/compat/format.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace docmig::integration {

// ─────────────────────────────────────────────────────
// Enumerations
// ─────────────────────────────────────────────────────

/// Severity, ordered so that comparisons express "at least as severe"
enum class log_level { trace, debug, info, warn, error, fatal, off };

/**
 * @brief Parse a log level name ("warning" and "critical" are accepted aliases)
 * @return Parsed level, or std::nullopt if the name is unknown
 */
[[nodiscard]] auto log_level_from_string(std::string_view name)
    -> std::optional<log_level>;

/// Job lifecycle events recorded in the audit trail, see job_event_name()
enum class job_event {
    created,
    documents_queued,
    started,
    paused,
    resumed,
    cancel_requested,
    cancelled,
    retried,
    settled
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Writers, level and rotation for logger_adapter::initialize()
 *
 * The application log is log_directory/docmig.log, rotated at
 * max_file_size_mb and keeping max_files generations. The audit trail is
 * log_directory/audit.json and is never rotated.
 */
struct logger_config {
    std::filesystem::path log_directory{"logs"};
    log_level min_level{log_level::info};

    bool enable_console{true};
    bool enable_file{true};
    bool enable_audit_log{true};

    std::size_t max_file_size_mb{100};
    std::size_t max_files{10};

    /// Hand messages to a logger_system background thread
    bool async_mode{true};
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Static logging facade over logger_system
 *
 * Logging before initialize() or after shutdown() is silently dropped.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/docmig";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Worker pool started with {} executors", 4);
 * logger_adapter::log_job_event(job_event::started, job_id);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Create the writers and open the audit trail
     *
     * A second call is ignored until shutdown(). Failing to open the audit
     * trail is logged as a warning and leaves audit_log_path() empty.
     */
    static void initialize(const logger_config& config);

    /// Flushes, closes the audit trail and releases the writers
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    // Formatting is skipped when the level is filtered out

    template <typename... Args>
    static void trace(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::error, fmt, std::forward<Args>(args)...);
    }

    static void log(log_level level, const std::string& message);

    /// false for log_level::off and anything below the minimum level
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record a job lifecycle event
     *
     * The audit line holds seq, timestamp, event_type and job_id followed by
     * @p fields (status, counters, actor); fields never replace those four.
     * The event is mirrored to the application log at info level.
     */
    static void log_job_event(job_event event,
                              const std::string& job_id,
                              const std::map<std::string, std::string>& fields = {});

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    /// Open audit trail file, empty when disabled or not initialized
    [[nodiscard]] static auto audit_log_path() -> std::filesystem::path;

    /// Audit name of an event, e.g. "JOB_CANCEL_REQUESTED"
    [[nodiscard]] static auto job_event_name(job_event event) -> std::string_view;

private:
    template <typename... Args>
    static void emit(log_level level, compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(level)) {
            log(level, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    class impl;
    [[nodiscard]] static auto state() -> impl&;
};

}  // namespace docmig::integration
